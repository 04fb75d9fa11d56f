#include <gtest/gtest.h>
#include <tickhook/hook_registry.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tickhook;

namespace {

HookEntry make_entry(HookId id, Term predicate, OperationKind kind = OperationKind::ParallelSplit) {
    HookEntry entry;
    entry.id = id;
    entry.name = "hook_" + std::to_string(id);
    entry.operation_kind = kind;
    entry.predicate_pattern = TermPattern::exact(predicate);
    return entry;
}

std::vector<Branch> one_branch() {
    Branch b;
    b.name = "noop";
    b.handler = [](const BranchContext&) { return BranchOutcome::Done; };
    return {b};
}

} // namespace

class HookRegistryTest : public ::testing::Test {
protected:
    HookRegistry registry{4};
};

TEST_F(HookRegistryTest, StartsWithEmptySnapshot) {
    auto snapshot = registry.read(0);
    EXPECT_TRUE(snapshot->empty());
    EXPECT_EQ(snapshot->epoch(), 0u);
    EXPECT_EQ(registry.current_epoch(), 0u);
}

TEST_F(HookRegistryTest, ChangesInvisibleUntilPublish) {
    registry.register_hook(make_entry(1, 10), one_branch());
    registry.register_hook(make_entry(2, 20), one_branch());
    EXPECT_EQ(registry.pending_changes(), 2u);

    {
        auto snapshot = registry.read(0);
        EXPECT_TRUE(snapshot->empty());
    }

    EXPECT_EQ(registry.publish(), 1u);
    EXPECT_EQ(registry.pending_changes(), 0u);

    auto snapshot = registry.read(0);
    ASSERT_EQ(snapshot->size(), 2u);
    EXPECT_EQ(snapshot->epoch(), 1u);
    EXPECT_EQ(snapshot->hook(0).entry.id, 1u);
    EXPECT_EQ(snapshot->hook(1).entry.id, 2u);
    EXPECT_EQ(snapshot->index_of(2), std::optional<size_t>(1));
    EXPECT_FALSE(snapshot->index_of(3).has_value());
}

TEST_F(HookRegistryTest, SnapshotLayoutIsPaddedStructureOfArrays) {
    registry.register_hook(make_entry(1, 10), one_branch());
    HookEntry wild = make_entry(2, 0);
    wild.predicate_pattern = TermPattern::any();
    registry.register_hook(wild, one_branch());
    registry.register_hook(make_entry(3, 30), one_branch());
    registry.publish();

    auto snapshot = registry.read(0);
    EXPECT_EQ(snapshot->size(), 3u);
    EXPECT_EQ(snapshot->padded_size(), 4u);
    EXPECT_EQ(snapshot->predicate_values()[0], 10u);
    EXPECT_EQ(snapshot->predicate_values()[2], 30u);
    EXPECT_EQ(snapshot->predicate_wildcards()[0], 0u);
    EXPECT_EQ(snapshot->predicate_wildcards()[1], ~uint64_t{0});
    EXPECT_EQ(snapshot->predicate_wildcards()[3], 0u);
}

TEST_F(HookRegistryTest, RejectsInvalidHooks) {
    registry.register_hook(make_entry(1, 10), one_branch());
    EXPECT_THROW(registry.register_hook(make_entry(1, 11), one_branch()), std::invalid_argument);
    EXPECT_THROW(registry.register_hook(make_entry(INVALID_ID, 11), one_branch()), std::invalid_argument);
    EXPECT_THROW(registry.register_hook(make_entry(2, 11), {}), std::invalid_argument);

    std::vector<Branch> too_many(MAX_BRANCHES + 1, one_branch()[0]);
    EXPECT_THROW(registry.register_hook(make_entry(3, 11), too_many), std::invalid_argument);

    Branch no_handler;
    no_handler.name = "empty";
    EXPECT_THROW(registry.register_hook(make_entry(4, 11), {no_handler}), std::invalid_argument);

    EXPECT_EQ(registry.staged_size(), 1u);
}

TEST_F(HookRegistryTest, HookSetIsBounded) {
    for (HookId id = 0; id < MAX_HOOKS; ++id) {
        registry.register_hook(make_entry(id, id), one_branch());
    }
    EXPECT_THROW(registry.register_hook(make_entry(MAX_HOOKS, 0), one_branch()), std::length_error);
    registry.publish();
    EXPECT_EQ(registry.read(0)->size(), MAX_HOOKS);
}

TEST_F(HookRegistryTest, UnregisterTakesEffectAtNextEpoch) {
    registry.register_hook(make_entry(1, 10), one_branch());
    registry.register_hook(make_entry(2, 20), one_branch());
    registry.publish();

    EXPECT_TRUE(registry.unregister_hook(1));
    EXPECT_FALSE(registry.unregister_hook(1));
    EXPECT_EQ(registry.read(0)->size(), 2u);

    registry.publish();
    auto snapshot = registry.read(0);
    ASSERT_EQ(snapshot->size(), 1u);
    EXPECT_EQ(snapshot->hook(0).entry.id, 2u);
}

TEST_F(HookRegistryTest, ReaderKeepsItsSnapshotAcrossPublish) {
    registry.register_hook(make_entry(1, 10), one_branch());
    registry.publish();

    auto held = registry.read(1);
    const HookSnapshot* held_ptr = held.get();

    registry.register_hook(make_entry(2, 20), one_branch());
    registry.publish();
    registry.register_hook(make_entry(3, 30), one_branch());
    registry.publish();

    // Retired snapshots stay alive while reader 1 is inside epoch 1
    EXPECT_EQ(registry.retired_count(), 2u);
    EXPECT_EQ(held->size(), 1u);
    EXPECT_EQ(held.get(), held_ptr);

    EXPECT_EQ(registry.read(0)->size(), 3u);
}

TEST_F(HookRegistryTest, ReclaimAfterReadersLeave) {
    registry.register_hook(make_entry(1, 10), one_branch());
    registry.publish();
    {
        auto held = registry.read(2);
        registry.register_hook(make_entry(2, 20), one_branch());
        registry.publish();
        EXPECT_EQ(registry.retired_count(), 1u);
        EXPECT_EQ(registry.reclaim(), 0u);
    }
    EXPECT_EQ(registry.reclaim(), 1u);
    EXPECT_EQ(registry.retired_count(), 0u);
}

TEST_F(HookRegistryTest, ReadRejectsUnknownReader) {
    EXPECT_THROW(registry.read(4), std::out_of_range);
}

TEST_F(HookRegistryTest, StrikesFollowTheHookAcrossEpochs) {
    registry.register_hook(make_entry(1, 10), one_branch());
    registry.register_hook(make_entry(2, 20), one_branch());
    registry.publish();

    uint16_t slot;
    {
        auto snapshot = registry.read(0);
        snapshot->set_strike(1);
        slot = snapshot->slot_of(1);
        EXPECT_TRUE(registry.has_strike(slot));
    }

    registry.unregister_hook(1);
    registry.register_hook(make_entry(3, 30), one_branch());
    registry.publish();

    auto snapshot = registry.read(0);
    auto index = snapshot->index_of(2);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(snapshot->slot_of(*index), slot);
    EXPECT_TRUE(snapshot->take_strike(*index));
    EXPECT_FALSE(snapshot->take_strike(*index));

    // The new hook did not inherit a strike slot still in use
    auto fresh = snapshot->index_of(3);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_NE(snapshot->slot_of(*fresh), slot);
    EXPECT_FALSE(snapshot->has_strike(*fresh));
}

TEST_F(HookRegistryTest, MatchersNeverObserveMixedHookSet) {
    // Every published set has hooks [0, n) where all predicates equal n.
    // A reader seeing a mix of two sets would see differing predicates.
    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::atomic<uint64_t> reads{0};

    std::vector<std::thread> readers;
    for (size_t r = 0; r < 3; ++r) {
        readers.emplace_back([&, r]() {
            while (!stop.load()) {
                auto snapshot = registry.read(r);
                size_t n = snapshot->size();
                for (size_t i = 0; i < n; ++i) {
                    if (snapshot->predicate_values()[i] != n ||
                        snapshot->hook(i).entry.predicate_pattern.value != n) {
                        torn.fetch_add(1);
                    }
                }
                reads.fetch_add(1);
            }
        });
    }

    for (size_t n = 1; n <= 64; ++n) {
        for (HookId id = 0; id < n; ++id) {
            registry.register_hook(make_entry(id, n), one_branch());
        }
        registry.publish();
        for (HookId id = 0; id < n; ++id) {
            EXPECT_TRUE(registry.unregister_hook(id));
        }
    }

    while (reads.load() == 0) {
        std::this_thread::yield();
    }
    stop.store(true);
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(torn.load(), 0);
    EXPECT_GT(reads.load(), 0u);
    registry.reclaim();
    EXPECT_EQ(registry.retired_count(), 0u);
}
