#include <gtest/gtest.h>
#include <tickhook/tick_governor.hpp>

#include <atomic>
#include <stdexcept>

using namespace tickhook;

namespace {

std::atomic<uint64_t> g_fake_cycles{0};

uint64_t fake_cycles() {
    return g_fake_cycles.load();
}

} // namespace

class TickGovernorTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_fake_cycles.store(1000);
    }

    TickGovernor governor{5, 100, 10, &fake_cycles};
};

TEST_F(TickGovernorTest, TicksRoundUp) {
    EXPECT_EQ(governor.to_ticks(0), 0u);
    EXPECT_EQ(governor.to_ticks(1), 1u);
    EXPECT_EQ(governor.to_ticks(100), 1u);
    EXPECT_EQ(governor.to_ticks(101), 2u);
}

TEST_F(TickGovernorTest, ClassifiesAgainstBudget) {
    Cycles start = governor.now();
    g_fake_cycles.store(start + 500);
    uint64_t ticks = governor.ticks_since(start);
    EXPECT_EQ(ticks, 5u);
    EXPECT_EQ(governor.classify(ticks), BudgetVerdict::WithinBudget);

    g_fake_cycles.store(start + 501);
    ticks = governor.ticks_since(start);
    EXPECT_EQ(ticks, 6u);
    EXPECT_EQ(governor.classify(ticks), BudgetVerdict::OverBudget);
}

TEST_F(TickGovernorTest, BudgetIsRuntimeTunable) {
    EXPECT_EQ(governor.classify(7), BudgetVerdict::OverBudget);
    governor.set_tick_budget(7);
    EXPECT_EQ(governor.tick_budget(), 7u);
    EXPECT_EQ(governor.classify(7), BudgetVerdict::WithinBudget);

    // Tightening the ceiling takes effect on the next classification
    governor.set_tick_budget(3);
    EXPECT_EQ(governor.classify(4), BudgetVerdict::OverBudget);
    EXPECT_THROW(governor.set_tick_budget(0), std::invalid_argument);
}

TEST_F(TickGovernorTest, SyncDeadline) {
    Cycles start = governor.now();
    Cycles deadline = governor.sync_deadline(start);
    EXPECT_EQ(deadline, start + 1000);
    EXPECT_FALSE(governor.expired(deadline));

    g_fake_cycles.store(deadline);
    EXPECT_FALSE(governor.expired(deadline));
    g_fake_cycles.store(deadline + 1);
    EXPECT_TRUE(governor.expired(deadline));

    governor.set_sync_deadline_ticks(2);
    EXPECT_EQ(governor.sync_deadline(start), start + 200);
}

TEST(TickGovernorConstructionTest, RejectsZeroValues) {
    EXPECT_THROW(TickGovernor(0, 100, 10), std::invalid_argument);
    EXPECT_THROW(TickGovernor(5, 0, 10), std::invalid_argument);
}

TEST(TickGovernorConstructionTest, HardwareCyclesAdvance) {
    TickGovernor governor(8, 1024, 64);
    Cycles a = governor.now();
    volatile uint64_t sink = 0;
    for (int i = 0; i < 100000; ++i) {
        sink = sink + static_cast<uint64_t>(i);
    }
    Cycles b = governor.now();
    EXPECT_GE(b, a);
}
