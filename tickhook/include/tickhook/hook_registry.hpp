#ifndef TICKHOOK_HOOK_REGISTRY_HPP
#define TICKHOOK_HOOK_REGISTRY_HPP

#include <tickhook/types.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tickhook {

// =============================================================================
// Branches
// =============================================================================

enum class BranchOutcome : uint8_t {
    Done,       // Branch finished
    Failed,     // Branch finished unsuccessfully (still accounted for)
    Deferred    // Synchronization only: completion reported later by token
};

struct BranchContext {
    const Event& event;
    HookId hook_id;
    uint32_t branch_index;
    SyncToken token;     // Valid only for Synchronization dispatch
};

// Guard decides whether the branch confirms the event; empty means always.
using BranchGuard = std::function<bool(const Event&)>;
using BranchHandler = std::function<BranchOutcome(const BranchContext&)>;

struct Branch {
    std::string name;
    BranchGuard guard;
    BranchHandler handler;
};

struct RegisteredHook {
    HookEntry entry;
    std::vector<Branch> branches;
    uint16_t strike_slot = 0;    // Assigned by the registry, stable across epochs

    // Full pattern check: subject/object confirm after the predicate screen
    bool confirms(const Event& event) const {
        return entry.predicate_pattern.matches(event.predicate) &&
               (!entry.subject_pattern || entry.subject_pattern->matches(event.subject)) &&
               (!entry.object_pattern || entry.object_pattern->matches(event.object));
    }
};

// =============================================================================
// HookSnapshot
// =============================================================================

/**
 * Immutable hook set for one epoch.
 *
 * Predicates are laid out structure-of-arrays and padded to a multiple of
 * SCREEN_GROUP so vector screens never read past the end. Padding entries
 * are never reported: screens truncate to size().
 *
 * wildcard_words holds all-ones for a wildcard predicate and zero otherwise,
 * so a screen can OR it straight into its comparison mask.
 */
class HookSnapshot {
public:
    static constexpr size_t SCREEN_GROUP = 4;

    // Without a strike array the snapshot owns one, indexed by hook position
    HookSnapshot(uint64_t epoch, std::vector<RegisteredHook> hooks,
                 std::atomic<uint8_t>* strikes = nullptr);

    HookSnapshot(const HookSnapshot&) = delete;
    HookSnapshot& operator=(const HookSnapshot&) = delete;

    uint64_t epoch() const { return epoch_; }
    size_t size() const { return hooks_.size(); }
    bool empty() const { return hooks_.empty(); }
    size_t padded_size() const { return predicate_values_.size(); }

    const Term* predicate_values() const { return predicate_values_.data(); }
    const uint64_t* predicate_wildcards() const { return wildcard_words_.data(); }

    const RegisteredHook& hook(size_t index) const { return hooks_[index]; }
    std::optional<size_t> index_of(HookId id) const;

    // Budget strikes: set by an over-budget completion, consumed by the next
    // event that matches the hook
    void set_strike(size_t index) const {
        strikes_[slot_of(index)].store(1, std::memory_order_relaxed);
    }
    bool take_strike(size_t index) const {
        return strikes_[slot_of(index)].exchange(0, std::memory_order_relaxed) != 0;
    }
    bool has_strike(size_t index) const {
        return strikes_[slot_of(index)].load(std::memory_order_relaxed) != 0;
    }
    uint16_t slot_of(size_t index) const {
        return owned_strikes_ ? static_cast<uint16_t>(index) : hooks_[index].strike_slot;
    }

private:
    uint64_t epoch_;
    std::vector<RegisteredHook> hooks_;
    std::vector<Term> predicate_values_;
    std::vector<uint64_t> wildcard_words_;
    std::unique_ptr<std::atomic<uint8_t>[]> owned_strikes_;
    std::atomic<uint8_t>* strikes_;
};

// =============================================================================
// HookRegistry
// =============================================================================

/**
 * Control-plane owner of the hook set.
 *
 * register_hook / unregister_hook stage changes; nothing becomes visible to
 * lanes until publish() builds a fresh HookSnapshot, bumps the epoch and
 * swaps the active pointer. Lanes read through a ReadGuard, which announces
 * the epoch it entered in a per-reader slot. A retired snapshot is deleted
 * only once every reader is idle or has announced a later epoch.
 *
 * Control-plane calls serialize on an internal mutex. read() is wait-free:
 * two atomic stores and two loads.
 */
class HookRegistry {
public:
    class ReadGuard {
    public:
        ReadGuard(ReadGuard&& other) noexcept
            : registry_(other.registry_), reader_(other.reader_), snapshot_(other.snapshot_) {
            other.registry_ = nullptr;
            other.snapshot_ = nullptr;
        }
        ReadGuard(const ReadGuard&) = delete;
        ReadGuard& operator=(const ReadGuard&) = delete;
        ReadGuard& operator=(ReadGuard&&) = delete;

        ~ReadGuard() {
            if (registry_) {
                registry_->leave(reader_);
            }
        }

        const HookSnapshot& operator*() const { return *snapshot_; }
        const HookSnapshot* operator->() const { return snapshot_; }
        const HookSnapshot* get() const { return snapshot_; }

    private:
        friend class HookRegistry;
        ReadGuard(const HookRegistry* registry, size_t reader, const HookSnapshot* snapshot)
            : registry_(registry), reader_(reader), snapshot_(snapshot) {}

        const HookRegistry* registry_;
        size_t reader_;
        const HookSnapshot* snapshot_;
    };

    explicit HookRegistry(size_t max_readers);
    ~HookRegistry();

    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;

    // Throws std::invalid_argument on a bad or duplicate hook and
    // std::length_error when the set would exceed MAX_HOOKS
    void register_hook(HookEntry entry, std::vector<Branch> branches);

    // Returns false if no staged hook has this id
    bool unregister_hook(HookId id);

    // Makes staged changes visible. Returns the new epoch.
    uint64_t publish();

    // Strike flags by RegisteredHook::strike_slot; shared by every snapshot
    void set_strike(uint16_t slot) { strikes_[slot].store(1, std::memory_order_relaxed); }
    bool has_strike(uint16_t slot) const { return strikes_[slot].load(std::memory_order_relaxed) != 0; }

    // Reader ids are [0, max_readers); one thread per reader id at a time
    ReadGuard read(size_t reader) const;

    // Frees retired snapshots no reader can still observe. Returns count freed.
    size_t reclaim();

    size_t retired_count() const;
    size_t pending_changes() const;
    size_t staged_size() const;
    uint64_t current_epoch() const { return epoch_.load(std::memory_order_seq_cst); }
    size_t max_readers() const { return max_readers_; }

private:
    static constexpr uint64_t IDLE = UINT64_MAX;

    struct alignas(64) ReaderSlot {
        std::atomic<uint64_t> epoch{IDLE};
    };

    void leave(size_t reader) const {
        readers_[reader].epoch.store(IDLE, std::memory_order_release);
    }

    size_t reclaim_locked();
    uint16_t allocate_strike_slot() const;

    const size_t max_readers_;
    std::unique_ptr<ReaderSlot[]> readers_;
    std::unique_ptr<std::atomic<uint8_t>[]> strikes_;

    alignas(64) std::atomic<const HookSnapshot*> current_{nullptr};
    alignas(64) std::atomic<uint64_t> epoch_{0};

    mutable std::mutex control_mutex_;
    std::vector<RegisteredHook> staged_;
    size_t pending_changes_ = 0;

    // (epoch from which the snapshot is unreachable, snapshot)
    std::vector<std::pair<uint64_t, std::unique_ptr<const HookSnapshot>>> retired_;
};

} // namespace tickhook

#endif // TICKHOOK_HOOK_REGISTRY_HPP
