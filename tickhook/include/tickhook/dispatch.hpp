#ifndef TICKHOOK_DISPATCH_HPP
#define TICKHOOK_DISPATCH_HPP

#include <tickhook/hook_registry.hpp>
#include <tickhook/telemetry.hpp>
#include <tickhook/tick_governor.hpp>
#include <tickhook/types.hpp>

#include <lockfree_ring/ring_buffer.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace tickhook {

// =============================================================================
// SyncTable
// =============================================================================

enum class SyncStatus : uint8_t {
    Free = 0,
    Pending = 1,
    Complete = 2,
    Demoted = 3
};

enum class SyncProgress : uint8_t {
    Pending,     // Branch recorded, others outstanding
    Completed,   // Last branch: caller now owns finalization
    Stale        // Duplicate, late or unknown token; no effect
};

// Immutable while the entry is open
struct SyncRecord {
    Event event;
    HookId hook_id = INVALID_ID;
    SlotIndex slot = INVALID_ID;
    uint16_t branches_total = 0;
    uint16_t strike_slot = 0;
    Cycles start = 0;
    uint64_t epoch = 0;
    SpanId span_id = 0;
};

/**
 * Arena of open Synchronization dispatches, addressable by any lane.
 *
 * Each entry's lifecycle lives in one 64-bit word:
 *   [generation:32][completed_mask:16][remaining:8][status:8]
 * Every transition is a CAS on that word, so a branch completion, a deadline
 * demotion and a duplicate completion can race safely: exactly one caller
 * observes the terminal transition and becomes the finalizer. The generation
 * changes on every open, so a token from a recycled entry is always Stale.
 *
 * The finalizer reads record() and must call recycle() when done.
 *
 * An entry opened unarmed belongs to the lane still fanning it out: deadline
 * sweeps and overdue() skip it until arm(). That lane checks the deadline
 * between branches itself, so the partial state it demotes with always
 * includes every branch that already returned.
 */
class SyncTable {
public:
    explicit SyncTable(size_t capacity);

    SyncTable(const SyncTable&) = delete;
    SyncTable& operator=(const SyncTable&) = delete;

    // nullopt when every entry is in use
    std::optional<SyncToken> open(const SyncRecord& record, Cycles deadline, bool armed = true);

    // Hands an unarmed pending entry over to deadline sweeps. False if the
    // entry is no longer pending under this token.
    bool arm(SyncToken token);

    SyncProgress complete_branch(SyncToken token, uint32_t branch);

    // Pending -> Demoted. Returns the partial state for the caller that made
    // the transition, nullopt for everyone else (already demoted, complete,
    // or stale). Calling it twice is harmless.
    std::optional<PartialDispatchState> demote(SyncToken token);

    // Demotes every pending entry whose deadline is before now.
    // on_demoted(token, record, partial) runs once per demoted entry; it owns
    // the entry and must recycle it.
    template<typename F>
    size_t expire_overdue(Cycles now, F&& on_demoted) {
        if (open_count_.load(std::memory_order_acquire) == 0) {
            return 0;
        }
        size_t expired = 0;
        for (uint32_t i = 0; i < capacity_; ++i) {
            uint64_t word = entries_[i].state.load(std::memory_order_acquire);
            if (status_of(word) != SyncStatus::Pending || unarmed(word)) {
                continue;
            }
            if (entries_[i].deadline.load(std::memory_order_acquire) >= now) {
                continue;
            }
            SyncToken token{i, generation_of(word)};
            auto partial = demote(token);
            if (partial) {
                ++expired;
                on_demoted(token, entries_[i].record, *partial);
            }
        }
        return expired;
    }

    bool overdue(SyncToken token, Cycles now) const;

    SyncStatus status(SyncToken token) const;
    const SyncRecord& record(SyncToken token) const { return entries_[token.index].record; }
    Cycles deadline(SyncToken token) const {
        return entries_[token.index].deadline.load(std::memory_order_acquire);
    }

    // Complete/Demoted -> Free; only the finalizer calls this
    bool recycle(SyncToken token);

    size_t capacity() const { return capacity_; }
    size_t open_count() const { return open_count_.load(std::memory_order_relaxed); }

    static PartialDispatchState partial_of(uint64_t word, const SyncRecord& record);

private:
    struct alignas(64) Entry {
        std::atomic<uint64_t> state{0};
        std::atomic<Cycles> deadline{0};
        SyncRecord record;
    };

    // Shares the status byte; set while the opening lane is still fanning out
    static constexpr uint64_t UNARMED = 0x80;

    static uint64_t pack(uint32_t generation, uint16_t mask, uint8_t remaining, SyncStatus status) {
        return (static_cast<uint64_t>(generation) << 32) |
               (static_cast<uint64_t>(mask) << 16) |
               (static_cast<uint64_t>(remaining) << 8) |
               static_cast<uint64_t>(status);
    }
    static uint32_t generation_of(uint64_t w) { return static_cast<uint32_t>(w >> 32); }
    static uint16_t mask_of(uint64_t w) { return static_cast<uint16_t>((w >> 16) & 0xFFFF); }
    static uint8_t remaining_of(uint64_t w) { return static_cast<uint8_t>((w >> 8) & 0xFF); }
    static SyncStatus status_of(uint64_t w) { return static_cast<SyncStatus>(w & 0x7F); }
    static bool unarmed(uint64_t w) { return (w & UNARMED) != 0; }

    bool owns(SyncToken token) const {
        return token.valid() && token.index < capacity_;
    }

    const uint32_t capacity_;
    std::unique_ptr<Entry[]> entries_;
    lockfree::RingBuffer<uint32_t> free_;
    std::atomic<size_t> open_count_{0};
};

// =============================================================================
// DispatchOperator
// =============================================================================

struct DispatchContext {
    SlotIndex slot = INVALID_ID;
    Cycles start = 0;
    Cycles deadline = 0;     // Synchronization only
    uint64_t epoch = 0;
    SpanId span_id = 0;
};

struct DispatchOutcome {
    // Ok: dispatch finished (for Synchronization, completed inline)
    // Pending: Synchronization still open, token is live
    // Demoted: deadline passed during fan-out; caller owns the entry
    // Stale: entry left Pending under someone else during fan-out
    // Unmatched: no branch confirmed (Discriminator or ParallelSplit)
    // PoolExhausted: no free Synchronization entry
    Status status = Status::Ok;
    OperationKind kind = OperationKind::ParallelSplit;
    uint16_t fired = 0;
    uint16_t failed = 0;
    uint16_t skipped = 0;        // Guard rejected (or short-circuited)
    SyncToken token;
    PartialDispatchState partial;    // Demoted only
};

/**
 * Applies a hook's operation kind to one matched event.
 *
 * - Discriminator: guards are evaluated in branch order; the first branch to
 *   confirm fires and every later branch is short-circuited.
 * - ParallelSplit: every confirming branch fires, independently. No branch
 *   confirming is Unmatched.
 * - Synchronization: opens a SyncTable entry, then fans out. Done and Failed
 *   count as completions immediately, a guard rejection counts as a skipped
 *   completion, and Deferred branches report later through the token. The
 *   deadline is checked before every branch after the first; once it has
 *   passed no further branch runs.
 *
 * Selection depends only on the hook, so the same event and hook set always
 * produce the same fan-out. A std::exception escaping a handler is logged and
 * counted as a failed branch. One escaping a guard is logged and counted too:
 * the Discriminator treats the branch as unconfirmed, the other kinds as
 * failed.
 */
class DispatchOperator {
public:
    DispatchOperator(SyncTable& table, Telemetry& telemetry, const TickGovernor& governor)
        : table_(table), telemetry_(telemetry), governor_(governor) {}

    DispatchOutcome dispatch(const Event& event, const RegisteredHook& hook,
                             const DispatchContext& context);

private:
    DispatchOutcome discriminate(const Event& event, const RegisteredHook& hook);
    DispatchOutcome split(const Event& event, const RegisteredHook& hook);
    DispatchOutcome synchronize(const Event& event, const RegisteredHook& hook,
                                const DispatchContext& context);

    enum class GuardVerdict { Confirmed, Rejected, Faulted };

    GuardVerdict evaluate_guard(const Branch& branch, const Event& event, HookId hook_id);
    BranchOutcome invoke(const Branch& branch, const BranchContext& context);

    // Stops the fan-out of an open entry: demotes it if the deadline passed,
    // or reports it Stale if it already left Pending. False to keep going.
    bool interrupted(SyncToken token, Cycles deadline, DispatchOutcome& outcome);

    SyncTable& table_;
    Telemetry& telemetry_;
    const TickGovernor& governor_;
};

} // namespace tickhook

#endif // TICKHOOK_DISPATCH_HPP
