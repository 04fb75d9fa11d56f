#include <tickhook/dispatch.hpp>
#include <tickhook/debug_log.hpp>

#include <exception>
#include <stdexcept>

namespace tickhook {

namespace {

size_t next_power_of_two(size_t n) {
    size_t p = 2;
    while (p < n) {
        p <<= 1;
    }
    return p;
}

} // namespace

// =============================================================================
// SyncTable
// =============================================================================

SyncTable::SyncTable(size_t capacity)
    : capacity_(static_cast<uint32_t>(capacity))
    , free_(next_power_of_two(capacity)) {
    if (capacity == 0 || capacity >= INVALID_ID) {
        throw std::invalid_argument("SyncTable capacity out of range");
    }
    entries_ = std::make_unique<Entry[]>(capacity_);
    for (uint32_t i = 0; i < capacity_; ++i) {
        if (!free_.try_enqueue(i)) {
            throw std::logic_error("SyncTable free list smaller than table");
        }
    }
}

std::optional<SyncToken> SyncTable::open(const SyncRecord& record, Cycles deadline, bool armed) {
    if (record.branches_total == 0 || record.branches_total > MAX_BRANCHES) {
        return std::nullopt;
    }
    auto index = free_.try_dequeue();
    if (!index) {
        return std::nullopt;
    }

    Entry& entry = entries_[*index];
    uint64_t word = entry.state.load(std::memory_order_acquire);
    uint32_t generation = generation_of(word) + 1;

    entry.record = record;
    entry.deadline.store(deadline, std::memory_order_relaxed);
    open_count_.fetch_add(1, std::memory_order_relaxed);

    // Publishes record and deadline to whoever loads the Pending word
    word = pack(generation, 0, static_cast<uint8_t>(record.branches_total),
                         SyncStatus::Pending);
    entry.state.store(armed ? word : word | UNARMED, std::memory_order_release);
    return SyncToken{*index, generation};
}

bool SyncTable::arm(SyncToken token) {
    if (!owns(token)) {
        return false;
    }
    Entry& entry = entries_[token.index];
    uint64_t word = entry.state.load(std::memory_order_acquire);

    for (;;) {
        if (generation_of(word) != token.generation || status_of(word) != SyncStatus::Pending) {
            return false;
        }
        if (!unarmed(word)) {
            return true;
        }
        if (entry.state.compare_exchange_weak(word, word & ~UNARMED,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            return true;
        }
    }
}

SyncProgress SyncTable::complete_branch(SyncToken token, uint32_t branch) {
    if (!owns(token) || branch >= MAX_BRANCHES) {
        return SyncProgress::Stale;
    }
    Entry& entry = entries_[token.index];
    uint64_t word = entry.state.load(std::memory_order_acquire);

    for (;;) {
        if (generation_of(word) != token.generation || status_of(word) != SyncStatus::Pending) {
            return SyncProgress::Stale;
        }
        uint16_t mask = mask_of(word);
        uint16_t bit = static_cast<uint16_t>(1u << branch);
        if ((mask & bit) != 0) {
            return SyncProgress::Stale;
        }
        uint8_t remaining = static_cast<uint8_t>(remaining_of(word) - 1);
        SyncStatus next = remaining == 0 ? SyncStatus::Complete : SyncStatus::Pending;
        uint64_t desired = pack(token.generation, static_cast<uint16_t>(mask | bit), remaining, next) |
                           (word & UNARMED);

        if (entry.state.compare_exchange_weak(word, desired,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            if (next == SyncStatus::Complete) {
                open_count_.fetch_sub(1, std::memory_order_relaxed);
                return SyncProgress::Completed;
            }
            return SyncProgress::Pending;
        }
    }
}

std::optional<PartialDispatchState> SyncTable::demote(SyncToken token) {
    if (!owns(token)) {
        return std::nullopt;
    }
    Entry& entry = entries_[token.index];
    uint64_t word = entry.state.load(std::memory_order_acquire);

    for (;;) {
        if (generation_of(word) != token.generation || status_of(word) != SyncStatus::Pending) {
            return std::nullopt;
        }
        uint64_t desired = pack(token.generation, mask_of(word), remaining_of(word),
                                SyncStatus::Demoted);
        if (entry.state.compare_exchange_weak(word, desired,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            open_count_.fetch_sub(1, std::memory_order_relaxed);
            return partial_of(word, entry.record);
        }
    }
}

bool SyncTable::overdue(SyncToken token, Cycles now) const {
    if (!owns(token)) {
        return false;
    }
    const Entry& entry = entries_[token.index];
    uint64_t word = entry.state.load(std::memory_order_acquire);
    return generation_of(word) == token.generation &&
           status_of(word) == SyncStatus::Pending &&
           !unarmed(word) &&
           entry.deadline.load(std::memory_order_acquire) < now;
}

SyncStatus SyncTable::status(SyncToken token) const {
    if (!owns(token)) {
        return SyncStatus::Free;
    }
    uint64_t word = entries_[token.index].state.load(std::memory_order_acquire);
    if (generation_of(word) != token.generation) {
        return SyncStatus::Free;
    }
    return status_of(word);
}

bool SyncTable::recycle(SyncToken token) {
    if (!owns(token)) {
        return false;
    }
    Entry& entry = entries_[token.index];
    uint64_t word = entry.state.load(std::memory_order_acquire);
    SyncStatus current = status_of(word);
    if (generation_of(word) != token.generation ||
        (current != SyncStatus::Complete && current != SyncStatus::Demoted)) {
        return false;
    }
    if (!entry.state.compare_exchange_strong(word, pack(token.generation, 0, 0, SyncStatus::Free),
                                             std::memory_order_acq_rel)) {
        return false;
    }
    // Cannot fail: at most capacity indices exist and the ring holds them all
    if (!free_.try_enqueue(token.index)) {
        TICKHOOK_LOG_ERROR("SyncTable free list rejected entry %u", token.index);
        return false;
    }
    return true;
}

PartialDispatchState SyncTable::partial_of(uint64_t word, const SyncRecord& record) {
    PartialDispatchState partial;
    partial.present = true;
    partial.hook_id = record.hook_id;
    partial.operation_kind = OperationKind::Synchronization;
    partial.branches_total = record.branches_total;
    partial.branches_completed = static_cast<uint16_t>(record.branches_total - remaining_of(word));
    partial.completed_mask = mask_of(word);
    return partial;
}

// =============================================================================
// DispatchOperator
// =============================================================================

DispatchOperator::GuardVerdict DispatchOperator::evaluate_guard(const Branch& branch,
                                                                const Event& event,
                                                                HookId hook_id) {
    if (!branch.guard) {
        return GuardVerdict::Confirmed;
    }
    try {
        return branch.guard(event) ? GuardVerdict::Confirmed : GuardVerdict::Rejected;
    } catch (const std::exception& e) {
        TICKHOOK_LOG_ERROR("Guard of branch '%s' of hook %u threw: %s",
                           branch.name.c_str(), hook_id, e.what());
        telemetry_.record_branch_failure();
        return GuardVerdict::Faulted;
    }
}

BranchOutcome DispatchOperator::invoke(const Branch& branch, const BranchContext& context) {
    try {
        return branch.handler(context);
    } catch (const std::exception& e) {
        TICKHOOK_LOG_ERROR("Branch '%s' of hook %u threw: %s",
                           branch.name.c_str(), context.hook_id, e.what());
        return BranchOutcome::Failed;
    }
}

bool DispatchOperator::interrupted(SyncToken token, Cycles deadline, DispatchOutcome& outcome) {
    if (table_.status(token) != SyncStatus::Pending) {
        outcome.status = Status::Stale;
        return true;
    }
    if (!governor_.expired(deadline)) {
        return false;
    }
    if (auto partial = table_.demote(token)) {
        outcome.status = Status::Demoted;
        outcome.partial = *partial;
    } else {
        // Deferred branches completed it first
        outcome.status = Status::Stale;
    }
    return true;
}

DispatchOutcome DispatchOperator::dispatch(const Event& event, const RegisteredHook& hook,
                                           const DispatchContext& context) {
    switch (hook.entry.operation_kind) {
        case OperationKind::Discriminator:
            return discriminate(event, hook);
        case OperationKind::ParallelSplit:
            return split(event, hook);
        case OperationKind::Synchronization:
            return synchronize(event, hook, context);
    }
    // Unreachable for a registered hook
    DispatchOutcome outcome;
    outcome.status = Status::Unmatched;
    return outcome;
}

DispatchOutcome DispatchOperator::discriminate(const Event& event, const RegisteredHook& hook) {
    DispatchOutcome outcome;
    outcome.kind = OperationKind::Discriminator;
    bool satisfied = false;

    const size_t n = hook.branches.size();
    for (size_t i = 0; i < n; ++i) {
        const Branch& branch = hook.branches[i];
        if (evaluate_guard(branch, event, hook.entry.id) != GuardVerdict::Confirmed) {
            continue;
        }
        satisfied = true;
        BranchContext ctx{event, hook.entry.id, static_cast<uint32_t>(i), SyncToken{}};
        if (invoke(branch, ctx) == BranchOutcome::Failed) {
            ++outcome.failed;
            telemetry_.record_branch_failure();
        } else {
            ++outcome.fired;
        }
        outcome.skipped = static_cast<uint16_t>(n - 1);
        break;
    }

    if (!satisfied) {
        outcome.status = Status::Unmatched;
        outcome.skipped = static_cast<uint16_t>(n);
        telemetry_.record_discriminator_unsatisfied();
        return outcome;
    }
    telemetry_.record_dispatch(OperationKind::Discriminator);
    return outcome;
}

DispatchOutcome DispatchOperator::split(const Event& event, const RegisteredHook& hook) {
    DispatchOutcome outcome;
    outcome.kind = OperationKind::ParallelSplit;

    for (size_t i = 0; i < hook.branches.size(); ++i) {
        const Branch& branch = hook.branches[i];
        GuardVerdict verdict = evaluate_guard(branch, event, hook.entry.id);
        if (verdict == GuardVerdict::Rejected) {
            ++outcome.skipped;
            continue;
        }
        if (verdict == GuardVerdict::Faulted) {
            ++outcome.failed;
            continue;
        }
        BranchContext ctx{event, hook.entry.id, static_cast<uint32_t>(i), SyncToken{}};
        if (invoke(branch, ctx) == BranchOutcome::Failed) {
            ++outcome.failed;
            telemetry_.record_branch_failure();
        } else {
            ++outcome.fired;
        }
    }

    if (outcome.fired == 0 && outcome.failed == 0) {
        outcome.status = Status::Unmatched;
        telemetry_.record_split_unconfirmed();
        return outcome;
    }
    telemetry_.record_dispatch(OperationKind::ParallelSplit);
    return outcome;
}

DispatchOutcome DispatchOperator::synchronize(const Event& event, const RegisteredHook& hook,
                                              const DispatchContext& context) {
    DispatchOutcome outcome;
    outcome.kind = OperationKind::Synchronization;

    SyncRecord record;
    record.event = event;
    record.hook_id = hook.entry.id;
    record.slot = context.slot;
    record.branches_total = static_cast<uint16_t>(hook.branches.size());
    record.strike_slot = hook.strike_slot;
    record.start = context.start;
    record.epoch = context.epoch;
    record.span_id = context.span_id;

    // Unarmed: no other lane may expire it while branches are still running here
    auto token = table_.open(record, context.deadline, false);
    if (!token) {
        outcome.status = Status::PoolExhausted;
        return outcome;
    }
    outcome.token = *token;
    telemetry_.record_sync_opened();
    telemetry_.record_dispatch(OperationKind::Synchronization);

    bool completed = false;
    for (size_t i = 0; i < hook.branches.size(); ++i) {
        if (i > 0 && interrupted(*token, context.deadline, outcome)) {
            return outcome;
        }
        const Branch& branch = hook.branches[i];
        BranchOutcome result = BranchOutcome::Done;
        switch (evaluate_guard(branch, event, hook.entry.id)) {
            case GuardVerdict::Confirmed: {
                BranchContext ctx{event, hook.entry.id, static_cast<uint32_t>(i), *token};
                result = invoke(branch, ctx);
                if (result == BranchOutcome::Failed) {
                    ++outcome.failed;
                    telemetry_.record_branch_failure();
                } else {
                    ++outcome.fired;
                }
                break;
            }
            case GuardVerdict::Rejected:
                ++outcome.skipped;
                break;
            case GuardVerdict::Faulted:
                ++outcome.failed;
                result = BranchOutcome::Failed;
                break;
        }

        if (result != BranchOutcome::Deferred &&
            table_.complete_branch(*token, static_cast<uint32_t>(i)) == SyncProgress::Completed) {
            completed = true;
        }
    }

    if (completed) {
        outcome.status = Status::Ok;
        return outcome;
    }
    if (interrupted(*token, context.deadline, outcome)) {
        return outcome;
    }
    // False only when deferred branches completed it meanwhile; the completer finalizes
    table_.arm(*token);
    outcome.status = Status::Pending;
    return outcome;
}

} // namespace tickhook
