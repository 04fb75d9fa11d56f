#include <tickhook/engine.hpp>
#include <tickhook/cpu_features.hpp>
#include <tickhook/debug_log.hpp>

#include <optional>
#include <thread>

namespace tickhook {

namespace {

EngineConfig checked(EngineConfig config) {
    config.validate();
    return config;
}

} // namespace

PredicateMatcher Engine::make_matcher(const EngineConfig& config) {
    if (config.screen_override) {
        MatcherBackend label = config.matcher_backend == MatcherBackend::Auto
            ? PredicateMatcher::best_available()
            : config.matcher_backend;
        return PredicateMatcher(label, config.screen_override, config.differential_check);
    }
    return PredicateMatcher(config.matcher_backend, config.differential_check);
}

Engine::Engine(EngineConfig config)
    : config_(checked(std::move(config)))
    , pool_(config_.lanes, config_.local_cache_slots, config_.shared_slots,
            config_.exhaustion_policy, config_.spin_limit)
    , lane_state_(std::make_unique<LaneState[]>(config_.lanes))
    , registry_(config_.lanes)
    , matcher_(make_matcher(config_))
    , governor_(config_.tick_budget, config_.cycles_per_tick,
                config_.sync_deadline_ticks, config_.cycle_source)
    , sync_table_(config_.sync_table_capacity)
    , dispatcher_(sync_table_, telemetry_, governor_)
    , receipts_(config_.receipt_capacity, config_.receipt_policy)
    , warm_path_(config_.warm_path_capacity)
    , lanes_(config_.lanes) {
    rings_.reserve(config_.lanes);
    for (size_t i = 0; i < config_.lanes; ++i) {
        rings_.emplace_back(std::make_unique<lockfree::RingBuffer<Event>>(config_.ring_capacity));
        lane_state_[i].receipts.reserve(MAX_HOOKS);
    }

    TICKHOOK_LOG_DEBUG("Engine: %zu lanes, ring %zu, pool %zu, budget %llu ticks, matcher %s%s",
                       config_.lanes, config_.ring_capacity, pool_.capacity(),
                       static_cast<unsigned long long>(config_.tick_budget),
                       matcher_backend_name(matcher_.backend()),
                       matcher_.self_check() ? " (self-check)" : "");
}

Engine::~Engine() {
    stop();
}

uint64_t Engine::publish() {
    uint64_t epoch = registry_.publish();
    TICKHOOK_LOG_DEBUG("Engine: hook epoch %llu active", static_cast<unsigned long long>(epoch));
    return epoch;
}

void Engine::start() {
    CpuFeatures::get().log_features();
    lanes_.start([this](size_t lane) {
        return lane_step(static_cast<LaneId>(lane));
    });
}

void Engine::stop() {
    lanes_.shutdown();
    if (lanes_.has_error()) {
        TICKHOOK_LOG_ERROR("Engine: lane stopped with %s: %s",
                           lanes_.get_error_description(), lanes_.get_error_message().c_str());
    }
}

Status Engine::submit(const Event& event, size_t producer_id) {
    lockfree::RingBuffer<Event>& ring = *rings_[producer_id % rings_.size()];
    if (!ring.try_enqueue(event)) {
        telemetry_.record_ring_full();
        return Status::Full;
    }
    telemetry_.record_submitted();
    return Status::Ok;
}

bool Engine::lane_step(LaneId lane) {
    bool worked = process_one(lane);
    LaneState& state = lane_state_[lane];
    if (!worked || ++state.steps % EXPIRY_INTERVAL == 0) {
        if (expire_overdue(lane) > 0) {
            worked = true;
        }
    }
    return worked;
}

bool Engine::process_one(LaneId lane) {
    std::optional<Event> next = rings_[lane]->try_dequeue();
    if (!next) {
        return false;
    }
    Cycles start = governor_.now();

    BufferSlot* slot = pool_.acquire(lane);
    if (!slot) {
        demote(*next, DemotionReason::PoolExhausted, PartialDispatchState{},
               registry_.current_epoch());
        telemetry_.record_processed();
        return true;
    }
    if (!pool_.mark_in_use(*slot)) {
        TICKHOOK_LOG_ERROR("Engine: slot %u not in Acquired state", slot->index());
    }
    slot->event = *next;
    slot->holds.store(1, std::memory_order_release);

    slot->match.reset(slot->event.id);
    slot->match.epoch = registry_.current_epoch();
    try {
        auto snapshot = registry_.read(lane);
        MatchResult& match = slot->match;
        match.epoch = snapshot->epoch();

        HookMask candidates;
        Status status = matcher_.match(slot->event, *snapshot, match, candidates);
        telemetry_.record_cardinality(candidates.popcount());

        switch (status) {
            case Status::Ok:
                dispatch_matched(slot->event, *slot, *snapshot, start, lane);
                break;
            case Status::MatchAmbiguous:
                telemetry_.record_match_ambiguous();
                demote(slot->event, DemotionReason::AmbiguousMatch, PartialDispatchState{},
                       snapshot->epoch());
                break;
            default:
                telemetry_.record_unmatched();
                break;
        }
    } catch (const std::exception& e) {
        // Whatever the lane had not finished goes to the warm path whole
        TICKHOOK_LOG_ERROR("Engine: lane %u faulted on event %llu: %s",
                           lane, static_cast<unsigned long long>(slot->event.id), e.what());
        telemetry_.record_lane_fault();
        demote(slot->event, DemotionReason::BudgetExceeded, PartialDispatchState{},
               slot->match.epoch);
    }

    release_hold(slot->index(), lane);
    telemetry_.record_processed();
    return true;
}

void Engine::dispatch_matched(const Event& event, BufferSlot& slot, const HookSnapshot& snapshot,
                              Cycles start, LaneId lane) {
    MatchResult& match = slot.match;

    // A hook that overran its budget last time sends this event to the warm
    // path instead; every matched strike is consumed
    bool struck = false;
    for (uint16_t i = 0; i < match.count; ++i) {
        if (snapshot.take_strike(match.matched_indices[i])) {
            struck = true;
        }
    }
    if (struck) {
        demote(event, DemotionReason::BudgetExceeded, PartialDispatchState{}, snapshot.epoch());
        return;
    }

    std::vector<PendingReceipt>& pending = lane_state_[lane].receipts;
    pending.clear();

    DispatchContext context;
    context.slot = slot.index();
    context.start = start;
    context.deadline = governor_.sync_deadline(start);
    context.epoch = snapshot.epoch();

    for (uint16_t i = 0; i < match.count; ++i) {
        uint16_t index = match.matched_indices[i];
        const RegisteredHook& hook = snapshot.hook(index);
        const bool sync = hook.entry.operation_kind == OperationKind::Synchronization;
        context.span_id = receipts_.next_span_id();

        // An open Synchronization keeps the slot alive past this lane step
        if (sync) {
            slot.holds.fetch_add(1, std::memory_order_acq_rel);
        }

        DispatchOutcome outcome = dispatcher_.dispatch(event, hook, context);

        switch (outcome.status) {
            case Status::Ok: {
                uint32_t lanes = static_cast<uint32_t>(outcome.fired + outcome.failed);
                if (sync) {
                    lanes = static_cast<uint32_t>(hook.branches.size());
                    telemetry_.record_sync_completed();
                    if (!sync_table_.recycle(outcome.token)) {
                        TICKHOOK_LOG_ERROR("Engine: could not recycle sync entry %u",
                                           outcome.token.index);
                    }
                    release_hold(slot.index(), lane);
                }
                pending.push_back(PendingReceipt{hook.entry.id, outcome.kind, lanes,
                                                 context.span_id, index});
                break;
            }
            case Status::Pending:
                // Finalized by complete_branch or expire_overdue
                break;
            case Status::Demoted:
                // Deadline passed between branches; no later branch ran
                finalize_demoted(outcome.token, sync_table_.record(outcome.token),
                                 outcome.partial, lane);
                break;
            case Status::Stale:
                // Finalized by whichever caller took the entry out of Pending
                break;
            case Status::PoolExhausted: {
                release_hold(slot.index(), lane);
                PartialDispatchState partial;
                partial.present = true;
                partial.hook_id = hook.entry.id;
                partial.operation_kind = OperationKind::Synchronization;
                partial.branches_total = static_cast<uint16_t>(hook.branches.size());
                demote(event, DemotionReason::PoolExhausted, partial, snapshot.epoch());
                break;
            }
            default:
                // No confirming branch; a Discriminator is counted by the operator
                break;
        }
    }

    uint64_t ticks = governor_.ticks_since(start);
    match.tick_count = ticks;
    const bool violation = governor_.classify(ticks) == BudgetVerdict::OverBudget;
    if (violation && !pending.empty()) {
        telemetry_.record_budget_violation();
    }

    for (const PendingReceipt& receipt : pending) {
        if (violation) {
            snapshot.set_strike(receipt.index);
        }
        receipts_.emit(event, receipt.hook_id, receipt.kind, ticks, receipt.lanes,
                       receipt.span_id, violation);
    }
}

size_t Engine::expire_overdue(LaneId lane) {
    return sync_table_.expire_overdue(
        governor_.now(),
        [this, lane](SyncToken token, const SyncRecord& record, const PartialDispatchState& partial) {
            finalize_demoted(token, record, partial, lane);
        });
}

Status Engine::complete_branch(SyncToken token, uint32_t branch) {
    if (sync_table_.overdue(token, governor_.now())) {
        if (auto partial = sync_table_.demote(token)) {
            finalize_demoted(token, sync_table_.record(token), *partial, NO_LANE);
            return Status::Demoted;
        }
    }

    switch (sync_table_.complete_branch(token, branch)) {
        case SyncProgress::Completed:
            finalize_completed(token, NO_LANE);
            return Status::Ok;
        case SyncProgress::Pending:
            return Status::Pending;
        case SyncProgress::Stale:
            break;
    }
    telemetry_.record_stale_completion();
    return Status::Stale;
}

void Engine::finalize_completed(SyncToken token, LaneId lane) {
    const SyncRecord record = sync_table_.record(token);

    uint64_t ticks = governor_.ticks_since(record.start);
    const bool violation = governor_.classify(ticks) == BudgetVerdict::OverBudget;
    if (violation) {
        telemetry_.record_budget_violation();
        registry_.set_strike(record.strike_slot);
    }
    receipts_.emit(record.event, record.hook_id, OperationKind::Synchronization, ticks,
                   record.branches_total, record.span_id, violation);
    telemetry_.record_sync_completed();

    if (!sync_table_.recycle(token)) {
        TICKHOOK_LOG_ERROR("Engine: could not recycle sync entry %u", token.index);
    }
    release_hold(record.slot, lane);
}

void Engine::finalize_demoted(SyncToken token, const SyncRecord& record,
                              const PartialDispatchState& partial, LaneId lane) {
    // record belongs to the entry and is reused once recycled
    const SlotIndex slot = record.slot;
    telemetry_.record_sync_expired();
    demote(record.event, DemotionReason::BudgetExceeded, partial, record.epoch);

    if (!sync_table_.recycle(token)) {
        TICKHOOK_LOG_ERROR("Engine: could not recycle sync entry %u", token.index);
    }
    release_hold(slot, lane);
}

void Engine::demote(const Event& event, DemotionReason reason,
                    const PartialDispatchState& partial, uint64_t epoch) {
    DemotedEvent demoted;
    demoted.event = event;
    demoted.reason = reason;
    demoted.partial = partial;
    demoted.epoch = epoch;

    telemetry_.record_demotion(reason);
    if (!warm_path_.forward(demoted)) {
        TICKHOOK_LOG_DEBUG("Engine: warm path full, dropped event %llu (%s)",
                           static_cast<unsigned long long>(event.id),
                           demotion_reason_name(reason));
    }
}

void Engine::release_hold(SlotIndex index, LaneId lane) {
    BufferSlot& slot = pool_.slot(index);
    if (slot.holds.fetch_sub(1, std::memory_order_acq_rel) != 1) {
        return;
    }
    if (!pool_.release(slot, lane)) {
        TICKHOOK_LOG_ERROR("Engine: slot %u released while not owned", index);
    }
}

TelemetrySnapshot Engine::telemetry() const {
    TelemetrySnapshot snapshot = telemetry_.snapshot();
    snapshot.receipts_emitted = receipts_.emitted();
    snapshot.receipts_dropped = receipts_.dropped();
    snapshot.warm_path_forwarded = warm_path_.forwarded();
    snapshot.warm_path_dropped = warm_path_.dropped();
    snapshot.pool_in_use = pool_.in_use();
    snapshot.pool_capacity = pool_.capacity();
    snapshot.hook_epoch = registry_.current_epoch();
    return snapshot;
}

bool Engine::wait_until_drained(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        TelemetrySnapshot snapshot = telemetry_.snapshot();
        if (snapshot.events_processed >= snapshot.events_submitted) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
}

} // namespace tickhook
