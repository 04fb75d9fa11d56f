#include <tickhook/telemetry.hpp>

namespace tickhook {

TelemetrySnapshot Telemetry::snapshot() const {
    TelemetrySnapshot snap;
    snap.events_submitted = read(events_submitted_);
    snap.events_processed = read(events_processed_);
    snap.ring_full = read(ring_full_);
    snap.unmatched = read(unmatched_);

    for (size_t i = 0; i < OPERATION_KIND_COUNT; ++i) {
        snap.dispatches[i] = read(dispatches_[i]);
    }
    for (size_t i = 0; i < DEMOTION_REASON_COUNT; ++i) {
        snap.demotions[i] = read(demotions_[i]);
    }

    snap.discriminator_unsatisfied = read(discriminator_unsatisfied_);
    snap.split_unconfirmed = read(split_unconfirmed_);
    snap.branch_failures = read(branch_failures_);
    snap.lane_faults = read(lane_faults_);
    snap.budget_violations = read(budget_violations_);
    snap.match_ambiguous = read(match_ambiguous_);

    snap.sync_opened = read(sync_opened_);
    snap.sync_completed = read(sync_completed_);
    snap.sync_expired = read(sync_expired_);
    snap.stale_completions = read(stale_completions_);

    for (size_t i = 0; i < CARDINALITY_BUCKETS; ++i) {
        snap.cardinality[i] = read(cardinality_[i]);
    }
    return snap;
}

} // namespace tickhook
