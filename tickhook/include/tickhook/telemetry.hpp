#ifndef TICKHOOK_TELEMETRY_HPP
#define TICKHOOK_TELEMETRY_HPP

#include <tickhook/types.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace tickhook {

// Candidate-bitmask cardinality buckets: 0, 1, 2, 3-4, 5-8, 9-16, 17-64, 65+
constexpr size_t CARDINALITY_BUCKETS = 8;

inline size_t cardinality_bucket(size_t candidates) {
    if (candidates <= 2) return candidates;
    if (candidates <= 4) return 3;
    if (candidates <= 8) return 4;
    if (candidates <= 16) return 5;
    if (candidates <= 64) return 6;
    return 7;
}

inline const char* cardinality_bucket_label(size_t bucket) {
    static const char* labels[CARDINALITY_BUCKETS] = {
        "0", "1", "2", "3-4", "5-8", "9-16", "17-64", "65+"
    };
    return bucket < CARDINALITY_BUCKETS ? labels[bucket] : "?";
}

/**
 * Point-in-time copy of every counter and gauge. Values are read with relaxed
 * loads, so counters are individually exact but not mutually consistent
 * while lanes are running.
 */
struct TelemetrySnapshot {
    uint64_t events_submitted = 0;
    uint64_t events_processed = 0;
    uint64_t ring_full = 0;
    uint64_t unmatched = 0;

    std::array<uint64_t, OPERATION_KIND_COUNT> dispatches{};
    std::array<uint64_t, DEMOTION_REASON_COUNT> demotions{};
    uint64_t discriminator_unsatisfied = 0;
    uint64_t split_unconfirmed = 0;
    uint64_t branch_failures = 0;
    uint64_t lane_faults = 0;        // Events demoted after an exception escaped dispatch

    uint64_t budget_violations = 0;
    uint64_t match_ambiguous = 0;

    uint64_t sync_opened = 0;
    uint64_t sync_completed = 0;
    uint64_t sync_expired = 0;
    uint64_t stale_completions = 0;

    // Channel counters, owned by the receipt and warm-path channels
    uint64_t receipts_emitted = 0;
    uint64_t receipts_dropped = 0;
    uint64_t warm_path_forwarded = 0;
    uint64_t warm_path_dropped = 0;

    std::array<uint64_t, CARDINALITY_BUCKETS> cardinality{};

    // Gauges
    size_t pool_in_use = 0;
    size_t pool_capacity = 0;
    uint64_t hook_epoch = 0;

    uint64_t total_demotions() const {
        uint64_t total = 0;
        for (uint64_t d : demotions) total += d;
        return total;
    }

    uint64_t total_dispatches() const {
        uint64_t total = 0;
        for (uint64_t d : dispatches) total += d;
        return total;
    }
};

/**
 * Best-effort observability counters. Every update is a single relaxed
 * fetch_add on its own cache line, so recording never blocks a lane.
 */
class Telemetry {
public:
    void record_submitted() { bump(events_submitted_); }
    void record_processed() { bump(events_processed_); }
    void record_ring_full() { bump(ring_full_); }
    void record_unmatched() { bump(unmatched_); }

    void record_dispatch(OperationKind kind) {
        bump(dispatches_[static_cast<size_t>(kind)]);
    }

    void record_demotion(DemotionReason reason) {
        bump(demotions_[static_cast<size_t>(reason)]);
    }

    void record_discriminator_unsatisfied() { bump(discriminator_unsatisfied_); }
    void record_split_unconfirmed() { bump(split_unconfirmed_); }
    void record_branch_failure() { bump(branch_failures_); }
    void record_lane_fault() { bump(lane_faults_); }
    void record_budget_violation() { bump(budget_violations_); }
    void record_match_ambiguous() { bump(match_ambiguous_); }

    void record_sync_opened() { bump(sync_opened_); }
    void record_sync_completed() { bump(sync_completed_); }
    void record_sync_expired() { bump(sync_expired_); }
    void record_stale_completion() { bump(stale_completions_); }

    void record_cardinality(size_t candidates) {
        bump(cardinality_[cardinality_bucket(candidates)]);
    }

    // Channel counters and gauges are filled in by the resource owner
    TelemetrySnapshot snapshot() const;

private:
    struct alignas(64) Counter {
        std::atomic<uint64_t> value{0};
    };

    static void bump(Counter& counter) {
        counter.value.fetch_add(1, std::memory_order_relaxed);
    }

    static uint64_t read(const Counter& counter) {
        return counter.value.load(std::memory_order_relaxed);
    }

    Counter events_submitted_;
    Counter events_processed_;
    Counter ring_full_;
    Counter unmatched_;
    Counter dispatches_[OPERATION_KIND_COUNT];
    Counter demotions_[DEMOTION_REASON_COUNT];
    Counter discriminator_unsatisfied_;
    Counter split_unconfirmed_;
    Counter branch_failures_;
    Counter lane_faults_;
    Counter budget_violations_;
    Counter match_ambiguous_;
    Counter sync_opened_;
    Counter sync_completed_;
    Counter sync_expired_;
    Counter stale_completions_;
    Counter cardinality_[CARDINALITY_BUCKETS];
};

} // namespace tickhook

#endif // TICKHOOK_TELEMETRY_HPP
