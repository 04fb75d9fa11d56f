#ifndef TICKHOOK_ENGINE_HPP
#define TICKHOOK_ENGINE_HPP

#include <tickhook/buffer_pool.hpp>
#include <tickhook/dispatch.hpp>
#include <tickhook/engine_config.hpp>
#include <tickhook/hook_registry.hpp>
#include <tickhook/predicate_matcher.hpp>
#include <tickhook/receipt_emitter.hpp>
#include <tickhook/telemetry.hpp>
#include <tickhook/tick_governor.hpp>
#include <tickhook/types.hpp>
#include <tickhook/warm_path.hpp>

#include <lane_system/lane_system.hpp>
#include <lockfree_ring/ring_buffer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tickhook {

/**
 * Hot-path event matcher and dispatcher.
 *
 * Producers submit() events into per-lane rings (lane = producer id modulo
 * the lane count, so one producer's events stay in order). Each lane pops
 * an event, claims a buffer slot, screens it against the current hook
 * snapshot and dispatches every confirmed hook. Completed dispatches emit a
 * receipt; anything that cannot finish inside the budget is demoted to the
 * warm-path channel.
 *
 * Thread roles:
 * - Control plane: register_hook, unregister_hook, publish, start, stop,
 *   set_tick_budget, set_sync_deadline_ticks. Serialized internally.
 * - Producers: submit. Any number of threads.
 * - Lanes: process_one and expire_overdue for lane L run on one thread at a
 *   time. start() runs them on the lane system; tests may call them directly
 *   while the engine is stopped.
 * - Branch workers: complete_branch, from any thread.
 * - Consumers: drain_receipts and drain_demoted, one thread each.
 */
class Engine {
public:
    explicit Engine(EngineConfig config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Control plane
    void register_hook(HookEntry entry, std::vector<Branch> branches) {
        registry_.register_hook(std::move(entry), std::move(branches));
    }
    bool unregister_hook(HookId id) { return registry_.unregister_hook(id); }
    uint64_t publish();

    void start();
    void stop();
    // False once a lane error has stopped the lanes
    bool running() const { return lanes_.is_running(); }

    // First error that stopped a lane, empty if none
    std::string lane_error() const { return lanes_.get_error_message(); }

    void set_tick_budget(uint64_t ticks) { governor_.set_tick_budget(ticks); }
    void set_sync_deadline_ticks(uint64_t ticks) { governor_.set_sync_deadline_ticks(ticks); }

    // Producers. Ok or Full; a full ring is counted and left to the caller.
    Status submit(const Event& event, size_t producer_id = 0);

    // Lanes. Returns false when the lane's ring was empty.
    bool process_one(LaneId lane);

    // Demotes Synchronization dispatches past their deadline
    size_t expire_overdue(LaneId lane);

    /**
     * Reports completion of a Deferred branch.
     * Ok: this call completed the dispatch and emitted its receipt.
     * Pending: other branches are still outstanding.
     * Demoted: the deadline had passed; the dispatch was demoted instead.
     * Stale: duplicate, late or unknown token; nothing changed.
     */
    Status complete_branch(SyncToken token, uint32_t branch);

    // Consumers
    template<typename Callback>
    size_t drain_receipts(Callback&& callback, size_t max_count = SIZE_MAX) {
        return receipts_.drain(std::forward<Callback>(callback), max_count);
    }

    template<typename Callback>
    size_t drain_demoted(Callback&& callback, size_t max_count = SIZE_MAX) {
        return warm_path_.drain(std::forward<Callback>(callback), max_count);
    }

    TelemetrySnapshot telemetry() const;

    // Waits until every accepted event has been processed
    bool wait_until_drained(std::chrono::milliseconds timeout) const;

    const EngineConfig& config() const { return config_; }
    const PredicateMatcher& matcher() const { return matcher_; }
    const TickGovernor& governor() const { return governor_; }
    size_t open_synchronizations() const { return sync_table_.open_count(); }

private:
    struct PendingReceipt {
        HookId hook_id;
        OperationKind kind;
        uint32_t lanes;
        SpanId span_id;
        uint16_t index;      // Position in the snapshot
    };

    struct alignas(64) LaneState {
        std::vector<PendingReceipt> receipts;
        uint64_t steps = 0;
    };

    static constexpr uint64_t EXPIRY_INTERVAL = 64;

    static PredicateMatcher make_matcher(const EngineConfig& config);

    bool lane_step(LaneId lane);
    void dispatch_matched(const Event& event, BufferSlot& slot, const HookSnapshot& snapshot,
                          Cycles start, LaneId lane);
    void finalize_completed(SyncToken token, LaneId lane);
    void finalize_demoted(SyncToken token, const SyncRecord& record,
                          const PartialDispatchState& partial, LaneId lane);
    void demote(const Event& event, DemotionReason reason,
                const PartialDispatchState& partial, uint64_t epoch);
    void release_hold(SlotIndex slot, LaneId lane);

    const EngineConfig config_;

    Telemetry telemetry_;
    BufferPool pool_;
    std::vector<std::unique_ptr<lockfree::RingBuffer<Event>>> rings_;
    std::unique_ptr<LaneState[]> lane_state_;
    HookRegistry registry_;
    PredicateMatcher matcher_;
    TickGovernor governor_;
    SyncTable sync_table_;
    DispatchOperator dispatcher_;
    ReceiptEmitter receipts_;
    WarmPathChannel warm_path_;

    // Declared last: lanes stop before anything they touch is destroyed
    lane_system::LaneSystem lanes_;
};

} // namespace tickhook

#endif // TICKHOOK_ENGINE_HPP
