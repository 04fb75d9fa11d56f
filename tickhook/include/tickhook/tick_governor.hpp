#ifndef TICKHOOK_TICK_GOVERNOR_HPP
#define TICKHOOK_TICK_GOVERNOR_HPP

#include <tickhook/types.hpp>

#include <atomic>
#include <cstdint>

namespace tickhook {

// Returns a monotonically non-decreasing cycle count
using CycleSource = uint64_t (*)();

// rdtsc on x86-64, cntvct_el0 on AArch64, steady_clock nanoseconds elsewhere
uint64_t read_hardware_cycles();

enum class BudgetVerdict : uint8_t {
    WithinBudget,
    OverBudget
};

/**
 * Measures hot-path spans in hardware cycles and classifies them against
 * the tick budget.
 *
 * One tick is cycles_per_tick raw cycles. The budget and the Synchronization
 * deadline are held in atomics so the control plane can retune them while
 * lanes are running; a lane sees the new value on its next classification.
 */
class TickGovernor {
public:
    TickGovernor(uint64_t tick_budget,
                 uint64_t cycles_per_tick,
                 uint64_t sync_deadline_ticks,
                 CycleSource source = nullptr);

    Cycles now() const { return source_(); }

    // Elapsed cycles rounded up to whole ticks
    uint64_t to_ticks(Cycles elapsed) const {
        return (elapsed + cycles_per_tick_ - 1) / cycles_per_tick_;
    }

    uint64_t ticks_since(Cycles start) const {
        Cycles end = now();
        return to_ticks(end > start ? end - start : 0);
    }

    BudgetVerdict classify(uint64_t ticks) const {
        return ticks <= tick_budget() ? BudgetVerdict::WithinBudget
                                      : BudgetVerdict::OverBudget;
    }

    // Absolute cycle count after which an open synchronization is demoted
    Cycles sync_deadline(Cycles start) const {
        return start + sync_deadline_ticks() * cycles_per_tick_;
    }

    bool expired(Cycles deadline) const { return now() > deadline; }

    void set_tick_budget(uint64_t ticks);
    void set_sync_deadline_ticks(uint64_t ticks);

    uint64_t tick_budget() const { return tick_budget_.load(std::memory_order_relaxed); }
    uint64_t sync_deadline_ticks() const { return sync_deadline_ticks_.load(std::memory_order_relaxed); }
    uint64_t cycles_per_tick() const { return cycles_per_tick_; }

private:
    std::atomic<uint64_t> tick_budget_;
    std::atomic<uint64_t> sync_deadline_ticks_;
    const uint64_t cycles_per_tick_;
    const CycleSource source_;
};

} // namespace tickhook

#endif // TICKHOOK_TICK_GOVERNOR_HPP
