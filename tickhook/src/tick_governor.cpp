#include <tickhook/tick_governor.hpp>
#include <tickhook/debug_log.hpp>

#include <chrono>
#include <stdexcept>

#if defined(__x86_64__) || defined(__i386__)
#include <x86intrin.h>
#endif

namespace tickhook {

uint64_t read_hardware_cycles() {
#if defined(__x86_64__) || defined(__i386__)
    return __rdtsc();
#elif defined(__aarch64__)
    uint64_t value;
    __asm__ __volatile__("mrs %0, cntvct_el0" : "=r"(value));
    return value;
#else
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
#endif
}

TickGovernor::TickGovernor(uint64_t tick_budget,
                           uint64_t cycles_per_tick,
                           uint64_t sync_deadline_ticks,
                           CycleSource source)
    : tick_budget_(tick_budget)
    , sync_deadline_ticks_(sync_deadline_ticks)
    , cycles_per_tick_(cycles_per_tick)
    , source_(source ? source : &read_hardware_cycles) {
    if (cycles_per_tick == 0) {
        throw std::invalid_argument("cycles_per_tick must be positive");
    }
    if (tick_budget == 0) {
        throw std::invalid_argument("tick budget must be positive");
    }
}

void TickGovernor::set_tick_budget(uint64_t ticks) {
    if (ticks == 0) {
        throw std::invalid_argument("tick budget must be positive");
    }
    uint64_t previous = tick_budget_.exchange(ticks, std::memory_order_relaxed);
    TICKHOOK_LOG_DEBUG("Tick budget %llu -> %llu",
                       static_cast<unsigned long long>(previous),
                       static_cast<unsigned long long>(ticks));
    (void)previous;
}

void TickGovernor::set_sync_deadline_ticks(uint64_t ticks) {
    sync_deadline_ticks_.store(ticks, std::memory_order_relaxed);
}

} // namespace tickhook
