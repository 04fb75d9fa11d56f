#ifndef TICKHOOK_ENGINE_CONFIG_HPP
#define TICKHOOK_ENGINE_CONFIG_HPP

#include <tickhook/buffer_pool.hpp>
#include <tickhook/predicate_matcher.hpp>
#include <tickhook/receipt_emitter.hpp>
#include <tickhook/tick_governor.hpp>

#include <cstddef>
#include <cstdint>

namespace tickhook {

struct EngineConfig {
    // Lanes
    size_t lanes = 1;
    size_t ring_capacity = 1024;           // Per lane, power of two

    // Buffer pool
    size_t local_cache_slots = 8;          // Per lane
    size_t shared_slots = 1024;
    ExhaustionPolicy exhaustion_policy = ExhaustionPolicy::FailFast;
    uint32_t spin_limit = 64;

    // Tick budget
    uint64_t tick_budget = 8;
    uint64_t cycles_per_tick = 1024;
    uint64_t sync_deadline_ticks = 64;
    size_t sync_table_capacity = 1024;

    // Collaborator channels
    size_t receipt_capacity = 4096;        // Power of two
    OverflowPolicy receipt_policy = OverflowPolicy::DropOldest;
    size_t warm_path_capacity = 4096;      // Power of two

    // Matcher
    MatcherBackend matcher_backend = MatcherBackend::Auto;
    bool differential_check = false;
    ScreenFn screen_override = nullptr;    // Replaces the vector screen

    // Null means the hardware cycle counter
    CycleSource cycle_source = nullptr;

    // Throws std::invalid_argument naming the first bad field
    void validate() const;
};

} // namespace tickhook

#endif // TICKHOOK_ENGINE_CONFIG_HPP
