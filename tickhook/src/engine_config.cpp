#include <tickhook/engine_config.hpp>

#include <stdexcept>
#include <string>

namespace tickhook {

namespace {

bool is_power_of_two(size_t n) {
    return n >= 2 && (n & (n - 1)) == 0;
}

void require(bool condition, const char* field, const char* rule) {
    if (!condition) {
        throw std::invalid_argument(std::string("EngineConfig.") + field + " " + rule);
    }
}

} // namespace

void EngineConfig::validate() const {
    require(lanes > 0, "lanes", "must be positive");
    require(is_power_of_two(ring_capacity), "ring_capacity", "must be a power of two >= 2");
    require(local_cache_slots <= BufferPool::MAX_LOCAL_CACHE, "local_cache_slots",
            "exceeds BufferPool::MAX_LOCAL_CACHE");
    require(lanes * local_cache_slots + shared_slots > 0, "shared_slots",
            "leaves the pool empty");
    require(tick_budget > 0, "tick_budget", "must be positive");
    require(cycles_per_tick > 0, "cycles_per_tick", "must be positive");
    require(sync_table_capacity > 0, "sync_table_capacity", "must be positive");
    require(is_power_of_two(receipt_capacity), "receipt_capacity", "must be a power of two >= 2");
    require(is_power_of_two(warm_path_capacity), "warm_path_capacity", "must be a power of two >= 2");
}

} // namespace tickhook
