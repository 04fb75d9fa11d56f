#include <tickhook/buffer_pool.hpp>
#include <tickhook/cpu_features.hpp>
#include <tickhook/debug_log.hpp>

#include <stdexcept>

namespace tickhook {

BufferPool::BufferPool(size_t num_lanes,
                       size_t local_cache_slots,
                       size_t shared_slots,
                       ExhaustionPolicy policy,
                       uint32_t spin_limit)
    : num_lanes_(num_lanes)
    , local_cache_slots_(local_cache_slots)
    , capacity_(num_lanes * local_cache_slots + shared_slots)
    , policy_(policy)
    , spin_limit_(spin_limit) {
    if (local_cache_slots > MAX_LOCAL_CACHE) {
        throw std::invalid_argument("BufferPool local cache exceeds MAX_LOCAL_CACHE");
    }
    if (capacity_ == 0) {
        throw std::invalid_argument("BufferPool needs at least one slot");
    }
    if (capacity_ >= NIL) {
        throw std::invalid_argument("BufferPool capacity too large");
    }

    slots_ = std::make_unique<BufferSlot[]>(capacity_);
    caches_ = std::make_unique<LocalCache[]>(num_lanes_ == 0 ? 1 : num_lanes_);
    next_ = std::make_unique<std::atomic<SlotIndex>[]>(capacity_);

    // Seed each lane's cache, the rest goes on the shared stack
    SlotIndex index = 0;
    for (size_t lane = 0; lane < num_lanes_; ++lane) {
        for (size_t i = 0; i < local_cache_slots_; ++i, ++index) {
            slots_[index].index_ = index;
            slots_[index].home_lane_ = static_cast<LaneId>(lane);
            caches_[lane].items[caches_[lane].count++] = index;
        }
    }

    SlotIndex head = NIL;
    for (size_t i = capacity_; i > index; --i) {
        SlotIndex s = static_cast<SlotIndex>(i - 1);
        slots_[s].index_ = s;
        next_[s].store(head, std::memory_order_relaxed);
        head = s;
    }
    shared_head_.store(pack(0, head), std::memory_order_release);

    TICKHOOK_LOG_DEBUG("BufferPool: %zu slots (%zu lanes x %zu local + %zu shared)",
                       capacity_, num_lanes_, local_cache_slots_, shared_slots);
}

BufferPool::~BufferPool() = default;

SlotIndex BufferPool::pop_shared() {
    uint64_t head = shared_head_.load(std::memory_order_acquire);
    for (;;) {
        SlotIndex index = index_of(head);
        if (index == NIL) {
            return NIL;
        }
        // A stale read of next_ is harmless: the tag makes the CAS fail
        SlotIndex next = next_[index].load(std::memory_order_relaxed);
        if (shared_head_.compare_exchange_weak(head, pack(tag_of(head) + 1, next),
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
            return index;
        }
    }
}

void BufferPool::push_shared(SlotIndex index) {
    uint64_t head = shared_head_.load(std::memory_order_acquire);
    for (;;) {
        next_[index].store(index_of(head), std::memory_order_relaxed);
        if (shared_head_.compare_exchange_weak(head, pack(tag_of(head) + 1, index),
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
            return;
        }
    }
}

BufferSlot* BufferPool::take(SlotIndex index) {
    BufferSlot& slot = slots_[index];
    SlotState expected = SlotState::Free;
    if (!slot.state_.compare_exchange_strong(expected, SlotState::Acquired,
                                             std::memory_order_acq_rel)) {
        // A free-list entry that is not Free means two owners; refuse it
        invalid_releases_.fetch_add(1, std::memory_order_relaxed);
        TICKHOOK_LOG_ERROR("BufferPool: slot %u on free list in state %d",
                           index, static_cast<int>(expected));
        return nullptr;
    }
    slot.holds.store(0, std::memory_order_relaxed);
    outstanding_.fetch_add(1, std::memory_order_relaxed);
    return &slot;
}

BufferSlot* BufferPool::acquire(LaneId lane) {
    if (lane != NO_LANE && lane < num_lanes_) {
        LocalCache& cache = caches_[lane];
        if (cache.count > 0) {
            return take(cache.items[--cache.count]);
        }
    }

    SlotIndex index = pop_shared();
    if (index == NIL && policy_ == ExhaustionPolicy::BoundedSpin) {
        for (uint32_t spin = 0; spin < spin_limit_ && index == NIL; ++spin) {
            cpu_relax();
            index = pop_shared();
        }
    }

    if (index == NIL) {
        exhausted_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    return take(index);
}

bool BufferPool::mark_in_use(BufferSlot& slot) {
    SlotState expected = SlotState::Acquired;
    return slot.state_.compare_exchange_strong(expected, SlotState::InUse,
                                               std::memory_order_acq_rel);
}

bool BufferPool::release(BufferSlot& slot, LaneId lane) {
    SlotState current = slot.state_.load(std::memory_order_acquire);
    do {
        if (current != SlotState::Acquired && current != SlotState::InUse) {
            invalid_releases_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    } while (!slot.state_.compare_exchange_weak(current, SlotState::Returned,
                                                std::memory_order_acq_rel,
                                                std::memory_order_acquire));

    outstanding_.fetch_sub(1, std::memory_order_relaxed);
    slot.state_.store(SlotState::Free, std::memory_order_release);

    if (lane != NO_LANE && lane < num_lanes_ && slot.home_lane_ == lane) {
        LocalCache& cache = caches_[lane];
        if (cache.count < local_cache_slots_) {
            cache.items[cache.count++] = slot.index_;
            return true;
        }
    }

    push_shared(slot.index_);
    return true;
}

} // namespace tickhook
