#ifndef TICKHOOK_BUFFER_POOL_HPP
#define TICKHOOK_BUFFER_POOL_HPP

#include <tickhook/types.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace tickhook {

enum class ExhaustionPolicy : uint8_t {
    FailFast,      // acquire returns nullptr immediately on a miss
    BoundedSpin    // retry the shared free-list up to a hard iteration cap
};

enum class SlotState : uint8_t {
    Free = 0,
    Acquired = 1,
    InUse = 2,
    Returned = 3
};

/**
 * Pooled, fixed-size region holding one event and its dispatch scratch.
 * Lifecycle: Free -> Acquired -> InUse -> Returned -> Free.
 * Only the pool changes state; owners hand the slot back with release().
 */
struct alignas(64) BufferSlot {
    Event event;
    MatchResult match;

    // Dispatches still referencing this slot (lane + open synchronizations)
    std::atomic<uint32_t> holds{0};

    SlotIndex index() const { return index_; }
    SlotState state() const { return state_.load(std::memory_order_acquire); }

private:
    friend class BufferPool;

    std::atomic<SlotState> state_{SlotState::Free};
    SlotIndex index_ = INVALID_ID;
    LaneId home_lane_ = NO_LANE;   // Local cache the slot was seeded into
};

/**
 * Pre-allocated slab of BufferSlots with a small per-lane cache in front of
 * a shared lock-free free-list.
 *
 * - acquire(lane) first pops the lane's own cache (no synchronization, only
 *   the owning lane touches it), then pops the shared Treiber stack.
 * - release(slot, lane) returns the slot to its home cache when the caller
 *   is that lane and the cache has room, otherwise to the shared stack.
 * - Exhaustion never allocates: it fails fast or spins a bounded number of
 *   times, then reports nullptr.
 *
 * Thread safety: any thread may call acquire/release with NO_LANE. A given
 * lane id must only be used by one thread at a time.
 */
class BufferPool {
public:
    static constexpr size_t MAX_LOCAL_CACHE = 64;

    BufferPool(size_t num_lanes,
               size_t local_cache_slots,
               size_t shared_slots,
               ExhaustionPolicy policy = ExhaustionPolicy::FailFast,
               uint32_t spin_limit = 64);

    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    // O(1), non-blocking. Returns nullptr when the pool is exhausted.
    BufferSlot* acquire(LaneId lane);

    // Acquired -> InUse once the owner starts using the slot
    bool mark_in_use(BufferSlot& slot);

    // Returns false (and changes nothing) if the slot is not currently owned
    bool release(BufferSlot& slot, LaneId lane);

    BufferSlot& slot(SlotIndex index) { return slots_[index]; }
    const BufferSlot& slot(SlotIndex index) const { return slots_[index]; }

    size_t capacity() const { return capacity_; }
    size_t in_use() const { return outstanding_.load(std::memory_order_relaxed); }
    size_t num_lanes() const { return num_lanes_; }

    uint64_t exhausted_count() const { return exhausted_.load(std::memory_order_relaxed); }
    uint64_t invalid_release_count() const { return invalid_releases_.load(std::memory_order_relaxed); }

    ExhaustionPolicy policy() const { return policy_; }

private:
    struct alignas(64) LocalCache {
        SlotIndex items[MAX_LOCAL_CACHE];
        size_t count = 0;
    };

    static constexpr uint32_t NIL = INVALID_ID;

    static uint64_t pack(uint32_t tag, SlotIndex index) {
        return (static_cast<uint64_t>(tag) << 32) | index;
    }
    static SlotIndex index_of(uint64_t head) { return static_cast<SlotIndex>(head & 0xFFFFFFFFu); }
    static uint32_t tag_of(uint64_t head) { return static_cast<uint32_t>(head >> 32); }

    SlotIndex pop_shared();
    void push_shared(SlotIndex index);
    BufferSlot* take(SlotIndex index);

    const size_t num_lanes_;
    const size_t local_cache_slots_;
    const size_t capacity_;
    const ExhaustionPolicy policy_;
    const uint32_t spin_limit_;

    std::unique_ptr<BufferSlot[]> slots_;
    std::unique_ptr<LocalCache[]> caches_;
    std::unique_ptr<std::atomic<SlotIndex>[]> next_;   // Shared stack links

    // Tagged head (tag << 32 | index) avoids ABA on pop
    alignas(64) std::atomic<uint64_t> shared_head_;
    alignas(64) std::atomic<size_t> outstanding_{0};
    std::atomic<uint64_t> exhausted_{0};
    std::atomic<uint64_t> invalid_releases_{0};
};

} // namespace tickhook

#endif // TICKHOOK_BUFFER_POOL_HPP
