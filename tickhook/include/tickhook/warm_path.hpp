#ifndef TICKHOOK_WARM_PATH_HPP
#define TICKHOOK_WARM_PATH_HPP

#include <tickhook/types.hpp>

#include <lockfree_ring/ring_buffer.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace tickhook {

// Bounded hand-off of demoted events to the warm-path resolver.
// forward() never waits; a full channel drops the event and counts it.
class WarmPathChannel {
public:
    explicit WarmPathChannel(size_t capacity) : channel_(capacity) {}

    bool forward(const DemotedEvent& demoted) {
        if (channel_.try_enqueue(demoted)) {
            forwarded_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    template<typename Callback>
    size_t drain(Callback&& callback, size_t max_count = SIZE_MAX) {
        return channel_.drain(std::forward<Callback>(callback), max_count);
    }

    size_t backlog() const { return channel_.size_approx(); }
    uint64_t forwarded() const { return forwarded_.load(std::memory_order_relaxed); }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    lockfree::RingBuffer<DemotedEvent> channel_;
    alignas(64) std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace tickhook

#endif // TICKHOOK_WARM_PATH_HPP
