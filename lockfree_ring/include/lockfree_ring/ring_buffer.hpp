#ifndef LOCKFREE_RING_BUFFER_HPP
#define LOCKFREE_RING_BUFFER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace lockfree {

// Bounded lock-free multi-producer multi-consumer ring buffer
// Based on Vyukov's bounded MPMC queue (per-slot sequence numbers)
// - Any number of threads may enqueue and dequeue concurrently
// - Fixed power-of-two capacity, index masking instead of modulo
// - try_enqueue fails fast when full, try_dequeue when empty
// - Items pushed by one producer are dequeued in that producer's order
template<typename T>
class RingBuffer {
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

public:
    explicit RingBuffer(std::size_t capacity)
        : capacity_(capacity)
        , mask_(capacity - 1) {
        if (capacity < 2 || (capacity & (capacity - 1)) != 0) {
            throw std::invalid_argument("RingBuffer capacity must be a power of two >= 2");
        }
        slots_ = std::make_unique<Slot[]>(capacity_);
        for (std::size_t i = 0; i < capacity_; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
        enqueue_index_.store(0, std::memory_order_relaxed);
        dequeue_index_.store(0, std::memory_order_relaxed);
    }

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    // Try to push an item. Returns false if the buffer is full.
    bool try_enqueue(const T& item) {
        Slot* slot;
        std::size_t pos = enqueue_index_.load(std::memory_order_relaxed);

        for (;;) {
            slot = &slots_[pos & mask_];
            std::size_t seq = slot->sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);

            if (diff == 0) {
                // Slot is ready for writing
                if (enqueue_index_.compare_exchange_weak(pos, pos + 1,
                        std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                // Consumers have not freed this slot yet
                return false;
            } else {
                // Another producer took this slot, advance
                pos = enqueue_index_.load(std::memory_order_relaxed);
            }
        }

        slot->data = item;
        // Publish: slot is ready for a consumer
        slot->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    // Try to pop an item. Returns nullopt if the buffer is empty.
    std::optional<T> try_dequeue() {
        Slot* slot;
        std::size_t pos = dequeue_index_.load(std::memory_order_relaxed);

        for (;;) {
            slot = &slots_[pos & mask_];
            std::size_t seq = slot->sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);

            if (diff == 0) {
                if (dequeue_index_.compare_exchange_weak(pos, pos + 1,
                        std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return std::nullopt;
            } else {
                pos = dequeue_index_.load(std::memory_order_relaxed);
            }
        }

        T item = slot->data;
        // Mark slot as writable for the producer one lap ahead
        slot->sequence.store(pos + capacity_, std::memory_order_release);
        return item;
    }

    // Drain up to max_count items, calling callback for each
    template<typename Callback>
    std::size_t drain(Callback&& callback, std::size_t max_count = SIZE_MAX) {
        std::size_t count = 0;
        while (count < max_count) {
            auto item = try_dequeue();
            if (!item) break;
            callback(*item);
            ++count;
        }
        return count;
    }

    // Approximate (racy) diagnostics
    bool empty() const {
        return size_approx() == 0;
    }

    std::size_t size_approx() const {
        std::size_t e = enqueue_index_.load(std::memory_order_acquire);
        std::size_t d = dequeue_index_.load(std::memory_order_acquire);
        return e >= d ? e - d : 0;
    }

    std::size_t capacity() const { return capacity_; }

private:
    struct alignas(64) Slot {
        std::atomic<std::size_t> sequence{0};
        T data{};
    };

    const std::size_t capacity_;
    const std::size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    // Pad to avoid false sharing between producers and consumers
    alignas(64) std::atomic<std::size_t> enqueue_index_;
    alignas(64) std::atomic<std::size_t> dequeue_index_;
};

} // namespace lockfree

#endif // LOCKFREE_RING_BUFFER_HPP
