#ifndef TICKHOOK_RECEIPT_EMITTER_HPP
#define TICKHOOK_RECEIPT_EMITTER_HPP

#include <tickhook/types.hpp>

#include <lockfree_ring/ring_buffer.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace tickhook {

enum class OverflowPolicy : uint8_t {
    DropOldest,   // Evict the oldest queued receipt to make room
    RejectNew     // Drop the receipt being emitted
};

inline const char* overflow_policy_name(OverflowPolicy policy) {
    return policy == OverflowPolicy::DropOldest ? "drop-oldest" : "reject-new";
}

// FNV-1a over the fields that define the dispatch
uint64_t receipt_content_hash(const Event& event, HookId hook_id, OperationKind kind);

/**
 * Builds receipts on the hot path and hands them to the audit consumer over
 * a bounded lock-free channel. emit() never waits: when the channel is full
 * the overflow policy decides which receipt is lost, and the loss is
 * counted in dropped().
 */
class ReceiptEmitter {
public:
    ReceiptEmitter(size_t capacity, OverflowPolicy policy);

    ReceiptEmitter(const ReceiptEmitter&) = delete;
    ReceiptEmitter& operator=(const ReceiptEmitter&) = delete;

    SpanId next_span_id() {
        return next_span_.fetch_add(1, std::memory_order_relaxed);
    }

    ReceiptEntry emit(const Event& event, HookId hook_id, OperationKind kind,
                      uint64_t ticks, uint32_t lanes, SpanId span_id,
                      bool budget_violation);

    // Consumer side
    template<typename Callback>
    size_t drain(Callback&& callback, size_t max_count = SIZE_MAX) {
        return channel_.drain(std::forward<Callback>(callback), max_count);
    }

    size_t backlog() const { return channel_.size_approx(); }
    size_t capacity() const { return channel_.capacity(); }
    OverflowPolicy policy() const { return policy_; }

    uint64_t emitted() const { return emitted_.load(std::memory_order_relaxed); }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    static constexpr int EVICT_ATTEMPTS = 4;

    lockfree::RingBuffer<ReceiptEntry> channel_;
    const OverflowPolicy policy_;

    alignas(64) std::atomic<uint64_t> next_id_{1};
    alignas(64) std::atomic<SpanId> next_span_{1};
    alignas(64) std::atomic<uint64_t> emitted_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace tickhook

#endif // TICKHOOK_RECEIPT_EMITTER_HPP
