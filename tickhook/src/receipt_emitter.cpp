#include <tickhook/receipt_emitter.hpp>

#include <chrono>

namespace tickhook {

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

inline uint64_t fnv1a_mix(uint64_t hash, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        hash ^= (value >> (i * 8)) & 0xFF;
        hash *= FNV_PRIME;
    }
    return hash;
}

uint64_t wall_clock_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

uint64_t receipt_content_hash(const Event& event, HookId hook_id, OperationKind kind) {
    uint64_t hash = FNV_OFFSET;
    hash = fnv1a_mix(hash, event.id);
    hash = fnv1a_mix(hash, event.subject);
    hash = fnv1a_mix(hash, event.predicate);
    hash = fnv1a_mix(hash, event.object);
    hash = fnv1a_mix(hash, event.kind);
    hash = fnv1a_mix(hash, event.correlation_id);
    hash = fnv1a_mix(hash, hook_id);
    hash = fnv1a_mix(hash, static_cast<uint64_t>(kind));
    return hash;
}

ReceiptEmitter::ReceiptEmitter(size_t capacity, OverflowPolicy policy)
    : channel_(capacity)
    , policy_(policy) {}

ReceiptEntry ReceiptEmitter::emit(const Event& event, HookId hook_id, OperationKind kind,
                                  uint64_t ticks, uint32_t lanes, SpanId span_id,
                                  bool budget_violation) {
    ReceiptEntry receipt;
    receipt.id = next_id_.fetch_add(1, std::memory_order_relaxed);
    receipt.ticks = ticks;
    receipt.lanes = lanes;
    receipt.span_id = span_id;
    receipt.content_hash = receipt_content_hash(event, hook_id, kind);
    receipt.timestamp_ms = wall_clock_ms();
    receipt.event_id = event.id;
    receipt.hook_id = hook_id;
    receipt.operation_kind = kind;
    receipt.budget_violation = budget_violation;

    emitted_.fetch_add(1, std::memory_order_relaxed);

    if (channel_.try_enqueue(receipt)) {
        return receipt;
    }

    if (policy_ == OverflowPolicy::DropOldest) {
        // Bounded: a racing producer may refill the freed slot
        for (int attempt = 0; attempt < EVICT_ATTEMPTS; ++attempt) {
            if (channel_.try_dequeue()) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
            if (channel_.try_enqueue(receipt)) {
                return receipt;
            }
        }
    }

    dropped_.fetch_add(1, std::memory_order_relaxed);
    return receipt;
}

} // namespace tickhook
