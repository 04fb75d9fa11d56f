#ifndef TICKHOOK_TYPES_HPP
#define TICKHOOK_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace tickhook {

// =============================================================================
// Identifiers
// =============================================================================

using HookId = uint32_t;
using EventId = uint64_t;
using LaneId = uint32_t;
using SlotIndex = uint32_t;
using SpanId = uint64_t;
using Term = uint64_t;      // Interned subject/predicate/object value
using Cycles = uint64_t;    // Raw hardware cycle count

constexpr uint32_t INVALID_ID = UINT32_MAX;

// Lane id used by threads that are not lanes (producers, control plane)
constexpr LaneId NO_LANE = INVALID_ID;

constexpr size_t MAX_HOOKS = 256;
constexpr size_t MAX_BRANCHES = 16;

// =============================================================================
// Status
// =============================================================================
// Outcome codes for hot-path operations. Nothing on the hot path throws.

enum class Status : uint8_t {
    Ok = 0,
    Full,             // Ring buffer saturated, producer decides
    PoolExhausted,    // No buffer slot, event demoted
    BudgetExceeded,   // Over tick budget (flagged or demoted)
    MatchAmbiguous,   // Scalar/vector screen disagreement, event demoted
    Demoted,          // Event handed to the warm path
    Pending,          // Synchronization still waiting on branches
    Stale,            // Late or duplicate completion, no effect
    Unmatched         // No hook matched
};

inline const char* status_description(Status status) {
    switch (status) {
        case Status::Ok: return "Ok";
        case Status::Full: return "Ring buffer full";
        case Status::PoolExhausted: return "Buffer pool exhausted";
        case Status::BudgetExceeded: return "Tick budget exceeded";
        case Status::MatchAmbiguous: return "Scalar and vector match disagree";
        case Status::Demoted: return "Demoted to warm path";
        case Status::Pending: return "Pending branch completions";
        case Status::Stale: return "Stale completion ignored";
        case Status::Unmatched: return "No hook matched";
    }
    return "Unknown status";
}

// =============================================================================
// Operation kinds and demotion reasons
// =============================================================================

enum class OperationKind : uint8_t {
    Discriminator = 0,
    ParallelSplit = 1,
    Synchronization = 2
};

constexpr size_t OPERATION_KIND_COUNT = 3;

inline const char* operation_kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::Discriminator: return "Discriminator";
        case OperationKind::ParallelSplit: return "Parallel Split";
        case OperationKind::Synchronization: return "Synchronization";
    }
    return "Invalid";
}

enum class DemotionReason : uint8_t {
    BudgetExceeded = 0,
    PoolExhausted = 1,
    AmbiguousMatch = 2
};

constexpr size_t DEMOTION_REASON_COUNT = 3;

inline const char* demotion_reason_name(DemotionReason reason) {
    switch (reason) {
        case DemotionReason::BudgetExceeded: return "BudgetExceeded";
        case DemotionReason::PoolExhausted: return "PoolExhausted";
        case DemotionReason::AmbiguousMatch: return "AmbiguousMatch";
    }
    return "Invalid";
}

// =============================================================================
// Event
// =============================================================================
// Immutable unit of work. Trivially copyable so it can live in ring slots
// and buffer slots without allocation.

struct Event {
    EventId id = 0;
    Term subject = 0;
    Term predicate = 0;
    Term object = 0;
    uint32_t kind = 0;
    uint64_t correlation_id = 0;
};

// =============================================================================
// TermPattern
// =============================================================================
// Exact value or wildcard.

struct TermPattern {
    Term value = 0;
    bool wildcard = true;

    static TermPattern any() { return TermPattern{0, true}; }
    static TermPattern exact(Term v) { return TermPattern{v, false}; }

    bool matches(Term t) const {
        return wildcard || value == t;
    }
};

// =============================================================================
// HookEntry
// =============================================================================
// A registered pattern. Subject/object patterns are optional; absent means
// "any".

struct HookEntry {
    HookId id = INVALID_ID;
    std::string name;
    OperationKind operation_kind = OperationKind::ParallelSplit;
    TermPattern predicate_pattern;
    std::optional<TermPattern> subject_pattern;
    std::optional<TermPattern> object_pattern;
};

// =============================================================================
// HookMask
// =============================================================================
// Fixed-width bitmask of candidate hook indices within one snapshot.

struct HookMask {
    static constexpr size_t WORDS = MAX_HOOKS / 64;

    uint64_t words[WORDS];

    HookMask() {
        std::memset(words, 0, sizeof(words));
    }

    bool test(size_t index) const {
        return (words[index / 64] >> (index % 64)) & 1;
    }

    void set(size_t index) {
        words[index / 64] |= (1ULL << (index % 64));
    }

    void clear(size_t index) {
        words[index / 64] &= ~(1ULL << (index % 64));
    }

    // OR a group of up to 8 comparison bits in at base (base % width == 0)
    void set_group(size_t base, uint32_t bits) {
        words[base / 64] |= static_cast<uint64_t>(bits) << (base % 64);
    }

    // Clear every bit at or above count
    void truncate(size_t count) {
        for (size_t w = 0; w < WORDS; ++w) {
            size_t lo = w * 64;
            if (count <= lo) {
                words[w] = 0;
            } else if (count < lo + 64) {
                words[w] &= (1ULL << (count - lo)) - 1;
            }
        }
    }

    bool empty() const {
        for (size_t i = 0; i < WORDS; ++i) {
            if (words[i] != 0) return false;
        }
        return true;
    }

    size_t popcount() const {
        size_t count = 0;
        for (size_t i = 0; i < WORDS; ++i) {
            count += __builtin_popcountll(words[i]);
        }
        return count;
    }

    // Visit set bits in ascending index order
    template<typename F>
    void for_each(F&& f) const {
        for (size_t w = 0; w < WORDS; ++w) {
            uint64_t word = words[w];
            while (word) {
                size_t bit = __builtin_ctzll(word);
                f(w * 64 + bit);
                word &= word - 1;  // Clear lowest set bit
            }
        }
    }

    bool operator==(const HookMask& other) const {
        return std::memcmp(words, other.words, sizeof(words)) == 0;
    }

    bool operator!=(const HookMask& other) const {
        return !(*this == other);
    }
};

// =============================================================================
// MatchResult
// =============================================================================
// Transient; lives in the event's buffer slot while it is dispatched.

struct MatchResult {
    EventId event_id = 0;
    uint16_t count = 0;
    HookId matched_hook_ids[MAX_HOOKS];
    uint16_t matched_indices[MAX_HOOKS];   // Positions within the snapshot
    uint64_t tick_count = 0;
    uint64_t epoch = 0;

    void reset(EventId id) {
        event_id = id;
        count = 0;
        tick_count = 0;
        epoch = 0;
    }

    void add(HookId hook_id, uint16_t index) {
        matched_hook_ids[count] = hook_id;
        matched_indices[count] = index;
        ++count;
    }
};

// =============================================================================
// ReceiptEntry
// =============================================================================
// Audit record of one completed dispatch.

struct ReceiptEntry {
    uint64_t id = 0;
    uint64_t ticks = 0;
    uint32_t lanes = 0;            // Branches that took part in the dispatch
    SpanId span_id = 0;
    uint64_t content_hash = 0;
    uint64_t timestamp_ms = 0;
    EventId event_id = 0;
    HookId hook_id = INVALID_ID;
    OperationKind operation_kind = OperationKind::ParallelSplit;
    bool budget_violation = false;
};

// =============================================================================
// SyncToken
// =============================================================================
// Handle to an open synchronization. Generation guards against a recycled
// table entry being completed by a late branch.

struct SyncToken {
    uint32_t index = INVALID_ID;
    uint32_t generation = 0;

    bool valid() const { return index != INVALID_ID; }
};

// =============================================================================
// Demotion
// =============================================================================

struct PartialDispatchState {
    bool present = false;
    HookId hook_id = INVALID_ID;
    OperationKind operation_kind = OperationKind::ParallelSplit;
    uint16_t branches_total = 0;
    uint16_t branches_completed = 0;
    uint32_t completed_mask = 0;
};

struct DemotedEvent {
    Event event;
    DemotionReason reason = DemotionReason::BudgetExceeded;
    PartialDispatchState partial;
    uint64_t epoch = 0;
};

} // namespace tickhook

#endif // TICKHOOK_TYPES_HPP
