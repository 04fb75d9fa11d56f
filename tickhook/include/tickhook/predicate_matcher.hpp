#ifndef TICKHOOK_PREDICATE_MATCHER_HPP
#define TICKHOOK_PREDICATE_MATCHER_HPP

#include <tickhook/hook_registry.hpp>
#include <tickhook/types.hpp>

#include <cstddef>
#include <cstdint>

namespace tickhook {

enum class MatcherBackend : uint8_t {
    Auto,      // Widest backend the CPU supports
    Scalar,    // One hook per compare
    Narrow,    // 2 x 64-bit compare (SSE4.1 / NEON)
    Wide       // 4 x 64-bit compare (AVX2)
};

inline const char* matcher_backend_name(MatcherBackend backend) {
    switch (backend) {
        case MatcherBackend::Auto: return "auto";
        case MatcherBackend::Scalar: return "scalar";
        case MatcherBackend::Narrow: return "narrow";
        case MatcherBackend::Wide: return "wide";
    }
    return "invalid";
}

// =============================================================================
// Predicate screens
// =============================================================================
// Each screen sets bit i of out for every i < count where values[i] equals
// the predicate or wildcards[i] is all-ones. Bits at or above count are
// cleared. values and wildcards must be readable up to count rounded up to
// HookSnapshot::SCREEN_GROUP. All screens produce identical masks.

using ScreenFn = void (*)(const Term* values, const uint64_t* wildcards,
                          size_t count, Term predicate, HookMask& out);

void screen_scalar(const Term* values, const uint64_t* wildcards,
                   size_t count, Term predicate, HookMask& out);

// Only valid when PredicateMatcher::backend_supported(Narrow)
void screen_narrow(const Term* values, const uint64_t* wildcards,
                   size_t count, Term predicate, HookMask& out);

// Only valid when PredicateMatcher::backend_supported(Wide)
void screen_wide(const Term* values, const uint64_t* wildcards,
                 size_t count, Term predicate, HookMask& out);

// =============================================================================
// PredicateMatcher
// =============================================================================

/**
 * Two-stage matcher: a vectorized predicate screen over the snapshot's
 * structure-of-arrays predicates, then full pattern confirmation only for
 * the candidate bits.
 *
 * The backend is chosen once at construction. An unsupported request falls
 * back to the best available backend with a warning. With self_check on,
 * every vector screen is repeated on the scalar path and a disagreement is
 * reported as MatchAmbiguous.
 */
class PredicateMatcher {
public:
    explicit PredicateMatcher(MatcherBackend requested = MatcherBackend::Auto,
                              bool self_check = false);

    // Replaces the vector screen; used to exercise the self-check path
    PredicateMatcher(MatcherBackend label, ScreenFn screen, bool self_check);

    MatcherBackend backend() const { return backend_; }
    bool self_check() const { return self_check_; }

    static bool backend_supported(MatcherBackend backend);
    static MatcherBackend best_available();
    static ScreenFn screen_for(MatcherBackend backend);

    // Predicate screen only. O(1) for an empty snapshot.
    HookMask match_predicate(const Event& event, const HookSnapshot& snapshot) const;

    static HookMask match_predicate_with(MatcherBackend backend, const Event& event,
                                         const HookSnapshot& snapshot);

    // Full pattern check of every candidate bit, in ascending hook index
    static void confirm(const Event& event, const HookSnapshot& snapshot,
                        const HookMask& candidates, MatchResult& out);

    /**
     * Screen, optionally self-check, then confirm into out.
     * Returns Ok when at least one hook confirmed, Unmatched when none did,
     * and MatchAmbiguous (out left empty) when the screens disagree.
     */
    Status match(const Event& event, const HookSnapshot& snapshot,
                 MatchResult& out, HookMask& candidates) const;

private:
    MatcherBackend backend_;
    ScreenFn screen_;
    bool self_check_;
};

} // namespace tickhook

#endif // TICKHOOK_PREDICATE_MATCHER_HPP
