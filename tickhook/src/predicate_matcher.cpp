#include <tickhook/predicate_matcher.hpp>
#include <tickhook/cpu_features.hpp>
#include <tickhook/debug_log.hpp>

#if defined(__x86_64__) || defined(__i386__)
#include <immintrin.h>
#define TICKHOOK_X86_SCREENS 1
#elif defined(__aarch64__)
#include <arm_neon.h>
#define TICKHOOK_NEON_SCREENS 1
#endif

namespace tickhook {

// =============================================================================
// Screens
// =============================================================================

void screen_scalar(const Term* values, const uint64_t* wildcards,
                   size_t count, Term predicate, HookMask& out) {
    out = HookMask();
    for (size_t i = 0; i < count; ++i) {
        if (values[i] == predicate || wildcards[i] != 0) {
            out.set(i);
        }
    }
}

#if defined(TICKHOOK_X86_SCREENS)

__attribute__((target("sse4.1")))
void screen_narrow(const Term* values, const uint64_t* wildcards,
                   size_t count, Term predicate, HookMask& out) {
    out = HookMask();
    const __m128i target = _mm_set1_epi64x(static_cast<long long>(predicate));

    for (size_t base = 0; base < count; base += 2) {
        __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(values + base));
        __m128i w = _mm_loadu_si128(reinterpret_cast<const __m128i*>(wildcards + base));
        __m128i hit = _mm_or_si128(_mm_cmpeq_epi64(v, target), w);
        uint32_t bits = static_cast<uint32_t>(_mm_movemask_pd(_mm_castsi128_pd(hit)));
        out.set_group(base, bits);
    }
    out.truncate(count);
}

__attribute__((target("avx2")))
void screen_wide(const Term* values, const uint64_t* wildcards,
                 size_t count, Term predicate, HookMask& out) {
    out = HookMask();
    const __m256i target = _mm256_set1_epi64x(static_cast<long long>(predicate));

    for (size_t base = 0; base < count; base += 4) {
        __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(values + base));
        __m256i w = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(wildcards + base));
        __m256i hit = _mm256_or_si256(_mm256_cmpeq_epi64(v, target), w);
        uint32_t bits = static_cast<uint32_t>(_mm256_movemask_pd(_mm256_castsi256_pd(hit)));
        out.set_group(base, bits);
    }
    out.truncate(count);
}

#elif defined(TICKHOOK_NEON_SCREENS)

void screen_narrow(const Term* values, const uint64_t* wildcards,
                   size_t count, Term predicate, HookMask& out) {
    out = HookMask();
    const uint64x2_t target = vdupq_n_u64(predicate);

    for (size_t base = 0; base < count; base += 2) {
        uint64x2_t v = vld1q_u64(values + base);
        uint64x2_t w = vld1q_u64(wildcards + base);
        uint64x2_t hit = vorrq_u64(vceqq_u64(v, target), w);
        uint32_t bits = static_cast<uint32_t>(vgetq_lane_u64(hit, 0) & 1) |
                        static_cast<uint32_t>((vgetq_lane_u64(hit, 1) & 1) << 1);
        out.set_group(base, bits);
    }
    out.truncate(count);
}

// No 4-lane 64-bit compare on AArch64
void screen_wide(const Term* values, const uint64_t* wildcards,
                 size_t count, Term predicate, HookMask& out) {
    screen_scalar(values, wildcards, count, predicate, out);
}

#else

void screen_narrow(const Term* values, const uint64_t* wildcards,
                   size_t count, Term predicate, HookMask& out) {
    screen_scalar(values, wildcards, count, predicate, out);
}

void screen_wide(const Term* values, const uint64_t* wildcards,
                 size_t count, Term predicate, HookMask& out) {
    screen_scalar(values, wildcards, count, predicate, out);
}

#endif

// =============================================================================
// PredicateMatcher
// =============================================================================

bool PredicateMatcher::backend_supported(MatcherBackend backend) {
    const CpuFeatures& cpu = CpuFeatures::get();
    switch (backend) {
        case MatcherBackend::Auto:
        case MatcherBackend::Scalar:
            return true;
        case MatcherBackend::Narrow:
            return cpu.has_sse41 || cpu.has_neon;
        case MatcherBackend::Wide:
            return cpu.has_avx2;
    }
    return false;
}

MatcherBackend PredicateMatcher::best_available() {
    if (backend_supported(MatcherBackend::Wide)) return MatcherBackend::Wide;
    if (backend_supported(MatcherBackend::Narrow)) return MatcherBackend::Narrow;
    return MatcherBackend::Scalar;
}

ScreenFn PredicateMatcher::screen_for(MatcherBackend backend) {
    if (backend == MatcherBackend::Auto) {
        backend = best_available();
    }
    if (!backend_supported(backend)) {
        return &screen_scalar;
    }
    switch (backend) {
        case MatcherBackend::Wide: return &screen_wide;
        case MatcherBackend::Narrow: return &screen_narrow;
        default: return &screen_scalar;
    }
}

PredicateMatcher::PredicateMatcher(MatcherBackend requested, bool self_check)
    : backend_(requested)
    , self_check_(self_check) {
    if (backend_ == MatcherBackend::Auto) {
        backend_ = best_available();
    } else if (!backend_supported(backend_)) {
        MatcherBackend fallback = best_available();
        TICKHOOK_LOG_WARN("Matcher backend '%s' not supported on %s, using '%s'",
                          matcher_backend_name(backend_), CpuFeatures::get().arch_name,
                          matcher_backend_name(fallback));
        backend_ = fallback;
    }
    screen_ = screen_for(backend_);
    TICKHOOK_LOG_DEBUG("PredicateMatcher backend=%s self_check=%d",
                       matcher_backend_name(backend_), self_check_);
}

PredicateMatcher::PredicateMatcher(MatcherBackend label, ScreenFn screen, bool self_check)
    : backend_(label)
    , screen_(screen ? screen : &screen_scalar)
    , self_check_(self_check) {}

HookMask PredicateMatcher::match_predicate(const Event& event, const HookSnapshot& snapshot) const {
    HookMask mask;
    if (snapshot.empty()) {
        return mask;
    }
    screen_(snapshot.predicate_values(), snapshot.predicate_wildcards(),
            snapshot.size(), event.predicate, mask);
    return mask;
}

HookMask PredicateMatcher::match_predicate_with(MatcherBackend backend, const Event& event,
                                                const HookSnapshot& snapshot) {
    HookMask mask;
    if (snapshot.empty()) {
        return mask;
    }
    screen_for(backend)(snapshot.predicate_values(), snapshot.predicate_wildcards(),
                        snapshot.size(), event.predicate, mask);
    return mask;
}

void PredicateMatcher::confirm(const Event& event, const HookSnapshot& snapshot,
                               const HookMask& candidates, MatchResult& out) {
    candidates.for_each([&](size_t index) {
        const RegisteredHook& hook = snapshot.hook(index);
        if (hook.confirms(event)) {
            out.add(hook.entry.id, static_cast<uint16_t>(index));
        }
    });
}

Status PredicateMatcher::match(const Event& event, const HookSnapshot& snapshot,
                               MatchResult& out, HookMask& candidates) const {
    out.reset(event.id);
    out.epoch = snapshot.epoch();
    candidates = match_predicate(event, snapshot);

    if (self_check_ && !snapshot.empty()) {
        HookMask reference;
        screen_scalar(snapshot.predicate_values(), snapshot.predicate_wildcards(),
                      snapshot.size(), event.predicate, reference);
        if (reference != candidates) {
            TICKHOOK_LOG_ERROR("Screen disagreement on event %llu (backend %s, %zu vs %zu candidates)",
                               static_cast<unsigned long long>(event.id),
                               matcher_backend_name(backend_),
                               candidates.popcount(), reference.popcount());
            return Status::MatchAmbiguous;
        }
    }

    if (candidates.empty()) {
        return Status::Unmatched;
    }
    confirm(event, snapshot, candidates, out);
    return out.count > 0 ? Status::Ok : Status::Unmatched;
}

} // namespace tickhook
