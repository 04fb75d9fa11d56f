#ifndef TICKHOOK_CPU_FEATURES_HPP
#define TICKHOOK_CPU_FEATURES_HPP

#if defined(__x86_64__) || defined(__i386__)
#include <immintrin.h>
#endif

namespace tickhook {

/**
 * CPU feature detection results.
 * Detected once on first access and cached for the life of the process.
 */
struct CpuFeatures {
    bool has_sse41;     // 2 x 64-bit compare (narrow path)
    bool has_avx2;      // 4 x 64-bit compare (wide path)
    bool has_neon;      // AArch64 2 x 64-bit compare (narrow path)
    const char* arch_name;

    static const CpuFeatures& get();

    void log_features() const;
};

// Spin-wait hint for bounded retry loops
inline void cpu_relax() {
#if defined(__x86_64__) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__)
    __asm__ __volatile__("yield");
#endif
}

} // namespace tickhook

#endif // TICKHOOK_CPU_FEATURES_HPP
