#include <tickhook/cpu_features.hpp>
#include <tickhook/debug_log.hpp>

namespace tickhook {

namespace {

CpuFeatures detect() {
    CpuFeatures features{false, false, false, "GENERIC"};

#if defined(__x86_64__) || defined(__i386__)
    __builtin_cpu_init();
    features.has_sse41 = __builtin_cpu_supports("sse4.1");
    features.has_avx2 = __builtin_cpu_supports("avx2");
    features.arch_name = features.has_avx2 ? "x86_64-AVX2"
                       : features.has_sse41 ? "x86_64-SSE4.1"
                       : "x86_64-SCALAR";
#elif defined(__aarch64__)
    // Advanced SIMD is mandatory on AArch64
    features.has_neon = true;
    features.arch_name = "ARM64-NEON";
#endif

    return features;
}

} // namespace

const CpuFeatures& CpuFeatures::get() {
    static const CpuFeatures features = detect();
    return features;
}

void CpuFeatures::log_features() const {
    TICKHOOK_LOG_DEBUG("Detected architecture: %s (sse4.1=%d avx2=%d neon=%d)",
                       arch_name, has_sse41, has_avx2, has_neon);
}

} // namespace tickhook
