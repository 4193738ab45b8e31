/**
 * @file logger.hpp
 * @brief Unified logging infrastructure for desktop and Android
 *
 * Purpose: Provides consistent logging interface that works on both
 * desktop (stdout/stderr) and Android (__android_log_print).
 * LOG_DEBUG is compiled out unless RFLOC_DEBUG_LOG is defined.
 *
 * References:
 * - Android NDK logging: https://developer.android.com/ndk/reference/group/logging
 *
 * Sample Input:
 *   LOG_INFO("Estimated position with %d fingerprints", k);
 *
 * Expected Output:
 *   Desktop: "[INFO] Estimated position with 3 fingerprints"
 *   Android: logcat shows "I/RfLoc: Estimated position with 3 fingerprints"
 */

#ifndef RFLOC_UTILS_LOGGER_HPP
#define RFLOC_UTILS_LOGGER_HPP

#ifdef ANDROID
#include <android/log.h>
#define LOG_TAG "RfLoc"
#define LOG_INFO(...) __android_log_print(ANDROID_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOG_WARN(...) __android_log_print(ANDROID_LOG_WARN, LOG_TAG, __VA_ARGS__)
#define LOG_ERROR(...) __android_log_print(ANDROID_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#define LOG_DEBUG_IMPL(...) __android_log_print(ANDROID_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#else
#include <cstdio>
#define LOG_INFO(...) do { std::printf("[INFO] " __VA_ARGS__); std::printf("\n"); } while(0)
#define LOG_WARN(...) do { std::fprintf(stderr, "[WARN] " __VA_ARGS__); std::fprintf(stderr, "\n"); } while(0)
#define LOG_ERROR(...) do { std::fprintf(stderr, "[ERROR] " __VA_ARGS__); std::fprintf(stderr, "\n"); } while(0)
#define LOG_DEBUG_IMPL(...) do { std::printf("[DEBUG] " __VA_ARGS__); std::printf("\n"); } while(0)
#endif

#ifdef RFLOC_DEBUG_LOG
#define LOG_DEBUG(...) LOG_DEBUG_IMPL(__VA_ARGS__)
#else
#define LOG_DEBUG(...) do { } while(0)
#endif

namespace rfloc {

/**
 * @brief Diagnostics of the last estimation, for logging
 */
struct EstimationDiagnostics {
    int nearest_fingerprints;   ///< Fingerprints (k) used by the successful attempt
    int equations;              ///< Linear equations or fitter observations
    int attempts;               ///< k values tried
    int iterations;             ///< Fitter iterations (0 for closed-form)
    double chi_sq;              ///< Fitter chi^2 (0 for closed-form)

    EstimationDiagnostics()
        : nearest_fingerprints(0), equations(0), attempts(0),
          iterations(0), chi_sq(0.0) {}
};

/**
 * @brief Log estimation diagnostics
 */
inline void log_diagnostics(const EstimationDiagnostics& d) {
    LOG_INFO("Estimation: k=%d, equations=%d, attempts=%d, iterations=%d, chi2=%.6g",
             d.nearest_fingerprints, d.equations, d.attempts,
             d.iterations, d.chi_sq);
}

} // namespace rfloc

#endif // RFLOC_UTILS_LOGGER_HPP
