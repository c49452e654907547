#ifndef MATH_UTILITIES_HH
#define MATH_UTILITIES_HH

/**
 * @file MathUtilities.hh
 * @brief Mathematical utility functions for weight calibration
 *
 * Provides:
 * - Clamping utilities
 * - Guarded division (zero denominators yield a fallback)
 * - Basic descriptive statistics on plain vectors
 */

#include <cmath>
#include <algorithm>
#include <limits>
#include <vector>

namespace WeightCalibration {

/**
 * @brief Clamp value to specified range
 * @param x Value to clamp
 * @param lo Lower bound
 * @param hi Upper bound
 * @return Clamped value in [lo, hi]
 */
inline double clamp(double x, double lo, double hi) {
    return std::max(lo, std::min(hi, x));
}

/**
 * @brief Divide, returning fallback when the denominator is zero
 *        or the quotient is not finite
 */
inline double safeDivide(double num, double den, double fallback = 0.0) {
    if (den == 0.0) return fallback;
    double q = num / den;
    return std::isfinite(q) ? q : fallback;
}

/**
 * @brief Arithmetic mean (0 for an empty vector)
 */
inline double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double s = 0.0;
    for (double x : v) s += x;
    return s / static_cast<double>(v.size());
}

/**
 * @brief Sample standard deviation (n - 1 denominator)
 * @return 0 for fewer than two values
 */
inline double sampleStdDev(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    double m = mean(v);
    double ss = 0.0;
    for (double x : v) ss += (x - m) * (x - m);
    return std::sqrt(ss / static_cast<double>(v.size() - 1));
}

/**
 * @brief Quantile with linear interpolation between order statistics
 * @param sorted Values sorted ascending
 * @param q Quantile in [0, 1]
 */
inline double quantileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    double pos = clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = static_cast<size_t>(std::ceil(pos));
    double frac = pos - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

/**
 * @brief True when every element equals the first one
 */
inline bool isConstant(const std::vector<double>& v) {
    for (size_t i = 1; i < v.size(); ++i) {
        if (v[i] != v[0]) return false;
    }
    return true;
}

} // namespace WeightCalibration

#endif // MATH_UTILITIES_HH
