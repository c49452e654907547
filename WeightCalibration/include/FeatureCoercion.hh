#ifndef FEATURE_COERCION_HH
#define FEATURE_COERCION_HH

/**
 * @file FeatureCoercion.hh
 * @brief Total conversion of claim fields to numbers
 *
 * Every read of a claim feature by the engine goes through one of
 * these functions. None of them can return NaN or infinity.
 */

#include "DataTypes.hh"
#include <string>

namespace WeightCalibration {

/**
 * @brief Strictly parse a feature as a finite number
 *
 * Accepts finite numbers and text that is entirely a decimal number
 * once surrounding whitespace is removed ("12", " 3.5 ", "-1e3").
 *
 * @param value Feature to parse
 * @param[out] out Parsed value, untouched on failure
 * @return true on success
 */
bool tryParseNumber(const FeatureValue& value, double& out);

/**
 * @brief Numeric value of a feature, 0 when absent or garbled
 */
double safeNumeric(const FeatureValue& value);

/**
 * @brief Score a feature in the categorical sense
 *
 * Numbers pass through unchanged. Text labels are mapped onto [0, 1]
 * (e.g. "Yes" -> 1, "Moderate" -> 0.6, "Non-compliant" -> 0.2);
 * numeric text is clamped to [0, 1]; anything else scores 0.
 */
double categoricalScore(const FeatureValue& value);

/**
 * @brief Lower-case copy of a string (ASCII)
 */
std::string toLower(const std::string& s);

/**
 * @brief Remove surrounding whitespace
 */
std::string trimWhitespace(const std::string& s);

} // namespace WeightCalibration

#endif // FEATURE_COERCION_HH
