#ifndef CALIBRATION_ERRORS_HH
#define CALIBRATION_ERRORS_HH

/**
 * @file CalibrationErrors.hh
 * @brief Exceptions raised by the calibration engine
 *
 * Both kinds are raised before any computation starts. Numeric
 * degeneracies (zero variance, zero denominators) are not errors and
 * never throw; non-convergence is reported in OptimizationResult.
 */

#include <stdexcept>
#include <string>

namespace WeightCalibration {

/**
 * @class CalibrationError
 * @brief Base class of all engine errors
 */
class CalibrationError : public std::runtime_error {
public:
    explicit CalibrationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @class InputValidationError
 * @brief Inconsistent weight table, configuration or weight vector
 */
class InputValidationError : public CalibrationError {
public:
    explicit InputValidationError(const std::string& what)
        : CalibrationError("Input validation failed: " + what) {}
};

/**
 * @class InsufficientDataError
 * @brief Not enough claims to evaluate or optimise
 */
class InsufficientDataError : public CalibrationError {
public:
    explicit InsufficientDataError(const std::string& what)
        : CalibrationError("Insufficient data: " + what) {}
};

} // namespace WeightCalibration

#endif // CALIBRATION_ERRORS_HH
