#ifndef METRICS_EVALUATOR_HH
#define METRICS_EVALUATOR_HH

/**
 * @file MetricsEvaluator.hh
 * @brief Aggregate error statistics of predictions against actual settlements
 */

#include "DataTypes.hh"
#include <vector>

namespace WeightCalibration {

/**
 * @class MetricsEvaluator
 * @brief Computes MAE, RMSE, MAPE, R^2 and per-claim variance
 *
 * Claims with a zero actual settlement are left out of the percentage
 * based aggregates (MAPE, variance %) and kept in the absolute ones.
 */
class MetricsEvaluator {
public:
    /// Risk band edges on the absolute deviation %, exclusive below
    static const double kCriticalThreshold;
    static const double kHighThreshold;
    static const double kMediumThreshold;

    /**
     * @brief Evaluate predictions against the claims' actual settlements
     * @param claims Claims, same order as predictions
     * @param predictions Predicted settlements
     * @throws InsufficientDataError if claims is empty
     * @throws InputValidationError if the sizes differ
     */
    static EvaluationResult evaluate(const std::vector<ClaimRecord>& claims,
                                     const std::vector<double>& predictions);

    /**
     * @brief Evaluate predictions against plain actual values
     */
    static EvaluationResult evaluate(const std::vector<double>& actuals,
                                     const std::vector<double>& predictions);

    /**
     * @brief Aggregate metrics only
     */
    static ErrorMetrics metrics(const std::vector<double>& actuals,
                                const std::vector<double>& predictions);

    /**
     * @brief Risk tier of an absolute deviation percentage
     *
     * > 30 Critical, > 20 High, > 10 Medium, else Low.
     * Exactly 30 is High, exactly 20 is Medium, exactly 10 is Low.
     */
    static RiskLevel classifyRisk(double absDeviationPct);

    /**
     * @brief |predicted - actual| / actual * 100
     * @return 0 when actual == 0
     */
    static double absolutePercentageError(double actual, double predicted);
};

} // namespace WeightCalibration

#endif // METRICS_EVALUATOR_HH
