#ifndef WEIGHT_OPTIMIZER_HH
#define WEIGHT_OPTIMIZER_HH

/**
 * @file WeightOptimizer.hh
 * @brief Bounded local search over the factor weights
 *
 * Three interchangeable strategies share one objective:
 *
 *   score = mape               (TargetMetric::Mape)
 *   score = rmse               (TargetMetric::Rmse)
 *   score = mape + rmse / 1e4  (TargetMetric::Both)
 *
 * The 1e4 divisor only brings RMSE (currency) to the magnitude of
 * MAPE (percent). Changing it changes every Both result.
 *
 * All strategies move one factor at a time, in weight table order, and
 * accept a move only when it strictly lowers the best score found so
 * far. Results therefore depend on the table order, and neither
 * strategy is a joint optimisation over all factors.
 */

#include "CancellationToken.hh"
#include "DataTypes.hh"
#include "RecalibrationRunner.hh"
#include "ScoringModel.hh"
#include <functional>
#include <string>
#include <vector>

namespace WeightCalibration {

/**
 * @class WeightOptimizer
 * @brief Coordinate descent, grid search and correlation-guided hybrid
 */
class WeightOptimizer {
public:
    /// Divisor of RMSE in the combined objective
    static const double kRmseScale;

    /**
     * @brief Constructor
     * @param config Optimizer configuration
     * @param model Scoring model used for every evaluation
     */
    explicit WeightOptimizer(const OptimizationConfig& config = OptimizationConfig(),
                             const ScoringModel& model = ScoringModel());

    void setConfig(const OptimizationConfig& config);
    const OptimizationConfig& getConfig() const;

    /**
     * @brief Run a strategy from the table's base weights
     * @param claims Claim set (not empty)
     * @param table Weight table (its order is the search order)
     * @param method Strategy
     * @param cancel Optional token polled once per outer iteration
     * @throws InputValidationError, InsufficientDataError before any work
     */
    OptimizationResult optimize(const std::vector<ClaimRecord>& claims,
                                const WeightTable& table,
                                OptimizationMethod method,
                                const CancellationToken* cancel = nullptr);

    /**
     * @brief Run a strategy from the given starting weights
     *
     * Factors missing from initial start at their base weight. The
     * table's base weights are the reference of the prediction
     * adjustment, so initial_mape is the MAPE the service reports for
     * the starting weights.
     */
    OptimizationResult optimize(const std::vector<ClaimRecord>& claims,
                                const WeightTable& table,
                                const WeightVector& initial,
                                OptimizationMethod method,
                                const CancellationToken* cancel = nullptr);

    /**
     * @brief Sequential coordinate descent
     *
     * Each round tries weight +/- learning_rate * (max - min) for every
     * non-frozen factor and keeps the better improving direction (up on
     * a tie). Stops when the largest accepted change of a round is below
     * convergence_threshold or after max_iterations rounds.
     */
    OptimizationResult coordinateDescent(const std::vector<ClaimRecord>& claims,
                                         const WeightTable& table,
                                         const WeightVector& initial,
                                         const CancellationToken* cancel = nullptr);

    /**
     * @brief One-factor-at-a-time grid search
     *
     * Samples grid_steps + 1 equally spaced weights on [min, max] per
     * non-frozen factor (only min when grid_steps is 0), holding the
     * others at the best vector so far. iterations_run counts the
     * evaluated candidates.
     */
    OptimizationResult gridSearch(const std::vector<ClaimRecord>& claims,
                                  const WeightTable& table,
                                  const WeightVector& initial,
                                  const CancellationToken* cancel = nullptr);

    /**
     * @brief Coordinate descent on the top-ranked factors only
     *
     * Factors are ranked by FactorImpactRanker::combinedScore against
     * the error of the starting weights; all but the top
     * top_factor_count are frozen.
     *
     * @param impacts Factor impacts to rank with; computed when null
     */
    OptimizationResult correlationGuided(const std::vector<ClaimRecord>& claims,
                                         const WeightTable& table,
                                         const WeightVector& initial,
                                         const FactorImpact* impacts = nullptr,
                                         const CancellationToken* cancel = nullptr);

    /**
     * @brief Non-frozen factors ordered by combined score, best first
     *
     * Ties keep table order.
     */
    std::vector<std::string> rankFactors(const std::vector<ClaimRecord>& claims,
                                         const WeightTable& table,
                                         const WeightVector& initial,
                                         const FactorImpact* impacts = nullptr) const;

    /**
     * @brief Objective value of a metric set for a target
     */
    static double objectiveScore(const ErrorMetrics& metrics, TargetMetric target);

    /**
     * @brief Check bounds, duplicates and emptiness of a weight table
     * @throws InputValidationError
     */
    static void validateTable(const WeightTable& table);

    /**
     * @brief Check a configuration against a table
     * @throws InputValidationError
     */
    static void validateConfig(const OptimizationConfig& config, const WeightTable& table);

    /**
     * @brief Starting vector in table order, missing factors at base weight
     * @throws InputValidationError for unknown factors or out-of-bound values
     */
    static WeightVector completeWeights(const WeightTable& table, const WeightVector& weights);

    OptimizerState getState() const { return m_state; }
    int getIterations() const { return m_iterations; }

private:
    typedef std::function<ErrorMetrics(const std::vector<double>&)> Objective;

    void validate(const std::vector<ClaimRecord>& claims, const WeightTable& table) const;

    /// Claims prepared against the table's base weights
    PreparedClaims prepareClaims(const std::vector<ClaimRecord>& claims, const WeightTable& table) const;

    OptimizationResult runCoordinateDescent(const Objective& objective,
                                            const WeightTable& table,
                                            const WeightVector& start,
                                            const OptimizationConfig& config,
                                            const CancellationToken* cancel);

    OptimizationResult runGridSearch(const Objective& objective,
                                     const WeightTable& table,
                                     const WeightVector& start,
                                     const CancellationToken* cancel);

    static WeightVector toVector(const WeightTable& table, const std::vector<double>& values);
    static void finish(OptimizationResult& result);

    OptimizationConfig m_config;
    ScoringModel m_model;
    OptimizerState m_state;
    int m_iterations;
};

} // namespace WeightCalibration

#endif // WEIGHT_OPTIMIZER_HH
