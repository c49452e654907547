#ifndef RECALIBRATION_SERVICE_HH
#define RECALIBRATION_SERVICE_HH

/**
 * @file RecalibrationService.hh
 * @brief Boundary operations of the calibration engine
 *
 * Provides the request/response style interface used by callers:
 * - recalibrate: metrics of a weight vector, optionally optimised
 * - optimize: run a named strategy and report the improvement
 * - sensitivityAnalysis: one-factor-at-a-time perturbation of the MAE
 * - compareWeights: metrics of two vectors side by side
 *
 * Engine errors are caught here and reported as success == false with
 * the error text as message. Predictions are always relative to the
 * weight table's base weights.
 */

#include "DataTypes.hh"
#include "ScoringModel.hh"
#include "CancellationToken.hh"
#include <map>
#include <string>
#include <vector>

namespace WeightCalibration {

struct RecalibrationResponse {
    bool success;
    ErrorMetrics metrics;
    bool has_optimized_weights;
    WeightVector optimized_weights;
    std::string message;

    RecalibrationResponse() : success(false), has_optimized_weights(false) {}
    void print() const;
};

/**
 * @brief Relative improvement of optimised over current weights, in %
 */
struct ImprovementMetrics {
    double mae_improvement;
    double rmse_improvement;
    double variance_reduction;   ///< Reduction of |avg_variance|

    ImprovementMetrics() : mae_improvement(0.0), rmse_improvement(0.0), variance_reduction(0.0) {}
};

struct OptimizationResponse {
    bool success;
    WeightVector optimized_weights;
    ImprovementMetrics improvement_metrics;
    int iterations;
    bool converged;
    OptimizationResult result;
    std::string message;

    OptimizationResponse() : success(false), iterations(0), converged(false) {}
    void print() const;
};

struct SensitivityEntry {
    double base_mae;
    double increased_mae;
    double decreased_mae;
    double sensitivity_score;    ///< |increased_mae - decreased_mae| / base_mae

    SensitivityEntry() : base_mae(0.0), increased_mae(0.0), decreased_mae(0.0), sensitivity_score(0.0) {}
};

struct SensitivityResponse {
    bool success;
    std::map<std::string, SensitivityEntry> sensitivity_results;
    std::string message;

    SensitivityResponse() : success(false) {}
    void print() const;
};

struct WeightComparison {
    bool success;
    ErrorMetrics metrics_a;
    ErrorMetrics metrics_b;
    RecalibrationMetrics comparison;   ///< a as baseline, b as candidate
    double mae_difference;             ///< b - a
    double rmse_difference;
    double mape_difference;
    std::string better;                ///< "a", "b" or "tie" by MAPE
    std::string message;

    WeightComparison()
        : success(false), mae_difference(0.0), rmse_difference(0.0), mape_difference(0.0) {}
    void print() const;
};

/**
 * @brief Descriptive statistics of one factor over the claim set
 */
struct WeightStatistics {
    bool success;
    std::string factor_name;
    double mean;
    double median;
    double mode;
    double std_dev;
    double min;
    double max;
    double q25;
    double q75;
    double correlation_with_variance;
    int sample_size;
    double suggested_weight;
    std::string reason;
    std::string confidence;            ///< "High", "Medium" or "Low"
    std::string message;

    WeightStatistics()
        : success(false), mean(0.0), median(0.0), mode(0.0), std_dev(0.0)
        , min(0.0), max(0.0), q25(0.0), q75(0.0), correlation_with_variance(0.0)
        , sample_size(0), suggested_weight(0.0) {}
    void print() const;
};

struct SweepPoint {
    double weight;
    double mae;
    double mape;
    double rmse;

    SweepPoint() : weight(0.0), mae(0.0), mape(0.0), rmse(0.0) {}
};

struct RecommendationResponse {
    bool success;
    std::vector<WeightRecommendation> recommendations;
    WeightVector recommended_weights;  ///< Rescaled to the base weight budget
    std::string message;

    RecommendationResponse() : success(false) {}
};

/**
 * @class RecalibrationService
 * @brief Stateless facade over the engine for one weight table
 */
class RecalibrationService {
public:
    /**
     * @brief Constructor
     * @param table Weight table (validated on use)
     * @param coefficients Settlement formula coefficients
     */
    explicit RecalibrationService(const WeightTable& table,
                                  const ScoringCoefficients& coefficients = ScoringCoefficients());

    /**
     * @brief Default claim set used when a call passes none
     */
    void setClaims(const std::vector<ClaimRecord>& claims);
    const std::vector<ClaimRecord>& getClaims() const { return m_claims; }

    const WeightTable& getTable() const { return m_table; }

    /**
     * @brief Base weights of the table
     */
    WeightVector defaultWeights() const;

    /**
     * @brief Metrics of a weight vector on the default claims
     * @param weights Weights to evaluate (missing factors at base)
     * @param optimize Also run coordinate descent from these weights
     */
    RecalibrationResponse recalibrate(const WeightVector& weights, bool optimize = false) const;

    /**
     * @brief Metrics of a weight vector on the given claims
     */
    RecalibrationResponse recalibrate(const WeightVector& weights,
                                      const std::vector<ClaimRecord>& claims,
                                      bool optimize = false) const;

    /**
     * @brief Run a named strategy from the current weights
     *
     * Method names: coordinate_descent (gradient_descent,
     * variance_minimization), grid_search, correlation_guided (smart).
     */
    OptimizationResponse optimize(const std::vector<ClaimRecord>& claims,
                                  const WeightVector& currentWeights,
                                  const std::string& method = "coordinate_descent",
                                  const OptimizationConfig& config = OptimizationConfig(),
                                  const CancellationToken* cancel = nullptr) const;

    /**
     * @brief MAE with each factor's weight moved up and down by a fraction
     *
     * One factor at a time, all others at the given weights. Perturbed
     * weights are clamped to the factor's bounds.
     */
    SensitivityResponse sensitivityAnalysis(const WeightVector& weights,
                                            double perturbation = 0.1) const;

    SensitivityResponse sensitivityAnalysis(const WeightVector& weights,
                                            const std::vector<ClaimRecord>& claims,
                                            double perturbation = 0.1) const;

    /**
     * @brief Metrics of two weight vectors on the default claims
     */
    WeightComparison compareWeights(const WeightVector& weightsA, const WeightVector& weightsB) const;

    WeightComparison compareWeights(const WeightVector& weightsA,
                                    const WeightVector& weightsB,
                                    const std::vector<ClaimRecord>& claims) const;

    /**
     * @brief Statistics of a factor's values and its tiered suggestion
     */
    WeightStatistics analyzeWeightStatistics(const std::vector<ClaimRecord>& claims,
                                             const std::string& factorName) const;

    /**
     * @brief Metrics for several test weights of one factor, others at baseline
     * @throws InputValidationError for an unknown factor or out-of-bound weight
     */
    std::vector<SweepPoint> sweepFactor(const std::vector<ClaimRecord>& claims,
                                        const std::string& factorName,
                                        const std::vector<double>& testWeights) const;

    /**
     * @brief Data-driven weight suggestions for the table
     */
    RecommendationResponse recommendWeights(const std::vector<ClaimRecord>& claims,
                                            const WeightVector& weights) const;

private:
    ErrorMetrics evaluate(const std::vector<ClaimRecord>& claims, const WeightVector& weights) const;

    WeightTable m_table;
    ScoringModel m_model;
    std::vector<ClaimRecord> m_claims;
};

} // namespace WeightCalibration

#endif // RECALIBRATION_SERVICE_HH
