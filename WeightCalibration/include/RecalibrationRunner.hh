#ifndef RECALIBRATION_RUNNER_HH
#define RECALIBRATION_RUNNER_HH

/**
 * @file RecalibrationRunner.hh
 * @brief Before/after evaluation of two weight vectors over a claim set
 *
 * Also the evaluation harness of the optimizer: a claim set is
 * prepared once (features extracted, reference score computed) and
 * then evaluated for many weight vectors.
 */

#include "DataTypes.hh"
#include "ScoringModel.hh"
#include <string>
#include <vector>

namespace WeightCalibration {

/**
 * @brief Claim set with the weight-independent work done
 */
struct PreparedClaims {
    std::vector<std::string> factor_names;   ///< Order of all aligned weight vectors
    std::vector<ClaimFeatures> features;
    std::vector<double> actuals;
    std::vector<double> reference_weights;   ///< Reference vector, aligned
    std::vector<double> reference_scores;    ///< Per-claim weighted score of the reference

    size_t size() const { return actuals.size(); }
};

/**
 * @class RecalibrationRunner
 * @brief Applies a baseline and a candidate weight vector to every claim
 */
class RecalibrationRunner {
public:
    explicit RecalibrationRunner(const ScoringModel& model = ScoringModel(),
                                 const RecalibrationThresholds& thresholds = RecalibrationThresholds());

    const ScoringModel& getModel() const { return m_model; }
    const RecalibrationThresholds& getThresholds() const { return m_thresholds; }

    /**
     * @brief Compare baseline and candidate predictions claim by claim
     *
     * The baseline is the reference vector, so baseline predictions are
     * the closed-form values. Claims with a zero actual settlement are
     * reported as excluded and counted as unchanged.
     *
     * @throws InsufficientDataError if claims is empty
     */
    RecalibrationReport run(const std::vector<ClaimRecord>& claims,
                            const WeightVector& baseline,
                            const WeightVector& candidate) const;

    /**
     * @brief Same comparison with an explicit reference vector
     *
     * Both vectors are scored relative to reference, so their
     * predictions match those of any other evaluation against it.
     */
    RecalibrationReport run(const std::vector<ClaimRecord>& claims,
                            const WeightVector& baseline,
                            const WeightVector& candidate,
                            const WeightVector& reference) const;

    /**
     * @brief Extract features once for repeated evaluation
     * @param claims Claim set
     * @param reference Reference vector of the weight adjustment
     * @param extraFactors Further factors the evaluated vectors may carry
     * @throws InsufficientDataError if claims is empty
     */
    PreparedClaims prepare(const std::vector<ClaimRecord>& claims,
                           const WeightVector& reference,
                           const std::vector<std::string>& extraFactors = std::vector<std::string>()) const;

    /**
     * @brief Align a weight vector with the prepared factor order
     *
     * Factors of the prepared set missing from the vector get weight 0.
     */
    static std::vector<double> align(const PreparedClaims& prepared, const WeightVector& weights);

    /**
     * @brief Predictions for all prepared claims under the given weights
     */
    static std::vector<double> predict(const PreparedClaims& prepared, const std::vector<double>& aligned);

    /**
     * @brief Error metrics of the given weights on the prepared claims
     */
    static ErrorMetrics evaluate(const PreparedClaims& prepared, const WeightVector& weights);

    /**
     * @brief Closed-form predictions (reference weights)
     */
    static std::vector<double> baselinePredictions(const PreparedClaims& prepared);

private:
    ClaimOutcome classify(double improvementPoints) const;

    ScoringModel m_model;
    RecalibrationThresholds m_thresholds;
};

} // namespace WeightCalibration

#endif // RECALIBRATION_RUNNER_HH
