#ifndef SCORING_MODEL_HH
#define SCORING_MODEL_HH

/**
 * @file ScoringModel.hh
 * @brief Settlement prediction model
 *
 * Implements the forward model for one claim:
 * - Severity sum S, impact score I and causation sum from claim fields
 * - Closed-form settlement exp(E) scaled by venue and causation multipliers
 * - Weight-driven adjustment via a normalised weighted factor score
 */

#include "DataTypes.hh"
#include <string>
#include <vector>

namespace WeightCalibration {

/**
 * @brief Claim quantities that do not depend on the weights
 *
 * Extracted once per claim so that repeated evaluations only redo
 * the weighted score.
 */
struct ClaimFeatures {
    double severity_sum;
    double impact_score;
    double causation_sum;
    double rating_weight;
    double base_prediction;              ///< Closed-form settlement
    std::vector<double> factor_values;   ///< Categorical scores, aligned with a factor list

    ClaimFeatures()
        : severity_sum(0.0), impact_score(2.0), causation_sum(0.0)
        , rating_weight(0.0), base_prediction(0.0) {}
};

/**
 * @class ScoringModel
 * @brief Forward model for settlement prediction
 *
 * The closed-form part:
 *   E    = C0 + C1*S + C2*I + C3*S*I + C4*I^2 + C5*I^3 + C6*S^2
 *   base = exp(E) * (1 + rating_weight) * (1 + 0.1 * causation_sum)
 *
 * Weights enter relative to a reference vector:
 *   predict(W, R) = base * max(0, 1 + score(W) - score(R))
 * where score() is the weight-normalised sum of categorical factor
 * scores. predict(W, W) is exactly the closed-form value.
 */
class ScoringModel {
public:
    static const double kDefaultImpact;        ///< I when the claim has none
    static const double kCausationScale;       ///< 0.1 per causation point
    static const double kMaxExponent;          ///< Keeps exp(E) finite

    /**
     * @brief Constructor with coefficients
     * @param coefficients C0..C6 of the exponent
     */
    explicit ScoringModel(const ScoringCoefficients& coefficients = ScoringCoefficients());

    void setCoefficients(const ScoringCoefficients& coefficients);
    const ScoringCoefficients& getCoefficients() const;

    /// Severity sub-factor field names, in summation order
    static const std::vector<std::string>& severityFactors();

    /// Causation sub-factor field names, in summation order
    static const std::vector<std::string>& causationFactors();

    /**
     * @brief Severity sum S
     *
     * Sum of the severity sub-factors plus the pre-computed
     * SEVERITY_SCORE when present. Garbled fields count as 0.
     */
    double severitySum(const ClaimRecord& claim) const;

    /**
     * @brief Impact score I, truncated to an integer and clamped to [1, 4]
     * @return kDefaultImpact (2) when absent or garbled
     */
    double impactScore(const ClaimRecord& claim) const;

    /**
     * @brief Sum of the causation sub-factors
     */
    double causationSum(const ClaimRecord& claim) const;

    /**
     * @brief Venue multiplier RATINGWEIGHT, 0 when absent
     */
    double ratingWeight(const ClaimRecord& claim) const;

    /**
     * @brief Exponent E for given S and I
     */
    double exponent(double S, double I) const;

    /**
     * @brief Closed-form settlement prediction (weights not involved)
     * @return Non-negative finite value
     */
    double basePrediction(const ClaimRecord& claim) const;

    /**
     * @brief Normalised weighted factor score
     *
     * sum(W[f] * categoricalScore(claim[f])) / sum(W[f]) over the
     * factors of W; 0 when the weights sum to 0.
     */
    double weightedScore(const ClaimRecord& claim, const WeightVector& weights) const;

    /**
     * @brief Predicted settlement under weights W relative to reference R
     * @return Non-negative value; equals basePrediction() when W == R
     */
    double predict(const ClaimRecord& claim,
                   const WeightVector& weights,
                   const WeightVector& reference) const;

    /**
     * @brief Extract the weight-independent quantities of a claim
     * @param claim Claim to read
     * @param factorNames Factors whose categorical scores are cached
     */
    ClaimFeatures extractFeatures(const ClaimRecord& claim,
                                  const std::vector<std::string>& factorNames) const;

    /**
     * @brief Weighted score from cached features
     * @param weights Weights aligned with the factor list used at extraction
     */
    static double weightedScore(const ClaimFeatures& features,
                                const std::vector<double>& weights);

    /**
     * @brief Prediction from cached features and a pre-computed reference score
     */
    static double predict(const ClaimFeatures& features,
                          const std::vector<double>& weights,
                          double referenceScore);

private:
    static double adjust(double base, double score, double referenceScore);
    double sumFields(const ClaimRecord& claim, const std::vector<std::string>& fields) const;

    ScoringCoefficients m_coefficients;
};

} // namespace WeightCalibration

#endif // SCORING_MODEL_HH
