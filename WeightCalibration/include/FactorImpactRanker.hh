#ifndef FACTOR_IMPACT_RANKER_HH
#define FACTOR_IMPACT_RANKER_HH

/**
 * @file FactorImpactRanker.hh
 * @brief Factor importance and data-driven weight recommendations
 *
 * Combines the correlation of a factor with the prediction error and
 * its current weighted contribution into one score:
 *
 *   combined = 0.6 * |correlation| + 0.4 * impact / max(impacts)
 *
 * and maps the score onto the factor's weight range.
 */

#include "DataTypes.hh"
#include <string>
#include <vector>

namespace WeightCalibration {

class FactorImpactRanker {
public:
    static const double kCorrelationShare;   ///< 0.6
    static const double kImpactShare;        ///< 0.4
    static const double kMinimumChange;      ///< Smallest suggestion worth reporting

    /**
     * @brief Largest impact value, 0 when empty or all non-positive
     */
    static double maxImpact(const FactorImpact& impacts);

    /**
     * @brief 0.6 * |correlation| + 0.4 * normalised impact
     * @param correlation Pearson coefficient of the factor
     * @param impact Impact of the factor
     * @param maxImpactValue Largest impact of the run (0 disables the term)
     */
    static double combinedScore(double correlation, double impact, double maxImpactValue);

    /**
     * @brief Recommended weight of one factor
     * @return min_weight + combined * (max_weight - min_weight), within bounds
     */
    static double recommend(const WeightEntry& entry,
                            double correlation,
                            const FactorImpact& impacts);

    /**
     * @brief Recommended weights of the whole table, before rescaling
     * @param correlations Factor -> correlation (missing factors count as 0)
     */
    static WeightVector recommendAll(const WeightTable& table,
                                     const FactorImpact& correlations,
                                     const FactorImpact& impacts);

    /**
     * @brief Rescale recommendations to the sum of the table's base weights
     *
     * Values are scaled by sum(base) / sum(recommended). Factors whose
     * scaled value would leave [min_weight, max_weight] are pinned to
     * the violated bound and the others share the rest of the budget,
     * so the result respects both the bounds and the budget. When no
     * bound is hit this is the plain proportional rescale. If every
     * recommendation is 0 the base weights are returned.
     */
    static WeightVector rescaleToBudget(const WeightTable& table,
                                        const WeightVector& recommended);

    /**
     * @brief Impact of every weighted factor
     *
     * impact[f] = mean over claims of |categoricalScore(claim[f]) * W[f] * variance_pct|
     * using the claims' recorded variance (claims without one add 0).
     */
    static FactorImpact computeImpacts(const std::vector<ClaimRecord>& claims,
                                       const WeightVector& weights);

    /**
     * @brief Impact of every weighted factor, variance from predictions
     * @throws InputValidationError if the sizes differ
     */
    static FactorImpact computeImpacts(const std::vector<ClaimRecord>& claims,
                                       const std::vector<double>& predictions,
                                       const WeightVector& weights);

    /**
     * @brief Per-factor suggestions with reason and confidence
     *
     * Only suggestions that move a weight by more than kMinimumChange
     * are returned, sorted by expected improvement (descending).
     */
    static std::vector<WeightRecommendation> generateRecommendations(
        const std::vector<ClaimRecord>& claims,
        const WeightTable& table,
        const FactorImpact& impacts);

private:
    static FactorImpact impactsFrom(const std::vector<ClaimRecord>& claims,
                                    const std::vector<double>& absVariance,
                                    const WeightVector& weights);
};

} // namespace WeightCalibration

#endif // FACTOR_IMPACT_RANKER_HH
