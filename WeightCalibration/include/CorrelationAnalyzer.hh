#ifndef CORRELATION_ANALYZER_HH
#define CORRELATION_ANALYZER_HH

/**
 * @file CorrelationAnalyzer.hh
 * @brief Pearson correlation of claim factors with prediction error
 */

#include "DataTypes.hh"
#include <string>
#include <vector>

namespace WeightCalibration {

/**
 * @class CorrelationAnalyzer
 * @brief Correlates one factor with the absolute variance % of each claim
 *
 * A claim contributes a sample when it has a value for the factor and
 * a defined variance. Numeric values (or numeric text) are used as-is;
 * other text goes through categoricalScore(). All degenerate cases
 * return 0.
 */
class CorrelationAnalyzer {
public:
    /**
     * @brief Pearson correlation coefficient
     * @return Value in [-1, 1]; 0 for fewer than 2 samples, mismatched
     *         sizes, or when either series is constant
     */
    static double pearson(const std::vector<double>& x, const std::vector<double>& y);

    /**
     * @brief Correlate a factor with the claims' recorded |variance_pct|
     *
     * Claims without a recorded variance are skipped.
     */
    static double correlate(const std::vector<ClaimRecord>& claims,
                            const std::string& factorName);

    /**
     * @brief Correlate a factor with |variance %| of the given predictions
     *
     * Claims with a zero actual settlement are skipped.
     * @throws InputValidationError if the sizes differ
     */
    static double correlate(const std::vector<ClaimRecord>& claims,
                            const std::vector<double>& predictions,
                            const std::string& factorName);

    /**
     * @brief Correlations of every factor of the table, recorded variance
     */
    static FactorImpact correlateAll(const std::vector<ClaimRecord>& claims,
                                     const WeightTable& table);

    /**
     * @brief Correlations of every factor of the table against predictions
     */
    static FactorImpact correlateAll(const std::vector<ClaimRecord>& claims,
                                     const std::vector<double>& predictions,
                                     const WeightTable& table);

    /**
     * @brief Numeric reading of a factor used for correlation
     * @return false when the claim has no value for the factor
     */
    static bool factorValue(const ClaimRecord& claim, const std::string& factorName, double& out);

private:
    static double correlateWith(const std::vector<ClaimRecord>& claims,
                                const std::vector<bool>& hasVariance,
                                const std::vector<double>& absVariance,
                                const std::string& factorName);
};

} // namespace WeightCalibration

#endif // CORRELATION_ANALYZER_HH
