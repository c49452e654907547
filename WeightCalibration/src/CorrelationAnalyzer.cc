/**
 * @file CorrelationAnalyzer.cc
 * @brief Implementation of factor / error correlation
 */

#include "CorrelationAnalyzer.hh"
#include "CalibrationErrors.hh"
#include "FeatureCoercion.hh"
#include "MathUtilities.hh"
#include <cmath>

namespace WeightCalibration {

double CorrelationAnalyzer::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return 0.0;
    if (isConstant(x) || isConstant(y)) return 0.0;

    const double mx = mean(x);
    const double my = mean(y);

    double numerator = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mx;
        double dy = y[i] - my;
        numerator += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    double denominator = std::sqrt(sxx * syy);
    if (denominator == 0.0 || !std::isfinite(denominator)) return 0.0;
    return clamp(safeDivide(numerator, denominator), -1.0, 1.0);
}

bool CorrelationAnalyzer::factorValue(const ClaimRecord& claim,
                                      const std::string& factorName,
                                      double& out) {
    const FeatureValue& value = claim.feature(factorName);
    if (!value.isPresent()) return false;
    if (tryParseNumber(value, out)) return true;
    if (value.kind == FeatureValue::Text && trimWhitespace(value.text).empty()) return false;
    out = categoricalScore(value);
    return true;
}

double CorrelationAnalyzer::correlateWith(const std::vector<ClaimRecord>& claims,
                                          const std::vector<bool>& hasVariance,
                                          const std::vector<double>& absVariance,
                                          const std::string& factorName) {
    std::vector<double> values;
    std::vector<double> variances;
    values.reserve(claims.size());
    variances.reserve(claims.size());

    for (size_t i = 0; i < claims.size(); ++i) {
        if (!hasVariance[i]) continue;
        double v = 0.0;
        if (!factorValue(claims[i], factorName, v)) continue;
        values.push_back(v);
        variances.push_back(absVariance[i]);
    }
    return pearson(values, variances);
}

double CorrelationAnalyzer::correlate(const std::vector<ClaimRecord>& claims,
                                      const std::string& factorName) {
    std::vector<bool> has(claims.size(), false);
    std::vector<double> absVariance(claims.size(), 0.0);
    for (size_t i = 0; i < claims.size(); ++i) {
        if (claims[i].has_variance && std::isfinite(claims[i].variance_pct)) {
            has[i] = true;
            absVariance[i] = std::abs(claims[i].variance_pct);
        }
    }
    return correlateWith(claims, has, absVariance, factorName);
}

double CorrelationAnalyzer::correlate(const std::vector<ClaimRecord>& claims,
                                      const std::vector<double>& predictions,
                                      const std::string& factorName) {
    if (claims.size() != predictions.size()) {
        throw InputValidationError("correlation needs one prediction per claim");
    }
    std::vector<bool> has(claims.size(), false);
    std::vector<double> absVariance(claims.size(), 0.0);
    for (size_t i = 0; i < claims.size(); ++i) {
        double actual = claims[i].actual_settlement;
        if (actual == 0.0) continue;
        has[i] = true;
        absVariance[i] = std::abs((predictions[i] - actual) / actual * 100.0);
    }
    return correlateWith(claims, has, absVariance, factorName);
}

FactorImpact CorrelationAnalyzer::correlateAll(const std::vector<ClaimRecord>& claims,
                                               const WeightTable& table) {
    FactorImpact out;
    for (const WeightEntry& entry : table) {
        out[entry.factor_name] = correlate(claims, entry.factor_name);
    }
    return out;
}

FactorImpact CorrelationAnalyzer::correlateAll(const std::vector<ClaimRecord>& claims,
                                               const std::vector<double>& predictions,
                                               const WeightTable& table) {
    FactorImpact out;
    for (const WeightEntry& entry : table) {
        out[entry.factor_name] = correlate(claims, predictions, entry.factor_name);
    }
    return out;
}

} // namespace WeightCalibration
