/**
 * @file ScoringModel.cc
 * @brief Implementation of the settlement prediction model
 */

#include "ScoringModel.hh"
#include "FeatureCoercion.hh"
#include "MathUtilities.hh"
#include <algorithm>
#include <cmath>

namespace WeightCalibration {

const double ScoringModel::kDefaultImpact = 2.0;
const double ScoringModel::kCausationScale = 0.1;
const double ScoringModel::kMaxExponent = 700.0;

ScoringModel::ScoringModel(const ScoringCoefficients& coefficients)
    : m_coefficients(coefficients)
{
}

void ScoringModel::setCoefficients(const ScoringCoefficients& coefficients) {
    m_coefficients = coefficients;
}

const ScoringCoefficients& ScoringModel::getCoefficients() const {
    return m_coefficients;
}

const std::vector<std::string>& ScoringModel::severityFactors() {
    static const std::vector<std::string> names = {
        "severity_allowed_tx_period",
        "severity_initial_tx",
        "severity_injections",
        "severity_objective_findings",
        "severity_pain_mgmt",
        "severity_type_tx",
        "severity_injury_site",
        "severity_code"
    };
    return names;
}

const std::vector<std::string>& ScoringModel::causationFactors() {
    static const std::vector<std::string> names = {
        "causation_probability",
        "causation_tx_delay",
        "causation_tx_gaps",
        "causation_compliance"
    };
    return names;
}

double ScoringModel::sumFields(const ClaimRecord& claim,
                               const std::vector<std::string>& fields) const {
    double total = 0.0;
    for (const std::string& name : fields) {
        total += safeNumeric(claim.feature(name));
    }
    return total;
}

double ScoringModel::severitySum(const ClaimRecord& claim) const {
    return sumFields(claim, severityFactors()) + safeNumeric(claim.feature("SEVERITY_SCORE"));
}

double ScoringModel::impactScore(const ClaimRecord& claim) const {
    double raw = 0.0;
    if (!tryParseNumber(claim.feature("IMPACT"), raw)) {
        return kDefaultImpact;
    }
    return clamp(std::trunc(raw), 1.0, 4.0);
}

double ScoringModel::causationSum(const ClaimRecord& claim) const {
    return sumFields(claim, causationFactors());
}

double ScoringModel::ratingWeight(const ClaimRecord& claim) const {
    return safeNumeric(claim.feature("RATINGWEIGHT"));
}

double ScoringModel::exponent(double S, double I) const {
    const ScoringCoefficients& c = m_coefficients;
    return c.C0
         + c.C1 * S
         + c.C2 * I
         + c.C3 * S * I
         + c.C4 * I * I
         + c.C5 * I * I * I
         + c.C6 * S * S;
}

double ScoringModel::basePrediction(const ClaimRecord& claim) const {
    double E = exponent(severitySum(claim), impactScore(claim));
    double base = std::exp(std::min(E, kMaxExponent));

    double venue = 1.0 + ratingWeight(claim);
    double causation = 1.0 + kCausationScale * causationSum(claim);
    double prediction = base * venue * causation;

    // Negative multipliers (large negative rating or causation inputs)
    if (!std::isfinite(prediction) || prediction < 0.0) return 0.0;
    return prediction;
}

double ScoringModel::weightedScore(const ClaimRecord& claim, const WeightVector& weights) const {
    double numerator = 0.0;
    double total = 0.0;
    for (const auto& entry : weights.entries()) {
        numerator += entry.second * categoricalScore(claim.feature(entry.first));
        total += entry.second;
    }
    return safeDivide(numerator, total);
}

double ScoringModel::adjust(double base, double score, double referenceScore) {
    double multiplier = std::max(0.0, 1.0 + score - referenceScore);
    if (multiplier == 0.0) return 0.0;
    return base * multiplier;
}

double ScoringModel::predict(const ClaimRecord& claim,
                             const WeightVector& weights,
                             const WeightVector& reference) const {
    double base = basePrediction(claim);
    if (weights == reference) return base;
    return adjust(base, weightedScore(claim, weights), weightedScore(claim, reference));
}

ClaimFeatures ScoringModel::extractFeatures(const ClaimRecord& claim,
                                            const std::vector<std::string>& factorNames) const {
    ClaimFeatures f;
    f.severity_sum = severitySum(claim);
    f.impact_score = impactScore(claim);
    f.causation_sum = causationSum(claim);
    f.rating_weight = ratingWeight(claim);
    f.base_prediction = basePrediction(claim);

    f.factor_values.reserve(factorNames.size());
    for (const std::string& name : factorNames) {
        f.factor_values.push_back(categoricalScore(claim.feature(name)));
    }
    return f;
}

double ScoringModel::weightedScore(const ClaimFeatures& features,
                                   const std::vector<double>& weights) {
    double numerator = 0.0;
    double total = 0.0;
    size_t n = std::min(weights.size(), features.factor_values.size());
    for (size_t i = 0; i < n; ++i) {
        numerator += weights[i] * features.factor_values[i];
        total += weights[i];
    }
    return safeDivide(numerator, total);
}

double ScoringModel::predict(const ClaimFeatures& features,
                             const std::vector<double>& weights,
                             double referenceScore) {
    return adjust(features.base_prediction, weightedScore(features, weights), referenceScore);
}

} // namespace WeightCalibration
