/**
 * @file FactorImpactRanker.cc
 * @brief Implementation of factor ranking and weight recommendations
 */

#include "FactorImpactRanker.hh"
#include "CalibrationErrors.hh"
#include "CorrelationAnalyzer.hh"
#include "FeatureCoercion.hh"
#include "MathUtilities.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace WeightCalibration {

const double FactorImpactRanker::kCorrelationShare = 0.6;
const double FactorImpactRanker::kImpactShare = 0.4;
const double FactorImpactRanker::kMinimumChange = 0.01;

namespace {

// Sum of the recommendations scaled by s and clamped to their bounds
double clampedSum(const WeightTable& table, const std::vector<double>& r, double s) {
    double total = 0.0;
    for (size_t i = 0; i < table.size(); ++i) {
        total += clamp(r[i] * s, table[i].min_weight, table[i].max_weight);
    }
    return total;
}

bool byExpectedImprovement(const WeightRecommendation& a, const WeightRecommendation& b) {
    return a.expected_improvement > b.expected_improvement;
}

} // namespace

double FactorImpactRanker::maxImpact(const FactorImpact& impacts) {
    double best = 0.0;
    for (const auto& kv : impacts) {
        if (std::isfinite(kv.second)) best = std::max(best, kv.second);
    }
    return best;
}

double FactorImpactRanker::combinedScore(double correlation, double impact, double maxImpactValue) {
    double normalizedImpact = (maxImpactValue > 0.0) ? impact / maxImpactValue : 0.0;
    double score = kCorrelationShare * std::abs(correlation) + kImpactShare * normalizedImpact;
    return clamp(score, 0.0, 1.0);
}

double FactorImpactRanker::recommend(const WeightEntry& entry,
                                     double correlation,
                                     const FactorImpact& impacts) {
    FactorImpact::const_iterator it = impacts.find(entry.factor_name);
    double impact = (it == impacts.end()) ? 0.0 : it->second;
    double score = combinedScore(correlation, impact, maxImpact(impacts));
    return clamp(entry.min_weight + score * entry.range(), entry.min_weight, entry.max_weight);
}

WeightVector FactorImpactRanker::recommendAll(const WeightTable& table,
                                              const FactorImpact& correlations,
                                              const FactorImpact& impacts) {
    WeightVector out;
    for (const WeightEntry& entry : table) {
        FactorImpact::const_iterator it = correlations.find(entry.factor_name);
        double corr = (it == correlations.end()) ? 0.0 : it->second;
        out = out.with(entry.factor_name, recommend(entry, corr, impacts));
    }
    return out;
}

WeightVector FactorImpactRanker::rescaleToBudget(const WeightTable& table,
                                                 const WeightVector& recommended) {
    double budget = 0.0;
    double sumRecommended = 0.0;
    std::vector<double> r(table.size(), 0.0);
    for (size_t i = 0; i < table.size(); ++i) {
        budget += table[i].base_weight;
        r[i] = std::max(0.0, recommended.get(table[i].factor_name, table[i].base_weight));
        sumRecommended += r[i];
    }

    if (sumRecommended <= 0.0) {
        return WeightVector::fromBaseWeights(table);
    }

    std::vector<double> values(table.size(), 0.0);

    // Plain proportional rescale when it stays inside every bound
    double scale = budget / sumRecommended;
    bool inBounds = true;
    for (size_t i = 0; i < table.size(); ++i) {
        values[i] = r[i] * scale;
        if (values[i] < table[i].min_weight || values[i] > table[i].max_weight) inBounds = false;
    }

    if (!inBounds) {
        // Largest reachable sum: positive recommendations at max, zeros stay put
        double reachable = 0.0;
        double headroom = 0.0;
        for (size_t i = 0; i < table.size(); ++i) {
            if (r[i] > 0.0) {
                reachable += table[i].max_weight;
            } else {
                double c = clamp(0.0, table[i].min_weight, table[i].max_weight);
                reachable += c;
                headroom += table[i].max_weight - c;
            }
        }

        if (reachable < budget) {
            double t = safeDivide(budget - reachable, headroom);
            for (size_t i = 0; i < table.size(); ++i) {
                if (r[i] > 0.0) {
                    values[i] = table[i].max_weight;
                } else {
                    double c = clamp(0.0, table[i].min_weight, table[i].max_weight);
                    values[i] = c + (table[i].max_weight - c) * t;
                }
            }
        } else {
            // clampedSum is non-decreasing in the scale; bisect for the budget
            double lo = 0.0;
            double hi = std::max(scale, 1.0);
            for (int k = 0; k < 2000 && clampedSum(table, r, hi) < budget; ++k) hi *= 2.0;
            for (int k = 0; k < 200; ++k) {
                double mid = 0.5 * (lo + hi);
                if (clampedSum(table, r, mid) < budget) lo = mid; else hi = mid;
            }
            scale = hi;

            // Exact scale for the factors left free at this point
            double pinned = 0.0;
            double freeSum = 0.0;
            for (size_t i = 0; i < table.size(); ++i) {
                double v = r[i] * scale;
                if (v <= table[i].min_weight || v >= table[i].max_weight) {
                    pinned += clamp(v, table[i].min_weight, table[i].max_weight);
                } else {
                    freeSum += r[i];
                }
            }
            if (freeSum > 0.0) scale = (budget - pinned) / freeSum;

            for (size_t i = 0; i < table.size(); ++i) {
                values[i] = clamp(r[i] * scale, table[i].min_weight, table[i].max_weight);
            }
        }
    }

    WeightVector out;
    for (size_t i = 0; i < table.size(); ++i) {
        out = out.with(table[i].factor_name, values[i]);
    }
    return out;
}

FactorImpact FactorImpactRanker::impactsFrom(const std::vector<ClaimRecord>& claims,
                                             const std::vector<double>& absVariance,
                                             const WeightVector& weights) {
    FactorImpact impacts;
    for (const auto& w : weights.entries()) {
        double total = 0.0;
        for (size_t i = 0; i < claims.size(); ++i) {
            double value = categoricalScore(claims[i].feature(w.first));
            total += std::abs(value * w.second * absVariance[i]);
        }
        impacts[w.first] = safeDivide(total, static_cast<double>(claims.size()));
    }
    return impacts;
}

FactorImpact FactorImpactRanker::computeImpacts(const std::vector<ClaimRecord>& claims,
                                                const WeightVector& weights) {
    std::vector<double> absVariance(claims.size(), 0.0);
    for (size_t i = 0; i < claims.size(); ++i) {
        if (claims[i].has_variance && std::isfinite(claims[i].variance_pct)) {
            absVariance[i] = std::abs(claims[i].variance_pct);
        }
    }
    return impactsFrom(claims, absVariance, weights);
}

FactorImpact FactorImpactRanker::computeImpacts(const std::vector<ClaimRecord>& claims,
                                                const std::vector<double>& predictions,
                                                const WeightVector& weights) {
    if (claims.size() != predictions.size()) {
        throw InputValidationError("impact analysis needs one prediction per claim");
    }
    std::vector<double> absVariance(claims.size(), 0.0);
    for (size_t i = 0; i < claims.size(); ++i) {
        double actual = claims[i].actual_settlement;
        if (actual != 0.0) {
            absVariance[i] = std::abs((predictions[i] - actual) / actual * 100.0);
        }
    }
    return impactsFrom(claims, absVariance, weights);
}

std::vector<WeightRecommendation> FactorImpactRanker::generateRecommendations(
    const std::vector<ClaimRecord>& claims,
    const WeightTable& table,
    const FactorImpact& impacts)
{
    std::vector<WeightRecommendation> out;
    const double maxImp = maxImpact(impacts);

    for (const WeightEntry& entry : table) {
        const double current = entry.base_weight;
        FactorImpact::const_iterator it = impacts.find(entry.factor_name);
        const double impact = (it == impacts.end()) ? 0.0 : it->second;
        const double normalizedImpact = (maxImp > 0.0) ? impact / maxImp : 0.0;
        const double correlation = std::abs(CorrelationAnalyzer::correlate(claims, entry.factor_name));
        const double dynamic = recommend(entry, correlation, impacts);

        WeightRecommendation rec;
        rec.factor_name = entry.factor_name;
        rec.current_weight = current;
        rec.suggested_weight = dynamic;

        std::ostringstream reason;
        reason << std::fixed;

        if (correlation > 0.5 && normalizedImpact > 0.6 && current < dynamic) {
            reason << "High correlation (" << std::setprecision(1) << correlation * 100.0
                   << "%) and high impact (" << std::setprecision(2) << impact
                   << "). Increasing weight will likely improve predictions.";
            rec.confidence = "high";
            rec.expected_improvement = static_cast<int>(std::round(correlation * 10.0));
        } else if (normalizedImpact > 0.5 && current < dynamic * 0.8) {
            reason << "Factor has high impact (" << std::setprecision(2) << impact
                   << ") but is underweighted. Suggested weight "
                   << std::setprecision(3) << dynamic << ".";
            rec.confidence = "high";
            rec.expected_improvement = static_cast<int>(std::round(normalizedImpact * 8.0));
        } else if (normalizedImpact < 0.3 && current > dynamic * 1.2) {
            reason << "Low impact factor (" << std::setprecision(2) << impact
                   << ") is overweighted. Reducing weight should not hurt accuracy.";
            rec.confidence = "medium";
            rec.expected_improvement = static_cast<int>(std::round((current - dynamic) * 20.0));
        } else if (std::abs(current - dynamic) > 0.02) {
            reason << "Data-driven weight is " << std::setprecision(3) << dynamic
                   << " (correlation: " << std::setprecision(1) << correlation * 100.0
                   << "%, impact: " << std::setprecision(2) << normalizedImpact << ").";
            rec.confidence = "medium";
            rec.expected_improvement = static_cast<int>(std::round(std::abs(current - dynamic) * 30.0));
        } else {
            reason << "Weight is near optimal (current: " << std::setprecision(3) << current
                   << ", recommended: " << dynamic << ").";
            rec.suggested_weight = current;
            rec.confidence = "low";
            rec.expected_improvement = 0;
        }
        rec.reason = reason.str();

        if (std::abs(rec.suggested_weight - current) > kMinimumChange) {
            out.push_back(rec);
        }
    }

    std::stable_sort(out.begin(), out.end(), byExpectedImprovement);
    return out;
}

} // namespace WeightCalibration
