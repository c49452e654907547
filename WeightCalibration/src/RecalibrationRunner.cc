/**
 * @file RecalibrationRunner.cc
 * @brief Implementation of the before/after recalibration run
 */

#include "RecalibrationRunner.hh"
#include "CalibrationErrors.hh"
#include "MathUtilities.hh"
#include "MetricsEvaluator.hh"
#include <set>

namespace WeightCalibration {

RecalibrationRunner::RecalibrationRunner(const ScoringModel& model,
                                         const RecalibrationThresholds& thresholds)
    : m_model(model)
    , m_thresholds(thresholds)
{
}

ClaimOutcome RecalibrationRunner::classify(double improvementPoints) const {
    if (improvementPoints > m_thresholds.improved_points) return ClaimOutcome::Improved;
    if (improvementPoints < m_thresholds.degraded_points) return ClaimOutcome::Degraded;
    return ClaimOutcome::Unchanged;
}

PreparedClaims RecalibrationRunner::prepare(const std::vector<ClaimRecord>& claims,
                                            const WeightVector& reference,
                                            const std::vector<std::string>& extraFactors) const {
    if (claims.empty()) {
        throw InsufficientDataError("empty claim set");
    }

    PreparedClaims prepared;
    prepared.factor_names = reference.names();
    std::set<std::string> seen(prepared.factor_names.begin(), prepared.factor_names.end());
    for (const std::string& name : extraFactors) {
        if (seen.insert(name).second) prepared.factor_names.push_back(name);
    }

    prepared.reference_weights = align(prepared, reference);
    prepared.features.reserve(claims.size());
    prepared.actuals.reserve(claims.size());
    prepared.reference_scores.reserve(claims.size());

    for (const ClaimRecord& claim : claims) {
        ClaimFeatures f = m_model.extractFeatures(claim, prepared.factor_names);
        prepared.reference_scores.push_back(ScoringModel::weightedScore(f, prepared.reference_weights));
        prepared.actuals.push_back(claim.actual_settlement);
        prepared.features.push_back(f);
    }
    return prepared;
}

std::vector<double> RecalibrationRunner::align(const PreparedClaims& prepared,
                                               const WeightVector& weights) {
    std::vector<double> aligned;
    aligned.reserve(prepared.factor_names.size());
    for (const std::string& name : prepared.factor_names) {
        aligned.push_back(weights.get(name, 0.0));
    }
    return aligned;
}

std::vector<double> RecalibrationRunner::predict(const PreparedClaims& prepared,
                                                 const std::vector<double>& aligned) {
    std::vector<double> predictions;
    predictions.reserve(prepared.size());
    for (size_t i = 0; i < prepared.size(); ++i) {
        predictions.push_back(ScoringModel::predict(prepared.features[i], aligned,
                                                    prepared.reference_scores[i]));
    }
    return predictions;
}

ErrorMetrics RecalibrationRunner::evaluate(const PreparedClaims& prepared, const WeightVector& weights) {
    return MetricsEvaluator::metrics(prepared.actuals, predict(prepared, align(prepared, weights)));
}

std::vector<double> RecalibrationRunner::baselinePredictions(const PreparedClaims& prepared) {
    std::vector<double> predictions;
    predictions.reserve(prepared.size());
    for (const ClaimFeatures& f : prepared.features) {
        predictions.push_back(f.base_prediction);
    }
    return predictions;
}

RecalibrationReport RecalibrationRunner::run(const std::vector<ClaimRecord>& claims,
                                             const WeightVector& baseline,
                                             const WeightVector& candidate) const {
    return run(claims, baseline, candidate, baseline);
}

RecalibrationReport RecalibrationRunner::run(const std::vector<ClaimRecord>& claims,
                                             const WeightVector& baseline,
                                             const WeightVector& candidate,
                                             const WeightVector& reference) const {
    std::vector<std::string> extra = baseline.names();
    std::vector<std::string> candidateNames = candidate.names();
    extra.insert(extra.end(), candidateNames.begin(), candidateNames.end());
    PreparedClaims prepared = prepare(claims, reference, extra);

    std::vector<double> before = (baseline == reference)
        ? baselinePredictions(prepared)
        : predict(prepared, align(prepared, baseline));
    std::vector<double> after = predict(prepared, align(prepared, candidate));

    RecalibrationReport report;
    report.before = MetricsEvaluator::metrics(prepared.actuals, before);
    report.after = MetricsEvaluator::metrics(prepared.actuals, after);

    RecalibrationMetrics& m = report.metrics;
    m.total_claims = static_cast<int>(claims.size());

    double improvementSum = 0.0;
    int included = 0;

    report.claims.reserve(claims.size());
    for (size_t i = 0; i < claims.size(); ++i) {
        ClaimComparison c;
        c.claim_id = claims[i].claim_id;
        c.actual = prepared.actuals[i];
        c.baseline_prediction = before[i];
        c.candidate_prediction = after[i];

        if (c.actual == 0.0) {
            c.outcome = ClaimOutcome::Excluded;
            ++m.excluded_count;
            ++m.unchanged_count;
        } else {
            c.baseline_error_pct = MetricsEvaluator::absolutePercentageError(c.actual, before[i]);
            c.candidate_error_pct = MetricsEvaluator::absolutePercentageError(c.actual, after[i]);
            c.improvement_pct = c.baseline_error_pct - c.candidate_error_pct;
            c.outcome = classify(c.improvement_pct);

            switch (c.outcome) {
                case ClaimOutcome::Improved: ++m.improved_count; break;
                case ClaimOutcome::Degraded: ++m.degraded_count; break;
                default: ++m.unchanged_count; break;
            }
            improvementSum += c.improvement_pct;
            ++included;
        }
        report.claims.push_back(c);
    }

    m.avg_improvement_pct = safeDivide(improvementSum, static_cast<double>(included));
    m.mape_before = report.before.mape;
    m.mape_after = report.after.mape;
    m.rmse_before = report.before.rmse;
    m.rmse_after = report.after.rmse;
    return report;
}

} // namespace WeightCalibration
