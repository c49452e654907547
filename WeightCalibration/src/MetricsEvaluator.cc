/**
 * @file MetricsEvaluator.cc
 * @brief Implementation of error metrics
 */

#include "MetricsEvaluator.hh"
#include "CalibrationErrors.hh"
#include "MathUtilities.hh"
#include <cmath>
#include <sstream>

namespace WeightCalibration {

const double MetricsEvaluator::kCriticalThreshold = 30.0;
const double MetricsEvaluator::kHighThreshold = 20.0;
const double MetricsEvaluator::kMediumThreshold = 10.0;

namespace {

void checkInputs(size_t actuals, size_t predictions) {
    if (actuals == 0) {
        throw InsufficientDataError("no claims to evaluate");
    }
    if (actuals != predictions) {
        std::ostringstream msg;
        msg << actuals << " claims but " << predictions << " predictions";
        throw InputValidationError(msg.str());
    }
}

} // namespace

RiskLevel MetricsEvaluator::classifyRisk(double absDeviationPct) {
    double d = std::abs(absDeviationPct);
    if (d > kCriticalThreshold) return RiskLevel::Critical;
    if (d > kHighThreshold) return RiskLevel::High;
    if (d > kMediumThreshold) return RiskLevel::Medium;
    return RiskLevel::Low;
}

double MetricsEvaluator::absolutePercentageError(double actual, double predicted) {
    if (actual == 0.0) return 0.0;
    return std::abs(predicted - actual) / std::abs(actual) * 100.0;
}

EvaluationResult MetricsEvaluator::evaluate(const std::vector<ClaimRecord>& claims,
                                            const std::vector<double>& predictions) {
    checkInputs(claims.size(), predictions.size());

    std::vector<double> actuals;
    actuals.reserve(claims.size());
    for (const ClaimRecord& claim : claims) {
        actuals.push_back(claim.actual_settlement);
    }
    return evaluate(actuals, predictions);
}

EvaluationResult MetricsEvaluator::evaluate(const std::vector<double>& actuals,
                                            const std::vector<double>& predictions) {
    EvaluationResult result;
    result.metrics = metrics(actuals, predictions);

    result.claims.reserve(actuals.size());
    for (size_t i = 0; i < actuals.size(); ++i) {
        ClaimVariance v;
        v.actual = actuals[i];
        v.predicted = predictions[i];
        if (v.actual != 0.0) {
            v.percentage_defined = true;
            v.variance_pct = (v.predicted - v.actual) / v.actual * 100.0;
            v.risk = classifyRisk(v.variance_pct);
        }
        result.claims.push_back(v);
    }
    return result;
}

ErrorMetrics MetricsEvaluator::metrics(const std::vector<double>& actuals,
                                       const std::vector<double>& predictions) {
    checkInputs(actuals.size(), predictions.size());

    ErrorMetrics m;
    const double n = static_cast<double>(actuals.size());

    double sumAbs = 0.0;
    double sumSq = 0.0;
    double sumDiff = 0.0;
    double sumPct = 0.0;
    int pctCount = 0;

    for (size_t i = 0; i < actuals.size(); ++i) {
        double diff = predictions[i] - actuals[i];
        sumAbs += std::abs(diff);
        sumSq += diff * diff;
        sumDiff += diff;
        if (actuals[i] != 0.0) {
            sumPct += absolutePercentageError(actuals[i], predictions[i]);
            ++pctCount;
        }
    }

    m.mae = sumAbs / n;
    m.rmse = std::sqrt(sumSq / n);
    m.mape = safeDivide(sumPct, static_cast<double>(pctCount));
    m.total_variance = sumDiff;
    m.avg_variance = sumDiff / n;
    m.evaluated_claims = static_cast<int>(actuals.size());
    m.percentage_claims = pctCount;

    // R^2 = 1 - SS_res / SS_tot
    double meanActual = mean(actuals);
    double ssTot = 0.0;
    for (double a : actuals) {
        ssTot += (a - meanActual) * (a - meanActual);
    }
    m.r_squared = (ssTot == 0.0) ? 0.0 : 1.0 - sumSq / ssTot;

    return m;
}

} // namespace WeightCalibration
