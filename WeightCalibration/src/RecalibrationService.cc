/**
 * @file RecalibrationService.cc
 * @brief Implementation of the engine boundary operations
 */

#include "RecalibrationService.hh"
#include "CalibrationErrors.hh"
#include "CorrelationAnalyzer.hh"
#include "FactorImpactRanker.hh"
#include "MathUtilities.hh"
#include "RecalibrationRunner.hh"
#include "WeightOptimizer.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace WeightCalibration {

namespace {

double relativeReduction(double before, double after) {
    return safeDivide(before - after, before) * 100.0;
}

const WeightEntry& findEntry(const WeightTable& table, const std::string& name) {
    for (const WeightEntry& entry : table) {
        if (entry.factor_name == name) return entry;
    }
    throw InputValidationError("unknown factor '" + name + "'");
}

void reportError(const char* operation, const CalibrationError& e) {
    std::cerr << "Error: " << operation << ": " << e.what() << std::endl;
}

} // namespace

RecalibrationService::RecalibrationService(const WeightTable& table,
                                           const ScoringCoefficients& coefficients)
    : m_table(table)
    , m_model(coefficients)
{
}

void RecalibrationService::setClaims(const std::vector<ClaimRecord>& claims) {
    m_claims = claims;
}

WeightVector RecalibrationService::defaultWeights() const {
    return WeightVector::fromBaseWeights(m_table);
}

ErrorMetrics RecalibrationService::evaluate(const std::vector<ClaimRecord>& claims,
                                            const WeightVector& weights) const {
    WeightOptimizer::validateTable(m_table);
    WeightVector completed = WeightOptimizer::completeWeights(m_table, weights);

    RecalibrationRunner runner(m_model);
    PreparedClaims prepared = runner.prepare(claims, defaultWeights());
    return RecalibrationRunner::evaluate(prepared, completed);
}

//------------------------------------------------------------------
// recalibrate
//------------------------------------------------------------------

RecalibrationResponse RecalibrationService::recalibrate(const WeightVector& weights, bool optimize) const {
    return recalibrate(weights, m_claims, optimize);
}

RecalibrationResponse RecalibrationService::recalibrate(const WeightVector& weights,
                                                        const std::vector<ClaimRecord>& claims,
                                                        bool optimize) const {
    RecalibrationResponse response;
    try {
        response.metrics = evaluate(claims, weights);

        if (optimize) {
            OptimizationResponse opt = this->optimize(claims, weights);
            if (!opt.success) {
                response.message = opt.message;
                return response;
            }
            response.has_optimized_weights = true;
            response.optimized_weights = opt.optimized_weights;
            response.message = "Recalibration completed with optimization";
        } else {
            response.message = "Recalibration completed";
        }
        response.success = true;
    } catch (const CalibrationError& e) {
        reportError("recalibrate", e);
        response.message = e.what();
    }
    return response;
}

//------------------------------------------------------------------
// optimize
//------------------------------------------------------------------

OptimizationResponse RecalibrationService::optimize(const std::vector<ClaimRecord>& claims,
                                                    const WeightVector& currentWeights,
                                                    const std::string& method,
                                                    const OptimizationConfig& config,
                                                    const CancellationToken* cancel) const {
    OptimizationResponse response;
    try {
        OptimizationMethod parsed;
        if (!parseOptimizationMethod(method, parsed)) {
            throw InputValidationError("unknown optimization method '" + method + "'");
        }

        WeightOptimizer optimizer(config, m_model);
        WeightVector start = currentWeights;
        if (start.empty()) start = defaultWeights();

        ErrorMetrics current = evaluate(claims, start);
        response.result = optimizer.optimize(claims, m_table, start, parsed, cancel);
        ErrorMetrics optimized = evaluate(claims, response.result.optimized_weights);

        response.optimized_weights = response.result.optimized_weights;
        response.iterations = response.result.iterations_run;
        response.converged = response.result.converged;
        response.improvement_metrics.mae_improvement = relativeReduction(current.mae, optimized.mae);
        response.improvement_metrics.rmse_improvement = relativeReduction(current.rmse, optimized.rmse);
        response.improvement_metrics.variance_reduction =
            relativeReduction(std::abs(current.avg_variance), std::abs(optimized.avg_variance));
        response.success = true;
        response.message = std::string("Optimization completed (") + toString(parsed) + ")";

        if (!response.converged && response.result.termination == OptimizerState::MaxIterationsReached) {
            std::cerr << "Warning: optimizer reached " << config.max_iterations
                      << " iterations without converging" << std::endl;
        }
    } catch (const CalibrationError& e) {
        reportError("optimize", e);
        response.message = e.what();
    }
    return response;
}

//------------------------------------------------------------------
// sensitivity analysis
//------------------------------------------------------------------

SensitivityResponse RecalibrationService::sensitivityAnalysis(const WeightVector& weights,
                                                              double perturbation) const {
    return sensitivityAnalysis(weights, m_claims, perturbation);
}

SensitivityResponse RecalibrationService::sensitivityAnalysis(const WeightVector& weights,
                                                              const std::vector<ClaimRecord>& claims,
                                                              double perturbation) const {
    SensitivityResponse response;
    try {
        if (!std::isfinite(perturbation) || perturbation < 0.0) {
            throw InputValidationError("perturbation must be a non-negative fraction");
        }
        WeightOptimizer::validateTable(m_table);
        WeightVector base = WeightOptimizer::completeWeights(m_table, weights);

        RecalibrationRunner runner(m_model);
        PreparedClaims prepared = runner.prepare(claims, defaultWeights());
        const double baseMae = RecalibrationRunner::evaluate(prepared, base).mae;

        for (const WeightEntry& entry : m_table) {
            const double w = base.get(entry.factor_name);
            WeightVector increased = base.with(entry.factor_name,
                clamp(w * (1.0 + perturbation), entry.min_weight, entry.max_weight));
            WeightVector decreased = base.with(entry.factor_name,
                clamp(w * (1.0 - perturbation), entry.min_weight, entry.max_weight));

            SensitivityEntry s;
            s.base_mae = baseMae;
            s.increased_mae = RecalibrationRunner::evaluate(prepared, increased).mae;
            s.decreased_mae = RecalibrationRunner::evaluate(prepared, decreased).mae;
            s.sensitivity_score = safeDivide(std::abs(s.increased_mae - s.decreased_mae), baseMae);
            response.sensitivity_results[entry.factor_name] = s;
        }
        response.success = true;
        response.message = "Sensitivity analysis completed";
    } catch (const CalibrationError& e) {
        reportError("sensitivity analysis", e);
        response.message = e.what();
    }
    return response;
}

//------------------------------------------------------------------
// compare
//------------------------------------------------------------------

WeightComparison RecalibrationService::compareWeights(const WeightVector& weightsA,
                                                      const WeightVector& weightsB) const {
    return compareWeights(weightsA, weightsB, m_claims);
}

WeightComparison RecalibrationService::compareWeights(const WeightVector& weightsA,
                                                      const WeightVector& weightsB,
                                                      const std::vector<ClaimRecord>& claims) const {
    WeightComparison response;
    try {
        WeightOptimizer::validateTable(m_table);
        WeightVector a = WeightOptimizer::completeWeights(m_table, weightsA);
        WeightVector b = WeightOptimizer::completeWeights(m_table, weightsB);

        RecalibrationRunner runner(m_model);
        RecalibrationReport report = runner.run(claims, a, b, defaultWeights());

        response.metrics_a = report.before;
        response.metrics_b = report.after;
        response.comparison = report.metrics;
        response.mae_difference = report.after.mae - report.before.mae;
        response.rmse_difference = report.after.rmse - report.before.rmse;
        response.mape_difference = report.after.mape - report.before.mape;

        if (report.after.mape < report.before.mape) {
            response.better = "b";
        } else if (report.after.mape > report.before.mape) {
            response.better = "a";
        } else {
            response.better = "tie";
        }
        response.success = true;
        response.message = "Comparison completed";
    } catch (const CalibrationError& e) {
        reportError("compare weights", e);
        response.message = e.what();
    }
    return response;
}

//------------------------------------------------------------------
// Supplementary analyses
//------------------------------------------------------------------

WeightStatistics RecalibrationService::analyzeWeightStatistics(const std::vector<ClaimRecord>& claims,
                                                               const std::string& factorName) const {
    WeightStatistics stats;
    stats.factor_name = factorName;
    try {
        std::vector<double> values;
        for (const ClaimRecord& claim : claims) {
            double v = 0.0;
            if (CorrelationAnalyzer::factorValue(claim, factorName, v)) values.push_back(v);
        }
        if (values.empty()) {
            throw InsufficientDataError("no values for factor '" + factorName + "'");
        }

        std::vector<double> sorted(values);
        std::sort(sorted.begin(), sorted.end());

        stats.sample_size = static_cast<int>(values.size());
        stats.mean = mean(values);
        stats.median = quantileSorted(sorted, 0.5);
        stats.std_dev = sampleStdDev(values);
        stats.min = sorted.front();
        stats.max = sorted.back();
        stats.q25 = quantileSorted(sorted, 0.25);
        stats.q75 = quantileSorted(sorted, 0.75);

        // Most frequent value, smallest on ties
        size_t bestRun = 0;
        for (size_t i = 0; i < sorted.size();) {
            size_t j = i;
            while (j < sorted.size() && sorted[j] == sorted[i]) ++j;
            if (j - i > bestRun) {
                bestRun = j - i;
                stats.mode = sorted[i];
            }
            i = j;
        }

        stats.correlation_with_variance = CorrelationAnalyzer::correlate(claims, factorName);
        const double r = std::abs(stats.correlation_with_variance);
        double suggested = 0.05;
        if (r > 0.5) {
            suggested = std::min(0.20, r);
            stats.reason = "High impact - increase weight";
        } else if (r > 0.3) {
            suggested = std::min(0.15, r);
            stats.reason = "Moderate impact - maintain weight";
        } else if (r > 0.1) {
            suggested = std::min(0.10, r);
            stats.reason = "Low impact - consider reducing weight";
        } else {
            stats.reason = "Minimal impact - consider removing";
        }
        stats.suggested_weight = std::round(suggested * 1000.0) / 1000.0;

        if (stats.sample_size > 100) {
            stats.confidence = "High";
        } else if (stats.sample_size > 30) {
            stats.confidence = "Medium";
        } else {
            stats.confidence = "Low";
        }

        stats.success = true;
        stats.message = "Statistics computed";
    } catch (const CalibrationError& e) {
        reportError("weight statistics", e);
        stats.message = e.what();
    }
    return stats;
}

std::vector<SweepPoint> RecalibrationService::sweepFactor(const std::vector<ClaimRecord>& claims,
                                                          const std::string& factorName,
                                                          const std::vector<double>& testWeights) const {
    WeightOptimizer::validateTable(m_table);
    const WeightEntry& entry = findEntry(m_table, factorName);

    RecalibrationRunner runner(m_model);
    WeightVector baseline = defaultWeights();
    PreparedClaims prepared = runner.prepare(claims, baseline);

    std::vector<SweepPoint> points;
    points.reserve(testWeights.size());
    for (double w : testWeights) {
        if (!std::isfinite(w) || w < entry.min_weight || w > entry.max_weight) {
            throw InputValidationError("test weight outside the bounds of '" + factorName + "'");
        }
        ErrorMetrics m = RecalibrationRunner::evaluate(prepared, baseline.with(factorName, w));

        SweepPoint p;
        p.weight = w;
        p.mae = m.mae;
        p.mape = m.mape;
        p.rmse = m.rmse;
        points.push_back(p);
    }
    return points;
}

RecommendationResponse RecalibrationService::recommendWeights(const std::vector<ClaimRecord>& claims,
                                                              const WeightVector& weights) const {
    RecommendationResponse response;
    try {
        WeightOptimizer::validateTable(m_table);
        WeightVector current = WeightOptimizer::completeWeights(m_table, weights);
        if (claims.empty()) {
            throw InsufficientDataError("no claims to analyse");
        }

        FactorImpact impacts = FactorImpactRanker::computeImpacts(claims, current);
        FactorImpact correlations = CorrelationAnalyzer::correlateAll(claims, m_table);

        response.recommendations = FactorImpactRanker::generateRecommendations(claims, m_table, impacts);
        response.recommended_weights = FactorImpactRanker::rescaleToBudget(
            m_table, FactorImpactRanker::recommendAll(m_table, correlations, impacts));
        response.success = true;
        response.message = "Recommendations generated";
    } catch (const CalibrationError& e) {
        reportError("recommend weights", e);
        response.message = e.what();
    }
    return response;
}

//------------------------------------------------------------------
// Reports
//------------------------------------------------------------------

void RecalibrationResponse::print() const {
    std::cout << "=== Recalibration ===\n";
    std::cout << "  Status: " << (success ? "OK" : "FAILED") << " - " << message << "\n";
    if (!success) return;
    metrics.print();
    if (has_optimized_weights) {
        std::cout << "\nOptimized weights:\n";
        optimized_weights.print();
    }
}

void OptimizationResponse::print() const {
    std::cout << "=== Optimization ===\n";
    std::cout << "  Status: " << (success ? "OK" : "FAILED") << " - " << message << "\n";
    if (!success) return;
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  MAE improvement:    " << improvement_metrics.mae_improvement << " %\n";
    std::cout << "  RMSE improvement:   " << improvement_metrics.rmse_improvement << " %\n";
    std::cout << "  Variance reduction: " << improvement_metrics.variance_reduction << " %\n";
    std::cout << "\n";
    result.print();
}

void SensitivityResponse::print() const {
    std::cout << "=== Sensitivity Analysis ===\n";
    if (!success) {
        std::cout << "  FAILED - " << message << "\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  " << std::left << std::setw(32) << "Factor" << std::right
              << std::setw(14) << "Base MAE" << std::setw(14) << "MAE (+)"
              << std::setw(14) << "MAE (-)" << std::setw(12) << "Score" << "\n";
    for (const auto& kv : sensitivity_results) {
        const SensitivityEntry& s = kv.second;
        std::cout << "  " << std::left << std::setw(32) << kv.first << std::right
                  << std::setw(14) << s.base_mae << std::setw(14) << s.increased_mae
                  << std::setw(14) << s.decreased_mae
                  << std::setw(12) << std::setprecision(6) << s.sensitivity_score
                  << std::setprecision(2) << "\n";
    }
}

void WeightComparison::print() const {
    std::cout << "=== Weight Comparison ===\n";
    if (!success) {
        std::cout << "  FAILED - " << message << "\n";
        return;
    }
    std::cout << "Weights A:\n";
    metrics_a.print();
    std::cout << "Weights B:\n";
    metrics_b.print();
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "  MAPE difference (B - A): " << mape_difference << " %\n";
    std::cout << "  Better: " << better << "\n";
    comparison.print();
}

void WeightStatistics::print() const {
    std::cout << "=== Weight Statistics: " << factor_name << " ===\n";
    if (!success) {
        std::cout << "  FAILED - " << message << "\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "  Samples:     " << sample_size << "\n";
    std::cout << "  Mean:        " << mean << "\n";
    std::cout << "  Median:      " << median << "\n";
    std::cout << "  Mode:        " << mode << "\n";
    std::cout << "  Std dev:     " << std_dev << "\n";
    std::cout << "  Range:       [" << min << ", " << max << "]\n";
    std::cout << "  IQR:         [" << q25 << ", " << q75 << "]\n";
    std::cout << "  Correlation: " << correlation_with_variance << "\n";
    std::cout << "  Suggested:   " << std::setprecision(3) << suggested_weight
              << " (" << reason << ", confidence " << confidence << ")\n";
}

} // namespace WeightCalibration
