/**
 * @file WeightOptimizer.cc
 * @brief Implementation of the weight search strategies
 */

#include "WeightOptimizer.hh"
#include "CalibrationErrors.hh"
#include "CorrelationAnalyzer.hh"
#include "FactorImpactRanker.hh"
#include "MathUtilities.hh"
#include "MetricsEvaluator.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace WeightCalibration {

const double WeightOptimizer::kRmseScale = 10000.0;

namespace {

bool cancelled(const CancellationToken* cancel) {
    return cancel != nullptr && cancel->isCancelled();
}

struct RankedFactor {
    std::string name;
    double score;
};

bool byScore(const RankedFactor& a, const RankedFactor& b) {
    return a.score > b.score;
}

} // namespace

WeightOptimizer::WeightOptimizer(const OptimizationConfig& config, const ScoringModel& model)
    : m_config(config)
    , m_model(model)
    , m_state(OptimizerState::Idle)
    , m_iterations(0)
{
}

void WeightOptimizer::setConfig(const OptimizationConfig& config) {
    m_config = config;
}

const OptimizationConfig& WeightOptimizer::getConfig() const {
    return m_config;
}

double WeightOptimizer::objectiveScore(const ErrorMetrics& metrics, TargetMetric target) {
    switch (target) {
        case TargetMetric::Mape: return metrics.mape;
        case TargetMetric::Rmse: return metrics.rmse;
        case TargetMetric::Both: return metrics.mape + metrics.rmse / kRmseScale;
    }
    return metrics.mape;
}

//------------------------------------------------------------------
// Validation
//------------------------------------------------------------------

void WeightOptimizer::validateTable(const WeightTable& table) {
    if (table.empty()) {
        throw InputValidationError("weight table is empty");
    }

    std::set<std::string> names;
    for (const WeightEntry& entry : table) {
        if (entry.factor_name.empty()) {
            throw InputValidationError("weight entry without a factor name");
        }
        if (!names.insert(entry.factor_name).second) {
            throw InputValidationError("duplicate factor '" + entry.factor_name + "'");
        }
        if (!std::isfinite(entry.min_weight) || !std::isfinite(entry.max_weight) ||
            !std::isfinite(entry.base_weight)) {
            throw InputValidationError("non-finite weight for '" + entry.factor_name + "'");
        }
        if (entry.min_weight > entry.max_weight) {
            std::ostringstream msg;
            msg << "factor '" << entry.factor_name << "' has min_weight " << entry.min_weight
                << " > max_weight " << entry.max_weight;
            throw InputValidationError(msg.str());
        }
        if (entry.base_weight < entry.min_weight || entry.base_weight > entry.max_weight) {
            std::ostringstream msg;
            msg << "factor '" << entry.factor_name << "' has base_weight " << entry.base_weight
                << " outside [" << entry.min_weight << ", " << entry.max_weight << "]";
            throw InputValidationError(msg.str());
        }
    }
}

void WeightOptimizer::validateConfig(const OptimizationConfig& config, const WeightTable& table) {
    if (!(config.learning_rate > 0.0 && config.learning_rate <= 1.0)) {
        throw InputValidationError("learning_rate must be in (0, 1]");
    }
    if (config.max_iterations < 0) {
        throw InputValidationError("max_iterations must not be negative");
    }
    if (config.grid_steps < 0) {
        throw InputValidationError("grid_steps must not be negative");
    }
    if (config.top_factor_count < 1) {
        throw InputValidationError("top_factor_count must be at least 1");
    }
    if (!(config.convergence_threshold >= 0.0)) {
        throw InputValidationError("convergence_threshold must not be negative");
    }

    std::set<std::string> names;
    for (const WeightEntry& entry : table) names.insert(entry.factor_name);
    for (const std::string& frozen : config.frozen_factors) {
        if (names.count(frozen) == 0) {
            throw InputValidationError("frozen factor '" + frozen + "' is not in the weight table");
        }
    }
}

WeightVector WeightOptimizer::completeWeights(const WeightTable& table, const WeightVector& weights) {
    std::set<std::string> names;
    for (const WeightEntry& entry : table) names.insert(entry.factor_name);
    for (const auto& w : weights.entries()) {
        if (names.count(w.first) == 0) {
            throw InputValidationError("weight for unknown factor '" + w.first + "'");
        }
    }

    WeightVector out;
    for (const WeightEntry& entry : table) {
        double value = weights.get(entry.factor_name, entry.base_weight);
        if (!std::isfinite(value) || value < entry.min_weight || value > entry.max_weight) {
            std::ostringstream msg;
            msg << "weight " << value << " of '" << entry.factor_name << "' outside ["
                << entry.min_weight << ", " << entry.max_weight << "]";
            throw InputValidationError(msg.str());
        }
        out = out.with(entry.factor_name, value);
    }
    return out;
}

void WeightOptimizer::validate(const std::vector<ClaimRecord>& claims, const WeightTable& table) const {
    validateTable(table);
    validateConfig(m_config, table);
    if (claims.empty()) {
        throw InsufficientDataError("optimizer needs at least one claim");
    }
}

PreparedClaims WeightOptimizer::prepareClaims(const std::vector<ClaimRecord>& claims,
                                              const WeightTable& table) const {
    RecalibrationRunner runner(m_model);
    return runner.prepare(claims, WeightVector::fromBaseWeights(table));
}

//------------------------------------------------------------------
// Entry points
//------------------------------------------------------------------

OptimizationResult WeightOptimizer::optimize(const std::vector<ClaimRecord>& claims,
                                             const WeightTable& table,
                                             OptimizationMethod method,
                                             const CancellationToken* cancel) {
    return optimize(claims, table, WeightVector(), method, cancel);
}

OptimizationResult WeightOptimizer::optimize(const std::vector<ClaimRecord>& claims,
                                             const WeightTable& table,
                                             const WeightVector& initial,
                                             OptimizationMethod method,
                                             const CancellationToken* cancel) {
    switch (method) {
        case OptimizationMethod::GridSearch:
            return gridSearch(claims, table, initial, cancel);
        case OptimizationMethod::CorrelationGuided:
            return correlationGuided(claims, table, initial, nullptr, cancel);
        case OptimizationMethod::CoordinateDescent:
            break;
    }
    return coordinateDescent(claims, table, initial, cancel);
}

OptimizationResult WeightOptimizer::coordinateDescent(const std::vector<ClaimRecord>& claims,
                                                      const WeightTable& table,
                                                      const WeightVector& initial,
                                                      const CancellationToken* cancel) {
    validate(claims, table);
    WeightVector start = completeWeights(table, initial);

    PreparedClaims prepared = prepareClaims(claims, table);
    Objective objective = [&prepared](const std::vector<double>& w) -> ErrorMetrics {
        return MetricsEvaluator::metrics(prepared.actuals, RecalibrationRunner::predict(prepared, w));
    };

    OptimizationResult result = runCoordinateDescent(objective, table, start, m_config, cancel);
    result.method = OptimizationMethod::CoordinateDescent;
    return result;
}

OptimizationResult WeightOptimizer::gridSearch(const std::vector<ClaimRecord>& claims,
                                               const WeightTable& table,
                                               const WeightVector& initial,
                                               const CancellationToken* cancel) {
    validate(claims, table);
    WeightVector start = completeWeights(table, initial);

    PreparedClaims prepared = prepareClaims(claims, table);
    Objective objective = [&prepared](const std::vector<double>& w) -> ErrorMetrics {
        return MetricsEvaluator::metrics(prepared.actuals, RecalibrationRunner::predict(prepared, w));
    };

    OptimizationResult result = runGridSearch(objective, table, start, cancel);
    result.method = OptimizationMethod::GridSearch;
    return result;
}

std::vector<std::string> WeightOptimizer::rankFactors(const std::vector<ClaimRecord>& claims,
                                                      const WeightTable& table,
                                                      const WeightVector& initial,
                                                      const FactorImpact* impacts) const {
    validate(claims, table);
    WeightVector start = completeWeights(table, initial);

    PreparedClaims prepared = prepareClaims(claims, table);
    std::vector<double> predictions =
        RecalibrationRunner::predict(prepared, RecalibrationRunner::align(prepared, start));

    FactorImpact computed;
    if (impacts == nullptr) {
        computed = FactorImpactRanker::computeImpacts(claims, predictions, start);
        impacts = &computed;
    }
    const double maxImpact = FactorImpactRanker::maxImpact(*impacts);

    std::vector<RankedFactor> ranked;
    for (const WeightEntry& entry : table) {
        if (m_config.isFrozen(entry.factor_name)) continue;
        FactorImpact::const_iterator it = impacts->find(entry.factor_name);
        double impact = (it == impacts->end()) ? 0.0 : it->second;
        double corr = CorrelationAnalyzer::correlate(claims, predictions, entry.factor_name);

        RankedFactor r;
        r.name = entry.factor_name;
        r.score = FactorImpactRanker::combinedScore(corr, impact, maxImpact);
        ranked.push_back(r);
    }
    std::stable_sort(ranked.begin(), ranked.end(), byScore);

    std::vector<std::string> names;
    names.reserve(ranked.size());
    for (const RankedFactor& r : ranked) names.push_back(r.name);
    return names;
}

OptimizationResult WeightOptimizer::correlationGuided(const std::vector<ClaimRecord>& claims,
                                                      const WeightTable& table,
                                                      const WeightVector& initial,
                                                      const FactorImpact* impacts,
                                                      const CancellationToken* cancel) {
    std::vector<std::string> ranked = rankFactors(claims, table, initial, impacts);
    WeightVector start = completeWeights(table, initial);

    // Freeze everything outside the top set
    OptimizationConfig focused = m_config;
    std::set<std::string> selected;
    for (size_t i = 0; i < ranked.size() && i < static_cast<size_t>(m_config.top_factor_count); ++i) {
        selected.insert(ranked[i]);
    }
    for (const WeightEntry& entry : table) {
        if (selected.count(entry.factor_name) == 0) focused.freeze(entry.factor_name);
    }

    if (m_config.verbose) {
        std::cout << "Correlation-guided: optimising " << selected.size() << " of "
                  << table.size() << " factors\n";
        for (size_t i = 0; i < ranked.size() && i < selected.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << ranked[i] << "\n";
        }
    }

    PreparedClaims prepared = prepareClaims(claims, table);
    Objective objective = [&prepared](const std::vector<double>& w) -> ErrorMetrics {
        return MetricsEvaluator::metrics(prepared.actuals, RecalibrationRunner::predict(prepared, w));
    };

    OptimizationResult result = runCoordinateDescent(objective, table, start, focused, cancel);
    result.method = OptimizationMethod::CorrelationGuided;
    return result;
}

//------------------------------------------------------------------
// Strategies
//------------------------------------------------------------------

WeightVector WeightOptimizer::toVector(const WeightTable& table, const std::vector<double>& values) {
    WeightVector out;
    for (size_t i = 0; i < table.size(); ++i) {
        out = out.with(table[i].factor_name, values[i]);
    }
    return out;
}

void WeightOptimizer::finish(OptimizationResult& result) {
    result.improvement_pct = (result.initial_mape == 0.0)
        ? 0.0
        : (result.initial_mape - result.final_mape) / result.initial_mape * 100.0;
}

OptimizationResult WeightOptimizer::runCoordinateDescent(const Objective& objective,
                                                         const WeightTable& table,
                                                         const WeightVector& start,
                                                         const OptimizationConfig& config,
                                                         const CancellationToken* cancel) {
    m_state = OptimizerState::Running;
    m_iterations = 0;

    std::vector<double> current;
    current.reserve(table.size());
    for (const WeightEntry& entry : table) current.push_back(start.get(entry.factor_name));

    ErrorMetrics best = objective(current);
    double bestScore = objectiveScore(best, config.target_metric);

    OptimizationResult result;
    result.initial_weights = start;
    result.initial_mape = best.mape;
    result.initial_rmse = best.rmse;

    OptimizerState terminal = OptimizerState::MaxIterationsReached;

    for (int iter = 1; iter <= config.max_iterations; ++iter) {
        if (cancelled(cancel)) {
            terminal = OptimizerState::Cancelled;
            break;
        }

        IterationRecord record;
        record.iteration = iter;
        double maxDelta = 0.0;

        for (size_t i = 0; i < table.size(); ++i) {
            const WeightEntry& entry = table[i];
            if (config.isFrozen(entry.factor_name)) continue;

            const double step = config.learning_rate * entry.range();
            if (step <= 0.0) continue;

            const double w = current[i];
            const double up = clamp(w + step, entry.min_weight, entry.max_weight);
            const double down = clamp(w - step, entry.min_weight, entry.max_weight);

            bool moved = false;
            double chosen = w;
            double chosenScore = bestScore;
            ErrorMetrics chosenMetrics = best;

            std::vector<double> trial(current);
            if (up != w) {
                trial[i] = up;
                ErrorMetrics m = objective(trial);
                double s = objectiveScore(m, config.target_metric);
                if (s < chosenScore) {
                    moved = true;
                    chosen = up;
                    chosenScore = s;
                    chosenMetrics = m;
                }
            }
            if (down != w) {
                trial[i] = down;
                ErrorMetrics m = objective(trial);
                double s = objectiveScore(m, config.target_metric);
                if (s < chosenScore) {
                    moved = true;
                    chosen = down;
                    chosenScore = s;
                    chosenMetrics = m;
                }
            }

            if (moved) {
                record.weight_deltas[entry.factor_name] = chosen - w;
                maxDelta = std::max(maxDelta, std::abs(chosen - w));
                current[i] = chosen;
                bestScore = chosenScore;
                best = chosenMetrics;
            }
        }

        record.mape = best.mape;
        record.rmse = best.rmse;
        record.weights = toVector(table, current);
        result.convergence_history.push_back(record);
        m_iterations = iter;

        if (config.verbose) {
            std::cout << std::fixed << "  Iter " << std::setw(3) << iter
                      << ": MAPE = " << std::setprecision(4) << best.mape
                      << "%, RMSE = " << std::setprecision(2) << best.rmse
                      << ", moved " << record.weight_deltas.size() << " factor(s)\n";
        }

        if (maxDelta < config.convergence_threshold) {
            terminal = OptimizerState::Converged;
            break;
        }
    }

    result.optimized_weights = toVector(table, current);
    result.iterations_run = m_iterations;
    result.final_mape = best.mape;
    result.final_rmse = best.rmse;
    result.converged = (terminal == OptimizerState::Converged);
    result.termination = terminal;
    finish(result);

    if (terminal == OptimizerState::MaxIterationsReached && config.verbose) {
        std::cout << "Warning: coordinate descent stopped after " << config.max_iterations
                  << " rounds without converging\n";
    }

    m_state = OptimizerState::Completed;
    return result;
}

OptimizationResult WeightOptimizer::runGridSearch(const Objective& objective,
                                                  const WeightTable& table,
                                                  const WeightVector& start,
                                                  const CancellationToken* cancel) {
    m_state = OptimizerState::Running;
    m_iterations = 0;

    std::vector<double> current;
    current.reserve(table.size());
    for (const WeightEntry& entry : table) current.push_back(start.get(entry.factor_name));

    ErrorMetrics best = objective(current);
    double bestScore = objectiveScore(best, m_config.target_metric);

    OptimizationResult result;
    result.initial_weights = start;
    result.initial_mape = best.mape;
    result.initial_rmse = best.rmse;

    OptimizerState terminal = OptimizerState::Converged;
    const int steps = m_config.grid_steps;

    for (size_t i = 0; i < table.size(); ++i) {
        const WeightEntry& entry = table[i];
        if (m_config.isFrozen(entry.factor_name)) continue;
        if (cancelled(cancel)) {
            terminal = OptimizerState::Cancelled;
            break;
        }

        bool improved = false;
        double bestValue = current[i];
        std::vector<double> trial(current);

        for (int k = 0; k <= steps; ++k) {
            double value = entry.min_weight;
            if (steps > 0) {
                value = (k == steps)
                    ? entry.max_weight
                    : entry.min_weight + entry.range() * static_cast<double>(k) / static_cast<double>(steps);
            }
            trial[i] = value;
            ErrorMetrics m = objective(trial);
            ++m_iterations;

            double s = objectiveScore(m, m_config.target_metric);
            if (s < bestScore) {
                improved = true;
                bestScore = s;
                best = m;
                bestValue = value;
            }
        }

        if (improved) {
            IterationRecord record;
            record.iteration = m_iterations;
            record.mape = best.mape;
            record.rmse = best.rmse;
            record.weight_deltas[entry.factor_name] = bestValue - current[i];
            current[i] = bestValue;
            record.weights = toVector(table, current);
            result.convergence_history.push_back(record);
        }

        if (m_config.verbose) {
            std::cout << std::fixed << "  Grid " << std::left << std::setw(32) << entry.factor_name
                      << std::right << " -> " << std::setprecision(4) << current[i]
                      << " (MAPE = " << best.mape << "%)\n";
        }
    }

    result.optimized_weights = toVector(table, current);
    result.iterations_run = m_iterations;
    result.final_mape = best.mape;
    result.final_rmse = best.rmse;
    result.converged = (terminal == OptimizerState::Converged);
    result.termination = terminal;
    finish(result);

    m_state = OptimizerState::Completed;
    return result;
}

} // namespace WeightCalibration
