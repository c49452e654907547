/**
 * @file DataTypes.cc
 * @brief Implementation of data type methods
 */

#include "DataTypes.hh"
#include <iostream>
#include <iomanip>

namespace WeightCalibration {

const FeatureValue& ClaimRecord::feature(const std::string& name) const {
    static const FeatureValue absent;
    std::map<std::string, FeatureValue>::const_iterator it = features.find(name);
    return (it == features.end()) ? absent : it->second;
}

ClaimRecord& ClaimRecord::set(const std::string& name, const FeatureValue& value) {
    features[name] = value;
    return *this;
}

ClaimRecord& ClaimRecord::setVariancePct(double pct) {
    has_variance = true;
    variance_pct = pct;
    return *this;
}

//------------------------------------------------------------------
// WeightVector
//------------------------------------------------------------------

WeightVector::WeightVector(const std::vector<std::pair<std::string, double>>& entries) {
    for (const auto& e : entries) {
        std::map<std::string, size_t>::const_iterator it = m_index.find(e.first);
        if (it != m_index.end()) {
            m_entries[it->second].second = e.second;
        } else {
            m_index[e.first] = m_entries.size();
            m_entries.push_back(e);
        }
    }
}

WeightVector WeightVector::fromBaseWeights(const WeightTable& table) {
    WeightVector v;
    for (const auto& entry : table) {
        v = v.with(entry.factor_name, entry.base_weight);
    }
    return v;
}

WeightVector WeightVector::with(const std::string& name, double value) const {
    WeightVector copy(*this);
    std::map<std::string, size_t>::const_iterator it = copy.m_index.find(name);
    if (it != copy.m_index.end()) {
        copy.m_entries[it->second].second = value;
    } else {
        copy.m_index[name] = copy.m_entries.size();
        copy.m_entries.push_back(std::make_pair(name, value));
    }
    return copy;
}

bool WeightVector::contains(const std::string& name) const {
    return m_index.count(name) > 0;
}

double WeightVector::get(const std::string& name, double fallback) const {
    std::map<std::string, size_t>::const_iterator it = m_index.find(name);
    return (it == m_index.end()) ? fallback : m_entries[it->second].second;
}

double WeightVector::sum() const {
    double total = 0.0;
    for (const auto& e : m_entries) {
        total += e.second;
    }
    return total;
}

std::vector<std::string> WeightVector::names() const {
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) {
        out.push_back(e.first);
    }
    return out;
}

void WeightVector::print() const {
    std::cout << std::fixed << std::setprecision(4);
    for (const auto& e : m_entries) {
        std::cout << "  " << std::left << std::setw(32) << e.first << std::right
                  << std::setw(10) << e.second << "\n";
    }
    std::cout << "  " << std::left << std::setw(32) << "(sum)" << std::right
              << std::setw(10) << sum() << "\n";
}

//------------------------------------------------------------------
// Names
//------------------------------------------------------------------

const char* toString(TargetMetric metric) {
    switch (metric) {
        case TargetMetric::Mape: return "mape";
        case TargetMetric::Rmse: return "rmse";
        case TargetMetric::Both: return "both";
    }
    return "unknown";
}

const char* toString(OptimizationMethod method) {
    switch (method) {
        case OptimizationMethod::CoordinateDescent: return "coordinate_descent";
        case OptimizationMethod::GridSearch: return "grid_search";
        case OptimizationMethod::CorrelationGuided: return "correlation_guided";
    }
    return "unknown";
}

const char* toString(OptimizerState state) {
    switch (state) {
        case OptimizerState::Idle: return "Idle";
        case OptimizerState::Running: return "Running";
        case OptimizerState::Converged: return "Converged";
        case OptimizerState::MaxIterationsReached: return "MaxIterationsReached";
        case OptimizerState::Cancelled: return "Cancelled";
        case OptimizerState::Completed: return "Completed";
    }
    return "Unknown";
}

const char* toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "Low Risk";
        case RiskLevel::Medium: return "Medium Risk";
        case RiskLevel::High: return "High Risk";
        case RiskLevel::Critical: return "Critical";
    }
    return "Unknown";
}

const char* toString(ClaimOutcome outcome) {
    switch (outcome) {
        case ClaimOutcome::Improved: return "improved";
        case ClaimOutcome::Degraded: return "degraded";
        case ClaimOutcome::Unchanged: return "unchanged";
        case ClaimOutcome::Excluded: return "excluded";
    }
    return "unknown";
}

bool parseTargetMetric(const std::string& name, TargetMetric& metric) {
    if (name == "mape") { metric = TargetMetric::Mape; return true; }
    if (name == "rmse") { metric = TargetMetric::Rmse; return true; }
    if (name == "both") { metric = TargetMetric::Both; return true; }
    return false;
}

bool parseOptimizationMethod(const std::string& name, OptimizationMethod& method) {
    if (name == "coordinate_descent" || name == "gradient_descent" ||
        name == "variance_minimization") {
        method = OptimizationMethod::CoordinateDescent;
        return true;
    }
    if (name == "grid_search") {
        method = OptimizationMethod::GridSearch;
        return true;
    }
    if (name == "correlation_guided" || name == "smart") {
        method = OptimizationMethod::CorrelationGuided;
        return true;
    }
    return false;
}

//------------------------------------------------------------------
// Reports
//------------------------------------------------------------------

void OptimizationResult::print() const {
    std::cout << std::fixed;
    std::cout << "=== Optimization Result (" << toString(method) << ") ===\n";
    std::cout << "  Iterations:        " << iterations_run << "\n";
    std::cout << "  Termination:       " << toString(termination) << "\n";
    std::cout << "  Converged:         " << (converged ? "Yes" : "No") << "\n";
    std::cout << "  MAPE:              " << std::setprecision(4) << initial_mape
              << " -> " << final_mape << " %\n";
    std::cout << "  RMSE:              " << std::setprecision(2) << initial_rmse
              << " -> " << final_rmse << "\n";
    std::cout << "  Improvement:       " << std::setprecision(3) << improvement_pct << " %\n";
    std::cout << "  History entries:   " << convergence_history.size() << "\n";
    std::cout << "\nOptimized weights:\n";
    optimized_weights.print();
    std::cout << "========================================\n";
}

void ErrorMetrics::print() const {
    std::cout << std::fixed;
    std::cout << "  MAE:            " << std::setprecision(2) << mae << "\n";
    std::cout << "  RMSE:           " << std::setprecision(2) << rmse << "\n";
    std::cout << "  MAPE:           " << std::setprecision(4) << mape << " %\n";
    std::cout << "  R^2:            " << std::setprecision(4) << r_squared << "\n";
    std::cout << "  Total variance: " << std::setprecision(2) << total_variance << "\n";
    std::cout << "  Avg variance:   " << std::setprecision(2) << avg_variance << "\n";
    std::cout << "  Claims:         " << evaluated_claims
              << " (" << percentage_claims << " in MAPE)\n";
}

void RecalibrationMetrics::print() const {
    std::cout << "=== Recalibration Metrics ===\n";
    std::cout << std::fixed;
    std::cout << "  Total claims:     " << total_claims << "\n";
    std::cout << "  Improved:         " << improved_count << "\n";
    std::cout << "  Degraded:         " << degraded_count << "\n";
    std::cout << "  Unchanged:        " << unchanged_count
              << " (" << excluded_count << " excluded, zero actual)\n";
    std::cout << "  Avg improvement:  " << std::setprecision(3) << avg_improvement_pct << " pts\n";
    std::cout << "  MAPE:             " << std::setprecision(4) << mape_before
              << " -> " << mape_after << " %\n";
    std::cout << "  RMSE:             " << std::setprecision(2) << rmse_before
              << " -> " << rmse_after << "\n";
    std::cout << "=============================\n";
}

} // namespace WeightCalibration
