#ifndef DATA_TYPES_HH
#define DATA_TYPES_HH

/**
 * @file DataTypes.hh
 * @brief Data structures for settlement weight calibration
 *
 * Defines the core data types used in the recalibration process:
 * - FeatureValue / ClaimRecord: Claim snapshots as delivered by the data layer
 * - WeightEntry / WeightTable: Per-factor weights with their allowed range
 * - WeightVector: Ordered factor -> weight mapping (never mutated in place)
 * - ScoringCoefficients: C0..C6 of the settlement formula
 * - OptimizationConfig / OptimizationResult: Optimizer input and output
 * - ErrorMetrics / RecalibrationMetrics: Aggregate error statistics
 */

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <limits>

namespace WeightCalibration {

/**
 * @brief A single claim field
 *
 * Claim fields arrive either as numbers or as text (numeric strings
 * and categorical labels are mixed in the source data). A default
 * constructed value is absent.
 */
struct FeatureValue {
    enum Kind { Absent, Number, Text };

    Kind kind;
    double number;
    std::string text;

    FeatureValue() : kind(Absent), number(0.0) {}
    FeatureValue(double v) : kind(Number), number(v) {}
    FeatureValue(int v) : kind(Number), number(static_cast<double>(v)) {}
    FeatureValue(const std::string& s) : kind(Text), number(0.0), text(s) {}
    FeatureValue(const char* s) : kind(Text), number(0.0), text(s ? s : "") {}

    bool isPresent() const { return kind != Absent; }
};

/**
 * @brief Immutable snapshot of one insurance claim
 *
 * Built by the data-access layer. The engine only ever reads it.
 */
struct ClaimRecord {
    std::string claim_id;
    int version;
    double actual_settlement;          ///< Settled amount
    bool has_variance;                 ///< Whether variance_pct was recorded
    double variance_pct;               ///< Recorded (predicted - actual) / actual * 100
    std::map<std::string, FeatureValue> features;

    ClaimRecord() : version(1), actual_settlement(0.0), has_variance(false), variance_pct(0.0) {}
    ClaimRecord(const std::string& id, double actual, int ver = 1)
        : claim_id(id), version(ver), actual_settlement(actual)
        , has_variance(false), variance_pct(0.0) {}

    /**
     * @brief Look up a feature
     * @return The stored value, or an absent value when missing
     */
    const FeatureValue& feature(const std::string& name) const;

    /**
     * @brief Set a feature (builder style, used while loading)
     */
    ClaimRecord& set(const std::string& name, const FeatureValue& value);

    /**
     * @brief Record the existing system's variance percentage
     */
    ClaimRecord& setVariancePct(double pct);
};

/**
 * @brief One row of the weight table
 *
 * Invariant: min_weight <= base_weight <= max_weight.
 */
struct WeightEntry {
    std::string factor_name;
    double base_weight;
    double min_weight;
    double max_weight;
    std::string category;
    std::string description;

    WeightEntry() : base_weight(0.0), min_weight(0.0), max_weight(0.0) {}
    WeightEntry(const std::string& name, double base, double lo, double hi,
                const std::string& cat = "")
        : factor_name(name), base_weight(base), min_weight(lo), max_weight(hi)
        , category(cat) {}

    double range() const { return max_weight - min_weight; }
};

/// Ordered weight table. The order is the optimisation order.
typedef std::vector<WeightEntry> WeightTable;

/// Factor name -> importance score (relative within one run)
typedef std::map<std::string, double> FactorImpact;

/**
 * @brief Ordered mapping from factor name to weight
 *
 * Keys are unique and keep their insertion order. Updates go through
 * with(), which returns a new vector, so a vector stored in a result
 * is a snapshot that later optimizer steps cannot alter.
 */
class WeightVector {
public:
    WeightVector() {}
    WeightVector(const std::vector<std::pair<std::string, double>>& entries);

    /**
     * @brief Vector of the table's base weights, in table order
     */
    static WeightVector fromBaseWeights(const WeightTable& table);

    /**
     * @brief Copy with one factor replaced (or appended when new)
     */
    WeightVector with(const std::string& name, double value) const;

    bool contains(const std::string& name) const;
    double get(const std::string& name, double fallback = 0.0) const;
    double sum() const;
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    std::vector<std::string> names() const;
    const std::vector<std::pair<std::string, double>>& entries() const { return m_entries; }

    bool operator==(const WeightVector& other) const { return m_entries == other.m_entries; }
    bool operator!=(const WeightVector& other) const { return !(*this == other); }

    void print() const;

private:
    std::vector<std::pair<std::string, double>> m_entries;
    std::map<std::string, size_t> m_index;
};

/**
 * @brief Coefficients of the settlement exponent
 *
 * E = C0 + C1*S + C2*I + C3*S*I + C4*I^2 + C5*I^3 + C6*S^2
 */
struct ScoringCoefficients {
    double C0;  ///< Base constant
    double C1;  ///< Severity
    double C2;  ///< Impact
    double C3;  ///< Severity * Impact interaction
    double C4;  ///< Impact^2
    double C5;  ///< Impact^3
    double C6;  ///< Severity^2

    ScoringCoefficients()
        : C0(10.5)
        , C1(0.15)
        , C2(0.25)
        , C3(0.05)
        , C4(-0.1)
        , C5(0.02)
        , C6(-0.01)
    {}
};

enum class TargetMetric { Mape, Rmse, Both };

enum class OptimizationMethod { CoordinateDescent, GridSearch, CorrelationGuided };

/**
 * @brief Optimizer run states
 *
 * Idle -> Running -> {Converged | MaxIterationsReached | Cancelled} -> Completed
 */
enum class OptimizerState { Idle, Running, Converged, MaxIterationsReached, Cancelled, Completed };

enum class RiskLevel { Low, Medium, High, Critical };

enum class ClaimOutcome { Improved, Degraded, Unchanged, Excluded };

const char* toString(TargetMetric metric);
const char* toString(OptimizationMethod method);
const char* toString(OptimizerState state);
const char* toString(RiskLevel level);
const char* toString(ClaimOutcome outcome);

/**
 * @brief Parse a target metric name ("mape", "rmse", "both")
 * @return false when the name is unknown
 */
bool parseTargetMetric(const std::string& name, TargetMetric& metric);

/**
 * @brief Parse an optimisation method name
 *
 * Accepts coordinate_descent (gradient_descent, variance_minimization),
 * grid_search and correlation_guided (smart).
 *
 * @return false when the name is unknown
 */
bool parseOptimizationMethod(const std::string& name, OptimizationMethod& method);

/**
 * @brief Configuration for the weight optimizer
 */
struct OptimizationConfig {
    TargetMetric target_metric;      ///< Metric to minimise
    int max_iterations;              ///< Coordinate descent rounds
    double learning_rate;            ///< Step as a fraction of (max - min), in (0, 1]
    double convergence_threshold;    ///< Stop when the largest accepted |delta| is below this
    int grid_steps;                  ///< Grid search samples grid_steps + 1 points per factor
    int top_factor_count;            ///< Factors kept by the correlation-guided strategy
    std::set<std::string> frozen_factors;  ///< Held at their starting weight
    bool verbose;                    ///< Print progress to stdout

    OptimizationConfig()
        : target_metric(TargetMetric::Mape)
        , max_iterations(50)
        , learning_rate(0.1)
        , convergence_threshold(1e-4)
        , grid_steps(5)
        , top_factor_count(10)
        , verbose(false)
    {}

    void freeze(const std::string& factor) { frozen_factors.insert(factor); }
    bool isFrozen(const std::string& factor) const { return frozen_factors.count(factor) > 0; }
};

/**
 * @brief One recorded optimizer step
 */
struct IterationRecord {
    int iteration;
    double mape;
    double rmse;
    std::map<std::string, double> weight_deltas;  ///< Accepted changes in this step
    WeightVector weights;                         ///< Weights after this step

    IterationRecord() : iteration(0), mape(0.0), rmse(0.0) {}
};

/**
 * @brief Results from one optimizer invocation
 */
struct OptimizationResult {
    OptimizationMethod method;
    WeightVector initial_weights;
    WeightVector optimized_weights;
    int iterations_run;
    double initial_mape;
    double initial_rmse;
    double final_mape;
    double final_rmse;
    double improvement_pct;          ///< (initial_mape - final_mape) / initial_mape * 100
    bool converged;
    OptimizerState termination;      ///< Converged, MaxIterationsReached or Cancelled
    std::vector<IterationRecord> convergence_history;

    OptimizationResult()
        : method(OptimizationMethod::CoordinateDescent)
        , iterations_run(0)
        , initial_mape(0.0)
        , initial_rmse(0.0)
        , final_mape(0.0)
        , final_rmse(0.0)
        , improvement_pct(0.0)
        , converged(false)
        , termination(OptimizerState::Idle)
    {}

    void print() const;
};

/**
 * @brief Aggregate error statistics over a claim set
 */
struct ErrorMetrics {
    double mae;
    double rmse;
    double mape;               ///< Over claims with a non-zero actual
    double r_squared;          ///< 0 when the actuals have no spread
    double total_variance;     ///< Sum of (predicted - actual)
    double avg_variance;       ///< Mean of (predicted - actual)
    int evaluated_claims;
    int percentage_claims;     ///< Claims that entered MAPE

    ErrorMetrics()
        : mae(0.0), rmse(0.0), mape(0.0), r_squared(0.0)
        , total_variance(0.0), avg_variance(0.0)
        , evaluated_claims(0), percentage_claims(0) {}

    void print() const;
};

/**
 * @brief Per-claim deviation
 */
struct ClaimVariance {
    double actual;
    double predicted;
    bool percentage_defined;   ///< false when actual == 0
    double variance_pct;       ///< (predicted - actual) / actual * 100
    RiskLevel risk;

    ClaimVariance()
        : actual(0.0), predicted(0.0), percentage_defined(false)
        , variance_pct(0.0), risk(RiskLevel::Low) {}
};

struct EvaluationResult {
    ErrorMetrics metrics;
    std::vector<ClaimVariance> claims;
};

/**
 * @brief Before/after comparison of one claim
 */
struct ClaimComparison {
    std::string claim_id;
    double actual;
    double baseline_prediction;
    double candidate_prediction;
    double baseline_error_pct;
    double candidate_error_pct;
    double improvement_pct;    ///< baseline_error_pct - candidate_error_pct (points)
    ClaimOutcome outcome;

    ClaimComparison()
        : actual(0.0), baseline_prediction(0.0), candidate_prediction(0.0)
        , baseline_error_pct(0.0), candidate_error_pct(0.0), improvement_pct(0.0)
        , outcome(ClaimOutcome::Unchanged) {}
};

/**
 * @brief Band in which a per-claim change counts as unchanged
 *
 * improved if (baseline_error - candidate_error) > improved_points,
 * degraded if it is < degraded_points.
 */
struct RecalibrationThresholds {
    double improved_points;
    double degraded_points;

    RecalibrationThresholds()
        : improved_points(1.0)
        , degraded_points(-1.0)
    {}
};

/**
 * @brief Aggregate before/after comparison over a claim set
 */
struct RecalibrationMetrics {
    int total_claims;
    int improved_count;
    int degraded_count;
    int unchanged_count;       ///< Includes claims excluded for a zero actual
    int excluded_count;
    double avg_improvement_pct;
    double mape_before;
    double mape_after;
    double rmse_before;
    double rmse_after;

    RecalibrationMetrics()
        : total_claims(0), improved_count(0), degraded_count(0)
        , unchanged_count(0), excluded_count(0), avg_improvement_pct(0.0)
        , mape_before(0.0), mape_after(0.0), rmse_before(0.0), rmse_after(0.0) {}

    void print() const;
};

struct RecalibrationReport {
    RecalibrationMetrics metrics;
    ErrorMetrics before;
    ErrorMetrics after;
    std::vector<ClaimComparison> claims;
};

/**
 * @brief Weight suggestion with its rationale
 */
struct WeightRecommendation {
    std::string factor_name;
    double current_weight;
    double suggested_weight;
    std::string reason;
    int expected_improvement;
    std::string confidence;    ///< "high", "medium" or "low"

    WeightRecommendation()
        : current_weight(0.0), suggested_weight(0.0), expected_improvement(0) {}
};

} // namespace WeightCalibration

#endif // DATA_TYPES_HH
