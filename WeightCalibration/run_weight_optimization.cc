/**
 * @file run_weight_optimization.cc
 * @brief Command-line driver: evaluate and optimise a weight table on a claim export
 *
 * Usage: run_weight_optimization [OPTIONS] <weights.csv> <claims.csv>
 *
 * Steps:
 * 1. Load the weight table and claims
 * 2. Evaluate the base weights
 * 3. Optimise with the selected strategy
 * 4. Compare base and optimised weights claim by claim
 * 5. Sensitivity analysis and data-driven suggestions for the result
 */

#include "ClaimsDataReader.hh"
#include "RecalibrationService.hh"
#include "DataTypes.hh"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using namespace WeightCalibration;

static void printUsage(const char* program) {
    cout << "Usage: " << program << " [OPTIONS] <weights.csv> <claims.csv>" << endl;
    cout << "Options:" << endl;
    cout << "  --method NAME: coordinate_descent (default), grid_search, correlation_guided" << endl;
    cout << "                 (aliases: gradient_descent, variance_minimization, smart)" << endl;
    cout << "  --target NAME: mape (default), rmse, both" << endl;
    cout << "  --max-iter N: Coordinate descent rounds (default: 50)" << endl;
    cout << "  --learning-rate VALUE: Step as a fraction of the weight range (default: 0.1)" << endl;
    cout << "  --threshold VALUE: Convergence threshold (default: 1e-4)" << endl;
    cout << "  --grid-steps N: Grid intervals per factor (default: 5)" << endl;
    cout << "  --top N: Factors optimised by correlation_guided (default: 10)" << endl;
    cout << "  --freeze NAME: Keep a factor at its starting weight (repeatable)" << endl;
    cout << "  --perturbation VALUE: Sensitivity perturbation fraction (default: 0.1)" << endl;
    cout << "  --verbose, -v: Print optimizer progress" << endl;
}

int main(int argc, char** argv)
{
    OptimizationConfig config;
    string method = "coordinate_descent";
    double perturbation = 0.1;
    vector<string> positional;

    for (int i = 1; i < argc; i++) {
        string arg = string(argv[i]);

        if (arg == "--method" && i + 1 < argc) {
            method = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            string name = argv[++i];
            if (!parseTargetMetric(name, config.target_metric)) {
                cerr << "Error: unknown target metric '" << name << "'" << endl;
                return 1;
            }
        } else if (arg == "--max-iter" && i + 1 < argc) {
            config.max_iterations = atoi(argv[++i]);
            if (config.max_iterations < 0) {
                cerr << "Error: max-iter must be >= 0" << endl;
                return 1;
            }
        } else if (arg == "--learning-rate" && i + 1 < argc) {
            config.learning_rate = atof(argv[++i]);
        } else if (arg == "--threshold" && i + 1 < argc) {
            config.convergence_threshold = atof(argv[++i]);
        } else if (arg == "--grid-steps" && i + 1 < argc) {
            config.grid_steps = atoi(argv[++i]);
        } else if (arg == "--top" && i + 1 < argc) {
            config.top_factor_count = atoi(argv[++i]);
        } else if (arg == "--freeze" && i + 1 < argc) {
            config.freeze(argv[++i]);
        } else if (arg == "--perturbation" && i + 1 < argc) {
            perturbation = atof(argv[++i]);
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            cout << "Unknown option: " << arg << endl;
            cout << "Use --help for usage information" << endl;
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        printUsage(argv[0]);
        return 1;
    }

    cout << "============================================" << endl;
    cout << "  Settlement Weight Optimisation" << endl;
    cout << "  METHOD: " << method << endl;
    cout << "  TARGET: " << toString(config.target_metric) << endl;
    cout << "============================================" << endl;

    //========================================================================
    // STEP 1: Load data
    //========================================================================
    ClaimsData::ClaimsDataReader reader;
    if (!reader.loadWeightTable(positional[0])) {
        cerr << "Failed to load weight table " << positional[0] << endl;
        return 1;
    }
    if (!reader.loadClaims(positional[1])) {
        cerr << "Failed to load claims " << positional[1] << endl;
        return 1;
    }
    reader.printSummary();

    RecalibrationService service(reader.getWeightTable());
    service.setClaims(reader.getClaims());
    WeightVector base = service.defaultWeights();

    //========================================================================
    // STEP 2: Current weights
    //========================================================================
    cout << "\n--- Current Weights ---" << endl;
    RecalibrationResponse current = service.recalibrate(base);
    current.print();
    if (!current.success) return 1;

    //========================================================================
    // STEP 3: Optimise
    //========================================================================
    cout << "\n--- Optimisation ---" << endl;
    OptimizationResponse optimized = service.optimize(service.getClaims(), base, method, config);
    optimized.print();
    if (!optimized.success) return 1;

    //========================================================================
    // STEP 4: Compare
    //========================================================================
    cout << "\n--- Comparison (a = base, b = optimised) ---" << endl;
    WeightComparison comparison = service.compareWeights(base, optimized.optimized_weights);
    comparison.print();

    //========================================================================
    // STEP 5: Sensitivity and suggestions
    //========================================================================
    cout << "\n--- Sensitivity of the Optimised Weights ---" << endl;
    SensitivityResponse sensitivity = service.sensitivityAnalysis(optimized.optimized_weights, perturbation);
    sensitivity.print();

    cout << "\n--- Data-Driven Suggestions ---" << endl;
    RecommendationResponse suggestions = service.recommendWeights(service.getClaims(), base);
    if (suggestions.success) {
        for (const WeightRecommendation& rec : suggestions.recommendations) {
            cout << "  " << left << setw(32) << rec.factor_name << right << fixed << setprecision(3)
                 << rec.current_weight << " -> " << rec.suggested_weight
                 << "  [" << rec.confidence << ", +" << rec.expected_improvement << "]" << endl;
            cout << "      " << rec.reason << endl;
        }
        if (suggestions.recommendations.empty()) {
            cout << "  All weights are near their data-driven values" << endl;
        }
    }

    return 0;
}
