/**
 * @file test_strategy_comparison_parallel.cc
 * @brief Runs the three search strategies in parallel and compares them
 *
 * This program:
 * 1. Builds a synthetic claim set from known weights
 * 2. Runs coordinate descent, grid search and the correlation-guided
 *    hybrid for several target metrics, one job per OpenMP thread
 * 3. Checks every parallel result against a serial run of the same job
 * 4. Prints a comparison table of the strategies
 *
 * The claim set and weight table are shared read-only between threads;
 * every job owns its optimizer.
 */

#include "WeightOptimizer.hh"
#include "DataTypes.hh"
#include "test_support.hh"

#include <omp.h>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

using namespace std;
using namespace WeightCalibration;
using namespace WeightCalibration::TestSupport;

struct StrategyJob {
    OptimizationMethod method;
    TargetMetric target;
};

struct StrategyOutcome {
    OptimizationResult result;
    double wall_time;
    int thread;

    StrategyOutcome() : wall_time(0.0), thread(-1) {}
};

static OptimizationResult runJob(const StrategyJob& job,
                                 const vector<ClaimRecord>& claims,
                                 const WeightTable& table) {
    OptimizationConfig config;
    config.target_metric = job.target;
    config.top_factor_count = 6;
    WeightOptimizer optimizer(config);
    return optimizer.optimize(claims, table, job.method);
}

int main() {
    cout << "============================================" << endl;
    cout << "  Parallel Strategy Comparison" << endl;
    cout << "============================================" << endl;

    CheckCounter checks("Parallel strategy comparison");

    WeightTable table = makeWeightTable();
    vector<ClaimRecord> claims = makeSyntheticClaims(120);

    vector<StrategyJob> jobs;
    const OptimizationMethod methods[] = {
        OptimizationMethod::CoordinateDescent,
        OptimizationMethod::GridSearch,
        OptimizationMethod::CorrelationGuided
    };
    const TargetMetric targets[] = { TargetMetric::Mape, TargetMetric::Rmse, TargetMetric::Both };
    for (OptimizationMethod m : methods) {
        for (TargetMetric t : targets) {
            StrategyJob job;
            job.method = m;
            job.target = t;
            jobs.push_back(job);
        }
    }

    // Can be overridden by OMP_NUM_THREADS
    int numThreads = 4;
    omp_set_num_threads(numThreads);

    cout << "\n--- Parameters ---" << endl;
    cout << "  Claims: " << claims.size() << endl;
    cout << "  Factors: " << table.size() << endl;
    cout << "  Jobs: " << jobs.size() << endl;
    cout << "  OpenMP threads: " << numThreads << endl;

    //------------------------------------------------------------------------
    // Parallel runs
    //------------------------------------------------------------------------
    cout << "\n--- Starting Parallel Optimisation ---" << endl;
    vector<StrategyOutcome> outcomes(jobs.size());
    double wall_start = omp_get_wtime();

    #pragma omp parallel for schedule(dynamic)
    for (int n = 0; n < static_cast<int>(jobs.size()); n++)
    {
        #pragma omp critical
        {
            cout << "Thread " << omp_get_thread_num() << " running "
                 << toString(jobs[n].method) << " / " << toString(jobs[n].target) << endl;
        }

        double job_start = omp_get_wtime();
        outcomes[n].result = runJob(jobs[n], claims, table);
        outcomes[n].wall_time = omp_get_wtime() - job_start;
        outcomes[n].thread = omp_get_thread_num();
    }

    double wall_time = omp_get_wtime() - wall_start;

    //------------------------------------------------------------------------
    // Serial reference runs
    //------------------------------------------------------------------------
    cout << "\n--- Serial Reference Runs ---" << endl;
    for (size_t n = 0; n < jobs.size(); n++) {
        OptimizationResult serial = runJob(jobs[n], claims, table);
        const OptimizationResult& parallel = outcomes[n].result;

        string label = string(toString(jobs[n].method)) + " / " + toString(jobs[n].target);
        checks.check(label + " matches serial",
                     serial.optimized_weights == parallel.optimized_weights &&
                     serial.iterations_run == parallel.iterations_run &&
                     serial.final_mape == parallel.final_mape);
        checks.check(label + " never worsens MAPE target",
                     jobs[n].target != TargetMetric::Mape || parallel.final_mape <= parallel.initial_mape);
        checks.check(label + " never worsens RMSE target",
                     jobs[n].target != TargetMetric::Rmse || parallel.final_rmse <= parallel.initial_rmse);
    }

    //------------------------------------------------------------------------
    // Comparison table
    //------------------------------------------------------------------------
    cout << "\n--- Strategy Comparison ---" << endl;
    cout << "  " << left << setw(20) << "Method" << setw(8) << "Target"
         << right << setw(12) << "MAPE 0" << setw(12) << "MAPE"
         << setw(14) << "RMSE" << setw(8) << "Iter" << setw(10) << "Time(s)" << endl;
    cout << "  " << string(84, '-') << endl;
    for (size_t n = 0; n < jobs.size(); n++) {
        const OptimizationResult& r = outcomes[n].result;
        cout << "  " << left << setw(20) << toString(jobs[n].method) << setw(8) << toString(jobs[n].target)
             << right << fixed << setprecision(4) << setw(12) << r.initial_mape << setw(12) << r.final_mape
             << setprecision(2) << setw(14) << r.final_rmse << setw(8) << r.iterations_run
             << setprecision(3) << setw(10) << outcomes[n].wall_time << endl;
    }

    cout << "\n  Wall clock time: " << fixed << setprecision(2) << wall_time << " seconds" << endl;

    return checks.summary();
}
