/**
 * @file test_correlation_ranker.cc
 * @brief Test program for factor correlation, impact ranking and rescaling
 */

#include "CorrelationAnalyzer.hh"
#include "FactorImpactRanker.hh"
#include "CalibrationErrors.hh"
#include "DataTypes.hh"
#include "test_support.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace WeightCalibration;
using namespace WeightCalibration::TestSupport;

namespace {

bool withinBounds(const WeightTable& table, const WeightVector& w) {
    for (const WeightEntry& e : table) {
        double v = w.get(e.factor_name, -1.0);
        if (v < e.min_weight - 1e-12 || v > e.max_weight + 1e-12) return false;
    }
    return true;
}

} // namespace

int main() {
    std::cout << "========================================\n";
    std::cout << "Correlation and Factor Ranking Test\n";
    std::cout << "========================================\n";

    CheckCounter checks("CorrelationAnalyzer / FactorImpactRanker");

    //------------------------------------------------------------------
    // 1. Pearson coefficient
    //------------------------------------------------------------------
    section("1. Pearson coefficient");

    std::vector<double> one = { 1.0 };
    checks.checkNear("single sample gives 0", CorrelationAnalyzer::pearson(one, one), 0.0, 0.0);

    std::vector<double> x = { 1.0, 2.0, 3.0, 4.0 };
    std::vector<double> up = { 2.0, 4.0, 6.0, 8.0 };
    std::vector<double> down = { 8.0, 6.0, 4.0, 2.0 };
    std::vector<double> flat = { 5.0, 5.0, 5.0, 5.0 };
    std::vector<double> shorter = { 1.0, 2.0, 3.0 };

    checks.checkNear("perfect positive", CorrelationAnalyzer::pearson(x, up), 1.0, 1e-12);
    checks.checkNear("perfect negative", CorrelationAnalyzer::pearson(x, down), -1.0, 1e-12);
    checks.checkNear("constant series gives 0", CorrelationAnalyzer::pearson(x, flat), 0.0, 0.0);
    checks.checkNear("size mismatch gives 0", CorrelationAnalyzer::pearson(x, shorter), 0.0, 0.0);

    //------------------------------------------------------------------
    // 2. Factor correlation over claims
    //------------------------------------------------------------------
    section("2. Factor correlation over claims");

    std::vector<ClaimRecord> claims;
    for (int i = 1; i <= 5; ++i) {
        ClaimRecord c("C" + std::to_string(i), 100000.0);
        c.set("Score", static_cast<double>(i));
        c.setVariancePct(-10.0 * i);        // |variance| grows with the factor
        claims.push_back(c);
    }
    ClaimRecord noVariance("NV", 100000.0);
    noVariance.set("Score", 100.0);
    claims.push_back(noVariance);
    ClaimRecord noValue("NF", 100000.0);
    noValue.setVariancePct(-500.0);
    claims.push_back(noValue);

    checks.checkNear("recorded variance, skipping incomplete claims",
                     CorrelationAnalyzer::correlate(claims, "Score"), 1.0, 1e-12);
    checks.checkNear("unknown factor gives 0",
                     CorrelationAnalyzer::correlate(claims, "Missing"), 0.0, 0.0);

    std::vector<double> predictions;
    for (size_t i = 0; i < claims.size(); ++i) {
        double s = 0.0;
        CorrelationAnalyzer::factorValue(claims[i], "Score", s);
        predictions.push_back(100000.0 * (1.0 - 0.02 * s));
    }
    double predCorr = CorrelationAnalyzer::correlate(claims, predictions, "Score");
    checks.checkNear("prediction variance", predCorr, 1.0, 1e-9);

    std::vector<double> wrongSize(2, 1.0);
    checks.checkThrows<InputValidationError>("prediction size mismatch", [&]() {
        CorrelationAnalyzer::correlate(claims, wrongSize, "Score");
    });

    ClaimRecord labels("L", 1.0);
    labels.set("Yes", "Yes").set("Text", "0.4").set("Num", 3).set("Blank", "  ");
    double v = 0.0;
    checks.check("label goes through categorical scoring",
                 CorrelationAnalyzer::factorValue(labels, "Yes", v) && v == 1.0);
    checks.check("numeric text is used as-is",
                 CorrelationAnalyzer::factorValue(labels, "Text", v) && v == 0.4);
    checks.check("numbers are used as-is",
                 CorrelationAnalyzer::factorValue(labels, "Num", v) && v == 3.0);
    checks.check("blank text has no value", !CorrelationAnalyzer::factorValue(labels, "Blank", v));
    checks.check("absent factor has no value", !CorrelationAnalyzer::factorValue(labels, "None", v));

    //------------------------------------------------------------------
    // 3. Combined score and recommendations
    //------------------------------------------------------------------
    section("3. Combined score");

    checks.checkNear("0.6 |r| + 0.4 impact/max", FactorImpactRanker::combinedScore(0.5, 5.0, 10.0), 0.5, 1e-12);
    checks.checkNear("sign of r is ignored", FactorImpactRanker::combinedScore(-1.0, 10.0, 10.0), 1.0, 1e-12);
    checks.checkNear("max impact 0 disables the impact term",
                     FactorImpactRanker::combinedScore(0.5, 5.0, 0.0), 0.3, 1e-12);

    FactorImpact impacts;
    impacts["A"] = 5.0;
    impacts["B"] = 10.0;
    impacts["C"] = std::nan("");
    checks.checkNear("max impact skips NaN", FactorImpactRanker::maxImpact(impacts), 10.0, 0.0);

    WeightEntry a("A", 0.1, 0.0, 0.2);
    checks.checkNear("recommend maps the score onto the range",
                     FactorImpactRanker::recommend(a, 0.5, impacts), 0.1, 1e-12);
    WeightEntry b("B", 0.1, 0.05, 0.2);
    checks.checkNear("full score reaches max_weight",
                     FactorImpactRanker::recommend(b, 1.0, impacts), 0.2, 1e-12);

    //------------------------------------------------------------------
    // 4. Budget rescaling
    //------------------------------------------------------------------
    section("4. Budget rescaling");

    WeightTable table = makeWeightTable();
    WeightVector base = WeightVector::fromBaseWeights(table);

    WeightVector doubled;
    for (const WeightEntry& e : table) doubled = doubled.with(e.factor_name, 2.0 * e.base_weight);
    WeightVector plain = FactorImpactRanker::rescaleToBudget(table, doubled);
    double maxDiff = 0.0;
    for (const WeightEntry& e : table) {
        maxDiff = std::max(maxDiff, std::abs(plain.get(e.factor_name) - e.base_weight));
    }
    checks.checkNear("proportional rescale", maxDiff, 0.0, 1e-12);

    WeightVector skewed;
    for (const WeightEntry& e : table) skewed = skewed.with(e.factor_name, 0.05);
    skewed = skewed.with("Surgical_Intervention", 1.0);
    WeightVector pinned = FactorImpactRanker::rescaleToBudget(table, skewed);
    checks.checkNear("pinned rescale keeps the budget", pinned.sum(), 1.0, 1e-6);
    checks.check("pinned rescale stays within bounds", withinBounds(table, pinned));
    checks.checkNear("overflowing factor is pinned at max_weight",
                     pinned.get("Surgical_Intervention"), 0.30, 1e-12);

    WeightVector sparse;
    for (const WeightEntry& e : table) sparse = sparse.with(e.factor_name, 0.0);
    sparse = sparse.with("Recovery_Duration", 0.5);
    WeightVector filled = FactorImpactRanker::rescaleToBudget(table, sparse);
    checks.checkNear("single recommendation keeps the budget", filled.sum(), 1.0, 1e-6);
    checks.check("single recommendation stays within bounds", withinBounds(table, filled));

    WeightVector zeros;
    for (const WeightEntry& e : table) zeros = zeros.with(e.factor_name, 0.0);
    checks.check("all-zero recommendations fall back to base weights",
                 FactorImpactRanker::rescaleToBudget(table, zeros) == base);

    //------------------------------------------------------------------
    // 5. Impacts and suggestions
    //------------------------------------------------------------------
    section("5. Impacts and suggestions");

    std::vector<ClaimRecord> pair;
    pair.push_back(ClaimRecord("P1", 100.0).set("F", "Yes").setVariancePct(10.0));
    pair.push_back(ClaimRecord("P2", 100.0).set("F", "Yes").setVariancePct(-20.0));
    pair.push_back(ClaimRecord("P3", 100.0).set("F", "Yes"));
    WeightVector fw;
    fw = fw.with("F", 0.5);
    FactorImpact recorded = FactorImpactRanker::computeImpacts(pair, fw);
    checks.checkNear("impact from recorded variance", recorded["F"], (5.0 + 10.0 + 0.0) / 3.0, 1e-12);

    std::vector<double> pairPred = { 110.0, 80.0, 130.0 };
    FactorImpact fromPred = FactorImpactRanker::computeImpacts(pair, pairPred, fw);
    checks.checkNear("impact from predictions", fromPred["F"], (5.0 + 10.0 + 15.0) / 3.0, 1e-12);
    checks.checkThrows<InputValidationError>("impact size mismatch", [&]() {
        FactorImpactRanker::computeImpacts(pair, wrongSize, fw);
    });

    WeightTable single;
    single.push_back(WeightEntry("Score", 0.05, 0.0, 1.0));
    FactorImpact scoreImpact;
    scoreImpact["Score"] = 10.0;
    std::vector<WeightRecommendation> recs =
        FactorImpactRanker::generateRecommendations(claims, single, scoreImpact);
    checks.check("correlated high-impact factor gets a suggestion", recs.size() == 1);
    if (!recs.empty()) {
        checks.checkNear("suggestion is raised to the data-driven weight", recs[0].suggested_weight, 1.0, 1e-12);
        checks.check("suggestion has high confidence", recs[0].confidence == "high");
        checks.check("expected improvement from correlation", recs[0].expected_improvement == 10);
    }

    std::vector<ClaimRecord> synthetic = makeSyntheticClaims(40);
    FactorImpact synthImpacts = FactorImpactRanker::computeImpacts(synthetic, base);
    std::vector<WeightRecommendation> all =
        FactorImpactRanker::generateRecommendations(synthetic, table, synthImpacts);
    bool sorted = true;
    bool meaningful = true;
    bool bounded = true;
    for (size_t i = 0; i < all.size(); ++i) {
        if (i > 0 && all[i - 1].expected_improvement < all[i].expected_improvement) sorted = false;
        if (std::abs(all[i].suggested_weight - all[i].current_weight) <= FactorImpactRanker::kMinimumChange) {
            meaningful = false;
        }
        for (const WeightEntry& e : table) {
            if (e.factor_name == all[i].factor_name &&
                (all[i].suggested_weight < e.min_weight || all[i].suggested_weight > e.max_weight)) {
                bounded = false;
            }
        }
    }
    std::cout << "  " << all.size() << " suggestion(s) on the synthetic claims\n";
    checks.check("suggestions sorted by expected improvement", sorted);
    checks.check("suggestions move a weight by more than the minimum", meaningful);
    checks.check("suggestions stay within bounds", bounded);

    return checks.summary();
}
