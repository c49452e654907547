/**
 * @file test_scoring_model.cc
 * @brief Test program for the settlement prediction model
 *
 * Checks:
 * 1. Defaults of a claim without optional fields
 * 2. Parsing of numeric text and coercion of garbled fields
 * 3. Impact clamping and the venue / causation multipliers
 * 4. Weight adjustment relative to a reference vector
 * 5. Cached feature path against the direct path
 * 6. Categorical label scoring
 */

#include "ScoringModel.hh"
#include "FeatureCoercion.hh"
#include "DataTypes.hh"
#include "test_support.hh"

#include <algorithm>
#include <iostream>
#include <cmath>
#include <vector>

using namespace WeightCalibration;
using namespace WeightCalibration::TestSupport;

int main() {
    std::cout << "========================================\n";
    std::cout << "Scoring Model Test\n";
    std::cout << "========================================\n";

    CheckCounter checks("ScoringModel");
    ScoringModel model;
    const ScoringCoefficients& c = model.getCoefficients();

    //------------------------------------------------------------------
    // 1. Empty claim
    //------------------------------------------------------------------
    section("1. Claim without optional fields");

    ClaimRecord empty("EMPTY", 50000.0);
    checks.checkNear("S defaults to 0", model.severitySum(empty), 0.0, 0.0);
    checks.checkNear("I defaults to 2", model.impactScore(empty), 2.0, 0.0);
    checks.checkNear("causation defaults to 0", model.causationSum(empty), 0.0, 0.0);
    checks.checkNear("rating weight defaults to 0", model.ratingWeight(empty), 0.0, 0.0);

    double expectedE = c.C0 + 2.0 * c.C2 + 4.0 * c.C4 + 8.0 * c.C5;
    checks.checkNear("prediction is exp(E(0, 2))", model.basePrediction(empty),
                     std::exp(expectedE), 1e-9 * std::exp(expectedE));

    // With only C0 left the prediction collapses to exp(C0) * 1 * 1
    ScoringCoefficients constantOnly;
    constantOnly.C1 = constantOnly.C2 = constantOnly.C3 = 0.0;
    constantOnly.C4 = constantOnly.C5 = constantOnly.C6 = 0.0;
    ScoringModel constantModel(constantOnly);
    checks.checkNear("constant-only coefficients give exp(C0)",
                     constantModel.basePrediction(empty), std::exp(constantOnly.C0), 1e-6);

    WeightTable table = makeWeightTable();
    WeightVector base = WeightVector::fromBaseWeights(table);
    checks.checkNear("predict(W, W) equals the closed form",
                     model.predict(empty, base, base), model.basePrediction(empty), 0.0);

    //------------------------------------------------------------------
    // 2. Field coercion
    //------------------------------------------------------------------
    section("2. Field coercion");

    ClaimRecord mixed("MIXED", 80000.0);
    mixed.set("severity_allowed_tx_period", "2")
         .set("severity_initial_tx", 1.5)
         .set("severity_injections", "abc")
         .set("severity_objective_findings", " 0.5 ")
         .set("severity_pain_mgmt", "12abc")
         .set("severity_code", "")
         .set("SEVERITY_SCORE", "1");
    checks.checkNear("S sums numbers and numeric text only", model.severitySum(mixed), 5.0, 1e-12);

    mixed.set("causation_probability", "0.8").set("causation_tx_gaps", "n/a");
    checks.checkNear("causation skips garbled text", model.causationSum(mixed), 0.8, 1e-12);

    double v = -1.0;
    checks.check("tryParseNumber rejects trailing junk", !tryParseNumber(FeatureValue("12abc"), v));
    checks.check("tryParseNumber rejects inf", !tryParseNumber(FeatureValue("inf"), v));
    checks.check("tryParseNumber rejects nan", !tryParseNumber(FeatureValue("nan"), v));
    checks.check("tryParseNumber rejects NaN numbers", !tryParseNumber(FeatureValue(std::nan("")), v));
    checks.check("tryParseNumber accepts scientific text",
                 tryParseNumber(FeatureValue("-1e3"), v) && v == -1000.0);
    checks.checkNear("safeNumeric of absent is 0", safeNumeric(FeatureValue()), 0.0, 0.0);

    double garbled = model.basePrediction(mixed);
    checks.check("garbled fields never produce NaN", std::isfinite(garbled) && garbled >= 0.0);

    //------------------------------------------------------------------
    // 3. Impact and multipliers
    //------------------------------------------------------------------
    section("3. Impact clamping and multipliers");

    ClaimRecord claim("IMPACT", 100000.0);
    claim.set("IMPACT", 7);
    checks.checkNear("impact 7 clamps to 4", model.impactScore(claim), 4.0, 0.0);
    claim.set("IMPACT", 0);
    checks.checkNear("impact 0 clamps to 1", model.impactScore(claim), 1.0, 0.0);
    claim.set("IMPACT", "2.9");
    checks.checkNear("impact 2.9 truncates to 2", model.impactScore(claim), 2.0, 0.0);
    claim.set("IMPACT", "severe");
    checks.checkNear("non-numeric impact defaults to 2", model.impactScore(claim), 2.0, 0.0);

    ClaimRecord plain("PLAIN", 100000.0);
    ClaimRecord scaled("SCALED", 100000.0);
    scaled.set("RATINGWEIGHT", 0.25).set("causation_probability", 1).set("causation_compliance", 1);
    checks.checkNear("venue and causation multipliers",
                     model.basePrediction(scaled),
                     model.basePrediction(plain) * 1.25 * 1.2,
                     1e-6 * model.basePrediction(plain));

    ClaimRecord negative("NEG", 100000.0);
    negative.set("RATINGWEIGHT", -3.0);
    checks.checkNear("negative multiplier floors at 0", model.basePrediction(negative), 0.0, 0.0);

    ClaimRecord huge("HUGE", 100000.0);
    huge.set("SEVERITY_SCORE", -1e6);
    double hugePrediction = model.basePrediction(huge);
    checks.check("extreme severity stays finite", std::isfinite(hugePrediction) && hugePrediction >= 0.0);

    //------------------------------------------------------------------
    // 4. Weight adjustment
    //------------------------------------------------------------------
    section("4. Weight adjustment");

    ClaimRecord weighted("WEIGHTED", 100000.0);
    weighted.set("Surgical_Intervention", "Yes").set("Injury_Extent", "Mild");

    WeightVector ref;
    ref = ref.with("Surgical_Intervention", 0.5).with("Injury_Extent", 0.5);
    WeightVector tilted = ref.with("Surgical_Intervention", 1.0);

    checks.checkNear("weighted score of the reference",
                     model.weightedScore(weighted, ref), 0.5 * 1.0 + 0.5 * 0.3, 1e-12);
    double expectedTilted = (1.0 * 1.0 + 0.5 * 0.3) / 1.5;
    checks.checkNear("weighted score is normalised by the weight sum",
                     model.weightedScore(weighted, tilted), expectedTilted, 1e-12);

    double basePrediction = model.basePrediction(weighted);
    checks.checkNear("tilted prediction",
                     model.predict(weighted, tilted, ref),
                     basePrediction * (1.0 + expectedTilted - 0.65), 1e-6 * basePrediction);

    WeightVector zero;
    zero = zero.with("Surgical_Intervention", 0.0).with("Injury_Extent", 0.0);
    checks.checkNear("zero weights score 0", model.weightedScore(weighted, zero), 0.0, 0.0);
    checks.check("prediction is never negative",
                 model.predict(weighted, zero, ref) >= 0.0);

    ClaimRecord numericFactor("NUMERIC", 100000.0);
    numericFactor.set("Surgical_Intervention", 5.0);
    WeightVector single;
    single = single.with("Surgical_Intervention", 1.0);
    checks.checkNear("raw numbers pass through", model.weightedScore(numericFactor, single), 5.0, 0.0);
    checks.checkNear("large reference score floors the multiplier at 0",
                     model.predict(numericFactor, zero.with("Surgical_Intervention", 0.0), single), 0.0, 0.0);

    //------------------------------------------------------------------
    // 5. Cached features
    //------------------------------------------------------------------
    section("5. Cached features");

    std::vector<ClaimRecord> claims = makeSyntheticClaims(24);
    std::vector<std::string> names = base.names();
    WeightVector truth = makeTrueWeights(table);
    std::vector<double> truthAligned;
    std::vector<double> baseAligned;
    for (const std::string& n : names) {
        truthAligned.push_back(truth.get(n));
        baseAligned.push_back(base.get(n));
    }

    double maxDiff = 0.0;
    for (const ClaimRecord& cl : claims) {
        ClaimFeatures f = model.extractFeatures(cl, names);
        double ref_score = ScoringModel::weightedScore(f, baseAligned);
        double cached = ScoringModel::predict(f, truthAligned, ref_score);
        double direct = model.predict(cl, truth, base);
        maxDiff = std::max(maxDiff, std::abs(cached - direct) / std::max(1.0, direct));
    }
    checks.checkNear("cached and direct predictions agree", maxDiff, 0.0, 1e-12);

    bool deterministic = true;
    for (const ClaimRecord& cl : claims) {
        if (model.predict(cl, truth, base) != model.predict(cl, truth, base)) deterministic = false;
    }
    checks.check("predictions are deterministic", deterministic);

    //------------------------------------------------------------------
    // 6. Categorical labels
    //------------------------------------------------------------------
    section("6. Categorical labels");

    checks.checkNear("Yes", categoricalScore(FeatureValue("Yes")), 1.0, 0.0);
    checks.checkNear("absent", categoricalScore(FeatureValue("Absent")), 0.0, 0.0);
    checks.checkNear("Moderate", categoricalScore(FeatureValue("Moderate")), 0.6, 0.0);
    checks.checkNear("Non-compliant before compliant", categoricalScore(FeatureValue("Non-compliant")), 0.2, 0.0);
    checks.checkNear("Compliant", categoricalScore(FeatureValue("Compliant")), 1.0, 0.0);
    checks.checkNear("Non-invasive before invasive", categoricalScore(FeatureValue("Non-invasive")), 0.4, 0.0);
    checks.checkNear("Inconsistent before consistent", categoricalScore(FeatureValue("Inconsistent")), 0.2, 0.0);
    checks.checkNear("5-12 weeks", categoricalScore(FeatureValue("5-12 weeks")), 0.7, 0.0);
    checks.checkNear("numeric text clamps to [0, 1]", categoricalScore(FeatureValue("5")), 1.0, 0.0);
    checks.checkNear("numeric text inside [0, 1]", categoricalScore(FeatureValue("0.35")), 0.35, 0.0);
    checks.checkNear("unknown label scores 0", categoricalScore(FeatureValue("whatever")), 0.0, 0.0);

    return checks.summary();
}
