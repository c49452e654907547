/**
 * @file test_support.hh
 * @brief Shared check counter and synthetic data for the calibration tests
 *
 * The synthetic claims are generated from a known "true" weight vector:
 * the actual settlement of a claim is the model prediction under the
 * true weights relative to the base weights of makeWeightTable(). An
 * optimizer started from the base weights can therefore always reduce
 * the error.
 */

#ifndef TEST_SUPPORT_HH
#define TEST_SUPPORT_HH

#include "DataTypes.hh"
#include "ScoringModel.hh"

#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace WeightCalibration {
namespace TestSupport {

/**
 * @class CheckCounter
 * @brief Collects named checks and prints the PASS/FAIL summary
 */
class CheckCounter {
public:
    explicit CheckCounter(const std::string& suite) : m_suite(suite) {}

    bool check(const std::string& name, bool ok, const std::string& detail = "") {
        Entry e;
        e.name = name;
        e.ok = ok;
        e.detail = detail;
        m_entries.push_back(e);
        std::cout << "  [" << (ok ? "PASS" : "FAIL") << "] " << name;
        if (!detail.empty()) std::cout << " (" << detail << ")";
        std::cout << "\n";
        return ok;
    }

    bool checkNear(const std::string& name, double actual, double expected, double tol) {
        std::ostringstream detail;
        detail << std::setprecision(10) << "got " << actual << ", expected " << expected;
        bool ok = std::isfinite(actual) && std::abs(actual - expected) <= tol;
        return check(name, ok, detail.str());
    }

    /**
     * @brief Check that fn throws exactly the given exception type
     */
    template <typename Exception, typename Fn>
    bool checkThrows(const std::string& name, Fn fn) {
        try {
            fn();
        } catch (const Exception& e) {
            return check(name, true, e.what());
        } catch (const std::exception& e) {
            return check(name, false, std::string("wrong exception: ") + e.what());
        }
        return check(name, false, "nothing thrown");
    }

    int failures() const {
        int n = 0;
        for (const Entry& e : m_entries) {
            if (!e.ok) ++n;
        }
        return n;
    }

    /**
     * @brief Print the summary table
     * @return Process exit code (0 when every check passed)
     */
    int summary() const {
        std::cout << "\n============================================\n";
        std::cout << "  TEST SUMMARY: " << m_suite << "\n";
        std::cout << "============================================\n";
        std::cout << "  " << std::left << std::setw(56) << "Check" << std::right
                  << std::setw(8) << "Status" << "\n";
        std::cout << "  " << std::string(64, '-') << "\n";
        for (const Entry& e : m_entries) {
            std::cout << "  " << std::left << std::setw(56) << e.name.substr(0, 55) << std::right
                      << std::setw(8) << (e.ok ? "PASS" : "FAIL") << "\n";
        }
        std::cout << "\n  " << (m_entries.size() - failures()) << " / " << m_entries.size()
                  << " checks passed\n";
        std::cout << "============================================\n";
        return failures() == 0 ? 0 : 1;
    }

private:
    struct Entry {
        std::string name;
        bool ok;
        std::string detail;
    };

    std::string m_suite;
    std::vector<Entry> m_entries;
};

inline void section(const std::string& title) {
    std::cout << "\n--- " << title << " ---\n";
}

/**
 * @brief Twelve categorical factors, base weights summing to 1
 */
inline WeightTable makeWeightTable() {
    WeightTable table;
    table.push_back(WeightEntry("Surgical_Intervention", 0.12, 0.02, 0.30, "Treatment"));
    table.push_back(WeightEntry("Injury_Extent",         0.10, 0.02, 0.25, "Injury"));
    table.push_back(WeightEntry("Treatment_Compliance",  0.08, 0.01, 0.20, "Causation"));
    table.push_back(WeightEntry("Emergency_Treatment",   0.08, 0.01, 0.20, "Treatment"));
    table.push_back(WeightEntry("Injury_Laterality",     0.06, 0.01, 0.15, "Injury"));
    table.push_back(WeightEntry("Physical_Therapy",      0.09, 0.02, 0.20, "Treatment"));
    table.push_back(WeightEntry("Head_Trauma",           0.07, 0.01, 0.20, "Injury"));
    table.push_back(WeightEntry("Nerve_Involvement",     0.08, 0.01, 0.20, "Injury"));
    table.push_back(WeightEntry("Treatment_Level",       0.10, 0.02, 0.25, "Treatment"));
    table.push_back(WeightEntry("Symptom_Timeline",      0.07, 0.01, 0.20, "Causation"));
    table.push_back(WeightEntry("Consistent_Mechanism",  0.06, 0.01, 0.15, "Causation"));
    table.push_back(WeightEntry("Recovery_Duration",     0.09, 0.02, 0.25, "Recovery"));
    return table;
}

/**
 * @brief Weights the synthetic settlements were generated with
 *
 * Differs from the base weights on the first few factors only.
 */
inline WeightVector makeTrueWeights(const WeightTable& table) {
    WeightVector w = WeightVector::fromBaseWeights(table);
    w = w.with("Surgical_Intervention", 0.26);
    w = w.with("Injury_Extent", 0.04);
    w = w.with("Treatment_Compliance", 0.16);
    w = w.with("Emergency_Treatment", 0.02);
    return w;
}

/**
 * @brief Deterministic claim set with settlements from makeTrueWeights()
 * @param count Number of claims
 */
inline std::vector<ClaimRecord> makeSyntheticClaims(int count) {
    static const char* yesNo[] = { "Yes", "No" };
    static const char* extent[] = { "Severe", "Moderate", "Mild" };
    static const char* compliance[] = { "Compliant", "Partial", "Non-compliant" };
    static const char* emergency[] = { "Inpatient", "Outpatient", "Treated & Released", "No" };
    static const char* laterality[] = { "Bilateral", "Unilateral" };
    static const char* level[] = { "Surgical", "Active", "Passive", "Non-invasive" };
    static const char* timeline[] = { "Immediate", "Within first 48 hours", "More than 7 days" };
    static const char* mechanism[] = { "Consistent", "Inconsistent" };
    static const char* duration[] = { "More than 12 weeks", "5-12 weeks", "2-4 weeks", "Less than 2 weeks" };

    WeightTable table = makeWeightTable();
    WeightVector base = WeightVector::fromBaseWeights(table);
    WeightVector truth = makeTrueWeights(table);
    ScoringModel model;

    std::vector<ClaimRecord> claims;
    claims.reserve(count);
    for (int i = 0; i < count; ++i) {
        std::ostringstream id;
        id << "CLM-" << std::setw(5) << std::setfill('0') << (i + 1);

        ClaimRecord claim(id.str(), 0.0);
        claim.set("severity_allowed_tx_period", (i % 4));
        claim.set("severity_initial_tx", (i % 3));
        claim.set("severity_injections", (i % 5 == 0) ? "1" : "0");
        claim.set("severity_objective_findings", (i % 2));
        claim.set("severity_pain_mgmt", 0.5 * (i % 3));
        claim.set("causation_probability", (i % 3 == 0) ? 1.0 : 0.5);
        claim.set("causation_tx_delay", (i % 4 == 1) ? "1" : "0");
        claim.set("IMPACT", 1 + (i % 4));
        claim.set("RATINGWEIGHT", 0.05 * (i % 3));

        claim.set("Surgical_Intervention", yesNo[(i / 2) % 2]);
        claim.set("Injury_Extent", extent[i % 3]);
        claim.set("Treatment_Compliance", compliance[(i / 3) % 3]);
        claim.set("Emergency_Treatment", emergency[i % 4]);
        claim.set("Injury_Laterality", laterality[(i / 5) % 2]);
        claim.set("Physical_Therapy", yesNo[(i / 3) % 2]);
        claim.set("Head_Trauma", yesNo[(i / 7) % 2]);
        claim.set("Nerve_Involvement", yesNo[(i + 1) % 2]);
        claim.set("Treatment_Level", level[(i / 2) % 4]);
        claim.set("Symptom_Timeline", timeline[i % 3]);
        claim.set("Consistent_Mechanism", mechanism[(i / 4) % 2]);
        claim.set("Recovery_Duration", duration[(i / 3) % 4]);

        double existing = model.basePrediction(claim);
        claim.actual_settlement = std::round(model.predict(claim, truth, base));
        if (claim.actual_settlement > 0.0) {
            claim.setVariancePct((existing - claim.actual_settlement) / claim.actual_settlement * 100.0);
        }
        claims.push_back(claim);
    }
    return claims;
}

} // namespace TestSupport
} // namespace WeightCalibration

#endif // TEST_SUPPORT_HH
