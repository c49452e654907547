/**
 * @file FeatureCoercion.cc
 * @brief Implementation of claim field coercion
 */

#include "FeatureCoercion.hh"
#include "MathUtilities.hh"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace WeightCalibration {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

std::string toLower(const std::string& s) {
    std::string out(s);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
    }
    return out;
}

std::string trimWhitespace(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool tryParseNumber(const FeatureValue& value, double& out) {
    switch (value.kind) {
        case FeatureValue::Absent:
            return false;
        case FeatureValue::Number:
            if (!std::isfinite(value.number)) return false;
            out = value.number;
            return true;
        case FeatureValue::Text:
            break;
    }

    std::string trimmed = trimWhitespace(value.text);
    if (trimmed.empty()) return false;

    const char* begin = trimmed.c_str();
    char* end = 0;
    errno = 0;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    if (!std::isfinite(parsed)) return false;

    out = parsed;
    return true;
}

double safeNumeric(const FeatureValue& value) {
    double v = 0.0;
    return tryParseNumber(value, v) ? v : 0.0;
}

double categoricalScore(const FeatureValue& value) {
    if (value.kind == FeatureValue::Absent) return 0.0;
    if (value.kind == FeatureValue::Number) {
        return std::isfinite(value.number) ? value.number : 0.0;
    }

    const std::string val = toLower(trimWhitespace(value.text));
    if (val.empty()) return 0.0;

    // Yes/No
    if (val == "yes" || val == "present") return 1.0;
    if (val == "no" || val == "absent") return 0.0;

    // Negated labels first; they contain the positive label as a substring
    if (contains(val, "non-compliant")) return 0.2;
    if (contains(val, "inconsistent")) return 0.2;
    if (contains(val, "non-invasive")) return 0.4;

    // Severity levels
    if (contains(val, "severe") || val == "high") return 1.0;
    if (contains(val, "moderate") || val == "medium") return 0.6;
    if (contains(val, "mild") || val == "low") return 0.3;

    // Duration bands
    if (contains(val, "more than 12 weeks") || contains(val, ">12")) return 1.0;
    if (contains(val, "5-12") || contains(val, "5 - 12")) return 0.7;
    if (contains(val, "2-4") || contains(val, "2 - 4")) return 0.4;
    if (contains(val, "less than") || contains(val, "<")) return 0.2;

    // Treatment levels
    if (contains(val, "invasive") || contains(val, "surgical")) return 1.0;
    if (contains(val, "passive")) return 0.3;
    if (contains(val, "active")) return 0.6;

    // Compliance
    if (contains(val, "partial")) return 0.5;
    if (contains(val, "compliant")) return 1.0;

    // Emergency treatment
    if (contains(val, "inpatient")) return 1.0;
    if (contains(val, "outpatient")) return 0.6;
    if (contains(val, "treated & released")) return 0.4;

    // Laterality / location
    if (contains(val, "bilateral")) return 1.0;
    if (contains(val, "unilateral")) return 0.6;
    if (contains(val, "multiple")) return 0.9;
    if (contains(val, "single")) return 0.5;

    // Timing
    if (contains(val, "immediate") || contains(val, "first 48")) return 1.0;
    if (contains(val, "more than 7")) return 0.3;

    // Mechanism
    if (contains(val, "consistent")) return 1.0;

    double parsed = 0.0;
    if (tryParseNumber(FeatureValue(val), parsed)) {
        return clamp(parsed, 0.0, 1.0);
    }
    return 0.0;
}

} // namespace WeightCalibration
