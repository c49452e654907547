/**
 * @file ClaimsDataReader.cc
 * @brief Implementation of the claims / weight table reader
 */

#include "ClaimsDataReader.hh"
#include "FeatureCoercion.hh"
#include <iostream>
#include <fstream>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <stdexcept>

using WeightCalibration::ClaimRecord;
using WeightCalibration::FeatureValue;
using WeightCalibration::WeightEntry;
using WeightCalibration::trimWhitespace;

namespace ClaimsData {

namespace {

int findColumn(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

std::string field(const std::vector<std::string>& fields, int index) {
    if (index < 0 || index >= static_cast<int>(fields.size())) return "";
    return fields[index];
}

} // namespace

bool ColumnLayout::isKnown(int index) const {
    if (index == claimID || index == version || index == actual || index == variancePct) return true;
    return std::find(settlementColumns.begin(), settlementColumns.end(), index) != settlementColumns.end();
}

ClaimsDataReader::ClaimsDataReader() {}

ColumnLayout ClaimsDataReader::resolveColumns(const std::vector<std::string>& header) {
    ColumnLayout layout;

    layout.claimID = findColumn(header, "claim_id");
    if (layout.claimID < 0) layout.claimID = findColumn(header, "CLAIMID");

    layout.version = findColumn(header, "version");
    if (layout.version < 0) layout.version = findColumn(header, "VersionID");

    // Settlement column, by priority
    const char* actualColumns[] = { "ConsensusValue", "SettlementAmount", "DOLLARAMOUNTHIGH", "actual_settlement" };
    for (const char* name : actualColumns) {
        int idx = findColumn(header, name);
        if (idx < 0) continue;
        layout.settlementColumns.push_back(idx);
        if (layout.actual < 0) {
            layout.actual = idx;
            layout.actualName = name;
        }
    }

    layout.variancePct = findColumn(header, "variance_pct");
    return layout;
}

bool ClaimsDataReader::loadWeightTable(const std::string& csvFile) {
    std::ifstream file(csvFile);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not open weight table " << csvFile << std::endl;
        return false;
    }

    std::string line;
    if (!std::getline(file, line)) {
        std::cerr << "Warning: Weight table " << csvFile << " is empty" << std::endl;
        return false;
    }

    std::vector<std::string> header = splitLine(line, ',');
    for (auto& h : header) h = trimWhitespace(h);

    const int nameCol = findColumn(header, "factor_name");
    const int baseCol = findColumn(header, "base_weight");
    const int minCol = findColumn(header, "min_weight");
    const int maxCol = findColumn(header, "max_weight");
    const int categoryCol = findColumn(header, "category");
    const int descriptionCol = findColumn(header, "description");

    if (nameCol < 0 || baseCol < 0 || minCol < 0 || maxCol < 0) {
        std::cerr << "Warning: Weight table " << csvFile
                  << " needs factor_name, base_weight, min_weight and max_weight columns" << std::endl;
        return false;
    }

    weightTable_.clear();
    int lineNo = 1;

    while (std::getline(file, line)) {
        ++lineNo;
        if (trimWhitespace(line).empty()) continue;

        std::vector<std::string> fields = splitLine(line, ',');

        WeightEntry entry;
        entry.factor_name = trimWhitespace(field(fields, nameCol));
        entry.base_weight = parseDouble(field(fields, baseCol));
        entry.min_weight = parseDouble(field(fields, minCol));
        entry.max_weight = parseDouble(field(fields, maxCol));
        entry.category = trimWhitespace(field(fields, categoryCol));
        entry.description = trimWhitespace(field(fields, descriptionCol));

        if (entry.factor_name.empty() || std::isnan(entry.base_weight) ||
            std::isnan(entry.min_weight) || std::isnan(entry.max_weight)) {
            std::cerr << "Warning: Skipping malformed weight row " << lineNo << std::endl;
            continue;
        }

        weightTable_.push_back(entry);
    }

    return !weightTable_.empty();
}

bool ClaimsDataReader::loadClaims(const std::string& csvFile) {
    std::ifstream file(csvFile);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not open claims file " << csvFile << std::endl;
        return false;
    }

    std::string line;
    if (!std::getline(file, line)) {
        std::cerr << "Warning: Claims file " << csvFile << " is empty" << std::endl;
        return false;
    }

    std::vector<std::string> header = splitLine(line, ',');
    for (auto& h : header) h = trimWhitespace(h);

    ColumnLayout layout = resolveColumns(header);
    if (layout.actual < 0) {
        std::cerr << "Warning: Claims file " << csvFile << " has no settlement column" << std::endl;
        return false;
    }

    // Everything that is not a known column is a feature
    featureColumns_.clear();
    std::vector<int> featureIdx;
    for (size_t i = 0; i < header.size(); ++i) {
        int idx = static_cast<int>(i);
        if (layout.isKnown(idx) || header[i].empty()) continue;
        featureColumns_.push_back(header[i]);
        featureIdx.push_back(idx);
    }

    claims_.clear();
    skippedRows_ = 0;
    int row = 0;

    while (std::getline(file, line)) {
        if (trimWhitespace(line).empty()) continue;
        ++row;

        std::vector<std::string> fields = splitLine(line, ',');

        double actual = parseDouble(field(fields, layout.actual));
        if (std::isnan(actual) || std::isinf(actual)) {
            ++skippedRows_;
            continue;
        }

        std::string id = trimWhitespace(field(fields, layout.claimID));
        if (id.empty()) id = "row-" + std::to_string(row);

        ClaimRecord claim(id, actual, parseInt(field(fields, layout.version), 1));

        double variance = parseDouble(field(fields, layout.variancePct));
        if (!std::isnan(variance) && !std::isinf(variance)) {
            claim.setVariancePct(variance);
        }

        for (size_t k = 0; k < featureIdx.size(); ++k) {
            std::string value = trimWhitespace(field(fields, featureIdx[k]));
            if (value.empty()) continue;
            claim.set(featureColumns_[k], FeatureValue(value));
        }

        claims_.push_back(claim);
    }

    if (skippedRows_ > 0) {
        std::cerr << "Warning: Skipped " << skippedRows_ << " claim row(s) without a numeric "
                  << layout.actualName << std::endl;
    }

    return !claims_.empty();
}

std::vector<ClaimRecord> ClaimsDataReader::getHighVarianceClaims(double minAbsVariancePct) const {
    std::vector<ClaimRecord> result;
    for (const auto& claim : claims_) {
        if (claim.has_variance && std::abs(claim.variance_pct) > minAbsVariancePct) {
            result.push_back(claim);
        }
    }
    return result;
}

void ClaimsDataReader::printSummary() const {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Claims Data Summary" << std::endl;
    std::cout << "========================================" << std::endl;

    std::cout << "Weight factors: " << weightTable_.size() << std::endl;
    std::cout << "Claims: " << claims_.size() << std::endl;
    std::cout << "Skipped rows: " << skippedRows_ << std::endl;
    std::cout << "Feature columns: " << featureColumns_.size() << std::endl;

    int withVariance = 0;
    double minActual = 0.0, maxActual = 0.0;
    for (size_t i = 0; i < claims_.size(); ++i) {
        if (claims_[i].has_variance) withVariance++;
        double a = claims_[i].actual_settlement;
        if (i == 0 || a < minActual) minActual = a;
        if (i == 0 || a > maxActual) maxActual = a;
    }
    std::cout << "Claims with recorded variance: " << withVariance << std::endl;
    if (!claims_.empty()) {
        std::cout << "Settlement range: " << std::fixed << std::setprecision(2)
                  << minActual << " - " << maxActual << std::endl;
    }

    std::cout << "========================================\n" << std::endl;
}

std::vector<std::string> ClaimsDataReader::splitLine(const std::string& line, char delimiter) {
    std::vector<std::string> result;
    bool inQuotes = false;
    std::string currentField;

    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == delimiter && !inQuotes) {
            result.push_back(currentField);
            currentField.clear();
        } else {
            currentField += c;
        }
    }
    result.push_back(currentField);

    return result;
}

double ClaimsDataReader::parseDouble(const std::string& str) {
    std::string trimmed = trimWhitespace(str);
    if (trimmed.empty() || trimmed == "N/A" || trimmed == "NA" || trimmed == "nan") {
        return std::nan("");
    }
    try {
        size_t pos = 0;
        double value = std::stod(trimmed, &pos);
        return (pos == trimmed.size()) ? value : std::nan("");
    } catch (const std::invalid_argument&) {
        return std::nan("");
    } catch (const std::out_of_range&) {
        return std::nan("");
    }
}

int ClaimsDataReader::parseInt(const std::string& str, int fallback) {
    std::string trimmed = trimWhitespace(str);
    if (trimmed.empty() || trimmed == "N/A" || trimmed == "NA") {
        return fallback;
    }
    try {
        size_t pos = 0;
        int value = std::stoi(trimmed, &pos);
        return (pos == trimmed.size()) ? value : fallback;
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

} // namespace ClaimsData
