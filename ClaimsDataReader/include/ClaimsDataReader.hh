/**
 * @file ClaimsDataReader.hh
 * @brief Reader for claim snapshots and weight tables exported as CSV
 *
 * This module loads the two inputs of a calibration run:
 * - the weight table (factor_name, base_weight, min_weight, max_weight,
 *   category, description)
 * - the claim export, one claim per row, with the actual settlement,
 *   the recorded variance % and every factor as its own column
 *
 * Values are kept as text; the engine coerces them on access.
 */

#ifndef CLAIMS_DATA_READER_HH
#define CLAIMS_DATA_READER_HH

#include "DataTypes.hh"
#include <string>
#include <vector>
#include <map>

namespace ClaimsData {

/**
 * @struct ColumnLayout
 * @brief Column indices resolved from a claims CSV header
 */
struct ColumnLayout {
    int claimID = -1;
    int version = -1;
    int actual = -1;           ///< First settlement column found, by priority
    int variancePct = -1;
    std::string actualName;    ///< Header name of the settlement column
    std::vector<int> settlementColumns;  ///< Every settlement candidate present

    bool isKnown(int index) const;
};

/**
 * @class ClaimsDataReader
 * @brief Loads weight tables and claim sets for the calibration engine
 */
class ClaimsDataReader {
public:
    ClaimsDataReader();
    ~ClaimsDataReader() = default;

    /**
     * @brief Load a weight table CSV
     * @param csvFile Path with a header naming factor_name, base_weight,
     *        min_weight and max_weight (category, description optional)
     * @return true if at least one valid row was read
     */
    bool loadWeightTable(const std::string& csvFile);

    /**
     * @brief Load a claims CSV
     *
     * The settlement column is the first present of ConsensusValue,
     * SettlementAmount, DOLLARAMOUNTHIGH and actual_settlement. Rows
     * without a numeric settlement are skipped.
     *
     * @param csvFile Path to the claim export
     * @return true if at least one claim was read
     */
    bool loadClaims(const std::string& csvFile);

    /**
     * @brief Resolve the known columns of a claims header
     */
    static ColumnLayout resolveColumns(const std::vector<std::string>& header);

    const WeightCalibration::WeightTable& getWeightTable() const { return weightTable_; }
    const std::vector<WeightCalibration::ClaimRecord>& getClaims() const { return claims_; }

    size_t getNumClaims() const { return claims_.size(); }
    size_t getNumFactors() const { return weightTable_.size(); }
    int getSkippedRows() const { return skippedRows_; }

    /**
     * @brief Claims whose recorded |variance_pct| is above a threshold
     */
    std::vector<WeightCalibration::ClaimRecord> getHighVarianceClaims(double minAbsVariancePct) const;

    /**
     * @brief Names of all feature columns seen in the claims file
     */
    std::vector<std::string> getFeatureColumns() const { return featureColumns_; }

    /**
     * @brief Print summary of loaded data
     */
    void printSummary() const;

private:
    WeightCalibration::WeightTable weightTable_;
    std::vector<WeightCalibration::ClaimRecord> claims_;
    std::vector<std::string> featureColumns_;
    int skippedRows_ = 0;

    // Helper methods
    static std::vector<std::string> splitLine(const std::string& line, char delimiter);
    static double parseDouble(const std::string& str);
    static int parseInt(const std::string& str, int fallback);
};

} // namespace ClaimsData

#endif // CLAIMS_DATA_READER_HH
