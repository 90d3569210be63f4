#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "preprocessing.h"
#include "utils.h"

namespace loanprep::feature_engineering {

// ============================================================
// Source and derived column names
// ============================================================

namespace columns {
inline constexpr std::string_view kLoanId = "loan_id";
inline constexpr std::string_view kDependents = "no_of_dependents";
inline constexpr std::string_view kEducation = "education";
inline constexpr std::string_view kIncome = "income_annum";
inline constexpr std::string_view kLoanAmount = "loan_amount";
inline constexpr std::string_view kLoanTerm = "loan_term";
inline constexpr std::string_view kCibilScore = "cibil_score";
inline constexpr std::string_view kResidentialAssets = "residential_assets_value";
inline constexpr std::string_view kCommercialAssets = "commercial_assets_value";
inline constexpr std::string_view kLuxuryAssets = "luxury_assets_value";
inline constexpr std::string_view kBankAssets = "bank_asset_value";
inline constexpr std::string_view kLoanStatus = "loan_status";

// Derived
inline constexpr std::string_view kEducationIndicator = "education_num";
inline constexpr std::string_view kAssetsTotal = "assets_total";
inline constexpr std::string_view kLabel = "loan_status_num";
} // namespace columns

inline constexpr std::array<std::string_view, 4> kAssetColumns{
    columns::kResidentialAssets,
    columns::kCommercialAssets,
    columns::kLuxuryAssets,
    columns::kBankAssets
};

// ============================================================
// Categorical synonym sets
// ============================================================

// Values are already trimmed and lower-case.
inline constexpr std::array<std::string_view, 3> kGraduateSynonyms{"graduate", "grad", "g"};
inline constexpr std::array<std::string_view, 5> kApprovalSynonyms{"approved", "yes", "y", "1", "true"};

/// Case-insensitive, whitespace-trimmed membership in kGraduateSynonyms.
bool is_graduate(std::string_view education);

/// Case-insensitive, whitespace-trimmed membership in kApprovalSynonyms.
bool is_approved(std::string_view loan_status);

// ============================================================
// Derived feature creation
// ============================================================

struct LabelDistribution {
    std::size_t rejected = 0;   // label 0
    std::size_t approved = 0;   // label 1

    [[nodiscard]] std::size_t total() const noexcept { return rejected + approved; }

    // Fewer than two distinct label values across the dataset.
    [[nodiscard]] bool is_degenerate() const noexcept { return rejected == 0 || approved == 0; }
};

struct DerivationSummary {
    std::vector<int> education_indicator;
    std::vector<double> assets_total;
    std::vector<int> labels;
    LabelDistribution distribution{};
};

/// Normalise the education and loan_status cells (trim + lower-case) and append
/// education_num, assets_total and loan_status_num to the table, preserving row order.
/// Throws MissingColumn / NumericConversionFailure on absent or non-numeric asset data.
DerivationSummary derive_features(preprocessing::TabularData& table);

std::string format_label_distribution(const LabelDistribution& distribution);

// ============================================================
// Input range metadata (UI validation)
// ============================================================

inline constexpr long long kCurrencyStep = 100000;

struct InputRange {
    std::string column;
    long long min = 0;   // truncated toward zero
    long long max = 0;
    long long step = kCurrencyStep;
};

/// Step is 1 for dependents, loan term and CIBIL score, kCurrencyStep otherwise.
long long input_step_for(std::string_view column);

/// One entry per numeric column in table order, excluding loan_id, loan_status_num and the
/// education / loan_status text columns.
std::vector<InputRange> extract_input_ranges(const preprocessing::TabularData& table);

// ============================================================
// Classifier feature projection
// ============================================================

inline constexpr double kCurrencyScale = 100000.0;

struct FeatureColumn {
    std::string_view column;   // internal table column
    std::string_view key;      // consumer-facing normalization_ranges key
    bool currency;             // divided by kCurrencyScale before normalization
};

// Order is shared with the consumer application and must not change on one side only.
inline constexpr std::array<FeatureColumn, 6> kFeatureColumns{{
    {columns::kDependents,          "dependents",   false},
    {columns::kEducationIndicator,  "education",    false},
    {columns::kIncome,              "income",       true},
    {columns::kLoanAmount,          "loan_amount",  true},
    {columns::kCibilScore,          "cibil",        false},
    {columns::kAssetsTotal,         "assets_total", true}
}};

inline constexpr std::size_t kFeatureCount = kFeatureColumns.size();

/// Project the derived table onto kFeatureColumns (rows x 6), currency columns rescaled.
utils::Matrix build_feature_matrix(const preprocessing::TabularData& table);

struct NormalizationRange {
    std::string key;
    double min = 0.0;
    double max = 0.0;
};

/// Pair fitted bounds (one per kFeatureColumns entry) with their consumer keys.
std::vector<NormalizationRange> make_normalization_ranges(const utils::ColumnStats& bounds);

} // namespace loanprep::feature_engineering
