#include "feature_engineering.h"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace loanprep::feature_engineering {
namespace {

template <std::size_t N>
bool contains_token(const std::array<std::string_view, N>& set, std::string_view raw) {
    const std::string token = utils::normalize_token(raw);
    return std::find(set.begin(), set.end(), token) != set.end();
}

std::vector<std::string> to_cells(const std::vector<int>& values) {
    std::vector<std::string> cells;
    cells.reserve(values.size());
    for (int v : values) {
        cells.push_back(std::to_string(v));
    }
    return cells;
}

std::vector<std::string> to_cells(const std::vector<double>& values) {
    std::vector<std::string> cells;
    cells.reserve(values.size());
    for (double v : values) {
        cells.push_back(utils::double_to_string(v));
    }
    return cells;
}

// Lower-cases and trims a text column in place, returning the normalised values.
std::vector<std::string> normalize_text_column(
    preprocessing::TabularData& table,
    std::string_view name
) {
    const std::size_t c = preprocessing::column_index(table, name);

    std::vector<std::string> values;
    values.reserve(table.rows.size());
    for (auto& row : table.rows) {
        row[c] = utils::normalize_token(row[c]);
        values.push_back(row[c]);
    }
    return values;
}

// Identifier, label and the two categorical text columns. The text columns stay
// excluded even when every cell happens to parse as a number (e.g. status "1"/"0").
bool is_excluded_from_input_ranges(std::string_view column) {
    return column == columns::kLoanId || column == columns::kLabel ||
           column == columns::kEducation || column == columns::kLoanStatus;
}

} // namespace

// ============================================================
// Categorical synonym sets
// ============================================================
bool is_graduate(std::string_view education) {
    return contains_token(kGraduateSynonyms, education);
}

bool is_approved(std::string_view loan_status) {
    return contains_token(kApprovalSynonyms, loan_status);
}

// ============================================================
// Derived feature creation
// ============================================================
DerivationSummary derive_features(preprocessing::TabularData& table) {
    const std::size_t rows = table.rows.size();

    const auto education = normalize_text_column(table, columns::kEducation);
    const auto status = normalize_text_column(table, columns::kLoanStatus);

    DerivationSummary summary;
    summary.education_indicator.reserve(rows);
    summary.labels.reserve(rows);
    summary.assets_total.assign(rows, 0.0);

    for (const auto& value : education) {
        summary.education_indicator.push_back(is_graduate(value) ? 1 : 0);
    }

    for (const auto asset_column : kAssetColumns) {
        const auto values = preprocessing::numeric_column(table, asset_column);
        for (std::size_t r = 0; r < rows; ++r) {
            summary.assets_total[r] += values[r];
        }
    }

    for (const auto& value : status) {
        const int label = is_approved(value) ? 1 : 0;
        summary.labels.push_back(label);
        if (label == 1) {
            ++summary.distribution.approved;
        } else {
            ++summary.distribution.rejected;
        }
    }

    preprocessing::set_column(
        table, std::string(columns::kEducationIndicator), to_cells(summary.education_indicator));
    preprocessing::set_column(
        table, std::string(columns::kAssetsTotal), to_cells(summary.assets_total));
    preprocessing::set_column(
        table, std::string(columns::kLabel), to_cells(summary.labels));

    utils::log_info("Loan status distribution: " + format_label_distribution(summary.distribution));
    if (summary.distribution.is_degenerate()) {
        utils::log_warning(
            "Only one class present in " + std::string(columns::kLabel) +
            "; check loan_status values (expected 'Approved'/'Rejected')."
        );
    }

    return summary;
}

std::string format_label_distribution(const LabelDistribution& distribution) {
    std::ostringstream oss;
    oss << "{0: " << distribution.rejected << ", 1: " << distribution.approved << "}";
    return oss.str();
}

// ============================================================
// Input range metadata
// ============================================================
long long input_step_for(std::string_view column) {
    if (column == columns::kDependents || column == columns::kLoanTerm || column == columns::kCibilScore) {
        return 1;
    }
    return kCurrencyStep;
}

std::vector<InputRange> extract_input_ranges(const preprocessing::TabularData& table) {
    std::vector<InputRange> ranges;

    for (std::size_t c = 0; c < table.column_names.size(); ++c) {
        const std::string& name = table.column_names[c];
        if (is_excluded_from_input_ranges(name) || !preprocessing::is_numeric_column(table, c)) {
            continue;
        }

        const auto values = preprocessing::numeric_column(table, name);
        const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());

        InputRange range;
        range.column = name;
        range.min = static_cast<long long>(*min_it);
        range.max = static_cast<long long>(*max_it);
        range.step = input_step_for(name);
        ranges.push_back(std::move(range));
    }

    return ranges;
}

// ============================================================
// Classifier feature projection
// ============================================================
utils::Matrix build_feature_matrix(const preprocessing::TabularData& table) {
    const std::size_t rows = table.rows.size();
    utils::Matrix X(rows, std::vector<double>(kFeatureCount, 0.0));

    for (std::size_t j = 0; j < kFeatureCount; ++j) {
        const auto& feature = kFeatureColumns[j];
        const auto values = preprocessing::numeric_column(table, feature.column);
        for (std::size_t r = 0; r < rows; ++r) {
            X[r][j] = feature.currency ? values[r] / kCurrencyScale : values[r];
        }
    }

    return X;
}

std::vector<NormalizationRange> make_normalization_ranges(const utils::ColumnStats& bounds) {
    if (bounds.size() != kFeatureCount) {
        throw std::invalid_argument(
            "make_normalization_ranges: expected " + std::to_string(kFeatureCount) +
            " bounds, got " + std::to_string(bounds.size())
        );
    }

    std::vector<NormalizationRange> out;
    out.reserve(kFeatureCount);
    for (std::size_t j = 0; j < kFeatureCount; ++j) {
        out.push_back(NormalizationRange{std::string(kFeatureColumns[j].key), bounds[j].min, bounds[j].max});
    }
    return out;
}

} // namespace loanprep::feature_engineering
