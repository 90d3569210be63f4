#include "preprocessing.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

#include "errors.h"

namespace loanprep::preprocessing {
namespace {

// ------------------------------------------------------------
// Internal helpers
// ------------------------------------------------------------
// Short rows are padded with empty cells; extra cells are a malformed record.
void fit_row_width(std::vector<std::string>& row, std::size_t width, std::size_t line_no) {
    if (row.size() > width) {
        throw std::runtime_error(
            "load_csv_data: line " + std::to_string(line_no) + " has " + std::to_string(row.size()) +
            " fields, header has " + std::to_string(width)
        );
    }
    row.resize(width);
}

std::vector<std::string> trimmed_header(std::vector<std::string> names) {
    for (auto& name : names) {
        name = utils::trim(name);
    }
    return names;
}

void validate_split_inputs(
    const utils::Matrix& features,
    const std::vector<int>& labels,
    const TrainTestSplitOptions& options
) {
    if (features.size() != labels.size()) {
        throw std::invalid_argument(
            "split_train_test: size mismatch (features=" + std::to_string(features.size()) +
            ", labels=" + std::to_string(labels.size()) + ")"
        );
    }
    if (!(options.test_ratio > 0.0 && options.test_ratio < 1.0)) {
        throw std::invalid_argument("split_train_test: test_ratio must be in (0, 1)");
    }
}

} // namespace

// ------------------------------------------------------------
// CSV loading
// ------------------------------------------------------------
TabularData load_csv_data(std::string_view csv_path, const CsvLoadOptions& options) {
    if (csv_path.empty()) {
        throw std::invalid_argument("load_csv_data: csv_path is empty");
    }

    if (!utils::file_exists(csv_path)) {
        throw DatasetNotFound(std::string(csv_path));
    }

    std::ifstream ifs{std::string(csv_path)};
    if (!ifs) {
        throw std::runtime_error("load_csv_data: failed to open file: " + std::string(csv_path));
    }

    TabularData table;
    std::string line;
    bool header_consumed = false;

    std::size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back(); // handle CRLF
        }

        if (options.skip_empty_lines && utils::trim(line).empty()) {
            continue;
        }

        std::vector<std::string> row;
        try {
            row = utils::parse_csv_row(line, options.delimiter, options.trim_fields);
        } catch (const std::exception& e) {
            throw std::runtime_error(
                "load_csv_data: CSV parse error at line " + std::to_string(line_no) + ": " + e.what()
            );
        }

        if (!header_consumed) {
            table.column_names = trimmed_header(std::move(row));
            header_consumed = true;
            continue;
        }

        fit_row_width(row, table.column_names.size(), line_no);
        table.rows.emplace_back(std::move(row));
    }

    if (ifs.bad()) {
        throw std::runtime_error("load_csv_data: read failure: " + std::string(csv_path));
    }

    return table;
}

// ------------------------------------------------------------
// Column access
// ------------------------------------------------------------
std::optional<std::size_t> find_column(const TabularData& table, std::string_view name) {
    for (std::size_t c = 0; c < table.column_names.size(); ++c) {
        if (table.column_names[c] == name) {
            return c;
        }
    }
    return std::nullopt;
}

std::size_t column_index(const TabularData& table, std::string_view name) {
    const auto idx = find_column(table, name);
    if (!idx.has_value()) {
        throw MissingColumn(std::string(name));
    }
    return *idx;
}

std::vector<double> numeric_column(const TabularData& table, std::string_view name) {
    const std::size_t c = column_index(table, name);

    std::vector<double> values;
    values.reserve(table.rows.size());

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const std::string cell = (c < row.size()) ? row[c] : std::string();

        const auto v = utils::parse_number(cell);
        if (!v.has_value()) {
            throw NumericConversionFailure(
                "column '" + std::string(name) + "', row " + std::to_string(r + 1) +
                ": '" + cell + "'"
            );
        }
        values.push_back(*v);
    }

    return values;
}

bool is_numeric_column(const TabularData& table, std::size_t column) {
    if (table.rows.empty() || column >= table.column_names.size()) {
        return false;
    }

    return std::all_of(table.rows.begin(), table.rows.end(), [column](const std::vector<std::string>& row) {
        return column < row.size() && utils::parse_number(row[column]).has_value();
    });
}

void set_column(TabularData& table, const std::string& name, const std::vector<std::string>& cells) {
    if (cells.size() != table.rows.size()) {
        throw std::invalid_argument(
            "set_column: cell count mismatch for '" + name + "' (expected " +
            std::to_string(table.rows.size()) + ", got " + std::to_string(cells.size()) + ")"
        );
    }

    const auto existing = find_column(table, name);
    if (existing.has_value()) {
        for (std::size_t r = 0; r < table.rows.size(); ++r) {
            table.rows[r][*existing] = cells[r];
        }
        return;
    }

    table.column_names.push_back(name);
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        table.rows[r].push_back(cells[r]);
    }
}

// ------------------------------------------------------------
// Normalization
// ------------------------------------------------------------
MinMaxResult normalize_min_max(const utils::Matrix& features) {
    if (features.empty()) {
        throw std::invalid_argument("normalize_min_max: feature matrix is empty");
    }

    MinMaxResult result;
    result.bounds = utils::fit_column_stats(features);
    result.scaled = utils::normalize_columns_min_max(features, result.bounds, 0.0, 1.0);
    return result;
}

// ------------------------------------------------------------
// Train / test split
// ------------------------------------------------------------
TrainTestSplit split_train_test(
    const utils::Matrix& features,
    const std::vector<int>& labels,
    const TrainTestSplitOptions& options
) {
    validate_split_inputs(features, labels, options);

    const std::size_t n = features.size();
    std::vector<std::size_t> indices(n);
    std::iota(indices.begin(), indices.end(), 0);

    if (options.shuffle) {
        auto rng = utils::make_rng(options.random_seed);
        std::shuffle(indices.begin(), indices.end(), rng);
    }

    const auto test_count = static_cast<std::size_t>(
        std::ceil(options.test_ratio * static_cast<double>(n))
    );
    const std::size_t train_count = (test_count < n) ? n - test_count : 0;

    if (test_count == 0 || train_count == 0) {
        throw EvaluationFailure(
            "cannot split " + std::to_string(n) + " rows into non-empty train/test partitions"
        );
    }

    TrainTestSplit split{};
    split.test_indices.assign(indices.begin(), indices.begin() + static_cast<std::ptrdiff_t>(test_count));
    split.train_indices.assign(indices.begin() + static_cast<std::ptrdiff_t>(test_count), indices.end());

    split.train_features.reserve(train_count);
    split.train_labels.reserve(train_count);
    for (std::size_t idx : split.train_indices) {
        split.train_features.push_back(features[idx]);
        split.train_labels.push_back(labels[idx]);
    }

    split.test_features.reserve(test_count);
    split.test_labels.reserve(test_count);
    for (std::size_t idx : split.test_indices) {
        split.test_features.push_back(features[idx]);
        split.test_labels.push_back(labels[idx]);
    }

    return split;
}

} // namespace loanprep::preprocessing
