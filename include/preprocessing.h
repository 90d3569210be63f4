#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils.h"

namespace loanprep::preprocessing {

// ------------------------------------------------------------
// Core data containers (tabular CSV-first)
// ------------------------------------------------------------
struct TabularData {
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows; // raw string cells, row-major
};

// ------------------------------------------------------------
// CSV loading
// ------------------------------------------------------------
struct CsvLoadOptions {
    char delimiter = ',';
    bool trim_fields = false;   // header names are always trimmed
    bool skip_empty_lines = true;
};

/// Load tabular CSV data into a raw string table.
/// Short rows are padded with empty cells to the header width.
/// Throws DatasetNotFound if the path is not an existing file, std::runtime_error on
/// malformed CSV (including a row with more fields than the header) or I/O failure.
TabularData load_csv_data(std::string_view csv_path, const CsvLoadOptions& options = {});

// ------------------------------------------------------------
// Column access
// ------------------------------------------------------------
std::optional<std::size_t> find_column(const TabularData& table, std::string_view name);

/// Throws MissingColumn when absent.
std::size_t column_index(const TabularData& table, std::string_view name);

/// Parse every cell of a column as a finite double.
/// Throws MissingColumn or NumericConversionFailure (names column and 1-based data row).
std::vector<double> numeric_column(const TabularData& table, std::string_view name);

/// True iff the table has rows and every cell of column `column` parses as a finite number.
bool is_numeric_column(const TabularData& table, std::size_t column);

/// Replace column `name` if present, append it otherwise. `cells` must have one entry per row.
void set_column(TabularData& table, const std::string& name, const std::vector<std::string>& cells);

// ------------------------------------------------------------
// Normalization
// ------------------------------------------------------------
struct MinMaxResult {
    utils::Matrix scaled;            // same shape as input, values in [0, 1]
    utils::ColumnStats bounds;       // per-column {min, max} fitted on the full input
};

/// Fit per-column bounds over all rows and map every value to the unit interval.
/// A constant column (max == min) maps to 0.
MinMaxResult normalize_min_max(const utils::Matrix& features);

// ------------------------------------------------------------
// Train / test splitting
// ------------------------------------------------------------
struct TrainTestSplitOptions {
    double test_ratio = 0.3;                    // (0,1)
    bool shuffle = true;
    std::uint32_t random_seed = 42;
};

struct TrainTestSplit {
    utils::Matrix train_features;
    std::vector<int> train_labels;
    utils::Matrix test_features;
    std::vector<int> test_labels;
    std::vector<std::size_t> train_indices;     // original row indices
    std::vector<std::size_t> test_indices;
};

/// Split rows into train/test partitions; test size is ceil(n * test_ratio).
/// Throws std::invalid_argument on size mismatch or invalid ratio and
/// EvaluationFailure if either partition would be empty.
TrainTestSplit split_train_test(
    const utils::Matrix& features,
    const std::vector<int>& labels,
    const TrainTestSplitOptions& options = {}
);

} // namespace loanprep::preprocessing
