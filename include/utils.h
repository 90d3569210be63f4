#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace loanprep::utils {

// -----------------------------
// Files and text
// -----------------------------

// True only for an existing regular file.
bool file_exists(std::string_view path);

std::string trim(std::string_view input);
std::string to_lower(std::string_view input);

// Trim, then lower-case. Categorical cells are compared in this form.
std::string normalize_token(std::string_view input);

// One CSV record. Quoted fields may contain the delimiter; "" inside quotes is a literal quote.
//   a,"b,c","x""y"  -> ["a", "b,c", "x\"y"]
// Throws std::runtime_error on an unterminated quote.
std::vector<std::string> parse_csv_row(
    std::string_view line,
    char delimiter = ',',
    bool trim_fields = false
);

// Whole-cell numeric parse after trimming. nullopt for empty text, trailing
// characters, overflow, NaN or infinity.
std::optional<double> parse_number(std::string_view input);

// Round-trippable text form (17 significant digits).
std::string double_to_string(double value);

// -----------------------------
// Column bounds and unit scaling
// -----------------------------
struct NormalizationStats {
    double min = 0.0;
    double max = 0.0;
};

using Matrix = std::vector<std::vector<double>>;
using ColumnStats = std::vector<NormalizationStats>;

// Per-column min/max of a non-empty rectangular matrix.
ColumnStats fit_column_stats(const Matrix& data);

// (v - min) / (max - min) mapped onto [out_min, out_max].
// A column whose range is within kConstantRangeEps maps to out_min in every row.
inline constexpr double kConstantRangeEps = 1e-12;

Matrix normalize_columns_min_max(
    const Matrix& data,
    const ColumnStats& stats,
    double out_min = 0.0,
    double out_max = 1.0
);

// Deterministic generator for shuffles.
std::mt19937 make_rng(std::uint32_t seed);

// -----------------------------
// Logging
// -----------------------------
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Messages below the threshold are dropped. Info outside any ScopedLogThreshold.
LogLevel log_threshold();

// Sets the threshold for its lifetime and restores the previous one on exit,
// so a run's verbosity never leaks into the next run.
class ScopedLogThreshold {
public:
    explicit ScopedLogThreshold(LogLevel level);
    ~ScopedLogThreshold();

    ScopedLogThreshold(const ScopedLogThreshold&) = delete;
    ScopedLogThreshold& operator=(const ScopedLogThreshold&) = delete;

private:
    LogLevel previous_;
};

void log(LogLevel level, std::string_view message);
void log_debug(std::string_view message);
void log_info(std::string_view message);
void log_warning(std::string_view message);
void log_error(std::string_view message);

// "[a, b, c, ... (n total)]" with fixed precision.
std::string format_vector_preview(
    const std::vector<double>& values,
    std::size_t max_items = 8,
    int precision = 4
);

// -----------------------------
// Timing
// -----------------------------
class Timer {
public:
    Timer();

    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] long long elapsed_milliseconds() const;

private:
    using Clock = std::chrono::steady_clock;
    Clock::time_point start_;
};

// Logs "<stage> took N ms" when the scope ends.
class ScopedTimer {
public:
    explicit ScopedTimer(std::string stage, LogLevel level = LogLevel::Debug);
    ~ScopedTimer() noexcept;

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string stage_;
    LogLevel level_;
    Timer timer_;
};

} // namespace loanprep::utils
