#include "utils.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace loanprep::utils {
namespace {

std::atomic<LogLevel> g_log_threshold{LogLevel::Info};

bool is_blank(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

std::string local_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm parts{};
#if defined(_WIN32)
    localtime_s(&parts, &now);
#else
    localtime_r(&now, &parts);
#endif

    std::ostringstream oss;
    oss << std::put_time(&parts, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::size_t checked_column_count(const Matrix& data, std::string_view caller) {
    if (data.empty() || data.front().empty()) {
        throw std::invalid_argument(std::string(caller) + ": matrix has no cells");
    }
    const std::size_t cols = data.front().size();
    const auto ragged = std::find_if(data.begin(), data.end(), [cols](const std::vector<double>& row) {
        return row.size() != cols;
    });
    if (ragged != data.end()) {
        throw std::invalid_argument(
            std::string(caller) + ": row " + std::to_string(ragged - data.begin()) +
            " has " + std::to_string(ragged->size()) + " cells, expected " + std::to_string(cols)
        );
    }
    return cols;
}

} // namespace

// -----------------------------
// Files and text
// -----------------------------
bool file_exists(std::string_view path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path{std::string(path)}, ec) && !ec;
}

std::string trim(std::string_view input) {
    const auto first = std::find_if_not(input.begin(), input.end(), is_blank);
    const auto last = std::find_if_not(input.rbegin(), input.rend(), is_blank).base();
    return (first < last) ? std::string(first, last) : std::string();
}

std::string to_lower(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(), [](char ch) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    });
    return out;
}

std::string normalize_token(std::string_view input) {
    return to_lower(trim(input));
}

std::vector<std::string> parse_csv_row(std::string_view line, char delimiter, bool trim_fields) {
    std::vector<std::string> fields;
    if (line.empty()) {
        return fields;
    }

    std::string field;
    bool quoted = false;

    auto finish_field = [&]() {
        fields.push_back(trim_fields ? trim(field) : field);
        field.clear();
    };

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];

        if (ch == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (ch == delimiter && !quoted) {
            finish_field();
        } else {
            field.push_back(ch);
        }
    }

    if (quoted) {
        throw std::runtime_error("parse_csv_row: unterminated quoted field");
    }

    finish_field();
    return fields;
}

std::optional<double> parse_number(std::string_view input) {
    const std::string text = trim(input);
    if (text.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);

    const bool consumed_all = (end == text.c_str() + text.size());
    if (!consumed_all || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string double_to_string(double value) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

// -----------------------------
// Column bounds and unit scaling
// -----------------------------
ColumnStats fit_column_stats(const Matrix& data) {
    const std::size_t cols = checked_column_count(data, "fit_column_stats");

    ColumnStats stats;
    stats.reserve(cols);
    for (std::size_t c = 0; c < cols; ++c) {
        NormalizationStats s{data.front()[c], data.front()[c]};
        for (const auto& row : data) {
            s.min = std::min(s.min, row[c]);
            s.max = std::max(s.max, row[c]);
        }
        stats.push_back(s);
    }
    return stats;
}

Matrix normalize_columns_min_max(
    const Matrix& data,
    const ColumnStats& stats,
    double out_min,
    double out_max
) {
    const std::size_t cols = checked_column_count(data, "normalize_columns_min_max");
    if (stats.size() != cols) {
        throw std::invalid_argument(
            "normalize_columns_min_max: " + std::to_string(stats.size()) +
            " column bounds for " + std::to_string(cols) + " columns"
        );
    }
    if (!(out_max > out_min)) {
        throw std::invalid_argument("normalize_columns_min_max: out_max must be greater than out_min");
    }

    Matrix out(data.size(), std::vector<double>(cols, out_min));
    const double span = out_max - out_min;

    for (std::size_t c = 0; c < cols; ++c) {
        const double range = stats[c].max - stats[c].min;
        if (std::fabs(range) <= kConstantRangeEps) {
            continue; // already out_min
        }
        for (std::size_t r = 0; r < data.size(); ++r) {
            out[r][c] = out_min + span * (data[r][c] - stats[c].min) / range;
        }
    }

    return out;
}

std::mt19937 make_rng(std::uint32_t seed) {
    return std::mt19937(seed);
}

// -----------------------------
// Logging
// -----------------------------
LogLevel log_threshold() {
    return g_log_threshold.load();
}

ScopedLogThreshold::ScopedLogThreshold(LogLevel level)
    : previous_(g_log_threshold.exchange(level)) {}

ScopedLogThreshold::~ScopedLogThreshold() {
    g_log_threshold.store(previous_);
}

void log(LogLevel level, std::string_view message) {
    if (level < log_threshold()) {
        return;
    }

    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    std::ostream& os = (level == LogLevel::Error) ? std::cerr : std::cout;
    os << "[" << local_timestamp() << "] [" << level_tag(level) << "] " << message << '\n';
    os.flush();
}

void log_debug(std::string_view message)   { log(LogLevel::Debug, message); }
void log_info(std::string_view message)    { log(LogLevel::Info, message); }
void log_warning(std::string_view message) { log(LogLevel::Warning, message); }
void log_error(std::string_view message)   { log(LogLevel::Error, message); }

std::string format_vector_preview(
    const std::vector<double>& values,
    std::size_t max_items,
    int precision
) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(std::max(0, precision)) << "[";

    const std::size_t shown = std::min(values.size(), max_items);
    for (std::size_t i = 0; i < shown; ++i) {
        oss << (i > 0 ? ", " : "") << values[i];
    }
    if (values.size() > shown) {
        oss << ", ... (" << values.size() << " total)";
    }

    oss << "]";
    return oss.str();
}

// -----------------------------
// Timing
// -----------------------------
Timer::Timer() : start_(Clock::now()) {}

double Timer::elapsed_seconds() const {
    return std::chrono::duration<double>(Clock::now() - start_).count();
}

long long Timer::elapsed_milliseconds() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
}

ScopedTimer::ScopedTimer(std::string stage, LogLevel level)
    : stage_(std::move(stage)), level_(level) {}

ScopedTimer::~ScopedTimer() noexcept {
    try {
        log(level_, stage_ + " took " + std::to_string(timer_.elapsed_milliseconds()) + " ms");
    } catch (const std::exception&) {
        // Logging must not escape a destructor.
    }
}

} // namespace loanprep::utils
