#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "utils.h"

namespace loanprep::evaluation {

// ============================================================
// Classification metric structs
// ============================================================

struct ClassificationMetrics {
    std::size_t sample_count = 0;
    std::size_t correct = 0;

    // Binary confusion counts, label 1 treated as positive
    std::size_t true_positive = 0;
    std::size_t true_negative = 0;
    std::size_t false_positive = 0;
    std::size_t false_negative = 0;

    double accuracy = 0.0;              // fraction in [0, 1]
};

// ============================================================
// Validation helpers
// ============================================================

/// Throws if vectors are empty or sizes mismatch.
void validate_prediction_pair(
    const std::vector<int>& y_true,
    const std::vector<int>& y_pred,
    std::string_view caller = "evaluation"
);

// ============================================================
// Core classification metrics
// ============================================================

/// Fraction of positions where y_pred equals y_true.
double accuracy_score(
    const std::vector<int>& y_true,
    const std::vector<int>& y_pred
);

ClassificationMetrics evaluate_classification(
    const std::vector<int>& y_true,
    const std::vector<int>& y_pred
);

/// Round half away from zero to `decimals` places.
double round_to(double value, int decimals);

// ============================================================
// Held-out accuracy of the reference classifier
// ============================================================

inline constexpr double kDegenerateAccuracyPercent = 100.0;

struct HoldoutOptions {
    double test_ratio = 0.3;
    std::size_t n_neighbors = 5;
    std::uint32_t random_seed = 42;
    int decimals = 2;
};

struct AccuracyReport {
    double accuracy_percent = 0.0;      // rounded to HoldoutOptions::decimals
    bool evaluated = false;             // false when the label column has a single value
    std::size_t train_rows = 0;
    std::size_t test_rows = 0;
    std::size_t neighbors_used = 0;
    ClassificationMetrics metrics{};
};

/// Split (X, y), fit k-NN on the train part and score the held-out part as a percentage.
/// With fewer than two distinct labels returns kDegenerateAccuracyPercent without evaluating.
/// Throws EvaluationFailure when a partition would be empty.
AccuracyReport evaluate_holdout_accuracy(
    const utils::Matrix& X,
    const std::vector<int>& y,
    const HoldoutOptions& options = {}
);

/// Compact human-readable line for logs.
std::string format_metrics(const ClassificationMetrics& metrics, int precision = 4);

} // namespace loanprep::evaluation
