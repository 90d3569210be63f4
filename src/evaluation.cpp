#include "evaluation.h"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

#include "modeling.h"
#include "preprocessing.h"

namespace loanprep::evaluation {
namespace {

std::size_t distinct_label_count(const std::vector<int>& y) {
    return std::set<int>(y.begin(), y.end()).size();
}

} // namespace

// ============================================================
// Validation helpers
// ============================================================
void validate_prediction_pair(
    const std::vector<int>& y_true,
    const std::vector<int>& y_pred,
    std::string_view caller
) {
    if (y_true.empty() || y_pred.empty()) {
        throw std::invalid_argument(std::string(caller) + ": y_true and y_pred must be non-empty");
    }

    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument(
            std::string(caller) + ": size mismatch (y_true=" + std::to_string(y_true.size()) +
            ", y_pred=" + std::to_string(y_pred.size()) + ")"
        );
    }
}

// ============================================================
// Core classification metrics
// ============================================================
double accuracy_score(
    const std::vector<int>& y_true,
    const std::vector<int>& y_pred
) {
    return evaluate_classification(y_true, y_pred).accuracy;
}

ClassificationMetrics evaluate_classification(
    const std::vector<int>& y_true,
    const std::vector<int>& y_pred
) {
    validate_prediction_pair(y_true, y_pred, "evaluate_classification");

    ClassificationMetrics out{};
    out.sample_count = y_true.size();

    for (std::size_t i = 0; i < y_true.size(); ++i) {
        const bool actual = (y_true[i] == 1);
        const bool predicted = (y_pred[i] == 1);

        if (y_true[i] == y_pred[i]) {
            ++out.correct;
        }

        if (actual && predicted) {
            ++out.true_positive;
        } else if (!actual && !predicted) {
            ++out.true_negative;
        } else if (predicted) {
            ++out.false_positive;
        } else {
            ++out.false_negative;
        }
    }

    out.accuracy = static_cast<double>(out.correct) / static_cast<double>(out.sample_count);
    return out;
}

double round_to(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

// ============================================================
// Held-out accuracy
// ============================================================
AccuracyReport evaluate_holdout_accuracy(
    const utils::Matrix& X,
    const std::vector<int>& y,
    const HoldoutOptions& options
) {
    AccuracyReport report{};

    if (distinct_label_count(y) < 2) {
        report.accuracy_percent = kDegenerateAccuracyPercent;
        report.evaluated = false;
        return report;
    }

    preprocessing::TrainTestSplitOptions split_opt{};
    split_opt.test_ratio = options.test_ratio;
    split_opt.shuffle = true;
    split_opt.random_seed = options.random_seed;

    const auto split = preprocessing::split_train_test(X, y, split_opt);

    modeling::KNearestNeighborsParams params{};
    params.n_neighbors = options.n_neighbors;
    modeling::KNearestNeighborsClassifier knn(params);
    const auto summary = knn.fit(split.train_features, split.train_labels);

    if (summary.neighbors_used < options.n_neighbors) {
        utils::log_warning(
            "Only " + std::to_string(summary.train_rows) + " training rows; k-NN votes with k=" +
            std::to_string(summary.neighbors_used) + " instead of " + std::to_string(options.n_neighbors)
        );
    }

    const auto y_pred = knn.predict(split.test_features);

    report.metrics = evaluate_classification(split.test_labels, y_pred);
    report.accuracy_percent = round_to(report.metrics.accuracy * 100.0, options.decimals);
    report.evaluated = true;
    report.train_rows = summary.train_rows;
    report.test_rows = split.test_features.size();
    report.neighbors_used = summary.neighbors_used;

    utils::log_debug("Held-out metrics: " + format_metrics(report.metrics));
    return report;
}

// ============================================================
// Formatting helper
// ============================================================
std::string format_metrics(const ClassificationMetrics& metrics, int precision) {
    if (precision < 0) {
        precision = 0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision);

    oss << "n=" << metrics.sample_count
        << ", accuracy=" << metrics.accuracy
        << ", TP=" << metrics.true_positive
        << ", TN=" << metrics.true_negative
        << ", FP=" << metrics.false_positive
        << ", FN=" << metrics.false_negative;

    return oss.str();
}

} // namespace loanprep::evaluation
