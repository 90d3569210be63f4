#include "modeling.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "evaluation.h"

namespace loanprep::modeling {
namespace {

// ============================================================
// Internal helpers: validation / math
// ============================================================

void validate_finite_scalar(double v, std::string_view name, std::string_view caller) {
    if (!std::isfinite(v)) {
        throw std::invalid_argument(std::string(caller) + ": non-finite value in " + std::string(name));
    }
}

std::size_t infer_feature_count(const utils::Matrix& X, std::string_view caller) {
    if (X.empty()) {
        throw std::invalid_argument(std::string(caller) + ": X must be non-empty");
    }
    if (X.front().empty()) {
        throw std::invalid_argument(std::string(caller) + ": X must have at least one feature column");
    }
    return X.front().size();
}

void ensure_feature_count(const std::vector<double>& row, std::size_t expected_cols, std::string_view caller) {
    if (row.size() != expected_cols) {
        throw std::invalid_argument(
            std::string(caller) + ": feature count mismatch (expected " +
            std::to_string(expected_cols) + ", got " + std::to_string(row.size()) + ")"
        );
    }
}

double squared_euclidean_distance(const std::vector<double>& a, const std::vector<double>& b) {
    double s = 0.0;
    for (std::size_t j = 0; j < a.size(); ++j) {
        const double d = a[j] - b[j];
        s += d * d;
    }
    return s;
}

} // namespace

// ============================================================
// Public validation helpers
// ============================================================

void validate_feature_matrix(const utils::Matrix& X, std::string_view caller) {
    const std::size_t cols = infer_feature_count(X, caller);

    for (std::size_t i = 0; i < X.size(); ++i) {
        if (X[i].size() != cols) {
            throw std::invalid_argument(
                std::string(caller) + ": X is not rectangular at row " + std::to_string(i)
            );
        }
        for (std::size_t j = 0; j < cols; ++j) {
            validate_finite_scalar(X[i][j], "X", caller);
        }
    }
}

void validate_training_data(
    const utils::Matrix& X,
    const std::vector<int>& y,
    std::string_view caller
) {
    validate_feature_matrix(X, caller);

    if (y.size() != X.size()) {
        throw std::invalid_argument(
            std::string(caller) + ": X/y size mismatch (X rows=" + std::to_string(X.size()) +
            ", y size=" + std::to_string(y.size()) + ")"
        );
    }
}

// ============================================================
// KNearestNeighborsClassifier
// ============================================================

KNearestNeighborsClassifier::KNearestNeighborsClassifier(KNearestNeighborsParams params)
    : params_(params) {}

std::string KNearestNeighborsClassifier::name() const {
    return "KNearestNeighborsClassifier(k=" + std::to_string(params_.n_neighbors) + ")";
}

std::size_t KNearestNeighborsClassifier::neighbors_used() const noexcept {
    return fitted_ ? std::min(params_.n_neighbors, train_features_.size()) : 0;
}

TrainSummary KNearestNeighborsClassifier::fit(const utils::Matrix& X, const std::vector<int>& y) {
    if (params_.n_neighbors == 0) {
        throw std::invalid_argument("KNearestNeighborsClassifier::fit: n_neighbors must be >= 1");
    }
    validate_training_data(X, y, "KNearestNeighborsClassifier::fit");

    train_features_ = X;
    train_labels_ = y;
    feature_count_ = X.front().size();
    fitted_ = true;

    TrainSummary s{};
    s.model_name = name();
    s.train_rows = train_features_.size();
    s.feature_count = feature_count_;
    s.neighbors_used = neighbors_used();
    s.fitted = true;
    return s;
}

int KNearestNeighborsClassifier::predict_one(const std::vector<double>& x) const {
    if (!fitted_) {
        throw std::runtime_error("KNearestNeighborsClassifier::predict_one: model is not fitted");
    }
    ensure_feature_count(x, feature_count_, "KNearestNeighborsClassifier::predict_one");

    const std::size_t n = train_features_.size();
    const std::size_t k = neighbors_used();

    // (squared distance, training index); sqrt is monotonic so it is skipped.
    std::vector<std::pair<double, std::size_t>> distances;
    distances.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        distances.emplace_back(squared_euclidean_distance(x, train_features_[i]), i);
    }

    std::partial_sort(
        distances.begin(),
        distances.begin() + static_cast<std::ptrdiff_t>(k),
        distances.end()
    );

    std::map<int, std::size_t> votes;
    for (std::size_t i = 0; i < k; ++i) {
        ++votes[train_labels_[distances[i].second]];
    }

    // std::map iterates labels in ascending order, so strict '>' keeps the smaller label on ties.
    int predicted = votes.begin()->first;
    std::size_t best = 0;
    for (const auto& [label, count] : votes) {
        if (count > best) {
            best = count;
            predicted = label;
        }
    }
    return predicted;
}

std::vector<int> KNearestNeighborsClassifier::predict(const utils::Matrix& X) const {
    validate_feature_matrix(X, "KNearestNeighborsClassifier::predict");

    std::vector<int> y_pred;
    y_pred.reserve(X.size());
    for (const auto& row : X) {
        y_pred.push_back(predict_one(row));
    }
    return y_pred;
}

double KNearestNeighborsClassifier::score(const utils::Matrix& X, const std::vector<int>& y_true) const {
    return evaluation::accuracy_score(y_true, predict(X));
}

} // namespace loanprep::modeling
