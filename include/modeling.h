#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "utils.h"

namespace loanprep::modeling {

// ============================================================
// Shared types
// ============================================================

struct TrainSummary {
    std::string model_name;
    std::size_t train_rows = 0;
    std::size_t feature_count = 0;
    std::size_t neighbors_used = 0;   // effective k after clamping to train_rows
    bool fitted = false;
};

struct KNearestNeighborsParams {
    std::size_t n_neighbors = 5;
};

// ============================================================
// k-nearest-neighbor classifier (brute-force Euclidean)
// ============================================================

class KNearestNeighborsClassifier final {
public:
    explicit KNearestNeighborsClassifier(KNearestNeighborsParams params = {});

    std::string name() const;
    bool is_fitted() const noexcept { return fitted_; }

    /// Stores the training set. Throws std::invalid_argument on empty, ragged or
    /// non-finite X, size mismatch with y, or n_neighbors == 0.
    TrainSummary fit(const utils::Matrix& X, const std::vector<int>& y);

    /// Majority vote among the min(k, train_rows) closest training rows. Neighbors are
    /// ordered by (distance, training index); a tied vote goes to the smaller label.
    int predict_one(const std::vector<double>& x) const;

    std::vector<int> predict(const utils::Matrix& X) const;

    /// Fraction of correctly classified rows, in [0, 1].
    double score(const utils::Matrix& X, const std::vector<int>& y_true) const;

    const KNearestNeighborsParams& params() const noexcept { return params_; }

    // Effective neighbour count used by predict (0 before fit).
    std::size_t neighbors_used() const noexcept;

private:
    KNearestNeighborsParams params_{};
    bool fitted_ = false;

    utils::Matrix train_features_{};
    std::vector<int> train_labels_{};
    std::size_t feature_count_ = 0;
};

// ============================================================
// Validation helpers
// ============================================================

/// Throws on empty/non-rectangular/non-finite X or X/y size mismatch.
void validate_training_data(
    const utils::Matrix& X,
    const std::vector<int>& y,
    std::string_view caller = "modeling"
);

/// Throws on empty/non-rectangular/non-finite X.
void validate_feature_matrix(
    const utils::Matrix& X,
    std::string_view caller = "modeling"
);

} // namespace loanprep::modeling
