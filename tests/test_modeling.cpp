#include "modeling.h"

#include <cmath>
#include <cstddef>
#include <functional>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr double kEps = 1e-8;

struct TestStats {
    int passed = 0;
    int failed = 0;
};

[[noreturn]] void fail(const std::string& msg) {
    throw std::runtime_error(msg);
}

void expect_true(bool cond, const std::string& msg) {
    if (!cond) {
        fail(msg);
    }
}

template <typename T>
void expect_eq(const T& actual, const T& expected, const std::string& msg) {
    if (!(actual == expected)) {
        std::ostringstream oss;
        oss << msg << " | expected: " << expected << ", actual: " << actual;
        fail(oss.str());
    }
}

void expect_near(double actual, double expected, double eps, const std::string& msg) {
    if (std::fabs(actual - expected) > eps) {
        std::ostringstream oss;
        oss << msg << " | expected: " << expected
            << ", actual: " << actual
            << ", abs diff: " << std::fabs(actual - expected)
            << ", eps: " << eps;
        fail(oss.str());
    }
}

template <typename ExceptionT, typename Fn>
void expect_throw(Fn&& fn, const std::string& msg) {
    try {
        fn();
    } catch (const ExceptionT&) {
        return;
    } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << msg << " | threw unexpected exception type: " << e.what();
        fail(oss.str());
    }
    fail(msg + " | expected exception was not thrown");
}

loanprep::modeling::KNearestNeighborsClassifier make_knn(std::size_t k) {
    loanprep::modeling::KNearestNeighborsParams params;
    params.n_neighbors = k;
    return loanprep::modeling::KNearestNeighborsClassifier(params);
}

void test_knn_separates_two_clusters() {
    const loanprep::utils::Matrix X = {
        {0.0, 0.0}, {0.0, 1.0}, {1.0, 0.0},
        {10.0, 10.0}, {10.0, 11.0}, {11.0, 10.0}
    };
    const std::vector<int> y = {0, 0, 0, 1, 1, 1};

    auto model = make_knn(3);
    const auto summary = model.fit(X, y);

    expect_true(model.is_fitted(), "model should be fitted");
    expect_true(summary.fitted, "summary should report fitted");
    expect_eq(summary.train_rows, static_cast<std::size_t>(6), "train rows");
    expect_eq(summary.feature_count, static_cast<std::size_t>(2), "feature count");
    expect_eq(summary.neighbors_used, static_cast<std::size_t>(3), "neighbors used");
    expect_eq(summary.model_name, std::string("KNearestNeighborsClassifier(k=3)"), "model name");

    expect_eq(model.predict_one({0.5, 0.5}), 0, "point near first cluster");
    expect_eq(model.predict_one({9.0, 9.0}), 1, "point near second cluster");

    const loanprep::utils::Matrix X_test = {{0.2, 0.1}, {10.5, 10.5}, {0.0, 0.0}};
    const std::vector<int> y_test = {0, 1, 1};
    const auto pred = model.predict(X_test);
    expect_eq(pred.size(), static_cast<std::size_t>(3), "prediction count");
    expect_near(model.score(X_test, y_test), 2.0 / 3.0, kEps, "score should be a fraction");
}

void test_knn_clamps_k_to_training_rows() {
    const loanprep::utils::Matrix X = {{0.0}, {1.0}};
    const std::vector<int> y = {1, 1};

    auto model = make_knn(5);
    expect_eq(model.neighbors_used(), static_cast<std::size_t>(0), "no neighbors before fit");

    const auto summary = model.fit(X, y);
    expect_eq(summary.neighbors_used, static_cast<std::size_t>(2), "k should be clamped to train rows");
    expect_eq(model.neighbors_used(), static_cast<std::size_t>(2), "neighbors_used after fit");
    expect_eq(model.predict_one({100.0}), 1, "prediction with clamped k");
}

void test_knn_tie_breaking() {
    const loanprep::utils::Matrix X = {{0.0}, {2.0}};
    const std::vector<int> y = {1, 0};

    // Equidistant neighbors: the lower training index wins the single slot.
    auto nearest = make_knn(1);
    nearest.fit(X, y);
    expect_eq(nearest.predict_one({1.0}), 1, "distance tie should prefer lower training index");

    // One vote each: the smaller label wins.
    auto pair = make_knn(2);
    pair.fit(X, y);
    expect_eq(pair.predict_one({1.0}), 0, "vote tie should prefer smaller label");
}

void test_knn_rejects_invalid_usage() {
    auto unfitted = make_knn(3);
    expect_throw<std::runtime_error>(
        [&]() { (void)unfitted.predict_one({0.0}); },
        "predict before fit should throw"
    );

    auto zero_k = make_knn(0);
    expect_throw<std::invalid_argument>(
        [&]() { (void)zero_k.fit({{0.0}}, {0}); },
        "k == 0 should throw"
    );

    auto model = make_knn(3);
    expect_throw<std::invalid_argument>(
        [&]() { (void)model.fit({}, {}); },
        "empty X should throw"
    );
    expect_throw<std::invalid_argument>(
        [&]() { (void)model.fit({{0.0, 1.0}, {2.0}}, {0, 1}); },
        "ragged X should throw"
    );
    expect_throw<std::invalid_argument>(
        [&]() { (void)model.fit({{0.0}, {1.0}}, {0}); },
        "X/y size mismatch should throw"
    );
    expect_throw<std::invalid_argument>(
        [&]() { (void)model.fit({{std::numeric_limits<double>::quiet_NaN()}}, {0}); },
        "NaN feature should throw"
    );

    model.fit({{0.0, 0.0}, {1.0, 1.0}}, {0, 1});
    expect_throw<std::invalid_argument>(
        [&]() { (void)model.predict_one({0.0}); },
        "feature width mismatch should throw"
    );
}

void run_test(const std::string& name, const std::function<void()>& fn, TestStats& stats) {
    try {
        fn();
        ++stats.passed;
        std::cout << "[PASS] " << name << '\n';
    } catch (const std::exception& e) {
        ++stats.failed;
        std::cerr << "[FAIL] " << name << " -> " << e.what() << '\n';
    }
}

} // namespace

int main() {
    TestStats stats{};

    run_test("k-NN separates two clusters", test_knn_separates_two_clusters, stats);
    run_test("k-NN clamps k to training rows", test_knn_clamps_k_to_training_rows, stats);
    run_test("k-NN tie breaking", test_knn_tie_breaking, stats);
    run_test("k-NN rejects invalid usage", test_knn_rejects_invalid_usage, stats);

    std::cout << "\nTest summary: " << stats.passed << " passed, "
              << stats.failed << " failed.\n";

    return (stats.failed == 0) ? 0 : 1;
}
