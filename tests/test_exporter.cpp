#include "errors.h"
#include "evaluation.h"
#include "exporter.h"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>

namespace fs = std::filesystem;

namespace {

constexpr double kEps = 1e-12;

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
        oss << msg << " | expected: " << expected << ", actual: " << actual
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

fs::path make_test_temp_dir() {
    const auto now_ticks = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto unique = std::to_string(static_cast<long long>(now_ticks));

    fs::path dir = fs::temp_directory_path() / "loanprep_exporter_tests" / unique;
    fs::create_directories(dir);
    return dir;
}

Json::Value read_json_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, ifs, &root, &errors)) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + errors);
    }
    return root;
}

Json::Value make_sample_artifact(double accuracy) {
    using namespace loanprep::feature_engineering;

    const loanprep::utils::Matrix scaled = {
        {0.0, 1.0, 1.0, 0.5, 1.0, 1.0},
        {1.0, 0.0, 0.0, 1.0, 0.0, 0.0}
    };
    const std::vector<int> labels = {1, 0};

    const std::vector<InputRange> input_ranges = {
        {"no_of_dependents", 0, 5, 1},
        {"income_annum", 200000, 9900000, kCurrencyStep}
    };

    std::vector<NormalizationRange> normalization_ranges;
    for (const auto& feature : kFeatureColumns) {
        normalization_ranges.push_back({std::string(feature.key), 0.0, 10.0});
    }

    return loanprep::exporter::build_artifact(scaled, labels, input_ranges, normalization_ranges, accuracy);
}

void test_build_artifact_structure() {
    using namespace loanprep::exporter;

    const Json::Value artifact = make_sample_artifact(66.67);

    expect_true(artifact.isObject(), "artifact should be a JSON object");
    expect_eq(artifact.getMemberNames().size(), static_cast<std::size_t>(4), "artifact should have four keys");

    const Json::Value& rows = artifact[kTrainingDataKey];
    expect_true(rows.isArray(), "training rows should be an array");
    expect_eq(rows.size(), Json::ArrayIndex{2}, "training row count");
    for (Json::ArrayIndex r = 0; r < rows.size(); ++r) {
        expect_eq(rows[r].size(), Json::ArrayIndex{7}, "row should be 6 features + label");
        expect_true(rows[r][6].isInt(), "label should be an integer");
    }
    expect_eq(rows[0][6].asInt(), 1, "first label");
    expect_eq(rows[1][6].asInt(), 0, "second label");
    expect_near(rows[0][3].asDouble(), 0.5, kEps, "feature value preserved");

    const Json::Value& income = artifact[kInputRangesKey]["income_annum"];
    expect_true(income.isObject(), "input range entries should be objects");
    expect_true(income["min"].isIntegral(), "input range bounds should be integers");
    expect_eq(income["min"].asInt64(), Json::Int64{200000}, "income min");
    expect_eq(income["max"].asInt64(), Json::Int64{9900000}, "income max");
    expect_eq(income["step"].asInt64(), Json::Int64{100000}, "income step");

    const Json::Value& norm = artifact[kNormalizationRangesKey];
    expect_eq(norm.size(), Json::ArrayIndex{6}, "one normalization range per feature");
    expect_true(norm.isMember("assets_total"), "assets_total normalization range present");
    expect_near(norm["cibil"]["max"].asDouble(), 10.0, kEps, "cibil max");

    expect_near(artifact[kAccuracyKey].asDouble(), 66.67, kEps, "accuracy preserved");

    expect_throw<std::invalid_argument>(
        [&]() {
            (void)build_artifact({{0.0, 0.0, 0.0, 0.0, 0.0, 0.0}}, {1, 0}, {}, {}, 100.0);
        },
        "row/label count mismatch should throw"
    );
}

void test_serialize_is_indented_with_trailing_newline() {
    const std::string text = loanprep::exporter::serialize_artifact(make_sample_artifact(100.0));

    expect_true(!text.empty() && text.back() == '\n', "serialized text should end with a newline");
    expect_true(text.find("\n  \"initial_accuracy\"") != std::string::npos,
                "top-level keys should be indented by two spaces");
}

void test_serialize_prints_rounded_accuracy_as_written() {
    const double accuracy = loanprep::evaluation::round_to(100.0 / 3.0, 2);
    const std::string text = loanprep::exporter::serialize_artifact(make_sample_artifact(accuracy));

    const std::string expected = "\"initial_accuracy\" : 33.33";
    const auto pos = text.find(expected);
    expect_true(pos != std::string::npos, "accuracy should serialize as 33.33:\n" + text);
    const char next = text[pos + expected.size()];
    expect_true(next == ',' || next == '\n', "accuracy should have no further digits:\n" + text);
    expect_true(text.find("33.329999") == std::string::npos, "no binary expansion of 33.33");

    // The 0.5 feature cell stays short too.
    expect_true(text.find("0.5,") != std::string::npos, "feature values keep their short form");
    expect_true(text.find("0.50000000") == std::string::npos, "no padded feature values");
}

void test_write_artifact_round_trips_and_leaves_no_temp() {
    const fs::path dir = make_test_temp_dir();
    const fs::path out = dir / "nested" / "model_data.json";
    fs::path tmp = out;
    tmp += ".tmp";

    loanprep::exporter::write_artifact(make_sample_artifact(66.67), out.string());

    expect_true(fs::exists(out), "artifact file should exist");
    expect_true(!fs::exists(tmp), "temporary file should be renamed away");

    const Json::Value parsed = read_json_file(out);
    expect_eq(parsed[loanprep::exporter::kTrainingDataKey].size(), Json::ArrayIndex{2}, "row count after reload");
    expect_eq(parsed[loanprep::exporter::kTrainingDataKey][0][6].asInt(), 1, "label after reload");
    expect_near(parsed[loanprep::exporter::kAccuracyKey].asDouble(), 66.67, kEps, "accuracy after reload");
    expect_eq(parsed[loanprep::exporter::kInputRangesKey]["no_of_dependents"]["step"].asInt64(),
              Json::Int64{1}, "dependents step after reload");

    fs::remove_all(dir);
}

void test_failed_write_keeps_previous_artifact() {
    const fs::path dir = make_test_temp_dir();
    const fs::path out = dir / "model_data.json";
    fs::path tmp = out;
    tmp += ".tmp";

    loanprep::exporter::write_artifact(make_sample_artifact(50.0), out.string());

    // A directory where the temporary file should go makes the write fail.
    fs::create_directories(tmp);
    expect_throw<loanprep::SerializationFailure>(
        [&]() { loanprep::exporter::write_artifact(make_sample_artifact(75.0), out.string()); },
        "unwritable temporary file should throw SerializationFailure"
    );

    const Json::Value parsed = read_json_file(out);
    expect_near(parsed[loanprep::exporter::kAccuracyKey].asDouble(), 50.0, kEps,
                "previous artifact should be left untouched");

    fs::remove_all(dir);
}

void test_write_artifact_over_directory_fails_cleanly() {
    const fs::path dir = make_test_temp_dir();
    const fs::path out = dir / "occupied";
    fs::create_directories(out / "child");
    fs::path tmp = out;
    tmp += ".tmp";

    expect_throw<loanprep::SerializationFailure>(
        [&]() { loanprep::exporter::write_artifact(make_sample_artifact(50.0), out.string()); },
        "renaming over a non-empty directory should throw SerializationFailure"
    );
    expect_true(fs::is_directory(out), "existing directory should be untouched");
    expect_true(!fs::exists(tmp), "temporary file should be removed after a failed rename");

    expect_throw<loanprep::SerializationFailure>(
        [&]() { loanprep::exporter::write_artifact(make_sample_artifact(50.0), ""); },
        "empty output path should throw SerializationFailure"
    );

    fs::remove_all(dir);
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

    run_test("build artifact structure", test_build_artifact_structure, stats);
    run_test("serialize is indented with trailing newline",
             test_serialize_is_indented_with_trailing_newline, stats);
    run_test("serialize prints rounded accuracy as written",
             test_serialize_prints_rounded_accuracy_as_written, stats);
    run_test("write artifact round-trips and leaves no temp file",
             test_write_artifact_round_trips_and_leaves_no_temp, stats);
    run_test("failed write keeps previous artifact", test_failed_write_keeps_previous_artifact, stats);
    run_test("write over directory fails cleanly", test_write_artifact_over_directory_fails_cleanly, stats);

    std::cout << "\nTest summary: " << stats.passed << " passed, "
              << stats.failed << " failed.\n";

    return (stats.failed == 0) ? 0 : 1;
}
