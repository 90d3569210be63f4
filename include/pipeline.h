#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <json/json.h>

#include "feature_engineering.h"
#include "utils.h"

namespace loanprep::pipeline {

struct PipelineOptions {
    std::string input_path = "./loan_approval_dataset.csv";
    std::string output_path = "model_data.json";
    char delimiter = ',';

    double test_ratio = 0.3;            // (0,1)
    std::size_t n_neighbors = 5;
    std::uint32_t seed = 42;

    // Applied for the duration of run_pipeline only.
    utils::LogLevel log_level = utils::LogLevel::Info;
};

struct PipelineResult {
    Json::Value artifact;
    std::size_t record_count = 0;
    feature_engineering::LabelDistribution labels{};
    double accuracy_percent = 0.0;
    bool accuracy_evaluated = false;
    std::vector<feature_engineering::InputRange> input_ranges;
    std::vector<feature_engineering::NormalizationRange> normalization_ranges;
    std::string output_path;
};

/// Load -> derive -> input ranges -> normalize -> evaluate -> export.
/// Writes the artifact to options.output_path only after every stage has succeeded.
/// Throws DatasetNotFound, MissingColumn, NumericConversionFailure, EvaluationFailure,
/// SerializationFailure (all LoanPrepException) or std::invalid_argument for bad options.
PipelineResult run_pipeline(const PipelineOptions& options);

/// Multi-line run summary: record count, approved/rejected counts, accuracy.
std::string format_summary(const PipelineResult& result);

} // namespace loanprep::pipeline
