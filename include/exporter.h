#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include "feature_engineering.h"
#include "utils.h"

namespace loanprep::exporter {

// Top-level keys read by the consumer application.
inline constexpr const char* kTrainingDataKey = "training_data_initial";
inline constexpr const char* kInputRangesKey = "input_ranges";
inline constexpr const char* kNormalizationRangesKey = "normalization_ranges";
inline constexpr const char* kAccuracyKey = "initial_accuracy";

/// Assemble the artifact. Each training row is the scaled feature vector followed by its
/// integer label, in source row order.
/// Throws std::invalid_argument if scaled_features and labels differ in length.
Json::Value build_artifact(
    const utils::Matrix& scaled_features,
    const std::vector<int>& labels,
    const std::vector<feature_engineering::InputRange>& input_ranges,
    const std::vector<feature_engineering::NormalizationRange>& normalization_ranges,
    double accuracy_percent
);

/// Pretty-printed JSON text (two-space indent, 15 significant digits, trailing newline).
std::string serialize_artifact(const Json::Value& artifact);

/// Serialize fully in memory, write to "<path>.tmp" and rename over `path`.
/// On failure the temp file is removed, any previous artifact is left untouched and
/// SerializationFailure is thrown.
void write_artifact(const Json::Value& artifact, std::string_view output_path);

} // namespace loanprep::exporter
