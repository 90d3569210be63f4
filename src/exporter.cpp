#include "exporter.h"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "errors.h"

namespace loanprep::exporter {
namespace {

namespace fs = std::filesystem;

Json::Value make_training_rows(const utils::Matrix& scaled_features, const std::vector<int>& labels) {
    if (scaled_features.size() != labels.size()) {
        throw std::invalid_argument(
            "build_artifact: size mismatch (rows=" + std::to_string(scaled_features.size()) +
            ", labels=" + std::to_string(labels.size()) + ")"
        );
    }

    Json::Value rows(Json::arrayValue);
    for (std::size_t r = 0; r < scaled_features.size(); ++r) {
        Json::Value row(Json::arrayValue);
        for (double v : scaled_features[r]) {
            row.append(v);
        }
        row.append(labels[r]);
        rows.append(std::move(row));
    }
    return rows;
}

Json::Value make_input_ranges(const std::vector<feature_engineering::InputRange>& ranges) {
    Json::Value out(Json::objectValue);
    for (const auto& range : ranges) {
        Json::Value entry(Json::objectValue);
        entry["min"] = static_cast<Json::Int64>(range.min);
        entry["max"] = static_cast<Json::Int64>(range.max);
        entry["step"] = static_cast<Json::Int64>(range.step);
        out[range.column] = std::move(entry);
    }
    return out;
}

Json::Value make_normalization_ranges(const std::vector<feature_engineering::NormalizationRange>& ranges) {
    Json::Value out(Json::objectValue);
    for (const auto& range : ranges) {
        Json::Value entry(Json::objectValue);
        entry["min"] = range.min;
        entry["max"] = range.max;
        out[range.key] = std::move(entry);
    }
    return out;
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

Json::Value build_artifact(
    const utils::Matrix& scaled_features,
    const std::vector<int>& labels,
    const std::vector<feature_engineering::InputRange>& input_ranges,
    const std::vector<feature_engineering::NormalizationRange>& normalization_ranges,
    double accuracy_percent
) {
    Json::Value artifact(Json::objectValue);
    artifact[kTrainingDataKey] = make_training_rows(scaled_features, labels);
    artifact[kInputRangesKey] = make_input_ranges(input_ranges);
    artifact[kNormalizationRangesKey] = make_normalization_ranges(normalization_ranges);
    artifact[kAccuracyKey] = accuracy_percent;
    return artifact;
}

std::string serialize_artifact(const Json::Value& artifact) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    // 15 significant digits print decimal-rounded values (33.33, 0.3) as written.
    builder["precision"] = 15;

    std::string text = Json::writeString(builder, artifact);
    text.push_back('\n');
    return text;
}

void write_artifact(const Json::Value& artifact, std::string_view output_path) {
    if (output_path.empty()) {
        throw SerializationFailure("output path is empty");
    }

    std::string payload;
    try {
        payload = serialize_artifact(artifact);
    } catch (const std::exception& e) {
        throw SerializationFailure(std::string("failed to encode artifact: ") + e.what());
    }

    const fs::path out_path{std::string(output_path)};
    fs::path tmp_path = out_path;
    tmp_path += ".tmp";

    if (out_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            throw SerializationFailure(
                "failed to create output directory '" + out_path.parent_path().string() + "': " + ec.message()
            );
        }
    }

    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw SerializationFailure("failed to open temporary file: " + tmp_path.string());
        }

        ofs.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        ofs.flush();
        if (!ofs.good()) {
            ofs.close();
            remove_quietly(tmp_path);
            throw SerializationFailure("failed while writing file: " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, out_path, ec);
    if (ec) {
        remove_quietly(tmp_path);
        throw SerializationFailure(
            "failed to move '" + tmp_path.string() + "' to '" + out_path.string() + "': " + ec.message()
        );
    }
}

} // namespace loanprep::exporter
