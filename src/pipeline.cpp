#include "pipeline.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include "errors.h"
#include "evaluation.h"
#include "exporter.h"
#include "preprocessing.h"

namespace loanprep::pipeline {
namespace {

void validate_options(const PipelineOptions& options) {
    if (options.input_path.empty()) {
        throw std::invalid_argument("run_pipeline: input_path is empty");
    }
    if (options.output_path.empty()) {
        throw std::invalid_argument("run_pipeline: output_path is empty");
    }
    if (!(options.test_ratio > 0.0 && options.test_ratio < 1.0)) {
        throw std::invalid_argument("run_pipeline: test_ratio must be in (0,1)");
    }
    if (options.n_neighbors == 0) {
        throw std::invalid_argument("run_pipeline: n_neighbors must be >= 1");
    }
}

} // namespace

PipelineResult run_pipeline(const PipelineOptions& options) {
    validate_options(options);
    const utils::ScopedLogThreshold verbosity(options.log_level);

    PipelineResult result;
    result.output_path = options.output_path;

    preprocessing::TabularData table;
    {
        utils::ScopedTimer timer("load");
        preprocessing::CsvLoadOptions load_opt{};
        load_opt.delimiter = options.delimiter;
        table = preprocessing::load_csv_data(options.input_path, load_opt);
    }

    if (table.rows.empty()) {
        throw LoanPrepException("dataset has no records: " + options.input_path);
    }
    result.record_count = table.rows.size();
    utils::log_info(
        "Loaded dataset with " + std::to_string(table.rows.size()) + " records and " +
        std::to_string(table.column_names.size()) + " columns"
    );

    feature_engineering::DerivationSummary derived;
    {
        utils::ScopedTimer timer("derive features");
        derived = feature_engineering::derive_features(table);
    }
    result.labels = derived.distribution;

    {
        utils::ScopedTimer timer("input ranges");
        result.input_ranges = feature_engineering::extract_input_ranges(table);
    }

    preprocessing::MinMaxResult normalized;
    {
        utils::ScopedTimer timer("normalize");
        const auto features = feature_engineering::build_feature_matrix(table);
        normalized = preprocessing::normalize_min_max(features);
        result.normalization_ranges = feature_engineering::make_normalization_ranges(normalized.bounds);
    }
    utils::log_debug("First scaled row: " + utils::format_vector_preview(normalized.scaled.front()));

    {
        utils::ScopedTimer timer("evaluate");
        evaluation::HoldoutOptions eval_opt{};
        eval_opt.test_ratio = options.test_ratio;
        eval_opt.n_neighbors = options.n_neighbors;
        eval_opt.random_seed = options.seed;

        const auto report = evaluation::evaluate_holdout_accuracy(normalized.scaled, derived.labels, eval_opt);
        result.accuracy_percent = report.accuracy_percent;
        result.accuracy_evaluated = report.evaluated;
    }

    std::ostringstream acc;
    acc << std::fixed << std::setprecision(2) << result.accuracy_percent;
    utils::log_info("KNN model trained successfully. Accuracy: " + acc.str() + "%");

    {
        utils::ScopedTimer timer("export");
        result.artifact = exporter::build_artifact(
            normalized.scaled,
            derived.labels,
            result.input_ranges,
            result.normalization_ranges,
            result.accuracy_percent
        );
        exporter::write_artifact(result.artifact, options.output_path);
    }
    utils::log_info(options.output_path + " successfully written.");

    return result;
}

std::string format_summary(const PipelineResult& result) {
    std::ostringstream oss;
    oss << "Summary:\n"
        << " - Records: " << result.record_count << "\n"
        << " - Approved: " << result.labels.approved << "\n"
        << " - Rejected: " << result.labels.rejected << "\n"
        << " - Accuracy: " << std::fixed << std::setprecision(2) << result.accuracy_percent << "%";
    if (!result.accuracy_evaluated) {
        oss << " (single label class, evaluation skipped)";
    }
    oss << "\n";
    return oss.str();
}

} // namespace loanprep::pipeline
