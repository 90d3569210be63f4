#include "errors.h"
#include "pipeline.h"
#include "utils.h"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace {

using loanprep::pipeline::PipelineOptions;

// ============================================================
// CLI
// ============================================================

struct CliOptions {
    PipelineOptions pipeline{};
    bool verbose = false;
    bool show_help = false;
};

void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options]\n\n"
        << "Options:\n"
        << "  --input <path>           Loan application CSV  (default: ./loan_approval_dataset.csv)\n"
        << "  --output <path>          JSON artifact path    (default: model_data.json)\n"
        << "  --delimiter <char>       CSV delimiter         (default: ,)\n"
        << "  --test-ratio <float>     Held-out ratio (0,1)  (default: 0.3)\n"
        << "  --neighbors <n>          k for k-NN            (default: 5)\n"
        << "  --seed <int>             Split seed            (default: 42)\n"
        << "  --verbose                Log debug output and stage timings\n"
        << "  --help                   Show this help message\n";
}

// Whole-string unsigned parse; rejects signs, junk and out-of-range values.
template <typename UInt>
std::optional<UInt> parse_unsigned(const std::string& s) {
    UInt value{};
    const char* const end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (s.empty() || ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions opt{};
    auto& p = opt.pipeline;

    auto require_value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for argument: " + std::string(flag));
        }
        ++i;
        return argv[i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opt.show_help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opt.verbose = true;
        } else if (arg == "--input") {
            p.input_path = require_value(i, arg);
        } else if (arg == "--output") {
            p.output_path = require_value(i, arg);
        } else if (arg == "--delimiter") {
            const auto s = require_value(i, arg);
            if (s.size() != 1) {
                throw std::invalid_argument("Invalid --delimiter: expected a single character");
            }
            p.delimiter = s[0];
        } else if (arg == "--test-ratio") {
            const auto s = require_value(i, arg);
            const auto v = loanprep::utils::parse_number(s);
            if (!v.has_value()) {
                throw std::invalid_argument("Invalid --test-ratio: " + s);
            }
            p.test_ratio = *v;
        } else if (arg == "--neighbors") {
            const auto s = require_value(i, arg);
            const auto n = parse_unsigned<std::size_t>(s);
            if (!n.has_value() || *n == 0) {
                throw std::invalid_argument("Invalid --neighbors: " + s);
            }
            p.n_neighbors = *n;
        } else if (arg == "--seed") {
            const auto s = require_value(i, arg);
            const auto seed = parse_unsigned<std::uint32_t>(s);
            if (!seed.has_value()) {
                throw std::invalid_argument("Invalid --seed: " + s);
            }
            p.seed = *seed;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (!(p.test_ratio > 0.0 && p.test_ratio < 1.0)) {
        throw std::invalid_argument("--test-ratio must be in (0,1)");
    }

    return opt;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli{};
    try {
        cli = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (cli.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (cli.verbose) {
        cli.pipeline.log_level = loanprep::utils::LogLevel::Debug;
    }
    const loanprep::utils::ScopedLogThreshold verbosity(cli.pipeline.log_level);

    try {
        loanprep::utils::Timer timer;
        const auto result = loanprep::pipeline::run_pipeline(cli.pipeline);

        std::cout << "\n" << loanprep::pipeline::format_summary(result);
        std::cout << "\nNext step: place '" << result.output_path
                  << "' in the client application's public directory.\n";
        loanprep::utils::log_debug("Total run time: " + std::to_string(timer.elapsed_seconds()) + " s");
        return 0;
    } catch (const loanprep::DatasetNotFound& e) {
        loanprep::utils::log_error(std::string(e.what()) + ". Place the CSV file at the --input path.");
        return 1;
    } catch (const std::exception& e) {
        loanprep::utils::log_error(std::string("Error: ") + e.what());
        return 1;
    }
}
