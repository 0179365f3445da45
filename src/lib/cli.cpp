#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "tokenizer.hpp"
#include <exception>
#include <iostream>
#include <string>

namespace cli {

namespace {

void log_stats(const report::Reporter &reporter,
               const tokenizer::Stats &stats, config::Mode mode) {
    std::string summary =
        "Processed " + std::to_string(stats.records) + " record(s): ";
    if (mode == config::Mode::Tokenize) {
        summary += std::to_string(stats.tokens_minted) + " new token(s), " +
                   std::to_string(stats.tokens_reused) + " reused";
    } else {
        summary += std::to_string(stats.values_restored) +
                   " value(s) restored";
    }
    reporter(report::Level::Info, summary);
}

} // namespace

int run(int argc, char *argv[], const ReporterFactory &make_reporter) {
    const std::string program = argc > 0 ? argv[0] : "csvtok";

    config::Options options;
    try {
        options = config::from_command_line(argc, argv);
    } catch (const errors::ConfigurationError &e) {
        make_reporter(report::Level::Info)(
            report::Level::Error,
            std::string("An error occurred: ") + e.what());
        std::cerr << "\n" << config::usage(program);
        return 1;
    }

    if (options.show_help) {
        std::cout << config::usage(program);
        return 0;
    }

    const report::Reporter reporter = make_reporter(options.log_level);
    if (!options.config_path.empty()) {
        reporter(report::Level::Debug,
                 "Loaded configuration from " + options.config_path);
    }

    try {
        if (options.mode == config::Mode::Detokenize) {
            auto stats = tokenizer::detokenize_file(
                options.input_path, options.output_path, options.mapping_path,
                reporter, options.delimiter);
            log_stats(reporter, stats, options.mode);
            reporter(report::Level::Info,
                     "Data detokenized successfully. Output saved to '" +
                         options.output_path + "'.");
        } else {
            reporter(report::Level::Debug,
                     std::string("Tokenizing with method ") +
                         tokengen::to_string(options.strategy));
            auto stats = tokenizer::tokenize_file(
                options.input_path, options.output_path, options.columns,
                options.strategy, options.mapping_path, reporter,
                options.delimiter, options.seed);
            log_stats(reporter, stats, options.mode);
            reporter(report::Level::Info,
                     "Data tokenized successfully. Output saved to '" +
                         options.output_path + "'. Token map saved to '" +
                         options.mapping_path + "'.");
        }
    } catch (const std::exception &e) {
        reporter(report::Level::Error,
                 std::string("An error occurred: ") + e.what());
        return 1;
    }

    return 0;
}

} // namespace cli
