#pragma once

#include "report.hpp"
#include "tokengen.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace config {

enum class Mode { Tokenize, Detokenize };

struct Options {
    std::string input_path;
    std::string output_path;
    std::vector<std::string> columns;
    tokengen::Strategy strategy = tokengen::Strategy::Uuid;
    std::string mapping_path = "token_map.csv";
    Mode mode = Mode::Tokenize;
    char delimiter = ',';
    report::Level log_level = report::Level::Info;
    uint64_t seed = 0; // 0 = non-deterministic
    std::string config_path;
    bool show_help = false;
};

// Config file read when present in the working directory
extern const char *const default_config_file;

// Applies the "csvtok" section of a params.yaml document on top of options.
// Unknown keys are ignored; bad values throw errors::ConfigurationError.
void apply_yaml(const YAML::Node &root, Options &options);

// Loads path with yaml-cpp and applies it. A missing or unparsable file
// throws errors::ConfigurationError.
Options load_file(const std::string &path, Options options = {});

// Applies command line arguments (without the program name) on top of
// options and validates the result
Options parse_args(const std::vector<std::string> &args, Options options = {});

// Full resolution: --config <path> or params.yaml (when present), then
// the command line
Options from_command_line(int argc, char *argv[]);

char parse_delimiter(const std::string &text);

std::string usage(const std::string &program);

} // namespace config
