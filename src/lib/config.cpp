#include "config.hpp"
#include "errors.hpp"
#include "io.hpp"
#include <sstream>
#include <stdexcept>

namespace config {

const char *const default_config_file = "params.yaml";

namespace {

uint64_t parse_seed(const std::string &text) {
    try {
        size_t used = 0;
        unsigned long long seed = std::stoull(text, &used);
        if (used != text.size()) {
            throw errors::ConfigurationError("Invalid seed: " + text);
        }
        return static_cast<uint64_t>(seed);
    } catch (const std::invalid_argument &) {
        throw errors::ConfigurationError("Invalid seed: " + text);
    } catch (const std::out_of_range &) {
        throw errors::ConfigurationError("Seed out of range: " + text);
    }
}

bool is_option(const std::string &arg) {
    return arg.size() > 1 && arg[0] == '-';
}

const std::string &option_value(const std::vector<std::string> &args,
                                size_t &i) {
    if (i + 1 >= args.size() || is_option(args[i + 1])) {
        throw errors::ConfigurationError("Option " + args[i] +
                                         " expects a value");
    }
    return args[++i];
}

void validate(const Options &options) {
    if (options.show_help) return;
    if (options.input_path.empty() || options.output_path.empty()) {
        throw errors::ConfigurationError(
            "Missing required arguments: input_file output_file");
    }
    if (options.mode == Mode::Tokenize && options.columns.empty()) {
        throw errors::ConfigurationError(
            "--tokenize_columns is required when tokenizing");
    }
    if (options.mapping_path.empty()) {
        throw errors::ConfigurationError("token_map_file must not be empty");
    }
}

} // namespace

char parse_delimiter(const std::string &text) {
    if (text == "\\t" || text == "tab") return '\t';
    if (text.size() != 1) {
        throw errors::ConfigurationError(
            "Delimiter must be a single character: '" + text + "'");
    }
    char c = text[0];
    if (c == '"' || c == '\r' || c == '\n') {
        throw errors::ConfigurationError("Unusable delimiter: '" + text + "'");
    }
    return c;
}

void apply_yaml(const YAML::Node &root, Options &options) {
    const YAML::Node section = root["csvtok"];
    if (!section) return;
    if (!section.IsMap()) {
        throw errors::ConfigurationError("'csvtok' must be a mapping");
    }

    try {
        if (section["token_method"]) {
            options.strategy = tokengen::parse_strategy(
                section["token_method"].as<std::string>());
        }
        if (section["token_map_file"]) {
            options.mapping_path = section["token_map_file"].as<std::string>();
        }
        if (section["delimiter"]) {
            options.delimiter =
                parse_delimiter(section["delimiter"].as<std::string>());
        }
        if (section["log_level"]) {
            options.log_level =
                report::parse_level(section["log_level"].as<std::string>());
        }
        if (section["seed"]) {
            options.seed = section["seed"].as<uint64_t>();
        }
        if (const YAML::Node columns = section["tokenize_columns"]) {
            options.columns.clear();
            if (columns.IsSequence()) {
                for (const auto &column : columns) {
                    options.columns.push_back(column.as<std::string>());
                }
            } else {
                options.columns.push_back(columns.as<std::string>());
            }
        }
    } catch (const YAML::Exception &e) {
        throw errors::ConfigurationError(std::string("Invalid config: ") +
                                         e.what());
    }
}

Options load_file(const std::string &path, Options options) {
    if (!io::file_exists(path)) {
        throw errors::ConfigurationError("Config file not found: " + path);
    }
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        throw errors::ConfigurationError("Failed to parse " + path + ": " +
                                         e.what());
    }
    apply_yaml(root, options);
    options.config_path = path;
    return options;
}

Options parse_args(const std::vector<std::string> &args, Options options) {
    size_t positional = 0;
    bool columns_from_args = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--tokenize_columns") {
            // Takes every following argument up to the next option
            if (!columns_from_args) {
                options.columns.clear();
                columns_from_args = true;
            }
            size_t before = options.columns.size();
            while (i + 1 < args.size() && !is_option(args[i + 1])) {
                options.columns.push_back(args[++i]);
            }
            if (options.columns.size() == before) {
                throw errors::ConfigurationError(
                    "--tokenize_columns expects at least one column");
            }
        } else if (arg == "--token_method") {
            options.strategy =
                tokengen::parse_strategy(option_value(args, i));
        } else if (arg == "--token_map_file") {
            options.mapping_path = option_value(args, i);
        } else if (arg == "--detokenize") {
            options.mode = Mode::Detokenize;
        } else if (arg == "--delimiter") {
            options.delimiter = parse_delimiter(option_value(args, i));
        } else if (arg == "--seed") {
            options.seed = parse_seed(option_value(args, i));
        } else if (arg == "--log_level") {
            options.log_level = report::parse_level(option_value(args, i));
        } else if (arg == "--config") {
            // Resolved by from_command_line
            option_value(args, i);
        } else if (is_option(arg)) {
            throw errors::ConfigurationError("Unknown option: " + arg);
        } else {
            switch (positional) {
            case 0:
                options.input_path = arg;
                break;
            case 1:
                options.output_path = arg;
                break;
            default:
                throw errors::ConfigurationError("Unexpected argument: " +
                                                 arg);
            }
            ++positional;
        }
    }

    validate(options);
    return options;
}

Options from_command_line(int argc, char *argv[]) {
    std::vector<std::string> args;
    if (argc > 1) args.assign(argv + 1, argv + argc);

    // Help must work even with a broken or missing config file
    for (const auto &arg : args) {
        if (arg == "-h" || arg == "--help") {
            Options options;
            options.show_help = true;
            return options;
        }
    }

    std::string config_path;
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") config_path = args[i + 1];
    }

    Options options;
    if (!config_path.empty()) {
        options = load_file(config_path);
    } else if (io::file_exists(default_config_file)) {
        options = load_file(default_config_file);
    }
    return parse_args(args, options);
}

std::string usage(const std::string &program) {
    std::ostringstream oss;
    oss << "csvtok - Replaces sensitive data in a CSV file with unique, "
           "reversible tokens.\n\n";
    oss << "Usage: " << program << " [options] <input_file> <output_file>\n\n";
    oss << "Arguments:\n";
    oss << "  input_file                  The input CSV file\n";
    oss << "  output_file                 The output CSV file\n\n";
    oss << "Options:\n";
    oss << "  --tokenize_columns <c>...   Columns to tokenize (required unless "
           "--detokenize)\n";
    oss << "  --token_method <m>          uuid or sequential (default: uuid)\n";
    oss << "  --token_map_file <path>     Token-to-value mapping file "
           "(default: token_map.csv)\n";
    oss << "  --detokenize                Restore original values using the "
           "token map\n";
    oss << "  --delimiter <c>             Field delimiter, 'tab' for tabs "
           "(default: ,)\n";
    oss << "  --seed <n>                  Seed for uuid tokens, 0 = random "
           "(default: 0)\n";
    oss << "  --log_level <l>             debug, info, warning or error "
           "(default: info)\n";
    oss << "  --config <path>             YAML config file (default: "
        << default_config_file << " if present)\n";
    oss << "  -h, --help                  Show this help message\n\n";
    oss << "Example:\n";
    oss << "  " << program
        << " people.csv people_tok.csv --tokenize_columns ssn "
           "--token_method sequential\n";
    return oss.str();
}

} // namespace config
