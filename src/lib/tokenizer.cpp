#include "tokenizer.hpp"
#include "csv.hpp"
#include "errors.hpp"
#include "io.hpp"
#include <fstream>
#include <functional>
#include <string>
#include <utility>

namespace tokenizer {

namespace {

using HeaderHook = std::function<void(const csv::Row &)>;
using RecordHook = std::function<void(csv::Row &)>;

// Copies header and records from in to out, letting on_record rewrite each
// record in place. Returns the number of records written.
size_t pass(std::istream &in, std::ostream &out, char delimiter,
            const report::Reporter &reporter, const HeaderHook &on_header,
            const RecordHook &on_record) {
    csv::Dialect dialect;
    dialect.delimiter = delimiter;
    csv::Reader reader(in, dialect);

    csv::Row header;
    do {
        if (!reader.read_row(header)) {
            reporter(report::Level::Warning,
                     "Input has no header row, nothing to process");
            return 0;
        }
    } while (header.empty());

    dialect.line_terminator = reader.line_terminator();
    csv::Writer writer(out, dialect);
    writer.write_row(header);
    on_header(header);

    csv::Row record;
    size_t count = 0;
    while (reader.read_row(record)) {
        if (record.empty()) continue;
        if (record.size() > header.size()) {
            throw errors::IOError(
                "Record at line " + std::to_string(reader.line()) + " has " +
                std::to_string(record.size()) + " fields but the header has " +
                std::to_string(header.size()));
        }
        record.resize(header.size());
        on_record(record);
        writer.write_row(record);
        ++count;
    }
    return count;
}

} // namespace

Stats tokenize(std::istream &in, std::ostream &out,
               const std::vector<std::string> &columns,
               tokengen::Generator &generator, mapping::Mapping &mapping,
               const report::Reporter &reporter, char delimiter) {
    Stats stats;
    std::vector<size_t> selected;

    auto on_header = [&](const csv::Row &header) {
        std::vector<bool> taken(header.size(), false);
        for (const auto &column : columns) {
            bool found = false;
            for (size_t i = 0; i < header.size(); ++i) {
                if (header[i] != column) continue;
                found = true;
                if (!taken[i]) {
                    taken[i] = true;
                    selected.push_back(i);
                }
            }
            if (!found) {
                stats.missing_columns.push_back(column);
                reporter(report::Level::Warning,
                         "Column '" + column + "' not found in input file.");
            }
        }
    };

    auto on_record = [&](csv::Row &record) {
        for (size_t i : selected) {
            bool minted = false;
            std::string token =
                tokengen::token_for(record[i], mapping, generator, &minted);
            if (minted) {
                mapping.insert(token, record[i]);
                ++stats.tokens_minted;
            } else {
                ++stats.tokens_reused;
            }
            record[i] = std::move(token);
        }
    };

    stats.records = pass(in, out, delimiter, reporter, on_header, on_record);
    return stats;
}

Stats detokenize(std::istream &in, std::ostream &out,
                 const mapping::Mapping &mapping,
                 const report::Reporter &reporter, char delimiter) {
    Stats stats;
    auto on_record = [&](csv::Row &record) {
        for (auto &field : record) {
            if (const std::string *original = mapping.find_value(field)) {
                field = *original;
                ++stats.values_restored;
            }
        }
    };
    stats.records = pass(
        in, out, delimiter, reporter, [](const csv::Row &) {}, on_record);
    return stats;
}

Stats tokenize_file(const std::string &input_path,
                    const std::string &output_path,
                    const std::vector<std::string> &columns,
                    tokengen::Strategy strategy,
                    const std::string &mapping_path,
                    const report::Reporter &reporter, char delimiter,
                    uint64_t seed) {
    tokengen::Generator generator(strategy, seed);
    mapping::Mapping mapping = mapping::load(mapping_path, reporter);

    std::ifstream in = io::open_input(input_path);
    std::ofstream out = io::open_output(output_path);
    Stats stats = tokenize(in, out, columns, generator, mapping, reporter,
                           delimiter);
    io::close_output(out, output_path);

    mapping::save(mapping, mapping_path);
    reporter(report::Level::Debug, "Saved " + std::to_string(mapping.size()) +
                                       " token(s) to " + mapping_path);
    return stats;
}

Stats detokenize_file(const std::string &input_path,
                      const std::string &output_path,
                      const std::string &mapping_path,
                      const report::Reporter &reporter, char delimiter) {
    const mapping::Mapping mapping =
        mapping::load_required(mapping_path, reporter);

    std::ifstream in = io::open_input(input_path);
    std::ofstream out = io::open_output(output_path);
    Stats stats = detokenize(in, out, mapping, reporter, delimiter);
    io::close_output(out, output_path);
    return stats;
}

} // namespace tokenizer
