#include "mapping.hpp"
#include "csv.hpp"
#include "errors.hpp"
#include "io.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace mapping {

namespace {

std::string format_row(const std::vector<std::string> &row) {
    std::string out = "[";
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + row[i] + "'";
    }
    return out + "]";
}

Mapping read_mapping(const std::string &path,
                     const report::Reporter &reporter) {
    Mapping mapping;
    std::ifstream file = io::open_input(path);
    csv::Reader reader(file);
    csv::Row row;
    size_t skipped = 0;
    try {
        while (reader.read_row(row)) {
            try {
                Entry entry = decode_row(row);
                mapping.insert(entry.token, entry.value);
            } catch (const errors::MalformedRowError &e) {
                ++skipped;
                reporter(report::Level::Warning,
                         "Skipping malformed row in token map file " + path +
                             " (line " + std::to_string(reader.line()) +
                             "): " + e.what());
            }
        }
    } catch (const errors::IOError &e) {
        throw errors::IOError("Error reading token map " + path + ": " +
                              e.what());
    }
    reporter(report::Level::Debug,
             "Loaded " + std::to_string(mapping.size()) +
                 " token(s) from " + path + " (" + std::to_string(skipped) +
                 " malformed row(s) skipped)");
    return mapping;
}

} // namespace

void Mapping::insert(const std::string &token, const std::string &value) {
    auto it = by_token_.find(token);
    if (it == by_token_.end()) {
        size_t index = entries_.size();
        entries_.push_back(Entry{token, value});
        by_token_.emplace(token, index);
        by_value_.try_emplace(value, index);
        return;
    }

    size_t index = it->second;
    if (entries_[index].value == value) return;

    std::string old_value = std::move(entries_[index].value);
    entries_[index].value = value;

    auto old_it = by_value_.find(old_value);
    if (old_it != by_value_.end() && old_it->second == index) {
        by_value_.erase(old_it);
        reindex_value(old_value);
    }
    // Reverse lookups resolve to the earliest entry holding the value
    auto [value_it, inserted] = by_value_.try_emplace(value, index);
    if (!inserted && value_it->second > index) {
        value_it->second = index;
    }
}

void Mapping::reindex_value(const std::string &value) {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].value == value) {
            by_value_.emplace(value, i);
            return;
        }
    }
}

const std::string *Mapping::find_value(const std::string &token) const {
    auto it = by_token_.find(token);
    if (it == by_token_.end()) return nullptr;
    return &entries_[it->second].value;
}

const std::string *Mapping::find_token(const std::string &value) const {
    auto it = by_value_.find(value);
    if (it == by_value_.end()) return nullptr;
    return &entries_[it->second].token;
}

Entry decode_row(const std::vector<std::string> &row) {
    if (row.size() != 2) {
        throw errors::MalformedRowError("expected 2 fields, got " +
                                        std::to_string(row.size()) + ": " +
                                        format_row(row));
    }
    return Entry{row[0], row[1]};
}

Mapping load(const std::string &path, const report::Reporter &reporter) {
    if (!io::file_exists(path)) {
        reporter(report::Level::Debug,
                 "Token map " + path + " does not exist, starting empty");
        return Mapping();
    }
    return read_mapping(path, reporter);
}

Mapping load_required(const std::string &path,
                      const report::Reporter &reporter) {
    if (!io::file_exists(path)) {
        throw errors::NotFoundError(path);
    }
    return read_mapping(path, reporter);
}

void save(const Mapping &mapping, const std::string &path) {
    const std::string temp_path = io::temp_path_for(path);
    try {
        std::ofstream file = io::open_output(temp_path);
        csv::Writer writer(file);
        for (const auto &entry : mapping.entries()) {
            writer.write_row({entry.token, entry.value});
        }
        io::close_output(file, temp_path);
    } catch (const errors::IOError &e) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw errors::IOError("Error writing token map " + path + ": " +
                              e.what());
    }
    io::replace_file(temp_path, path);
}

} // namespace mapping
