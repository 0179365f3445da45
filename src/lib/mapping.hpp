#pragma once

#include "report.hpp"
#include <absl/container/flat_hash_map.h>
#include <cstddef>
#include <string>
#include <vector>

namespace mapping {

struct Entry {
    std::string token;
    std::string value;
};

// Token -> original value association with a value -> token index kept
// alongside. Entries keep the order in which tokens were first inserted.
class Mapping {
  public:
    // Inserts a new pair, or replaces the value of an existing token in place.
    // A value that already has a token keeps it for reverse lookups.
    void insert(const std::string &token, const std::string &value);

    // nullptr when absent
    const std::string *find_value(const std::string &token) const;
    const std::string *find_token(const std::string &value) const;

    bool contains_token(const std::string &token) const {
        return by_token_.contains(token);
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<Entry> &entries() const { return entries_; }

  private:
    void reindex_value(const std::string &value);

    std::vector<Entry> entries_;
    absl::flat_hash_map<std::string, size_t> by_token_;
    absl::flat_hash_map<std::string, size_t> by_value_;
};

// Decodes one mapping file row, throwing errors::MalformedRowError unless it
// has exactly two fields
Entry decode_row(const std::vector<std::string> &row);

// Loads path, or returns an empty mapping if it does not exist. Malformed
// rows are reported as warnings and skipped.
Mapping load(const std::string &path, const report::Reporter &reporter);

// Same as load, but a missing file throws errors::NotFoundError
Mapping load_required(const std::string &path,
                      const report::Reporter &reporter);

// Writes all entries to a uniquely named temporary file next to path
// (io::temp_path_for) and renames it over path. Throws errors::IOError.
void save(const Mapping &mapping, const std::string &path);

} // namespace mapping
