#pragma once

#include "mapping.hpp"
#include "report.hpp"
#include "tokengen.hpp"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace tokenizer {

struct Stats {
    size_t records = 0;
    size_t tokens_minted = 0;   // new (token, value) pairs added to the mapping
    size_t tokens_reused = 0;   // values that already had a token
    size_t values_restored = 0; // detokenize: values replaced by originals
    std::vector<std::string> missing_columns;
};

// Stream-level passes. The first non-blank row is the header and is written
// through unchanged; output reuses the input's delimiter and line terminator.
// Blank input lines are dropped, short records are padded with empty values
// and a record longer than the header throws errors::IOError.

// Replaces the values of the named columns with tokens, inserting newly
// minted pairs into mapping. Columns missing from the header are reported
// once as a warning and ignored.
Stats tokenize(std::istream &in, std::ostream &out,
               const std::vector<std::string> &columns,
               tokengen::Generator &generator, mapping::Mapping &mapping,
               const report::Reporter &reporter, char delimiter = ',');

// Replaces every value, in any column, that is a token of mapping with its
// original value
Stats detokenize(std::istream &in, std::ostream &out,
                 const mapping::Mapping &mapping,
                 const report::Reporter &reporter, char delimiter = ',');

// File-level operations.
// tokenize_file: a missing mapping file starts an empty mapping. The input
// must exist (errors::NotFoundError, raised before the output is created).
// The mapping is saved once, after the whole input has been written.
Stats tokenize_file(const std::string &input_path,
                    const std::string &output_path,
                    const std::vector<std::string> &columns,
                    tokengen::Strategy strategy,
                    const std::string &mapping_path,
                    const report::Reporter &reporter, char delimiter = ',',
                    uint64_t seed = 0);

// detokenize_file: both the mapping file and the input must exist
// (errors::NotFoundError)
Stats detokenize_file(const std::string &input_path,
                      const std::string &output_path,
                      const std::string &mapping_path,
                      const report::Reporter &reporter, char delimiter = ',');

} // namespace tokenizer
