#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace csv {

using Row = std::vector<std::string>;

struct Dialect {
    char delimiter = ',';
    char quote = '"';
    std::string line_terminator = "\r\n";
};

// Streaming reader: one row per read_row call, quoted fields may span lines.
// A blank line yields an empty row.
class Reader {
  public:
    explicit Reader(std::istream &in, Dialect dialect = {});

    // Returns false at end of input. Throws errors::IOError on an
    // unterminated quoted field or a failing stream.
    bool read_row(Row &row);

    // Terminator of the first row read, or the dialect's if none seen yet
    const std::string &line_terminator() const;

    // Line number where the last returned row started (1-based)
    size_t line() const { return row_line_; }

    const Dialect &dialect() const { return dialect_; }

  private:
    // Consumes an end of line starting with c ('\r' or '\n')
    void end_of_line(char c);

    std::istream &in_;
    Dialect dialect_;
    std::string seen_terminator_;
    size_t line_ = 1;
    size_t row_line_ = 0;
};

class Writer {
  public:
    explicit Writer(std::ostream &out, Dialect dialect = {});

    // Throws errors::IOError if the stream fails
    void write_row(const Row &row);

    const Dialect &dialect() const { return dialect_; }

  private:
    bool needs_quoting(const std::string &field) const;

    std::ostream &out_;
    Dialect dialect_;
};

} // namespace csv
