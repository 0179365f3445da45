#include "csv.hpp"
#include "errors.hpp"
#include <string>
#include <utility>

namespace csv {

namespace {

enum class State { StartRecord, StartField, Unquoted, Quoted, QuoteInQuoted };

} // namespace

Reader::Reader(std::istream &in, Dialect dialect)
    : in_(in), dialect_(std::move(dialect)) {}

const std::string &Reader::line_terminator() const {
    return seen_terminator_.empty() ? dialect_.line_terminator
                                    : seen_terminator_;
}

void Reader::end_of_line(char c) {
    std::string terminator(1, c);
    if (c == '\r' && in_.peek() == '\n') {
        in_.get();
        terminator = "\r\n";
    }
    if (seen_terminator_.empty()) {
        seen_terminator_ = terminator;
    }
    ++line_;
}

bool Reader::read_row(Row &row) {
    row.clear();
    std::string field;
    State state = State::StartRecord;
    row_line_ = line_;
    const char delim = dialect_.delimiter;
    const char quote = dialect_.quote;

    char c;
    while (in_.get(c)) {
        switch (state) {
        case State::StartRecord:
        case State::StartField:
            if (c == quote) {
                state = State::Quoted;
            } else if (c == delim) {
                row.push_back(std::move(field));
                field.clear();
                state = State::StartField;
            } else if (c == '\n' || c == '\r') {
                end_of_line(c);
                if (state == State::StartField) {
                    row.push_back(std::move(field));
                }
                return true;
            } else {
                field += c;
                state = State::Unquoted;
            }
            break;
        case State::Unquoted:
            if (c == delim) {
                row.push_back(std::move(field));
                field.clear();
                state = State::StartField;
            } else if (c == '\n' || c == '\r') {
                end_of_line(c);
                row.push_back(std::move(field));
                return true;
            } else {
                field += c;
            }
            break;
        case State::Quoted:
            if (c == quote) {
                state = State::QuoteInQuoted;
            } else {
                if (c == '\n') ++line_;
                field += c;
            }
            break;
        case State::QuoteInQuoted:
            if (c == quote) {
                field += c;
                state = State::Quoted;
            } else if (c == delim) {
                row.push_back(std::move(field));
                field.clear();
                state = State::StartField;
            } else if (c == '\n' || c == '\r') {
                end_of_line(c);
                row.push_back(std::move(field));
                return true;
            } else {
                // Text after a closing quote is kept verbatim
                field += c;
                state = State::Unquoted;
            }
            break;
        }
    }

    if (in_.bad()) {
        throw errors::IOError("Read error at line " +
                              std::to_string(row_line_));
    }
    if (state == State::StartRecord) {
        return false;
    }
    if (state == State::Quoted) {
        throw errors::IOError("Unterminated quoted field starting at line " +
                              std::to_string(row_line_));
    }
    row.push_back(std::move(field));
    return true;
}

Writer::Writer(std::ostream &out, Dialect dialect)
    : out_(out), dialect_(std::move(dialect)) {}

bool Writer::needs_quoting(const std::string &field) const {
    for (char c : field) {
        if (c == dialect_.delimiter || c == dialect_.quote || c == '\r' ||
            c == '\n') {
            return true;
        }
    }
    return false;
}

void Writer::write_row(const Row &row) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out_.put(dialect_.delimiter);
        const std::string &field = row[i];
        // A lone empty field would read back as a blank line
        bool quote = needs_quoting(field) || (row.size() == 1 && field.empty());
        if (!quote) {
            out_ << field;
            continue;
        }
        out_.put(dialect_.quote);
        for (char c : field) {
            if (c == dialect_.quote) out_.put(c);
            out_.put(c);
        }
        out_.put(dialect_.quote);
    }
    out_ << dialect_.line_terminator;
    if (!out_) {
        throw errors::IOError("Failed to write record");
    }
}

} // namespace csv
