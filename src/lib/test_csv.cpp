#include "csv.hpp"
#include "errors.hpp"
#include <cassert>
#include <sstream>

int main() {
    // Test 1: Plain rows, LF terminator
    {
        std::istringstream in("id,name\n1,Alice\n2,Bob\n");
        csv::Reader reader(in);
        csv::Row row;

        assert(reader.read_row(row));
        assert((row == csv::Row{"id", "name"}));
        assert(reader.line_terminator() == "\n");
        assert(reader.read_row(row));
        assert((row == csv::Row{"1", "Alice"}));
        assert(reader.read_row(row));
        assert((row == csv::Row{"2", "Bob"}));
        assert(reader.line() == 3);
        assert(!reader.read_row(row));
    }

    // Test 2: CRLF terminator is detected, last row without terminator
    {
        std::istringstream in("a,b\r\nx,y");
        csv::Reader reader(in);
        csv::Row row;

        assert(reader.read_row(row));
        assert(reader.line_terminator() == "\r\n");
        assert(reader.read_row(row));
        assert((row == csv::Row{"x", "y"}));
        assert(!reader.read_row(row));
    }

    // Test 3: Quoted fields with delimiter, escaped quote and newline
    {
        std::istringstream in(
            "\"Smith, John\",\"say \"\"hi\"\"\",\"two\nlines\"\nnext,row\n");
        csv::Reader reader(in);
        csv::Row row;

        assert(reader.read_row(row));
        assert(row.size() == 3);
        assert(row[0] == "Smith, John");
        assert(row[1] == "say \"hi\"");
        assert(row[2] == "two\nlines");
        assert(reader.read_row(row));
        assert(reader.line() == 3);
        assert((row == csv::Row{"next", "row"}));
    }

    // Test 4: Blank line yields an empty row, empty fields are kept
    {
        std::istringstream in("a,,c\n\n,\n");
        csv::Reader reader(in);
        csv::Row row;

        assert(reader.read_row(row));
        assert((row == csv::Row{"a", "", "c"}));
        assert(reader.read_row(row));
        assert(row.empty());
        assert(reader.read_row(row));
        assert((row == csv::Row{"", ""}));
        assert(!reader.read_row(row));
    }

    // Test 5: Unterminated quote is an I/O error
    {
        std::istringstream in("a,\"never closed\n");
        csv::Reader reader(in);
        csv::Row row;
        bool thrown = false;
        try {
            reader.read_row(row);
        } catch (const errors::IOError &) {
            thrown = true;
        }
        assert(thrown);
    }

    // Test 6: Custom delimiter
    {
        csv::Dialect dialect;
        dialect.delimiter = ';';
        std::istringstream in("a;b,c\n");
        csv::Reader reader(in, dialect);
        csv::Row row;

        assert(reader.read_row(row));
        assert((row == csv::Row{"a", "b,c"}));
    }

    // Test 7: Writer quotes only when needed
    {
        std::ostringstream out;
        csv::Dialect dialect;
        dialect.line_terminator = "\n";
        csv::Writer writer(out, dialect);

        writer.write_row({"plain", "a,b", "say \"hi\"", "two\nlines", ""});
        writer.write_row({""});
        assert(out.str() ==
               "plain,\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\",\n\"\"\n");
    }

    // Test 8: Writer with ';' leaves commas alone
    {
        std::ostringstream out;
        csv::Dialect dialect;
        dialect.delimiter = ';';
        csv::Writer writer(out, dialect);

        writer.write_row({"a,b", "c;d"});
        assert(out.str() == "a,b;\"c;d\"\r\n");
    }

    // Test 9: Tricky row survives a write/read cycle
    {
        csv::Row original{"", "\"", "x,y", "line\r\nbreak", " padded "};
        std::stringstream buffer;
        csv::Writer writer(buffer);
        writer.write_row(original);

        csv::Reader reader(buffer);
        csv::Row row;
        assert(reader.read_row(row));
        assert(row == original);
        assert(!reader.read_row(row));
    }

    return 0;
}
