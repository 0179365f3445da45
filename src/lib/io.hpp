#pragma once

#include <fstream>
#include <string>

namespace io {

bool file_exists(const std::string &path);

// Opens path for reading in binary mode. Throws errors::NotFoundError if the
// file does not exist, errors::IOError if it exists but cannot be opened.
std::ifstream open_input(const std::string &path);

// Opens (truncating) path for writing in binary mode; errors::IOError on
// failure
std::ofstream open_output(const std::string &path);

// Flushes and closes, throwing errors::IOError if any write failed
void close_output(std::ofstream &file, const std::string &path);

// Unused sibling name for path: "<path>.tmp.<pid>.<random hex>"
std::string temp_path_for(const std::string &path);

// Renames from over to. Both must be on the same filesystem; from is removed
// if the rename fails.
void replace_file(const std::string &from, const std::string &to);

std::string read_file(const std::string &path);
void write_file(const std::string &path, const std::string &contents);

} // namespace io
