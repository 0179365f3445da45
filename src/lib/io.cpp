#include "io.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace io {

bool file_exists(const std::string &path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::ifstream open_input(const std::string &path) {
    if (!file_exists(path)) {
        throw errors::NotFoundError(path);
    }
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw errors::IOError("Failed to open " + path + " for reading");
    }
    return file;
}

std::ofstream open_output(const std::string &path) {
    std::ofstream file(path,
                       std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        throw errors::IOError("Failed to open " + path + " for writing");
    }
    return file;
}

void close_output(std::ofstream &file, const std::string &path) {
    file.flush();
    if (!file) {
        throw errors::IOError("Failed to write to " + path);
    }
    file.close();
    if (file.fail()) {
        throw errors::IOError("Failed to close " + path);
    }
}

std::string temp_path_for(const std::string &path) {
    std::random_device rd;
    for (;;) {
        std::ostringstream oss;
        oss << path << ".tmp." << ::getpid() << '.' << std::hex << rd();
        std::error_code ec;
        if (!std::filesystem::exists(oss.str(), ec)) {
            return oss.str();
        }
    }
}

void replace_file(const std::string &from, const std::string &to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(from, ec);
        throw errors::IOError("Failed to replace " + to + ": " + reason);
    }
}

std::string read_file(const std::string &path) {
    std::ifstream file = open_input(path);
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw errors::IOError("Failed to read from " + path);
    }
    return contents.str();
}

void write_file(const std::string &path, const std::string &contents) {
    std::ofstream file = open_output(path);
    file << contents;
    close_output(file, path);
}

} // namespace io
