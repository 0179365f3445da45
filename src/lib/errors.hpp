#pragma once

#include <stdexcept>
#include <string>

namespace errors {

// Required file is missing (input file, or mapping file when detokenizing)
class NotFoundError : public std::runtime_error {
  public:
    explicit NotFoundError(const std::string &path)
        : std::runtime_error("File not found: " + path), path_(path) {}

    const std::string &path() const { return path_; }

  private:
    std::string path_;
};

// Read/write failure on a record stream or the mapping file
class IOError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Mapping row without exactly two fields. Only raised and caught inside the
// mapping loader.
class MalformedRowError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Unknown strategy, bad command line argument or bad config value
class ConfigurationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // namespace errors
