#pragma once

#include "report.hpp"
#include <functional>

namespace cli {

// Builds the reporter once the log level is known
using ReporterFactory = std::function<report::Reporter(report::Level)>;

// Resolves options from argv, runs tokenize or detokenize and returns the
// process exit status: 0 on success (or --help), 1 after logging
// "An error occurred: <what>" for any failure.
int run(int argc, char *argv[],
        const ReporterFactory &make_reporter = report::console);

} // namespace cli
