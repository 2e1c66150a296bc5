#pragma once
#include "logger.hpp"
#include "scanner.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kushn {

// Settings gathered from the command line. The library itself never reads
// these; main() passes the values on explicitly.
struct Options {
    std::filesystem::path root;
    std::string outputName;
    std::optional<std::filesystem::path> ignoreFile;
    std::vector<std::string> excludes;
    TraversalPolicy policy = TraversalPolicy::Strict;
    LogLevel logLevel = LogLevel::Warn;
    std::string logFile;
    bool showHelp = false;
    bool showVersion = false;
    std::string usage;
};

// Throws boost::program_options::error on malformed arguments.
Options parse_options(int argc, const char* const argv[]);

// Rules from the ignore file (the explicit one, or <root>/.kushnignore if it
// exists) followed by the --exclude patterns.
std::vector<std::string> collect_ignore_rules(const Options& options);

} // namespace kushn
