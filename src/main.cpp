#include "cli.hpp"
#include "logger.hpp"
#include "manifest.hpp"
#include <boost/program_options/errors.hpp>
#include <iostream>

#ifndef KUSHN_VERSION
#define KUSHN_VERSION "0.1.0"
#endif

int main(int argc, char* argv[]) {
    kushn::Options opts;
    try {
        opts = kushn::parse_options(argc, argv);
    } catch (const boost::program_options::error& ex) {
        std::cerr << "Error: " << ex.what() << "\n"
                  << "Try 'kushn --help' for more information.\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    if (opts.showHelp) {
        std::cout << opts.usage;
        return 0;
    }
    if (opts.showVersion) {
        std::cout << "kushn " << KUSHN_VERSION << "\n";
        return 0;
    }

    if (!kushn::Logger::instance().init(opts.logFile, opts.logLevel)) {
        std::cerr << "Warning: cannot open log file " << opts.logFile << "\n";
    }

    try {
        auto rules = kushn::collect_ignore_rules(opts);
        auto result = kushn::generate_manifest(opts.root, rules, opts.outputName, opts.policy);

        if (!result.failures.empty()) {
            std::cerr << "Warning: " << result.failures.size()
                      << " directory entries could not be read and were skipped\n";
        }
        std::cout << "File hashes generated and saved to " << opts.outputName << ".\n";
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
