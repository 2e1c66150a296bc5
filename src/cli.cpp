#include "cli.hpp"
#include "manifest.hpp"
#include <boost/program_options.hpp>
#include <sstream>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace kushn {

Options parse_options(int argc, const char* const argv[]) {
    Options opts;
    std::string root;
    std::string ignoreFile;

    po::options_description desc("Usage: kushn [options]\n\nOptions");
    desc.add_options()
        ("help,h", "show this help and exit")
        ("version", "print the version and exit")
        ("name,n", po::value<std::string>(&opts.outputName)->default_value(kDefaultManifestName),
            "output file name for the generated hashes manifest")
        ("directory,C", po::value<std::string>(&root),
            "directory to process (default: current directory)")
        ("ignore-file,i", po::value<std::string>(&ignoreFile),
            "ignore rules file (default: <directory>/.kushnignore if present)")
        ("exclude,x", po::value<std::vector<std::string>>(&opts.excludes)->composing(),
            "extra ignore pattern, may be repeated")
        ("lenient", "skip unreadable directory entries instead of failing")
        ("verbose,v", "log progress")
        ("debug", "log every visited entry")
        ("log-file", po::value<std::string>(&opts.logFile), "also append log lines to this file");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    std::ostringstream usage;
    usage << desc;
    opts.usage = usage.str();

    opts.showHelp = vm.count("help") > 0;
    opts.showVersion = vm.count("version") > 0;
    opts.root = root.empty() ? fs::current_path() : fs::path(root);
    if (!ignoreFile.empty()) {
        opts.ignoreFile = fs::path(ignoreFile);
    }
    if (vm.count("lenient")) {
        opts.policy = TraversalPolicy::Lenient;
    }
    if (vm.count("debug")) {
        opts.logLevel = LogLevel::Debug;
    } else if (vm.count("verbose")) {
        opts.logLevel = LogLevel::Info;
    }
    if (opts.outputName.empty()) {
        throw po::error("the output file name must not be empty");
    }
    return opts;
}

std::vector<std::string> collect_ignore_rules(const Options& options) {
    std::vector<std::string> rules;

    if (options.ignoreFile) {
        rules = load_ignore_file(*options.ignoreFile);
    } else {
        fs::path dotfile = options.root / kDefaultIgnoreFileName;
        std::error_code ec;
        if (fs::exists(dotfile, ec)) {
            rules = load_ignore_file(dotfile);
        }
    }

    rules.insert(rules.end(), options.excludes.begin(), options.excludes.end());
    return rules;
}

} // namespace kushn
