// sift -- select files by include/exclude glob patterns.
//
//     sift -i '**/*.cpp' -x 'build/**' src      # walk src/
//     git ls-files | sift --stdin -i '**/*.hpp'  # filter an explicit list
//     sift -c sift.toml                          # patterns from a config file
//
// Selected paths go to stdout, one per line. Diagnostics go to stderr.

#include <sift/config.hpp>
#include <sift/filter.hpp>
#include <sift/log.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sift;

static const char* kUsage =
    "usage: sift [options] [ROOT]\n"
    "  -i, --include PATTERN   add an include pattern (repeatable)\n"
    "  -x, --exclude PATTERN   add an exclude pattern (repeatable)\n"
    "  -c, --config FILE       load a TOML config file\n"
    "      --stdin             filter paths read from stdin instead of walking\n"
    "  -v, --verbose           debug logging\n"
    "  -q, --quiet             only log errors\n"
    "  -h, --help              show this help\n";

struct Options {
    std::vector<std::string> includes;
    std::vector<std::string> excludes;
    std::string config_path;
    std::string root;
    bool from_stdin = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return SiftError{SiftError::InvalidArg,
                    "missing value for " + flag, kUsage};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "-i" || arg == "--include") {
            auto v = next(arg);
            SIFT_TRY(v);
            opts.includes.push_back(v.value());
        } else if (arg == "-x" || arg == "--exclude") {
            auto v = next(arg);
            SIFT_TRY(v);
            opts.excludes.push_back(v.value());
        } else if (arg == "-c" || arg == "--config") {
            auto v = next(arg);
            SIFT_TRY(v);
            opts.config_path = v.value();
        } else if (arg == "--stdin") {
            opts.from_stdin = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return SiftError{SiftError::InvalidArg,
                "unknown option: " + arg, kUsage};
        } else if (opts.root.empty()) {
            opts.root = arg;
        } else {
            return SiftError{SiftError::InvalidArg,
                "more than one ROOT given: " + arg, kUsage};
        }
    }
    return Result<Options>::ok(std::move(opts));
}

// Global config is optional; an explicit --config file must exist.
static Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        SIFT_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (!opts.config_path.empty()) {
        auto l = Config::load(opts.config_path);
        SIFT_TRY(l);
        local = std::move(l).value();
    }

    Config cfg = Config::effective(global, local);

    // Command line goes on top
    cfg.filter.includes.insert(cfg.filter.includes.end(),
                               opts.includes.begin(), opts.includes.end());
    cfg.filter.excludes.insert(cfg.filter.excludes.end(),
                               opts.excludes.begin(), opts.excludes.end());
    if (!opts.root.empty()) cfg.filter.root = opts.root;
    if (opts.verbose) cfg.logging.level = log::Debug;
    if (opts.quiet) cfg.logging.level = log::Error;

    return Result<Config>::ok(std::move(cfg));
}

static Result<Selection> run(const Config& cfg, bool from_stdin) {
    if (cfg.filter.includes.empty()) {
        log::warn("no include patterns given, nothing will be selected");
    }

    if (!from_stdin) {
        log::debug("root: %s", cfg.filter.root.c_str());
        return sift::find(cfg.filter.root, cfg.filter.includes, cfg.filter.excludes);
    }

    std::vector<std::string> paths;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) paths.push_back(line);
    }
    log::debug("read %zu paths from stdin", paths.size());
    return Result<Selection>::ok(
        filter_files(paths, cfg.filter.includes, cfg.filter.excludes));
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }
    if (opts.value().help) {
        std::cout << kUsage;
        return 0;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        log::report(log::Error, cfg.error().format());
        return 1;
    }

    log::set_level(cfg.value().logging.level);
    if (cfg.value().log_color_set) log::set_color_enabled(cfg.value().logging.color);

    auto sel = run(cfg.value(), opts.value().from_stdin);
    if (sel.is_err()) {
        log::report(log::Error, sel.error().format());
        return 1;
    }

    for (const auto& err : sel.value().pattern_errors) {
        log::report(log::Warn, err.format());
    }
    for (const auto& p : sel.value().paths) {
        std::cout << p << "\n";
    }
    return 0;
}
