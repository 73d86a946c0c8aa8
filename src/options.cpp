#include <algorithm>
#include <cctype>
#include <climits>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace pathmon {

namespace {
const std::set<std::string> kKnownFlags{
    "--config-yaml", "--config-json",   "--log-file", "--log-level",  "--verbose",
    "--json-log",    "--compress-logs", "--max-log-size", "--log-rotate", "--syslog",
    "--syslog-facility", "--resolve",   "--max-runtime", "--help",     "--version"};

const std::set<std::string> kSwitches{"--verbose", "--json-log", "--compress-logs",
                                      "--syslog",  "--resolve",  "--help",
                                      "--version"};

const std::map<char, std::string> kShortFlags{{'y', "--config-yaml"}, {'j', "--config-json"},
                                              {'l', "--log-file"},    {'L', "--log-level"},
                                              {'g', "--verbose"},     {'r', "--resolve"},
                                              {'h', "--help"},        {'V', "--version"}};

// Load the configuration named on the command line, if any.
ConfigData load_config(const ArgParser& parser, fs::path& config_file) {
    ConfigData cfg;
    for (const char* flag : {"--config-yaml", "--config-json"}) {
        if (!parser.has_flag(flag))
            continue;
        std::string file = parser.get_option(flag);
        if (file.empty())
            throw std::runtime_error(std::string(flag) + " requires a file");
        std::string err;
        bool loaded = std::string(flag) == "--config-yaml" ? load_yaml_config(file, cfg, err)
                                                           : load_json_config(file, cfg, err);
        if (!loaded)
            throw std::runtime_error("Failed to load config: " + err);
        config_file = file;
    }
    return cfg;
}
} // namespace

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, kKnownFlags, kShortFlags, kSwitches);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    Options opts;
    ConfigData cfg = load_config(parser, opts.config_file);
    for (const auto& kv : cfg.opts) {
        if (!kKnownFlags.count(kv.first) || kv.first == "--config-yaml" ||
            kv.first == "--config-json")
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg.opts.find(k);
        if (it == cfg.opts.end())
            return false;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "" || v == "1" || v == "true" || v == "yes";
    };
    // Command line value first, config value otherwise.
    auto value_of = [&](const std::string& k) {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg.opts.find(k);
        return it != cfg.opts.end() ? it->second : std::string();
    };
    auto given = [&](const std::string& k) { return parser.has_flag(k) || cfg.opts.count(k) > 0; };
    auto flag_set = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };

    opts.show_help = flag_set("--help");
    opts.print_version = flag_set("--version");
    opts.resolve_only = flag_set("--resolve");

    bool ok = false;
    if (given("--max-runtime")) {
        auto dur = parse_duration(value_of("--max-runtime"), ok);
        if (!ok || dur.count() < 1 || dur.count() > INT_MAX)
            throw std::runtime_error("Invalid value for --max-runtime");
        opts.runtime_limit = dur;
    }

    LoggingOptions& log = opts.logging;
    log.log_file = value_of("--log-file");
    if (flag_set("--verbose"))
        log.log_level = LogLevel::DEBUG;
    if (given("--log-level")) {
        std::string val = value_of("--log-level");
        if (val.empty())
            throw std::runtime_error("--log-level requires a value");
        if (!parse_log_level(val, log.log_level))
            throw std::runtime_error("Invalid log level: " + val);
    }
    log.json_log = flag_set("--json-log");
    log.compress_logs = flag_set("--compress-logs");
    log.use_syslog = flag_set("--syslog");
    if (given("--syslog-facility")) {
        log.syslog_facility =
            static_cast<int>(parse_size_t(value_of("--syslog-facility"), 0, INT_MAX, ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
    }
    if (given("--max-log-size")) {
        log.max_log_size = parse_bytes(value_of("--max-log-size"), 1, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (given("--log-rotate")) {
        log.log_rotate = parse_size_t(value_of("--log-rotate"), 1, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-rotate");
    }

    for (const auto& p : cfg.paths)
        opts.paths.emplace_back(p);
    for (const auto& p : parser.positional()) {
        opts.cli_paths.emplace_back(p);
        opts.paths.emplace_back(p);
    }
    return opts;
}

std::vector<fs::path> reload_config_paths(const Options& opts) {
    std::vector<fs::path> paths;
    if (!opts.config_file.empty()) {
        ConfigData cfg;
        std::string err;
        if (!load_config_file(opts.config_file.string(), cfg, err))
            throw std::runtime_error("Failed to load config: " + err);
        for (const auto& p : cfg.paths)
            paths.emplace_back(p);
    }
    paths.insert(paths.end(), opts.cli_paths.begin(), opts.cli_paths.end());
    return paths;
}

} // namespace pathmon
