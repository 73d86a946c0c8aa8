#include "test_common.hpp"
#include <stdexcept>

using namespace pathmon;

namespace {
fs::path write_config(const std::string& name, const std::string& text) {
    fs::path file = fs::temp_directory_path() / name;
    std::ofstream ofs(file);
    ofs << text;
    return file;
}
} // namespace

TEST_CASE("parse_options defaults") {
    const char* argv[] = {"prog"};
    Options opts = parse_options(1, const_cast<char**>(argv));
    REQUIRE(opts.paths.empty());
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE(opts.logging.log_rotate == 1);
    REQUIRE(opts.logging.max_log_size == 0);
    REQUIRE_FALSE(opts.resolve_only);
    REQUIRE(opts.runtime_limit == std::chrono::seconds(0));
    REQUIRE(opts.config_file.empty());
}

TEST_CASE("parse_options positional paths after switches") {
    const char* argv[] = {"prog", "--resolve", "/srv/a", "-g", "/srv/b"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.resolve_only);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.paths == std::vector<fs::path>{"/srv/a", "/srv/b"});
    REQUIRE(opts.cli_paths == opts.paths);
}

TEST_CASE("parse_options logging flags") {
    const char* argv[] = {"prog",           "--log-file", "pm.log", "-L",           "warn",
                          "--json-log",     "--compress-logs",      "--max-log-size", "2M",
                          "--log-rotate=5", "--syslog",   "--syslog-facility",       "8"};
    Options opts = parse_options(13, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_file == "pm.log");
    REQUIRE(opts.logging.log_level == LogLevel::WARNING);
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.logging.max_log_size == 2 * 1024 * 1024);
    REQUIRE(opts.logging.log_rotate == 5);
    REQUIRE(opts.logging.use_syslog);
    REQUIRE(opts.logging.syslog_facility == 8);
}

TEST_CASE("parse_options runtime limit units") {
    const char* argv[] = {"prog", "--max-runtime", "2m"};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(opts.runtime_limit == std::chrono::minutes(2));
}

TEST_CASE("parse_options rejects invalid values") {
    SECTION("unknown option") {
        const char* argv[] = {"prog", "--interval", "5"};
        REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);
    }
    SECTION("zero runtime") {
        const char* argv[] = {"prog", "--max-runtime", "0"};
        REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);
    }
    SECTION("bad rotation count") {
        const char* argv[] = {"prog", "--log-rotate", "0"};
        REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);
    }
    SECTION("bad size") {
        const char* argv[] = {"prog", "--max-log-size", "lots"};
        REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);
    }
    SECTION("bad level") {
        const char* argv[] = {"prog", "--log-level", "LOUD"};
        REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);
    }
    SECTION("missing config") {
        const char* argv[] = {"prog", "--config-yaml", "/nonexistent/pathmon.yaml"};
        REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);
    }
}

TEST_CASE("parse_options reads a YAML config") {
    fs::path cfg = write_config("pathmon_opts.yaml", "Logging:\n"
                                                     "  log-level: DEBUG\n"
                                                     "  compress-logs: yes\n"
                                                     "max-runtime: 30\n"
                                                     "paths:\n"
                                                     "  - /cfg/one\n");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "-y", cfg_str.c_str(), "/cli/two"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.config_file == cfg);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.runtime_limit == std::chrono::seconds(30));
    REQUIRE(opts.paths == std::vector<fs::path>{"/cfg/one", "/cli/two"});
    REQUIRE(opts.cli_paths == std::vector<fs::path>{"/cli/two"});
    fs::remove(cfg);
}

TEST_CASE("parse_options command line overrides config") {
    fs::path cfg = write_config("pathmon_opts.json",
                                "{\"log-level\": \"ERROR\", \"log-rotate\": 2}");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "--config-json", cfg_str.c_str(), "--log-level", "INFO"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE(opts.logging.log_rotate == 2);
    fs::remove(cfg);
}

TEST_CASE("parse_options rejects unknown config keys") {
    fs::path cfg = write_config("pathmon_opts_bad.yaml", "interval: 5\n");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "--config-yaml", cfg_str.c_str()};
    REQUIRE_THROWS_WITH(parse_options(3, const_cast<char**>(argv)),
                        "Unknown option in config: --interval");
    fs::remove(cfg);

    fs::path nested = write_config("pathmon_opts_nested.yaml", "config-yaml: other.yaml\n");
    std::string nested_str = nested.string();
    const char* argv2[] = {"prog", "--config-yaml", nested_str.c_str()};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv2)), std::runtime_error);
    fs::remove(nested);
}

TEST_CASE("reload_config_paths picks up edits") {
    fs::path cfg = write_config("pathmon_reload.yaml", "paths: [/cfg/old]\n");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "-y", cfg_str.c_str(), "/cli/keep"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.paths == std::vector<fs::path>{"/cfg/old", "/cli/keep"});

    write_config("pathmon_reload.yaml", "paths: [/cfg/new, /cfg/extra]\n");
    REQUIRE(reload_config_paths(opts) ==
            std::vector<fs::path>{"/cfg/new", "/cfg/extra", "/cli/keep"});

    fs::remove(cfg);
    REQUIRE_THROWS_AS(reload_config_paths(opts), std::runtime_error);
}
