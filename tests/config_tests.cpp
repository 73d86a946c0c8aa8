#include "test_common.hpp"

using namespace pathmon;

namespace {
fs::path write_file(const std::string& name, const std::string& text) {
    fs::path file = fs::temp_directory_path() / name;
    std::ofstream ofs(file);
    ofs << text;
    return file;
}
} // namespace

TEST_CASE("YAML config loading") {
    fs::path cfg = write_file("pathmon_cfg.yaml", "log-level: DEBUG\n"
                                                  "json-log: yes\n"
                                                  "max-log-size: 1M\n"
                                                  "paths:\n"
                                                  "  - /srv/data\n"
                                                  "  - /srv/logs\n");
    ConfigData data;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), data, err));
    REQUIRE(data.opts["--log-level"] == "DEBUG");
    REQUIRE(data.opts["--json-log"] == "yes");
    REQUIRE(data.opts["--max-log-size"] == "1M");
    REQUIRE(data.opts.count("--paths") == 0);
    REQUIRE(data.paths == std::vector<std::string>{"/srv/data", "/srv/logs"});
    fs::remove(cfg);
}

TEST_CASE("YAML config categories") {
    fs::path cfg = write_file("pathmon_cfg_cat.yaml", "Logging:\n"
                                                      "  log-level: WARNING\n"
                                                      "  log-rotate: 3\n"
                                                      "Basics:\n"
                                                      "  max-runtime: 5m\n"
                                                      "paths: /srv/single\n");
    ConfigData data;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), data, err));
    REQUIRE(data.opts["--log-level"] == "WARNING");
    REQUIRE(data.opts["--log-rotate"] == "3");
    REQUIRE(data.opts["--max-runtime"] == "5m");
    REQUIRE(data.paths == std::vector<std::string>{"/srv/single"});
    fs::remove(cfg);
}

TEST_CASE("YAML config rejects bad paths") {
    fs::path cfg = write_file("pathmon_cfg_bad.yaml", "paths:\n  nested: /srv\n");
    ConfigData data;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), data, err));
    REQUIRE(err == "'paths' must be a list of strings");
    fs::remove(cfg);
}

TEST_CASE("YAML config root must be a map") {
    fs::path cfg = write_file("pathmon_cfg_list.yaml", "- a\n- b\n");
    ConfigData data;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), data, err));
    REQUIRE(err == "Root YAML node is not a map");
    fs::remove(cfg);
}

TEST_CASE("JSON config loading") {
    fs::path cfg = write_file("pathmon_cfg.json", "{\n"
                                                  "  \"log-rotate\": 4,\n"
                                                  "  \"compress-logs\": true,\n"
                                                  "  \"paths\": [\"/srv/a\", \"/srv/b\"]\n"
                                                  "}");
    ConfigData data;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), data, err));
    REQUIRE(data.opts["--log-rotate"] == "4");
    REQUIRE(data.opts["--compress-logs"] == "true");
    REQUIRE(data.paths == std::vector<std::string>{"/srv/a", "/srv/b"});
    fs::remove(cfg);
}

TEST_CASE("JSON config categories") {
    fs::path cfg = write_file("pathmon_cfg_cat.json", "{\n"
                                                      "  \"Logging\": {\n"
                                                      "    \"log-level\": \"DEBUG\",\n"
                                                      "    \"syslog\": false\n"
                                                      "  }\n"
                                                      "}");
    ConfigData data;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), data, err));
    REQUIRE(data.opts["--log-level"] == "DEBUG");
    REQUIRE(data.opts["--syslog"] == "false");
    REQUIRE(data.paths.empty());
    fs::remove(cfg);
}

TEST_CASE("JSON config rejects bad paths") {
    fs::path cfg = write_file("pathmon_cfg_bad.json", "{\"paths\": [\"/srv\", 3]}");
    ConfigData data;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), data, err));
    REQUIRE(err == "'paths' must be a list of strings");
    fs::remove(cfg);
}

TEST_CASE("Malformed JSON reports a parse error") {
    fs::path cfg = write_file("pathmon_cfg_broken.json", "{\"paths\": [");
    ConfigData data;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), data, err));
    REQUIRE_FALSE(err.empty());
    fs::remove(cfg);
}

TEST_CASE("Missing config file") {
    ConfigData data;
    std::string err;
    fs::path missing = fs::temp_directory_path() / "pathmon_no_such_config.yaml";
    fs::remove(missing);
    REQUIRE_FALSE(load_yaml_config(missing.string(), data, err));
    REQUIRE(err == "Failed to open file");
}

TEST_CASE("load_config_file picks the format from the extension") {
    fs::path json = write_file("pathmon_cfg_ext.json", "{\"paths\": \"/srv/json\"}");
    fs::path yaml = write_file("pathmon_cfg_ext.yml", "paths: [/srv/yaml]\n");
    ConfigData from_json;
    ConfigData from_yaml;
    std::string err;
    REQUIRE(load_config_file(json.string(), from_json, err));
    REQUIRE(load_config_file(yaml.string(), from_yaml, err));
    REQUIRE(from_json.paths == std::vector<std::string>{"/srv/json"});
    REQUIRE(from_yaml.paths == std::vector<std::string>{"/srv/yaml"});
    fs::remove(json);
    fs::remove(yaml);
}
