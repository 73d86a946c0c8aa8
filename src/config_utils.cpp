#include "config_utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace pathmon {

namespace {
bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || !(node.IsScalar() || node.IsNull()))
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars keep their literal spelling, so `yes` and `1` reach the option
    // parser unchanged.
    out = node.Scalar();
    return true;
}

bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool read_yaml_paths(const YAML::Node& node, std::vector<std::string>& paths,
                     std::string& error) {
    if (node.IsScalar()) {
        paths.push_back(node.Scalar());
        return true;
    }
    if (node.IsNull())
        return true;
    if (!node.IsSequence()) {
        error = "'paths' must be a list of strings";
        return false;
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            error = "'paths' must be a list of strings";
            return false;
        }
        paths.push_back(item.Scalar());
    }
    return true;
}

bool read_json_paths(const nlohmann::json& node, std::vector<std::string>& paths,
                     std::string& error) {
    if (node.is_string()) {
        paths.push_back(node.get<std::string>());
        return true;
    }
    if (node.is_null())
        return true;
    if (!node.is_array()) {
        error = "'paths' must be a list of strings";
        return false;
    }
    for (const auto& item : node) {
        if (!item.is_string()) {
            error = "'paths' must be a list of strings";
            return false;
        }
        paths.push_back(item.get<std::string>());
    }
    return true;
}
} // namespace

bool load_yaml_config(const std::string& path, ConfigData& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (key_name == "paths") {
                if (!read_yaml_paths(node, cfg.paths, error))
                    return false;
            } else if (node.IsMap()) {
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    if (!sub->first.IsScalar())
                        continue;
                    std::string s;
                    if (to_string_value(sub->second, s))
                        cfg.opts["--" + sub->first.as<std::string>()] = s;
                }
            } else {
                std::string s;
                if (to_string_value(node, s))
                    cfg.opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigData& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            const std::string key_name = it.key();
            if (key_name == "paths") {
                if (!read_json_paths(val, cfg.paths, error))
                    return false;
            } else if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    std::string s;
                    if (to_string_value(sub.value(), s))
                        cfg.opts["--" + sub.key()] = s;
                }
            } else {
                std::string s;
                if (to_string_value(val, s))
                    cfg.opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_config_file(const std::string& path, ConfigData& cfg, std::string& error) {
    if (std::filesystem::path(path).extension() == ".json")
        return load_json_config(path, cfg, error);
    return load_yaml_config(path, cfg, error);
}

} // namespace pathmon
