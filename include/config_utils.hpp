#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

namespace pathmon {

/**
 * @brief Options and watched paths read from a configuration file.
 *
 * Option keys are stored with a leading `--` so they can be checked against
 * the command line flags directly.
 */
struct ConfigData {
    std::map<std::string, std::string> opts;
    std::vector<std::string> paths;
};

/**
 * @brief Load configuration options from a YAML file.
 *
 * The root node must be a map. A `paths` entry may be a sequence of path
 * strings or a single string; every other scalar entry becomes an option.
 * Nested maps are flattened one level deep.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param cfg   Receives the options and paths found.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, ConfigData& cfg, std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout as @ref load_yaml_config with a JSON object at the root.
 */
bool load_json_config(const std::string& path, ConfigData& cfg, std::string& error);

/**
 * @brief Load a configuration file, picking the format from its extension.
 *
 * `.json` selects JSON; anything else is read as YAML.
 */
bool load_config_file(const std::string& path, ConfigData& cfg, std::string& error);

} // namespace pathmon

#endif // CONFIG_UTILS_HPP
