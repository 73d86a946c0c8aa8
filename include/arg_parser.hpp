#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pathmon {

/**
 * @brief Command line parser for `pathmon`.
 *
 * Long options take the forms `--flag`, `--opt value` and `--opt=value`.
 * Short options are mapped to their long names through @a short_map and may
 * be bundled (`-gr`) or carry a value (`-L DEBUG`, `-LDEBUG`, `-L=DEBUG`).
 * Anything not starting with a dash is positional. When @a known_flags is not
 * empty, flags outside it end up in @ref unknown_flags instead.
 */
class ArgParser {
  public:
    /**
     * @param switches Flags that never take a value, so a positional
     *        argument may follow them directly.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {})
        : known_flags_(known_flags), short_map_(short_map), switches_(switches) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) == 0)
                parse_long(arg, argc, argv, i);
            else if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1]))
                parse_short(arg, argc, argv, i);
            else
                positional_.push_back(arg);
        }
    }

    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return Last value given for @p opt, or an empty string. */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        return it != options_.end() ? it->second : std::string();
    }

    /** @return Every value given for a repeatable option, in order. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        return it != multi_options_.end() ? it->second : std::vector<std::string>{};
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

  private:
    bool accepted(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void store_flag(const std::string& key) {
        if (accepted(key))
            flags_.insert(key);
        else
            unknown_flags_.push_back(key);
    }

    void store_value(const std::string& key, const std::string& val) {
        if (!accepted(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

    void parse_long(const std::string& arg, int argc, char* argv[], int& i) {
        size_t eq = arg.find('=');
        if (eq != std::string::npos)
            store_value(arg.substr(0, eq), arg.substr(eq + 1));
        else if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0 &&
                 takes_value(arg))
            store_value(arg, argv[++i]);
        else
            store_flag(arg);
    }

    // "-abc", "-Lvalue", "-L=value" or "-L value".
    void parse_short(const std::string& arg, int argc, char* argv[], int& i) {
        size_t eq = arg.find('=');
        std::string cluster = arg.substr(1, eq == std::string::npos ? std::string::npos : eq - 1);
        std::string attached = eq == std::string::npos ? std::string() : arg.substr(eq + 1);
        for (size_t j = 0; j < cluster.size(); ++j) {
            auto it = short_map_.find(cluster[j]);
            if (it == short_map_.end())
                return;
            const std::string& key = it->second;
            bool last = j + 1 == cluster.size();
            if (!last && !short_map_.count(cluster[j + 1])) {
                store_value(key, cluster.substr(j + 1) + attached);
                return;
            }
            if (last) {
                if (!attached.empty()) {
                    store_value(key, attached);
                    return;
                }
                if (i + 1 < argc && argv[i + 1][0] != '-' && takes_value(key)) {
                    store_value(key, argv[++i]);
                    return;
                }
            }
            store_flag(key);
        }
    }

    bool takes_value(const std::string& key) const { return !switches_.count(key); }

  private:
    std::set<std::string> flags_;
    std::map<std::string, std::string> options_;
    std::map<std::string, std::vector<std::string>> multi_options_;
    std::vector<std::string> positional_;
    std::vector<std::string> unknown_flags_;
    std::set<std::string> known_flags_;
    std::map<char, std::string> short_map_;
    std::set<std::string> switches_;
};

} // namespace pathmon

#endif // ARG_PARSER_HPP
