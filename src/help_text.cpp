#include "help_text.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace pathmon {

namespace {
struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}
} // namespace

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--resolve", "-r", "", "Print the resolved paths and exit", "Basics"},
        {"--max-runtime", "", "<N[s|m|h|d|w]>", "Exit after given runtime", "Basics"},
        {"--version", "-V", "", "Print the version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--config-yaml", "-y", "<file>", "Load options and paths from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options and paths from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "Write log lines to this file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-g", "", "Same as --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON objects", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size", "Logging"},
        {"--log-rotate", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Also log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    std::cout << "pathmon - Link-aware path monitor\n";
    std::cout << "Resolves every symbolic link and junction along the given paths and\n";
    std::cout << "reports whenever the set of real locations changes.\n";
    std::cout << "On POSIX systems SIGHUP reloads the paths from the config file.\n\n";
    std::cout << "Usage: " << prog << " [options] <path>...\n\n";
    for (const char* cat : {"Basics", "Config", "Logging"}) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat])
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
                      << o->desc << "\n";
        std::cout << "\n";
    }
}

} // namespace pathmon
