#include "parse_utils.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>
#include <utility>

namespace pathmon {

namespace {
bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool to_ull(const std::string& s, unsigned long long& out) {
    if (!all_digits(s))
        return false;
    try {
        out = std::stoull(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}
} // namespace

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}


size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    static const std::pair<const char*, unsigned long long> units[] = {
        {"kb", 1ull << 10}, {"mb", 1ull << 20}, {"gb", 1ull << 30}, {"tb", 1ull << 40},
        {"pb", 1ull << 50}, {"k", 1ull << 10},  {"m", 1ull << 20},  {"g", 1ull << 30},
        {"t", 1ull << 40},  {"p", 1ull << 50},  {"b", 1ull}};
    ok = false;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    unsigned long long mult = 1;
    for (const auto& [suffix, factor] : units) {
        std::string suf = suffix;
        if (val.size() > suf.size() &&
            val.compare(val.size() - suf.size(), suf.size(), suf) == 0) {
            mult = factor;
            val.erase(val.size() - suf.size());
            break;
        }
    }
    unsigned long long base = 0;
    if (!to_ull(val, base) || base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}


std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = 's';
    std::string num = value;
    if (!std::isdigit(static_cast<unsigned char>(value.back()))) {
        unit = value.back();
        num.pop_back();
    }
    unsigned long long n = 0;
    if (!to_ull(num, n) || n > static_cast<unsigned long long>(LLONG_MAX) / (7 * 24 * 3600))
        return std::chrono::seconds(0);
    long long secs = static_cast<long long>(n);
    switch (unit) {
    case 's':
        break;
    case 'm':
        secs *= 60;
        break;
    case 'h':
        secs *= 3600;
        break;
    case 'd':
        secs *= 24 * 3600;
        break;
    case 'w':
        secs *= 7 * 24 * 3600;
        break;
    default:
        return std::chrono::seconds(0);
    }
    ok = true;
    return std::chrono::seconds(secs);
}

} // namespace pathmon
