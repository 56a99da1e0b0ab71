#include "parse_utils.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

long parse_long(const std::string& value, long min, long max, bool& ok) {
    ok = false;
    size_t used = 0;
    long v = 0;
    try {
        v = std::stol(value, &used);
    } catch (const std::logic_error&) {
        return 0;
    }
    if (used != value.size() || v < min || v > max)
        return 0;
    ok = true;
    return v;
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = lowercase(value);
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lowercase(value);
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    unsigned long long mult = 1;
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("tb")) {
        mult = 1024ull * 1024 * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("b")) {
        val.pop_back();
    }
    if (val.empty() || !std::all_of(val.begin(), val.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; }))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}
