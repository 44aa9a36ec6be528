#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty())
        return 0;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val.size() > 1 && val.back() == 'b' &&
        !std::isdigit(static_cast<unsigned char>(val[val.size() - 2])))
        val.pop_back(); // "kb" -> "k"
    else if (!val.empty() && val.back() == 'b')
        val.pop_back();
    unsigned long long mult = 1;
    if (!val.empty()) {
        switch (val.back()) {
        case 'k':
            mult = 1024ull;
            break;
        case 'm':
            mult = 1024ull * 1024;
            break;
        case 'g':
            mult = 1024ull * 1024 * 1024;
            break;
        default:
            break;
        }
        if (mult != 1)
            val.pop_back();
    }
    bool digits_ok = false;
    unsigned long long base = parse_size_t(val, 0, SIZE_MAX, digits_ok);
    if (!digits_ok || base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

LogLevel parse_log_level(const std::string& value, bool& ok) {
    std::string val = value;
    for (auto& c : val)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    ok = true;
    if (val == "DEBUG")
        return LogLevel::DEBUG;
    if (val == "INFO")
        return LogLevel::INFO;
    if (val == "WARNING" || val == "WARN")
        return LogLevel::WARNING;
    if (val == "ERROR")
        return LogLevel::ERR;
    ok = false;
    return LogLevel::INFO;
}
