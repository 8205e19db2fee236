#include "tradecli/validators.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string_view>

#include "tradecli/errors.hpp"

namespace {

static std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static bool tryParseInt(std::string_view s, int& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < static_cast<long long>(std::numeric_limits<int>::min()) || v > static_cast<long long>(std::numeric_limits<int>::max())) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

static bool tryParseDouble(std::string_view s, double& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

} // namespace

namespace tradecli {

int positiveInt(const std::string& raw) {
    int value = 0;
    if (!tryParseInt(raw, value) || value <= 0) {
        throw ValidationError(raw + " is invalid for this parameter, should be a positive integer value");
    }
    return value;
}

namespace converters {

Converter string() {
    return [](const std::string& raw) -> OptionValue { return raw; };
}

Converter integer() {
    return [](const std::string& raw) -> OptionValue {
        int value = 0;
        if (!tryParseInt(raw, value)) throw ValidationError("invalid int value: '" + raw + "'");
        return value;
    };
}

Converter floating() {
    return [](const std::string& raw) -> OptionValue {
        double value = 0.0;
        if (!tryParseDouble(raw, value)) throw ValidationError("invalid float value: '" + raw + "'");
        return value;
    };
}

Converter positiveInteger() {
    return [](const std::string& raw) -> OptionValue { return positiveInt(raw); };
}

} // namespace converters

} // namespace tradecli
