#include "tradecli/timerange.hpp"

#include <array>
#include <cctype>
#include <limits>
#include <vector>

#include "tradecli/errors.hpp"

namespace {

using tradecli::RangeKind;

// A rule shape is a sequence of '-' literals and digit runs: "D8" exactly eight
// digits, "D10" exactly ten, "D+" one or more. Each digit run is captured.
struct Rule {
    std::string_view shape;
    RangeKind start;
    RangeKind stop;
    bool negativeStop; // "-D+" keeps its sign: the stop value counts lines from the end
};

// Order matters: fixed-width date rules must be tried before the open-width
// line/index rules, which would otherwise accept the same strings.
constexpr std::array<Rule, 9> kRules{{
    {"-D8", RangeKind::None, RangeKind::Date, false},
    {"D8-", RangeKind::Date, RangeKind::None, false},
    {"D8-D8", RangeKind::Date, RangeKind::Date, false},
    {"-D10", RangeKind::None, RangeKind::Date, false},
    {"D10-", RangeKind::Date, RangeKind::None, false},
    {"D10-D10", RangeKind::Date, RangeKind::Date, false},
    {"-D+", RangeKind::None, RangeKind::Line, true},
    {"D+-", RangeKind::Line, RangeKind::None, false},
    {"D+-D+", RangeKind::Index, RangeKind::Index, false},
}};

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Anchored match of the whole text against a rule shape.
bool matchShape(std::string_view shape, std::string_view text, std::vector<std::string_view>& groups) {
    groups.clear();
    std::size_t s = 0;
    std::size_t t = 0;
    while (s < shape.size()) {
        if (shape[s] == '-') {
            if (t >= text.size() || text[t] != '-') return false;
            ++s;
            ++t;
            continue;
        }

        // 'D' followed by a width or '+'.
        ++s;
        std::size_t width = 0;
        bool open = false;
        if (s < shape.size() && shape[s] == '+') {
            open = true;
            ++s;
        } else {
            while (s < shape.size() && isDigit(shape[s])) width = width * 10 + static_cast<std::size_t>(shape[s++] - '0');
        }

        const std::size_t begin = t;
        while (t < text.size() && isDigit(text[t])) ++t;
        const std::size_t len = t - begin;
        if (open ? len == 0 : len != width) return false;
        groups.push_back(text.substr(begin, len));
    }
    return t == text.size();
}

std::int64_t toInt64(std::string_view digits, const std::string& text) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    std::int64_t value = 0;
    for (const char c : digits) {
        const auto d = static_cast<std::int64_t>(c - '0');
        if (value > (kMax - d) / 10) throw tradecli::ParseError("Timerange value out of range in \"" + text + "\"", text);
        value = value * 10 + d;
    }
    return value;
}

std::int64_t resolveValue(RangeKind kind, std::string_view digits, const std::string& text) {
    if (kind == RangeKind::Date && digits.size() == 8) {
        const auto ymd = toInt64(digits, text);
        const auto epoch = tradecli::epochFromYmd(static_cast<int>(ymd / 10000),
                                                  static_cast<int>((ymd / 100) % 100),
                                                  static_cast<int>(ymd % 100));
        if (!epoch) throw tradecli::ParseError("Invalid date \"" + std::string(digits) + "\" in timerange \"" + text + "\"", text);
        return *epoch;
    }
    return toInt64(digits, text);
}

} // namespace

namespace tradecli {

std::string_view kindName(RangeKind kind) {
    switch (kind) {
        case RangeKind::None: return "none";
        case RangeKind::Date: return "date";
        case RangeKind::Line: return "line";
        case RangeKind::Index: return "index";
    }
    return "none";
}

std::string toString(const TimeRange& range) {
    return "TimeRange(" + std::string(kindName(range.startKind())) + ", " + std::string(kindName(range.stopKind())) +
           ", " + std::to_string(range.startValue()) + ", " + std::to_string(range.stopValue()) + ")";
}

std::optional<std::int64_t> epochFromYmd(int year, int month, int day) {
    static constexpr std::array<int, 12> kDaysInMonth{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) return std::nullopt;
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    const int monthDays = kDaysInMonth[static_cast<std::size_t>(month - 1)] + ((month == 2 && leap) ? 1 : 0);
    if (day > monthDays) return std::nullopt;

    // Days from 1970-01-01 in the proleptic Gregorian calendar, with March as the
    // first month of the shifted year so the leap day falls last.
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const std::int64_t days = era * 146097 + doe - 719468;
    return days * 86400;
}

TimeRange parseTimeRange(const std::optional<std::string>& text) {
    if (!text) return TimeRange{};

    std::vector<std::string_view> groups;
    for (const auto& rule : kRules) {
        if (!matchShape(rule.shape, *text, groups)) continue;

        std::size_t index = 0;
        std::int64_t startValue = 0;
        std::int64_t stopValue = 0;
        if (rule.start != RangeKind::None) startValue = resolveValue(rule.start, groups[index++], *text);
        if (rule.stop != RangeKind::None) {
            const auto value = resolveValue(rule.stop, groups[index], *text);
            stopValue = rule.negativeStop ? -value : value;
        }
        return TimeRange(rule.start, rule.stop, startValue, stopValue);
    }
    throw ParseError("Incorrect syntax for timerange \"" + *text + "\"", *text);
}

} // namespace tradecli
