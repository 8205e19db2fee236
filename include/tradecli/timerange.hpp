#ifndef TRADECLI_TIMERANGE_HPP
#define TRADECLI_TIMERANGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tradecli {

enum class RangeKind {
    None,
    Date,  // epoch seconds
    Line,  // negative stop: last N lines
    Index, // absolute dataset index
};

// Normalized --timerange. A value is meaningful only when its kind is not None.
// Fields are fixed at construction.
class TimeRange {
public:
    TimeRange() = default;
    TimeRange(RangeKind startKind, RangeKind stopKind, std::int64_t startValue, std::int64_t stopValue)
        : startKind_(startKind), stopKind_(stopKind), startValue_(startValue), stopValue_(stopValue) {}

    [[nodiscard]] RangeKind startKind() const { return startKind_; }
    [[nodiscard]] RangeKind stopKind() const { return stopKind_; }
    [[nodiscard]] std::int64_t startValue() const { return startValue_; }
    [[nodiscard]] std::int64_t stopValue() const { return stopValue_; }

    bool operator==(const TimeRange& other) const {
        return startKind_ == other.startKind_ && stopKind_ == other.stopKind_ && startValue_ == other.startValue_ &&
               stopValue_ == other.stopValue_;
    }
    bool operator!=(const TimeRange& other) const { return !(*this == other); }

private:
    RangeKind startKind_{RangeKind::None};
    RangeKind stopKind_{RangeKind::None};
    std::int64_t startValue_{0};
    std::int64_t stopValue_{0};
};

std::string_view kindName(RangeKind kind);

// "TimeRange(date, none, 1525132800, 0)"
std::string toString(const TimeRange& range);

// Seconds since the epoch at 00:00:00 UTC of a YYYYMMDD day.
// Returns std::nullopt for a date that does not exist.
std::optional<std::int64_t> epochFromYmd(int year, int month, int day);

// Resolves a --timerange expression. Absent text means no restriction.
// Rules, first match wins:
//   -YYYYMMDD  YYYYMMDD-  YYYYMMDD-YYYYMMDD      calendar days (UTC)
//   -EPOCH10   EPOCH10-   EPOCH10-EPOCH10        epoch seconds
//   -N                                           last N lines (stop = -N)
//   N-                                           from line N
//   A-B                                          index span
// Throws ParseError when nothing matches.
TimeRange parseTimeRange(const std::optional<std::string>& text);

} // namespace tradecli

#endif // TRADECLI_TIMERANGE_HPP
