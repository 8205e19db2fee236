#ifndef TRADECLI_PARSED_ARGS_HPP
#define TRADECLI_PARSED_ARGS_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "option.hpp"
#include "schema.hpp"
#include "timerange.hpp"

namespace tradecli {

// Immutable destination -> value namespace produced by a parse.
class ParsedArgs {
public:
    ParsedArgs() = default;
    ParsedArgs(std::map<std::string, OptionValue> values, std::string command, Handler handler)
        : values_(std::move(values)), command_(std::move(command)), handler_(std::move(handler)) {}

    // Selected subcommand, empty when none was given.
    [[nodiscard]] const std::string& command() const { return command_; }
    [[nodiscard]] const Handler& handler() const { return handler_; }

    // True if the destination belongs to the parsed scopes, even when its value is None.
    [[nodiscard]] bool contains(const std::string& dest) const { return values_.find(dest) != values_.end(); }

    // True if the destination holds a value other than None.
    [[nodiscard]] bool has(const std::string& dest) const {
        const auto it = values_.find(dest);
        return it != values_.end() && !std::holds_alternative<std::monostate>(it->second);
    }

    // Throws std::out_of_range for an unknown destination.
    [[nodiscard]] const OptionValue& value(const std::string& dest) const {
        const auto it = values_.find(dest);
        if (it == values_.end()) throw std::out_of_range("unknown destination: " + dest);
        return it->second;
    }

    // Throws std::bad_variant_access when the stored type differs (including None).
    template <typename T>
    [[nodiscard]] const T& get(const std::string& dest) const {
        return std::get<T>(value(dest));
    }

    template <typename T>
    [[nodiscard]] std::optional<T> find(const std::string& dest) const {
        const auto it = values_.find(dest);
        if (it == values_.end()) return std::nullopt;
        if (const auto* v = std::get_if<T>(&it->second)) return *v;
        return std::nullopt;
    }

    [[nodiscard]] const std::map<std::string, OptionValue>& values() const { return values_; }

    // Returns a copy with one destination replaced.
    [[nodiscard]] ParsedArgs withValue(const std::string& dest, OptionValue value) const {
        ParsedArgs out = *this;
        out.values_[dest] = std::move(value);
        return out;
    }

    // Resolves the "timerange" destination. Throws ParseError for a malformed expression.
    [[nodiscard]] TimeRange timerange() const { return parseTimeRange(find<std::string>("timerange")); }

private:
    std::map<std::string, OptionValue> values_;
    std::string command_;
    Handler handler_;
};

} // namespace tradecli

#endif // TRADECLI_PARSED_ARGS_HPP
