#ifndef TRADECLI_OPTION_HPP
#define TRADECLI_OPTION_HPP

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tradecli {

// std::monostate marks a destination that was never set and has no default.
using OptionValue = std::variant<std::monostate, bool, int, double, std::string, std::vector<std::string>>;

// Converts one raw token into a typed value. Throws ValidationError on failure.
using Converter = std::function<OptionValue(const std::string&)>;

enum class Cardinality {
    Scalar,        // --opt value, last occurrence wins
    Append,        // --opt a --opt b -> [a, b]
    StoreTrue,     // --opt -> true
    StoreFalse,    // --opt -> false
    Count,         // -vvv -> 3
    OneOrMore,     // --opt a b c -> [a, b, c]
    OptionalValue, // --opt [value], bare form stores constValue
    Version,       // prints the version string and stops parsing
};

class Option {
public:
    explicit Option(std::vector<std::string> longNames,
                    std::string shortName,
                    std::string dest,
                    std::string help,
                    Cardinality cardinality = Cardinality::Scalar)
        : longNames_(std::move(longNames)),
          shortName_(std::move(shortName)),
          dest_(std::move(dest)),
          help_(std::move(help)),
          cardinality_(cardinality) {}

    [[nodiscard]] const std::vector<std::string>& longNames() const { return longNames_; }
    [[nodiscard]] const std::string& longName() const { return longNames_.back(); }
    [[nodiscard]] const std::string& shortName() const { return shortName_; }
    [[nodiscard]] const std::string& dest() const { return dest_; }
    [[nodiscard]] const std::string& help() const { return help_; }
    [[nodiscard]] const std::string& metavar() const { return metavar_; }
    [[nodiscard]] Cardinality cardinality() const { return cardinality_; }
    [[nodiscard]] const OptionValue& defaultValue() const { return defaultValue_; }
    [[nodiscard]] const OptionValue& constValue() const { return constValue_; }
    [[nodiscard]] const std::vector<std::string>& choices() const { return choices_; }
    [[nodiscard]] const std::string& deprecated() const { return deprecated_; }
    [[nodiscard]] const Converter& converter() const { return converter_; }

    // True for cardinalities that never read a value token.
    [[nodiscard]] bool isNullary() const {
        return cardinality_ == Cardinality::StoreTrue || cardinality_ == Cardinality::StoreFalse ||
               cardinality_ == Cardinality::Count || cardinality_ == Cardinality::Version;
    }

    // All spellings, short one last.
    [[nodiscard]] std::vector<std::string> spellings() const {
        std::vector<std::string> out = longNames_;
        if (!shortName_.empty()) out.push_back(shortName_);
        return out;
    }

    [[nodiscard]] bool matches(const std::string& token) const {
        if (!shortName_.empty() && token == shortName_) return true;
        for (const auto& n : longNames_) {
            if (n == token) return true;
        }
        return false;
    }

    Option& metavar(std::string v) {
        metavar_ = std::move(v);
        return *this;
    }

    Option& defaultValue(OptionValue v) {
        defaultValue_ = std::move(v);
        return *this;
    }

    Option& constValue(OptionValue v) {
        constValue_ = std::move(v);
        return *this;
    }

    Option& choices(std::vector<std::string> c) {
        choices_ = std::move(c);
        return *this;
    }

    Option& deprecated(std::string msg) {
        deprecated_ = std::move(msg);
        return *this;
    }

    Option& converter(Converter c) {
        converter_ = std::move(c);
        return *this;
    }

private:
    std::vector<std::string> longNames_; // --eps, --enable-position-stacking
    std::string shortName_;              // -c
    std::string dest_;                   // position_stacking
    std::string help_;
    std::string metavar_;                // PATH
    Cardinality cardinality_;
    OptionValue defaultValue_;
    OptionValue constValue_;
    std::vector<std::string> choices_;
    std::string deprecated_;
    Converter converter_;
};

struct OptionGroup {
    std::string name;
    std::vector<Option> options;
};

// Returns a printable form of a value for help output and diagnostics.
std::string toString(const OptionValue& v);

} // namespace tradecli

#endif // TRADECLI_OPTION_HPP
