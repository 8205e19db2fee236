#ifndef TRADECLI_PARSER_HPP
#define TRADECLI_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "option.hpp"
#include "utils.hpp"

namespace tradecli {

// Parses one scope of an argument vector (the tokens before a subcommand, or the
// tokens after it) against a flat option list. Only supplied options end up in
// values(); defaults are applied by the caller.
class Parser {
public:
    struct Options {
        // Stop at the first positional token and report its index via stopIndex().
        bool stopAtPositional{false};
        bool shortFlagGrouping{true}; // -vvv, -cpath
        bool suggestFlags{true};
        bool allowAbbreviation{true}; // --strat -> --strategy when the prefix is unique
        std::size_t suggestionsMinimumDistance{2};
    };

    Parser(const std::vector<std::string>& args, std::size_t begin, const std::vector<Option>& options)
        : Parser(args, begin, options, Options{}) {}

    Parser(const std::vector<std::string>& args, std::size_t begin, const std::vector<Option>& options, Options parseOptions)
        : options_(&options), parseOptions_(parseOptions) {
        for (const auto& o : options) {
            for (auto& s : o.spellings()) knownKeys_.push_back(std::move(s));
        }
        knownKeys_.push_back("--help");
        knownKeys_.push_back("-h");

        stopIndex_ = args.size();
        bool positionalOnly = false;
        for (std::size_t i = begin; i < args.size() && ok_; ++i) {
            const std::string& arg = args[i];
            if (!positionalOnly && arg == "--") {
                positionalOnly = true;
                continue;
            }

            if (!positionalOnly && isFlagToken(arg)) {
                if (arg == "-h" || arg == "--help") {
                    helpRequested_ = true;
                    stopIndex_ = i;
                    return;
                }

                // --key=value and -k=value
                const auto eq = arg.find('=');
                const bool longForm = arg.rfind("--", 0) == 0;
                if (eq != std::string::npos && (longForm || eq == 2)) {
                    const auto key = arg.substr(0, eq);
                    const auto* opt = findOption(key);
                    if (!opt) {
                        if (ok_) failUnknownFlag(key);
                        break;
                    }
                    if (opt->isNullary()) {
                        fail("argument " + displayName(*opt) + ": ignored explicit argument '" + arg.substr(eq + 1) + "'");
                        break;
                    }
                    // An attached value is the only value, even for one-or-more options.
                    const std::string value = arg.substr(eq + 1);
                    if (opt->cardinality() == Cardinality::OneOrMore) {
                        if (!storeMany(*opt, {value})) break;
                    } else if (!storeValue(*opt, value)) {
                        break;
                    }
                    continue;
                }

                if (parseOptions_.shortFlagGrouping && isShortGroupToken(arg)) {
                    if (!parseShortGroup(arg, i, args)) break;
                    if (versionRequested_) {
                        stopIndex_ = i;
                        return;
                    }
                    continue;
                }

                const auto* opt = findOption(arg);
                if (!opt) {
                    if (ok_) failUnknownFlag(arg);
                    break;
                }
                if (!consume(*opt, i, args)) break;
                if (versionRequested_) {
                    stopIndex_ = i;
                    return;
                }
                continue;
            }

            // A subcommand may also follow "--".
            if (parseOptions_.stopAtPositional) {
                stopIndex_ = i;
                return;
            }
            positionals_.push_back(arg);
        }
    }

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] const std::string& error() const { return error_; }
    [[nodiscard]] bool helpRequested() const { return helpRequested_; }
    [[nodiscard]] bool versionRequested() const { return versionRequested_; }
    [[nodiscard]] std::size_t stopIndex() const { return stopIndex_; }
    [[nodiscard]] const std::vector<std::string>& positionals() const { return positionals_; }
    [[nodiscard]] const std::unordered_map<std::string, OptionValue>& values() const { return values_; }

    [[nodiscard]] bool supplied(const std::string& dest) const { return values_.find(dest) != values_.end(); }

    // argparse-compatible: "-5" and "-.5" are values, not options.
    static bool looksLikeNegativeNumber(std::string_view s) {
        if (s.size() < 2 || s[0] != '-') return false;
        std::size_t pos = 1;
        bool digitsBeforeDot = false;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            digitsBeforeDot = true;
            ++pos;
        }
        if (pos == s.size()) return digitsBeforeDot;
        if (s[pos] != '.') return false;
        ++pos;
        if (pos == s.size()) return false;
        while (pos < s.size()) {
            if (!std::isdigit(static_cast<unsigned char>(s[pos]))) return false;
            ++pos;
        }
        return true;
    }

    static bool isFlagToken(std::string_view s) {
        return s.size() >= 2 && s[0] == '-' && !looksLikeNegativeNumber(s);
    }

    // Up to `maxResults` candidates within `maxDistance` edits of `input`, closest
    // first. A candidate that starts with `input` counts as distance 0.
    static std::vector<std::string> suggest(std::string_view input,
                                            const std::vector<std::string>& candidates,
                                            std::size_t maxResults = 3,
                                            std::size_t maxDistance = 2) {
        std::vector<std::pair<std::size_t, std::string>> ranked;
        for (const auto& c : candidates) {
            if (c.empty()) continue;
            const std::size_t d = c.rfind(input, 0) == 0 ? 0 : editDistance(input, c);
            if (d <= maxDistance) ranked.emplace_back(d, c);
        }
        std::sort(ranked.begin(), ranked.end());
        ranked.erase(std::unique(ranked.begin(), ranked.end()), ranked.end());

        std::vector<std::string> out;
        for (auto& r : ranked) {
            if (out.size() == maxResults) break;
            out.push_back(std::move(r.second));
        }
        return out;
    }

private:
    // Levenshtein distance over a single row of the table.
    static std::size_t editDistance(std::string_view a, std::string_view b) {
        std::vector<std::size_t> row(b.size() + 1);
        for (std::size_t j = 0; j < row.size(); ++j) row[j] = j;
        for (std::size_t i = 1; i <= a.size(); ++i) {
            std::size_t diagonal = row[0];
            row[0] = i;
            for (std::size_t j = 1; j <= b.size(); ++j) {
                const std::size_t above = row[j];
                row[j] = std::min({above + 1, row[j - 1] + 1, diagonal + (a[i - 1] == b[j - 1] ? 0 : 1)});
                diagonal = above;
            }
        }
        return row[b.size()];
    }

    static bool isShortGroupToken(const std::string& s) {
        return s.size() > 2 && s[0] == '-' && s[1] != '-';
    }

    static std::string displayName(const Option& o) {
        std::vector<std::string> names;
        if (!o.shortName().empty()) names.push_back(o.shortName());
        for (const auto& n : o.longNames()) names.push_back(n);
        return utils::join(names, "/");
    }

    // Exact spelling first, then a unique long-option prefix. An ambiguous prefix
    // fails the parse and returns nullptr.
    const Option* findOption(const std::string& key) {
        for (const auto& o : *options_) {
            if (o.matches(key)) return &o;
        }
        if (!parseOptions_.allowAbbreviation || key.size() < 3 || key.rfind("--", 0) != 0) return nullptr;

        const Option* found = nullptr;
        bool ambiguous = false;
        std::vector<std::string> matches;
        for (const auto& o : *options_) {
            for (const auto& name : o.longNames()) {
                if (name.rfind(key, 0) != 0) continue;
                matches.push_back(name);
                if (found && found != &o) ambiguous = true;
                found = &o;
            }
        }
        if (!ambiguous) return found;
        fail("ambiguous option: " + key + " could match " + utils::join(matches, ", "));
        return nullptr;
    }

    // Reads the value tokens an option needs, starting after position `i`.
    bool consume(const Option& opt, std::size_t& i, const std::vector<std::string>& args) {
        switch (opt.cardinality()) {
        case Cardinality::StoreTrue:
            values_[opt.dest()] = true;
            return true;
        case Cardinality::StoreFalse:
            values_[opt.dest()] = false;
            return true;
        case Cardinality::Count:
            increment(opt);
            return true;
        case Cardinality::Version:
            versionRequested_ = true;
            return true;
        case Cardinality::OptionalValue:
            if (i + 1 < args.size() && !isFlagToken(args[i + 1]) && args[i + 1] != "--") {
                return storeValue(opt, args[++i]);
            }
            values_[opt.dest()] = opt.constValue();
            return true;
        case Cardinality::OneOrMore: {
            std::vector<std::string> items;
            collectMany(args, i, items);
            if (items.empty()) {
                fail("argument " + displayName(opt) + ": expected at least one argument");
                return false;
            }
            return storeMany(opt, std::move(items));
        }
        case Cardinality::Scalar:
        case Cardinality::Append:
            break;
        }

        if (i + 1 >= args.size() || isFlagToken(args[i + 1])) {
            fail("argument " + displayName(opt) + ": expected one argument");
            return false;
        }
        return storeValue(opt, args[++i]);
    }

    void collectMany(const std::vector<std::string>& args, std::size_t& i, std::vector<std::string>& items) const {
        while (i + 1 < args.size() && !isFlagToken(args[i + 1]) && args[i + 1] != "--") {
            items.push_back(args[++i]);
        }
    }

    void increment(const Option& opt) {
        auto& slot = values_[opt.dest()];
        if (const auto* n = std::get_if<int>(&slot)) {
            slot = *n + 1;
        } else {
            slot = 1;
        }
    }

    bool checkChoice(const Option& opt, const std::string& raw) {
        const auto& choices = opt.choices();
        if (choices.empty()) return true;
        if (std::find(choices.begin(), choices.end(), raw) != choices.end()) return true;
        fail("argument " + displayName(opt) + ": invalid choice: '" + raw + "' (choose from " + utils::join(choices, ", ", "'") +
             ")");
        return false;
    }

    bool convert(const Option& opt, const std::string& raw, OptionValue& out) {
        if (!checkChoice(opt, raw)) return false;
        if (!opt.converter()) {
            out = raw;
            return true;
        }
        try {
            out = opt.converter()(raw);
        } catch (const ValidationError& e) {
            fail("argument " + displayName(opt) + ": " + e.what());
            return false;
        }
        return true;
    }

    bool storeValue(const Option& opt, const std::string& raw) {
        OptionValue converted;
        if (!convert(opt, raw, converted)) return false;

        if (opt.cardinality() == Cardinality::Append) {
            auto& slot = values_[opt.dest()];
            if (!std::holds_alternative<std::vector<std::string>>(slot)) slot = std::vector<std::string>{};
            std::get<std::vector<std::string>>(slot).push_back(toString(converted));
            return true;
        }
        values_[opt.dest()] = std::move(converted);
        return true;
    }

    // A later occurrence replaces the earlier list.
    bool storeMany(const Option& opt, std::vector<std::string> items) {
        std::vector<std::string> out;
        out.reserve(items.size());
        for (auto& raw : items) {
            OptionValue converted;
            if (!convert(opt, raw, converted)) return false;
            out.push_back(toString(converted));
        }
        values_[opt.dest()] = std::move(out);
        return true;
    }

    bool parseShortGroup(const std::string& group, std::size_t& i, const std::vector<std::string>& args) {
        for (std::size_t pos = 1; pos < group.size(); ++pos) {
            const std::string key = std::string("-") + group[pos];
            if (key == "-h") {
                helpRequested_ = true;
                stopIndex_ = i;
                return false;
            }
            const auto* opt = findOption(key);
            if (!opt) {
                failUnknownFlag(pos == 1 ? group : key);
                return false;
            }

            if (opt->isNullary()) {
                consume(*opt, i, args);
                if (versionRequested_) return true;
                continue;
            }

            // Needs a value: -cvalue, -vc=value or -c value. An attached value
            // is the only value.
            if (pos + 1 < group.size()) {
                auto rest = group.substr(pos + 1);
                if (rest[0] == '=') rest.erase(0, 1);
                if (opt->cardinality() == Cardinality::OneOrMore) return storeMany(*opt, {rest});
                return storeValue(*opt, rest);
            }
            return consume(*opt, i, args);
        }
        return true;
    }

    void fail(std::string message) {
        ok_ = false;
        error_ = std::move(message);
    }

    void failUnknownFlag(const std::string& key) {
        ok_ = false;
        error_ = "unrecognized arguments: " + key;
        if (!parseOptions_.suggestFlags || knownKeys_.empty()) return;
        const auto suggestions = suggest(key, knownKeys_, /*maxResults=*/3, parseOptions_.suggestionsMinimumDistance);
        if (suggestions.empty()) return;
        error_ += "\n\nDid you mean this?\n";
        for (const auto& s : suggestions) error_ += "  " + s + "\n";
    }

    const std::vector<Option>* options_;
    Options parseOptions_;
    std::unordered_map<std::string, OptionValue> values_;
    std::vector<std::string> knownKeys_;
    std::vector<std::string> positionals_;
    std::size_t stopIndex_{0};
    bool helpRequested_{false};
    bool versionRequested_{false};
    bool ok_{true};
    std::string error_;
};

} // namespace tradecli

#endif // TRADECLI_PARSER_HPP
