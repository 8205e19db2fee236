#ifndef TRADECLI_ARGUMENTS_HPP
#define TRADECLI_ARGUMENTS_HPP

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "option.hpp"
#include "parsed_args.hpp"
#include "schema.hpp"

namespace tradecli {

// Builds the schema once, parses the argument vector against it and applies
// post-parse normalization. Help, version and usage errors are written to the
// configured streams and reported as an exit code instead of a ParsedArgs.
class Arguments {
public:
    // Parsed namespace, or the exit code the process should stop with.
    using Outcome = std::variant<ParsedArgs, int>;

    static constexpr int kUsageError = 2;

    // Full command surface: global options plus backtesting, edge and hyperopt.
    Arguments(std::vector<std::string> args, std::string description);

    // Script mode: the given groups form the only scope, no subcommands.
    Arguments(std::vector<std::string> args, std::string description, std::vector<OptionGroup> rootGroups);

    Arguments& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    Arguments& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    Arguments& programName(std::string name) {
        program_ = std::move(name);
        return *this;
    }

    // Binds the handler of a subcommand. Must be called before parsedArgs().
    Arguments& bind(const std::string& command, Handler handler) {
        handlers_[command] = std::move(handler);
        return *this;
    }

    // Parses on first call and caches the outcome.
    const Outcome& parsedArgs();

    [[nodiscard]] SchemaRegistry buildSchema() const;

    // If the config destination is declared but was never supplied, substitutes
    // exactly one default path. Supplied paths are kept as given.
    static ParsedArgs normalizeConfig(const ParsedArgs& parsed);

    void printHelp(const SchemaRegistry& registry, const CommandSpec* command, std::ostream& os) const;

private:
    [[nodiscard]] Outcome parse(const SchemaRegistry& registry) const;

    int fail(const std::string& message, const SchemaRegistry& registry, const CommandSpec* command) const;
    void warnDeprecated(const std::vector<Option>& options, const std::unordered_map<std::string, OptionValue>& supplied) const;

    std::string buildUsageLine(const SchemaRegistry& registry, const CommandSpec* command) const;
    static std::string formatOptionForHelp(const Option& o);

    std::ostream& out() const { return out_ ? *out_ : std::cout; }
    std::ostream& err() const { return err_ ? *err_ : std::cerr; }

    std::vector<std::string> args_;
    std::string description_;
    std::string program_;
    std::optional<std::vector<OptionGroup>> rootGroups_;
    std::unordered_map<std::string, Handler> handlers_;
    std::optional<Outcome> parsed_;
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
};

} // namespace tradecli

#endif // TRADECLI_ARGUMENTS_HPP
