#ifndef TRADECLI_SCHEMA_HPP
#define TRADECLI_SCHEMA_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "option.hpp"

namespace tradecli {

class ParsedArgs;

// Entry point of a subcommand. Owned and invoked by the dispatcher.
using Handler = std::function<int(const ParsedArgs&)>;

class CommandSpec {
public:
    CommandSpec(std::string name, std::string help, std::vector<Option> globalOptions, std::vector<Option> options, Handler handler)
        : name_(std::move(name)),
          help_(std::move(help)),
          globalOptions_(std::move(globalOptions)),
          options_(std::move(options)),
          handler_(std::move(handler)) {}

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& help() const { return help_; }
    [[nodiscard]] const Handler& handler() const { return handler_; }

    // Options accepted after the command token.
    [[nodiscard]] const std::vector<Option>& options() const { return options_; }

    // Global options followed by the command's own options, as a fresh copy.
    [[nodiscard]] std::vector<Option> mergedOptions() const {
        std::vector<Option> out;
        out.reserve(globalOptions_.size() + options_.size());
        out.insert(out.end(), globalOptions_.begin(), globalOptions_.end());
        out.insert(out.end(), options_.begin(), options_.end());
        return out;
    }

private:
    std::string name_;
    std::string help_;
    std::vector<Option> globalOptions_;
    std::vector<Option> options_;
    Handler handler_;
};

class SchemaRegistry {
public:
    SchemaRegistry(std::string program, std::string description, std::vector<Option> globalOptions, std::vector<CommandSpec> commands)
        : program_(std::move(program)),
          description_(std::move(description)),
          globalOptions_(std::move(globalOptions)),
          commands_(std::move(commands)) {}

    [[nodiscard]] const std::string& program() const { return program_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::vector<Option>& globalOptions() const { return globalOptions_; }
    [[nodiscard]] const std::vector<CommandSpec>& commands() const { return commands_; }

    [[nodiscard]] const CommandSpec* findCommand(const std::string& name) const {
        for (const auto& c : commands_) {
            if (c.name() == name) return &c;
        }
        return nullptr;
    }

    [[nodiscard]] std::vector<std::string> commandNames() const {
        std::vector<std::string> out;
        out.reserve(commands_.size());
        for (const auto& c : commands_) out.push_back(c.name());
        return out;
    }

private:
    std::string program_;
    std::string description_;
    std::vector<Option> globalOptions_;
    std::vector<CommandSpec> commands_;
};

// Composes option groups into a registry. Groups are copied in, so the same
// group value can feed any number of commands.
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string program, std::string description = {})
        : program_(std::move(program)), description_(std::move(description)) {}

    SchemaBuilder& withGlobalGroup(const OptionGroup& group) {
        globalOptions_.insert(globalOptions_.end(), group.options.begin(), group.options.end());
        return *this;
    }

    SchemaBuilder& addCommand(std::string name, std::string help, const std::vector<OptionGroup>& groups, Handler handler = {}) {
        PendingCommand cmd{std::move(name), std::move(help), {}, std::move(handler)};
        for (const auto& g : groups) cmd.options.insert(cmd.options.end(), g.options.begin(), g.options.end());
        commands_.push_back(std::move(cmd));
        return *this;
    }

    // Validates destinations and spellings, then freezes the schema.
    // Throws SchemaError on any collision.
    [[nodiscard]] SchemaRegistry build() const;

private:
    struct PendingCommand {
        std::string name;
        std::string help;
        std::vector<Option> options;
        Handler handler;
    };

    std::string program_;
    std::string description_;
    std::vector<Option> globalOptions_;
    std::vector<PendingCommand> commands_;
};

} // namespace tradecli

#endif // TRADECLI_SCHEMA_HPP
