#include "tradecli/arguments.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <utility>

#include "tradecli/constants.hpp"
#include "tradecli/option_groups.hpp"
#include "tradecli/parser.hpp"
#include "tradecli/utils.hpp"

namespace tradecli {

namespace {

void applyDefaults(const std::vector<Option>& options, std::map<std::string, OptionValue>& values) {
    for (const auto& o : options) {
        if (o.cardinality() == Cardinality::Version) continue;
        values[o.dest()] = o.defaultValue();
    }
}

void applySupplied(const std::unordered_map<std::string, OptionValue>& supplied, std::map<std::string, OptionValue>& values) {
    for (const auto& [dest, value] : supplied) values[dest] = value;
}

bool declaresDestination(const std::vector<Option>& options, const std::string& dest) {
    for (const auto& o : options) {
        if (o.dest() == dest) return true;
    }
    return false;
}

} // namespace

Arguments::Arguments(std::vector<std::string> args, std::string description)
    : args_(std::move(args)), description_(std::move(description)), program_(constants::kProgramName) {}

Arguments::Arguments(std::vector<std::string> args, std::string description, std::vector<OptionGroup> rootGroups)
    : args_(std::move(args)),
      description_(std::move(description)),
      program_(constants::kProgramName),
      rootGroups_(std::move(rootGroups)) {}

SchemaRegistry Arguments::buildSchema() const {
    SchemaBuilder builder(program_, description_);
    if (rootGroups_) {
        for (const auto& g : *rootGroups_) builder.withGlobalGroup(g);
        return builder.build();
    }

    auto handlerFor = [&](const std::string& name) -> Handler {
        const auto it = handlers_.find(name);
        return it == handlers_.end() ? Handler{} : it->second;
    };

    builder.withGlobalGroup(globalOptions());
    builder.addCommand("backtesting", "Backtesting module.", {optimizerSharedOptions(), backtestingOptions()},
                       handlerFor("backtesting"));
    builder.addCommand("edge", "Edge module.", {optimizerSharedOptions(), edgeOptions()}, handlerFor("edge"));
    builder.addCommand("hyperopt", "Hyperopt module.", {optimizerSharedOptions(), hyperoptOptions()}, handlerFor("hyperopt"));
    return builder.build();
}

const Arguments::Outcome& Arguments::parsedArgs() {
    if (!parsed_) {
        const auto registry = buildSchema();
        parsed_ = parse(registry);
    }
    return *parsed_;
}

Arguments::Outcome Arguments::parse(const SchemaRegistry& registry) const {
    const bool hasCommands = !registry.commands().empty();

    Parser::Options rootOpts;
    rootOpts.stopAtPositional = hasCommands;
    const Parser root(args_, 0, registry.globalOptions(), rootOpts);
    if (!root.ok()) return fail(root.error(), registry, nullptr);
    if (root.helpRequested()) {
        printHelp(registry, nullptr, out());
        return 0;
    }
    if (root.versionRequested()) {
        out() << registry.program() << " " << constants::kVersion << "\n";
        return 0;
    }
    if (!root.positionals().empty()) {
        return fail("unrecognized arguments: " + utils::join(root.positionals(), " "), registry, nullptr);
    }

    std::map<std::string, OptionValue> values;
    applyDefaults(registry.globalOptions(), values);
    applySupplied(root.values(), values);
    warnDeprecated(registry.globalOptions(), root.values());

    std::string commandName;
    Handler handler;
    if (hasCommands && root.stopIndex() < args_.size()) {
        const auto& token = args_[root.stopIndex()];
        const auto* command = registry.findCommand(token);
        if (!command) {
            std::string msg = "argument subcommand: invalid choice: '" + token + "' (choose from " +
                              utils::join(registry.commandNames(), ", ", "'") + ")";
            const auto suggestions = Parser::suggest(token, registry.commandNames());
            if (!suggestions.empty()) {
                msg += "\n\nDid you mean this?\n";
                for (const auto& s : suggestions) msg += "  " + s + "\n";
            }
            return fail(msg, registry, nullptr);
        }

        const Parser sub(args_, root.stopIndex() + 1, command->options());
        if (!sub.ok()) return fail(sub.error(), registry, command);
        if (sub.helpRequested()) {
            printHelp(registry, command, out());
            return 0;
        }
        if (!sub.positionals().empty()) {
            return fail("unrecognized arguments: " + utils::join(sub.positionals(), " "), registry, command);
        }

        applyDefaults(command->options(), values);
        applySupplied(sub.values(), values);
        warnDeprecated(command->options(), sub.values());
        commandName = command->name();
        handler = command->handler();
    }

    ParsedArgs parsed(std::move(values), std::move(commandName), std::move(handler));
    if (!declaresDestination(registry.globalOptions(), "config")) return parsed;
    return normalizeConfig(parsed);
}

ParsedArgs Arguments::normalizeConfig(const ParsedArgs& parsed) {
    const auto paths = parsed.find<std::vector<std::string>>("config");
    if (paths && !paths->empty()) return parsed;
    return parsed.withValue("config", std::vector<std::string>{constants::kDefaultConfig});
}

int Arguments::fail(const std::string& message, const SchemaRegistry& registry, const CommandSpec* command) const {
    if (!message.empty()) {
        err() << "Error: " << message;
        if (message.back() != '\n') err() << "\n";
    }
    err() << "\n" << buildUsageLine(registry, command);
    return kUsageError;
}

void Arguments::warnDeprecated(const std::vector<Option>& options,
                               const std::unordered_map<std::string, OptionValue>& supplied) const {
    for (const auto& o : options) {
        if (o.deprecated().empty()) continue;
        if (supplied.find(o.dest()) == supplied.end()) continue;
        err() << "Flag \"" << o.longName() << "\" is deprecated: " << o.deprecated() << "\n";
    }
}

std::string Arguments::buildUsageLine(const SchemaRegistry& registry, const CommandSpec* command) const {
    std::ostringstream oss;
    oss << "Usage: " << registry.program();
    if (command) {
        oss << " " << command->name() << " [flags]";
    } else if (!registry.commands().empty()) {
        oss << " [flags] [command]";
    } else {
        oss << " [flags]";
    }
    oss << "\n";
    return oss.str();
}

std::string Arguments::formatOptionForHelp(const Option& o) {
    std::string names;
    if (!o.shortName().empty()) names += o.shortName() + ", ";
    names += utils::join(o.longNames(), ", ");

    std::string meta = o.metavar();
    if (!o.choices().empty()) meta = "{" + utils::join(o.choices(), ",") + "}";
    if (meta.empty()) {
        for (const char ch : o.dest()) meta.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }

    switch (o.cardinality()) {
    case Cardinality::Scalar:
    case Cardinality::Append:
        names += " " + meta;
        break;
    case Cardinality::OneOrMore:
        names += " " + meta + " [" + meta + " ...]";
        break;
    case Cardinality::OptionalValue:
        names += " [" + meta + "]";
        break;
    default:
        break;
    }

    std::string desc = o.help();
    if (!o.deprecated().empty()) desc += " (deprecated: " + o.deprecated() + ")";
    const auto& dv = o.defaultValue();
    const bool showDefault = !std::holds_alternative<std::monostate>(dv) && !std::holds_alternative<bool>(dv) &&
                             o.cardinality() != Cardinality::Count;
    if (showDefault) {
        if (!desc.empty()) desc.push_back(' ');
        desc += "(default: " + toString(dv) + ")";
    }
    if (!desc.empty()) names += " - " + desc;
    return names;
}

void Arguments::printHelp(const SchemaRegistry& registry, const CommandSpec* command, std::ostream& os) const {
    os << buildUsageLine(registry, command);

    const auto& about = command ? command->help() : registry.description();
    if (!about.empty()) os << "\n" << about << "\n";

    if (!command && !registry.commands().empty()) {
        std::size_t width = 0;
        for (const auto& c : registry.commands()) width = std::max(width, c.name().size());
        os << "\nCommands:\n";
        for (const auto& c : registry.commands()) {
            os << "  " << c.name() << std::string(width - c.name().size() + 2, ' ') << c.help() << "\n";
        }
    }

    os << "\nFlags:\n";
    const auto& options = command ? command->options() : registry.globalOptions();
    for (const auto& o : options) os << "  " << formatOptionForHelp(o) << "\n";
    os << "  -h, --help - Show this help message and exit\n";

    if (!command && !registry.commands().empty()) {
        os << "\nUse \"" << registry.program() << " [command] --help\" for more information about a command.\n";
    }
}

} // namespace tradecli
