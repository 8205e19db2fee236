#include "tradecli/schema.hpp"

#include <unordered_set>

#include "tradecli/errors.hpp"

namespace tradecli {

namespace {

void checkDestinations(const std::string& scope, const std::vector<Option>& options) {
    std::unordered_set<std::string> seen;
    for (const auto& o : options) {
        if (o.dest().empty()) throw SchemaError(scope + ": option " + o.longName() + " has no destination");
        if (!seen.insert(o.dest()).second) {
            throw SchemaError(scope + ": duplicate destination '" + o.dest() + "' (" + o.longName() + ")");
        }
    }
}

// Spellings only need to be unique within one parse scope; a command may reuse a
// global short name (hyperopt -s vs. global -s).
void checkSpellings(const std::string& scope, const std::vector<Option>& options) {
    std::unordered_set<std::string> seen{"-h", "--help"};
    for (const auto& o : options) {
        for (const auto& s : o.spellings()) {
            if (s.size() < 2 || s[0] != '-') throw SchemaError(scope + ": invalid option spelling '" + s + "'");
            if (!seen.insert(s).second) throw SchemaError(scope + ": duplicate option spelling '" + s + "'");
        }
    }
}

} // namespace

SchemaRegistry SchemaBuilder::build() const {
    checkDestinations(program_, globalOptions_);
    checkSpellings(program_, globalOptions_);

    std::unordered_set<std::string> names;
    std::vector<CommandSpec> commands;
    commands.reserve(commands_.size());
    for (const auto& pending : commands_) {
        if (pending.name.empty()) throw SchemaError(program_ + ": command without a name");
        if (!names.insert(pending.name).second) throw SchemaError(program_ + ": duplicate command '" + pending.name + "'");

        const auto scope = program_ + " " + pending.name;
        checkSpellings(scope, pending.options);

        CommandSpec spec(pending.name, pending.help, globalOptions_, pending.options, pending.handler);
        checkDestinations(scope, spec.mergedOptions());
        commands.push_back(std::move(spec));
    }
    return SchemaRegistry(program_, description_, globalOptions_, std::move(commands));
}

} // namespace tradecli
