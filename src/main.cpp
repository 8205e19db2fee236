#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "tradecli/tradecli.hpp"

namespace {

void dumpSettings(const tradecli::ParsedArgs& args) {
    for (const auto& [dest, value] : args.values()) {
        std::cerr << "  " << dest << " = " << tradecli::toString(value) << "\n";
    }
}

// The optimizer engines live outside this binary; each handler reports the
// resolved inputs it would hand over.
int runOptimizer(const std::string& mode, const tradecli::ParsedArgs& args) {
    const auto range = args.timerange();
    if (args.get<int>("loglevel") > 0) {
        std::cerr << "Resolved " << mode << " settings:\n";
        dumpSettings(args);
    }
    std::cout << mode << ": strategy=" << args.get<std::string>("strategy")
              << " config=" << tradecli::toString(args.value("config")) << " timerange=" << tradecli::toString(range)
              << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    tradecli::Arguments arguments(std::move(args), "Simple High Frequency Trading Bot for crypto currencies");
    arguments.bind("backtesting", [](const tradecli::ParsedArgs& a) { return runOptimizer("backtesting", a); })
        .bind("edge", [](const tradecli::ParsedArgs& a) { return runOptimizer("edge", a); })
        .bind("hyperopt", [](const tradecli::ParsedArgs& a) { return runOptimizer("hyperopt", a); });

    try {
        const auto& outcome = arguments.parsedArgs();
        if (const auto* code = std::get_if<int>(&outcome)) return *code;

        const auto& parsed = std::get<tradecli::ParsedArgs>(outcome);
        if (!parsed.handler()) {
            if (parsed.get<int>("loglevel") > 0) dumpSettings(parsed);
            std::cerr << "No subcommand given; choose one of: backtesting, edge, hyperopt\n";
            return 1;
        }
        return parsed.handler()(parsed);
    } catch (const tradecli::ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const tradecli::SchemaError& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 1;
    }
}
