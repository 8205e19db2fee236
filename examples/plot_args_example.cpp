#include <iostream>
#include <string>
#include <vector>

#include "tradecli/tradecli.hpp"

// Plot scripts take the global options plus --pairs and a timerange.
int main(int argc, char** argv) {
    auto shared = tradecli::optimizerSharedOptions();
    tradecli::OptionGroup timerangeOnly{"plot", {}};
    for (const auto& o : shared.options) {
        if (o.dest() == "timerange" || o.dest() == "ticker_interval") timerangeOnly.options.push_back(o);
    }

    tradecli::Arguments arguments(std::vector<std::string>(argv + 1, argv + argc), "Graph dataframe",
                                  {tradecli::globalOptions(), tradecli::scriptsOptions(), timerangeOnly});
    arguments.programName("plot_dataframe");

    const auto& outcome = arguments.parsedArgs();
    if (const auto* code = std::get_if<int>(&outcome)) return *code;

    const auto& parsed = std::get<tradecli::ParsedArgs>(outcome);
    try {
        std::cout << "pairs=" << parsed.find<std::string>("pairs").value_or("<config>")
                  << " timerange=" << tradecli::toString(parsed.timerange()) << "\n";
    } catch (const tradecli::ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
