#include <iostream>
#include <string>
#include <vector>

#include "tradecli/tradecli.hpp"

int main(int argc, char** argv) {
    tradecli::Arguments arguments(std::vector<std::string>(argv + 1, argv + argc), "Download backtest data",
                                  {tradecli::downloadOptions()});
    arguments.programName("download_backtest_data");

    const auto& outcome = arguments.parsedArgs();
    if (const auto* code = std::get_if<int>(&outcome)) return *code;

    const auto& parsed = std::get<tradecli::ParsedArgs>(outcome);
    std::cout << "exchange=" << parsed.get<std::string>("exchange")
              << " timeframes=" << tradecli::toString(parsed.value("timeframes"))
              << " config=" << tradecli::toString(parsed.value("config"))
              << " erase=" << tradecli::toString(parsed.value("erase")) << "\n";
    if (const auto days = parsed.find<int>("days")) std::cout << "days=" << *days << "\n";
    return 0;
}
