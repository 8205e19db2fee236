#include <iostream>
#include <string>

#include "tradecli/tradecli.hpp"

// Resolves each argument as a --timerange expression.
int main(int argc, char** argv) {
    int status = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string text = argv[i];
        try {
            std::cout << text << " -> " << tradecli::toString(tradecli::parseTimeRange(text)) << "\n";
        } catch (const tradecli::ParseError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            status = 1;
        }
    }
    return status;
}
