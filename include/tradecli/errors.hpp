#ifndef TRADECLI_ERRORS_HPP
#define TRADECLI_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace tradecli {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed schema construction (duplicate destination, duplicate spelling).
// Raised while building the registry, never in response to user input.
class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& what) : Error(what) {}
};

// A single option value rejected by its converter.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error(what) {}
};

// A --timerange value that matches none of the grammar rules.
class ParseError : public Error {
public:
    ParseError(const std::string& what, std::string text) : Error(what), text_(std::move(text)) {}

    [[nodiscard]] const std::string& text() const { return text_; }

private:
    std::string text_;
};

} // namespace tradecli

#endif // TRADECLI_ERRORS_HPP
