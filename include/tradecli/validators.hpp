#ifndef TRADECLI_VALIDATORS_HPP
#define TRADECLI_VALIDATORS_HPP

#include <string>

#include "option.hpp"

namespace tradecli {

// Parses `raw` as a base-10 integer greater than zero.
// Throws ValidationError otherwise.
int positiveInt(const std::string& raw);

namespace converters {

// Converter adapters plugged into Option::converter().
Converter string();
Converter integer();
Converter floating();
Converter positiveInteger();

} // namespace converters

} // namespace tradecli

#endif // TRADECLI_VALIDATORS_HPP
