#ifndef TRADECLI_TRADECLI_HPP
#define TRADECLI_TRADECLI_HPP

#include "arguments.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "option.hpp"
#include "option_groups.hpp"
#include "parsed_args.hpp"
#include "parser.hpp"
#include "schema.hpp"
#include "timerange.hpp"
#include "validators.hpp"

#endif // TRADECLI_TRADECLI_HPP
