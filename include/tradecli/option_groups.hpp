#ifndef TRADECLI_OPTION_GROUPS_HPP
#define TRADECLI_OPTION_GROUPS_HPP

#include "option.hpp"

namespace tradecli {

// Every builder returns a fresh group. Commands composed from the same group
// own independent copies of its options.

// Options accepted before any subcommand.
OptionGroup globalOptions();

// Options shared by backtesting, edge and hyperopt.
OptionGroup optimizerSharedOptions();

OptionGroup backtestingOptions();
OptionGroup edgeOptions();
OptionGroup hyperoptOptions();

// Auxiliary scripts (plotting, profit reports).
OptionGroup scriptsOptions();

// Test-data download script. Carries its own --config.
OptionGroup downloadOptions();

} // namespace tradecli

#endif // TRADECLI_OPTION_GROUPS_HPP
