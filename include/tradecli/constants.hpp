#ifndef TRADECLI_CONSTANTS_HPP
#define TRADECLI_CONSTANTS_HPP

namespace tradecli::constants {

inline constexpr const char* kVersion = "0.18.0";
inline constexpr const char* kProgramName = "tradecli";

inline constexpr const char* kDefaultConfig = "config.json";
inline constexpr const char* kDefaultStrategy = "DefaultStrategy";
inline constexpr const char* kDefaultHyperopt = "DefaultHyperOpts";
inline constexpr const char* kDefaultExportFilename = "user_data/backtest_data/backtest-result.json";
inline constexpr const char* kDefaultExchange = "bittrex";

inline constexpr int kHyperoptEpochs = 100;
inline constexpr int kDynamicWhitelist = 20;
// -1: all CPUs, -2: all but one, ...
inline constexpr int kHyperoptJobs = -1;

} // namespace tradecli::constants

#endif // TRADECLI_CONSTANTS_HPP
