#include "tradecli/option_groups.hpp"

#include <string>
#include <vector>

#include "tradecli/constants.hpp"
#include "tradecli/validators.hpp"

namespace tradecli {

namespace {

Option configOption() {
    return Option({"--config"}, "-c", "config",
                  std::string("Specify configuration file (default: ") + constants::kDefaultConfig +
                      "). Multiple --config options may be used.",
                  Cardinality::Append)
        .metavar("PATH");
}

Option positionStackingOption() {
    return Option({"--eps", "--enable-position-stacking"}, "", "position_stacking",
                  "Allow buying the same pair multiple times (position stacking).", Cardinality::StoreTrue)
        .defaultValue(false);
}

Option maxMarketPositionsOption() {
    return Option({"--dmmp", "--disable-max-market-positions"}, "", "use_max_market_positions",
                  "Disable applying `max_open_trades` during backtest "
                  "(same as setting `max_open_trades` to a very high number).",
                  Cardinality::StoreFalse)
        .defaultValue(true);
}

} // namespace

OptionGroup globalOptions() {
    OptionGroup g{"global", {}};
    auto& o = g.options;
    o.push_back(Option({"--verbose"}, "-v", "loglevel", "Verbose mode (-vv for more, -vvv to get all messages).",
                       Cardinality::Count)
                    .defaultValue(0));
    o.push_back(Option({"--logfile"}, "", "logfile", "Log to the file specified.").metavar("FILE"));
    o.push_back(Option({"--version"}, "", "version", "Show program's version number and exit.", Cardinality::Version));
    o.push_back(configOption());
    o.push_back(Option({"--datadir"}, "-d", "datadir", "Path to backtest data.").metavar("PATH"));
    o.push_back(Option({"--strategy"}, "-s", "strategy", "Specify strategy class name.")
                    .metavar("NAME")
                    .defaultValue(std::string(constants::kDefaultStrategy)));
    o.push_back(Option({"--strategy-path"}, "", "strategy_path", "Specify additional strategy lookup path.").metavar("PATH"));
    o.push_back(Option({"--dynamic-whitelist"}, "", "dynamic_whitelist",
                       "Dynamically generate and update whitelist based on 24h BaseVolume (default: " +
                           std::to_string(constants::kDynamicWhitelist) + ").",
                       Cardinality::OptionalValue)
                    .metavar("INT")
                    .converter(converters::integer())
                    .constValue(constants::kDynamicWhitelist)
                    .deprecated("use a dynamic pairlist in the configuration instead"));
    o.push_back(Option({"--db-url"}, "", "db_url",
                       "Override trades database URL, this is useful if dry_run is enabled or in custom deployments.")
                    .metavar("PATH"));
    o.push_back(Option({"--sd-notify"}, "", "sd_notify", "Notify systemd service manager.", Cardinality::StoreTrue)
                    .defaultValue(false));
    return g;
}

OptionGroup optimizerSharedOptions() {
    OptionGroup g{"optimizer", {}};
    auto& o = g.options;
    o.push_back(Option({"--ticker-interval"}, "-i", "ticker_interval", "Specify ticker interval (1m, 5m, 30m, 1h, 1d)."));
    o.push_back(Option({"--timerange"}, "", "timerange", "Specify what timerange of data to use."));
    o.push_back(Option({"--max_open_trades"}, "", "max_open_trades", "Specify max_open_trades to use.")
                    .metavar("INT")
                    .converter(converters::integer()));
    o.push_back(Option({"--stake_amount"}, "", "stake_amount", "Specify stake_amount.")
                    .metavar("FLOAT")
                    .converter(converters::floating()));
    o.push_back(Option({"--refresh-pairs-cached"}, "-r", "refresh_pairs",
                       "Refresh the pairs files in tests/testdata with the latest data from the exchange. "
                       "Use it if you want to run your optimization commands with up-to-date data.",
                       Cardinality::StoreTrue)
                    .defaultValue(false));
    return g;
}

OptionGroup backtestingOptions() {
    OptionGroup g{"backtesting", {}};
    auto& o = g.options;
    o.push_back(positionStackingOption());
    o.push_back(maxMarketPositionsOption());
    o.push_back(Option({"--live"}, "-l", "live", "Use live data.", Cardinality::StoreTrue).defaultValue(false));
    o.push_back(Option({"--strategy-list"}, "", "strategy_list",
                       "Provide a list of strategies to backtest. The ticker interval needs to be set either in "
                       "config or via command line. When used together with --export trades, the strategy name "
                       "is injected into the filename.",
                       Cardinality::OneOrMore));
    o.push_back(Option({"--export"}, "", "export", "Export backtest results, argument are: trades. Example --export=trades"));
    o.push_back(Option({"--export-filename"}, "", "exportfilename",
                       "Save backtest results to this filename, requires --export to be set as well.")
                    .metavar("PATH")
                    .defaultValue(std::string(constants::kDefaultExportFilename)));
    return g;
}

OptionGroup edgeOptions() {
    OptionGroup g{"edge", {}};
    g.options.push_back(Option({"--stoplosses"}, "", "stoploss_range",
                               "Defines a range of stoploss against which edge will assess the strategy, "
                               "the format is \"min,max,step\" (without any space). "
                               "Example: --stoplosses=-0.01,-0.1,-0.001"));
    return g;
}

OptionGroup hyperoptOptions() {
    OptionGroup g{"hyperopt", {}};
    auto& o = g.options;
    o.push_back(Option({"--customhyperopt"}, "", "hyperopt", "Specify hyperopt class name.")
                    .metavar("NAME")
                    .defaultValue(std::string(constants::kDefaultHyperopt)));
    o.push_back(positionStackingOption());
    o.push_back(maxMarketPositionsOption());
    o.push_back(Option({"--epochs"}, "-e", "epochs", "Specify number of epochs.")
                    .metavar("INT")
                    .converter(converters::integer())
                    .defaultValue(constants::kHyperoptEpochs));
    o.push_back(Option({"--spaces"}, "-s", "spaces", "Specify which parameters to hyperopt. Space separated list.",
                       Cardinality::OneOrMore)
                    .choices({"all", "buy", "sell", "roi", "stoploss"})
                    .defaultValue(std::vector<std::string>{"all"}));
    o.push_back(Option({"--print-all"}, "", "print_all", "Print all results, not only the best ones.", Cardinality::StoreTrue)
                    .defaultValue(false));
    o.push_back(Option({"--job-workers"}, "-j", "hyperopt_jobs",
                       "The number of concurrently running jobs for hyperoptimization (hyperopt worker processes). "
                       "If -1 (default), all CPUs are used, for -2, all CPUs but one are used, etc. "
                       "If 1 is given, no parallel computing code is used at all.")
                    .metavar("JOBS")
                    .converter(converters::integer())
                    .defaultValue(constants::kHyperoptJobs));
    o.push_back(Option({"--random-state"}, "", "hyperopt_random_state",
                       "Set random state to some positive integer for reproducible hyperopt results.")
                    .metavar("INT")
                    .converter(converters::positiveInteger()));
    return g;
}

OptionGroup scriptsOptions() {
    OptionGroup g{"scripts", {}};
    g.options.push_back(
        Option({"--pairs"}, "-p", "pairs", "Show profits for only this pairs. Pairs are comma-separated."));
    return g;
}

OptionGroup downloadOptions() {
    OptionGroup g{"download", {}};
    auto& o = g.options;
    o.push_back(Option({"--pairs-file"}, "", "pairs_file", "File containing a list of pairs to download.").metavar("PATH"));
    o.push_back(Option({"--export"}, "", "export", "Export files to given dir.").metavar("PATH"));
    o.push_back(configOption());
    o.push_back(Option({"--days"}, "", "days", "Download data for given number of days.")
                    .metavar("INT")
                    .converter(converters::integer()));
    o.push_back(Option({"--exchange"}, "", "exchange", "Exchange name. Only valid if no config is provided.")
                    .defaultValue(std::string(constants::kDefaultExchange)));
    o.push_back(Option({"--timeframes"}, "-t", "timeframes", "Specify which tickers to download. Space separated list.",
                       Cardinality::OneOrMore)
                    .choices({"1m", "3m", "5m", "15m", "30m", "1h", "2h", "4h", "6h", "8h", "12h", "1d", "3d", "1w"})
                    .defaultValue(std::vector<std::string>{"1m", "5m"}));
    o.push_back(Option({"--erase"}, "", "erase", "Clean all existing data for the selected exchange/pairs/timeframes.",
                       Cardinality::StoreTrue)
                    .defaultValue(false));
    return g;
}

} // namespace tradecli
