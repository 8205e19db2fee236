#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "tradecli/option_groups.hpp"
#include "tradecli/parser.hpp"

using tradecli::Parser;

namespace {

std::vector<tradecli::Option> hyperoptScope() {
    auto out = tradecli::optimizerSharedOptions().options;
    const auto own = tradecli::hyperoptOptions().options;
    out.insert(out.end(), own.begin(), own.end());
    return out;
}

} // namespace

TEST(ParserTest, CountFlagGrouping) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"-vvv"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(std::get<int>(p.values().at("loglevel")), 3);
}

TEST(ParserTest, CountFlagRepeated) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"-v", "--verbose"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(std::get<int>(p.values().at("loglevel")), 2);
}

TEST(ParserTest, AppendKeepsOrder) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"-c", "a.json", "--config=b.json", "-cc.json"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    const std::vector<std::string> want{"a.json", "b.json", "c.json"};
    EXPECT_EQ(std::get<std::vector<std::string>>(p.values().at("config")), want);
}

TEST(ParserTest, ShortOptionWithEquals) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"-i=5m", "-e=30", "-s=buy"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(std::get<std::string>(p.values().at("ticker_interval")), "5m");
    EXPECT_EQ(std::get<int>(p.values().at("epochs")), 30);
    EXPECT_EQ(std::get<std::vector<std::string>>(p.values().at("spaces")), std::vector<std::string>{"buy"});
}

TEST(ParserTest, ShortGroupWithEquals) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"-c=a.json", "-vc=b.json"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    const std::vector<std::string> want{"a.json", "b.json"};
    EXPECT_EQ(std::get<std::vector<std::string>>(p.values().at("config")), want);
    EXPECT_EQ(std::get<int>(p.values().at("loglevel")), 1);
}

TEST(ParserTest, ShortNullaryWithEqualsFails) {
    const auto options = tradecli::backtestingOptions().options;
    const std::vector<std::string> args{"-l=1"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("ignored explicit argument '1'"), std::string::npos);
}

TEST(ParserTest, AttachedValueIsTheOnlyListValue) {
    const auto options = hyperoptScope();
    {
        const std::vector<std::string> args{"--spaces=buy", "sell"};
        const Parser p(args, 0, options);
        ASSERT_TRUE(p.ok()) << p.error();
        EXPECT_EQ(std::get<std::vector<std::string>>(p.values().at("spaces")), std::vector<std::string>{"buy"});
        EXPECT_EQ(p.positionals(), std::vector<std::string>{"sell"});
    }
    {
        const std::vector<std::string> args{"-sbuy", "sell"};
        const Parser p(args, 0, options);
        ASSERT_TRUE(p.ok()) << p.error();
        EXPECT_EQ(std::get<std::vector<std::string>>(p.values().at("spaces")), std::vector<std::string>{"buy"});
        EXPECT_EQ(p.positionals(), std::vector<std::string>{"sell"});
    }
}

TEST(ParserTest, AttachedChoiceIsChecked) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"--spaces=everything"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("invalid choice: 'everything'"), std::string::npos);
}

TEST(ParserTest, UniquePrefixSelectsLongOption) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"--strategy-p", "user_data", "--db=sqlite://", "--verb"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(std::get<std::string>(p.values().at("strategy_path")), "user_data");
    EXPECT_EQ(std::get<std::string>(p.values().at("db_url")), "sqlite://");
    EXPECT_EQ(std::get<int>(p.values().at("loglevel")), 1);
}

TEST(ParserTest, ExactSpellingBeatsLongerPrefixMatch) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"--strategy", "X"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(std::get<std::string>(p.values().at("strategy")), "X");
    EXPECT_FALSE(p.supplied("strategy_path"));
}

TEST(ParserTest, AmbiguousPrefixFails) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"--strat", "X"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_EQ(p.error(), "ambiguous option: --strat could match --strategy, --strategy-path");
}

TEST(ParserTest, AbbreviationCanBeDisabled) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"--verb"};
    Parser::Options opts;
    opts.allowAbbreviation = false;
    const Parser p(args, 0, options, opts);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("unrecognized arguments: --verb"), std::string::npos);
}

TEST(ParserTest, StopsAtPositionalAfterDoubleDash) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"-v", "--", "backtesting"};
    Parser::Options opts;
    opts.stopAtPositional = true;
    const Parser p(args, 0, options, opts);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.stopIndex(), 2u);
}

TEST(ParserTest, SuggestRanksByDistance) {
    const std::vector<std::string> candidates{"backtesting", "edge", "hyperopt", "hyperopt"};
    EXPECT_EQ(Parser::suggest("hyperop", candidates), std::vector<std::string>{"hyperopt"});
    EXPECT_EQ(Parser::suggest("edgy", candidates), std::vector<std::string>{"edge"});
    EXPECT_TRUE(Parser::suggest("plot", candidates).empty());
    EXPECT_EQ(Parser::suggest("", {"b", "a"}, 1), std::vector<std::string>{"a"});
}

TEST(ParserTest, StopsAtFirstPositional) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"-s", "MyStrategy", "backtesting", "--live"};
    Parser::Options opts;
    opts.stopAtPositional = true;
    const Parser p(args, 0, options, opts);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.stopIndex(), 2u);
    EXPECT_EQ(std::get<std::string>(p.values().at("strategy")), "MyStrategy");
}

TEST(ParserTest, NegativeNumbersAreValues) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"-j", "-2", "--timerange", "-20180101"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(std::get<int>(p.values().at("hyperopt_jobs")), -2);
    EXPECT_EQ(std::get<std::string>(p.values().at("timerange")), "-20180101");
}

TEST(ParserTest, OneOrMoreStopsAtNextOption) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"--spaces", "buy", "sell", "--epochs", "5"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    const std::vector<std::string> want{"buy", "sell"};
    EXPECT_EQ(std::get<std::vector<std::string>>(p.values().at("spaces")), want);
    EXPECT_EQ(std::get<int>(p.values().at("epochs")), 5);
}

TEST(ParserTest, ChoiceOutsideSetFails) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"-s", "buy", "everything"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("invalid choice: 'everything'"), std::string::npos);
}

TEST(ParserTest, OneOrMoreNeedsAValue) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"--spaces", "--print-all"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("expected at least one argument"), std::string::npos);
}

TEST(ParserTest, ConverterFailureIsReported) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"--random-state", "0"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("--random-state"), std::string::npos);
    EXPECT_NE(p.error().find("should be a positive integer value"), std::string::npos);
}

TEST(ParserTest, MissingValueFails) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"--timerange"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("expected one argument"), std::string::npos);
}

TEST(ParserTest, OptionalValueUsesConstantWhenBare) {
    const auto options = tradecli::globalOptions().options;
    {
        const std::vector<std::string> args{"--dynamic-whitelist", "--sd-notify"};
        const Parser p(args, 0, options);
        ASSERT_TRUE(p.ok()) << p.error();
        EXPECT_EQ(std::get<int>(p.values().at("dynamic_whitelist")), 20);
        EXPECT_TRUE(std::get<bool>(p.values().at("sd_notify")));
    }
    {
        const std::vector<std::string> args{"--dynamic-whitelist", "15"};
        const Parser p(args, 0, options);
        ASSERT_TRUE(p.ok()) << p.error();
        EXPECT_EQ(std::get<int>(p.values().at("dynamic_whitelist")), 15);
    }
}

TEST(ParserTest, StoreFalse) {
    auto options = tradecli::backtestingOptions().options;
    const std::vector<std::string> args{"--dmmp", "--eps"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_FALSE(std::get<bool>(p.values().at("use_max_market_positions")));
    EXPECT_TRUE(std::get<bool>(p.values().at("position_stacking")));
}

TEST(ParserTest, ExplicitValueOnFlagFails) {
    const auto options = tradecli::backtestingOptions().options;
    const std::vector<std::string> args{"--live=yes"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("ignored explicit argument"), std::string::npos);
}

TEST(ParserTest, UnknownFlagSuggests) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"--strategi", "X"};
    const Parser p(args, 0, options);
    EXPECT_FALSE(p.ok());
    EXPECT_NE(p.error().find("unrecognized arguments: --strategi"), std::string::npos);
    EXPECT_NE(p.error().find("--strategy"), std::string::npos);
}

TEST(ParserTest, VersionStopsParsing) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"--version", "--no-such-flag"};
    const Parser p(args, 0, options);
    EXPECT_TRUE(p.ok());
    EXPECT_TRUE(p.versionRequested());
}

TEST(ParserTest, HelpStopsParsing) {
    const auto options = tradecli::globalOptions().options;
    const std::vector<std::string> args{"-h", "--no-such-flag"};
    const Parser p(args, 0, options);
    EXPECT_TRUE(p.ok());
    EXPECT_TRUE(p.helpRequested());
}

TEST(ParserTest, FloatConversion) {
    const auto options = hyperoptScope();
    const std::vector<std::string> args{"--stake_amount", "0.05", "--max_open_trades", "3"};
    const Parser p(args, 0, options);
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_DOUBLE_EQ(std::get<double>(p.values().at("stake_amount")), 0.05);
    EXPECT_EQ(std::get<int>(p.values().at("max_open_trades")), 3);
}

TEST(ParserTest, NegativeNumberDetection) {
    EXPECT_TRUE(Parser::looksLikeNegativeNumber("-100"));
    EXPECT_TRUE(Parser::looksLikeNegativeNumber("-0.5"));
    EXPECT_TRUE(Parser::looksLikeNegativeNumber("-.5"));
    EXPECT_FALSE(Parser::looksLikeNegativeNumber("-v"));
    EXPECT_FALSE(Parser::looksLikeNegativeNumber("-0.01,-0.1"));
    EXPECT_FALSE(Parser::looksLikeNegativeNumber("-"));
    EXPECT_FALSE(Parser::isFlagToken("-20180101"));
    EXPECT_TRUE(Parser::isFlagToken("--live"));
}
