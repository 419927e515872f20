#include <gtest/gtest.h>
#include "cli/Args.hpp"
#include "cli/Parser.hpp"

#include <string>
#include <vector>

using namespace lc::cli;

TEST(ArgsTest, DirectoryOnlyUsesDefaults) {
    const auto args = Args::parse(std::vector<std::string>{"src"});
    EXPECT_EQ(args.directory, "src");
    EXPECT_FALSE(args.by_ext.has_value());
    EXPECT_FALSE(args.threads.has_value());
    EXPECT_FALSE(args.json);
    EXPECT_FALSE(args.config_path.has_value());
}

TEST(ArgsTest, ShortFlags) {
    const auto args = Args::parse(std::vector<std::string>{"-A", "-j", "8", "proj"});
    EXPECT_EQ(args.directory, "proj");
    EXPECT_EQ(args.by_ext, true);
    EXPECT_EQ(args.threads, 8u);
}

TEST(ArgsTest, LongFlags) {
    const auto args = Args::parse(std::vector<std::string>{"proj", "--by-ext", "--threads", "3", "--json"});
    EXPECT_EQ(args.directory, "proj");
    EXPECT_EQ(args.by_ext, true);
    EXPECT_EQ(args.threads, 3u);
    EXPECT_TRUE(args.json);
}

TEST(ArgsTest, GluedValues) {
    EXPECT_EQ(Args::parse(std::vector<std::string>{"-j4", "d"}).threads, 4u);
    EXPECT_EQ(Args::parse(std::vector<std::string>{"--threads=12", "d"}).threads, 12u);

    const auto bundled = Args::parse(std::vector<std::string>{"-Aj2", "d"});
    EXPECT_EQ(bundled.by_ext, true);
    EXPECT_EQ(bundled.threads, 2u);
}

TEST(ArgsTest, LastThreadsValueWins) {
    EXPECT_EQ(Args::parse(std::vector<std::string>{"-j", "2", "d", "-j", "5"}).threads, 5u);
}

TEST(ArgsTest, ZeroThreadsIsAccepted) {
    EXPECT_EQ(Args::parse(std::vector<std::string>{"-j", "0", "d"}).threads, 0u);
}

TEST(ArgsTest, ConfigPath) {
    const auto args = Args::parse(std::vector<std::string>{"-c", "/etc/linecount.yaml", "d"});
    ASSERT_TRUE(args.config_path.has_value());
    EXPECT_EQ(*args.config_path, "/etc/linecount.yaml");
}

TEST(ArgsTest, DirectoryAfterSentinelMayStartWithDash) {
    const auto args = Args::parse(std::vector<std::string>{"-A", "--", "-weird"});
    EXPECT_EQ(args.directory, "-weird");
}

TEST(ArgsTest, MissingDirectoryIsRejected) {
    EXPECT_THROW(Args::parse(std::vector<std::string>{}), ArgsError);
    EXPECT_THROW(Args::parse(std::vector<std::string>{"-A"}), ArgsError);
}

TEST(ArgsTest, ExtraPositionalIsRejected) {
    EXPECT_THROW(Args::parse(std::vector<std::string>{"a", "b"}), ArgsError);
}

TEST(ArgsTest, InvalidThreadsAreRejected) {
    EXPECT_THROW(Args::parse(std::vector<std::string>{"-j", "many", "d"}), ArgsError);
    EXPECT_THROW(Args::parse(std::vector<std::string>{"-j", "-2", "d"}), ArgsError);
    EXPECT_THROW(Args::parse(std::vector<std::string>{"-j", "3.5", "d"}), ArgsError);
    EXPECT_THROW(Args::parse(std::vector<std::string>{"--threads=", "d"}), ArgsError);
    EXPECT_THROW(Args::parse(std::vector<std::string>{"-j", "99999999999", "d"}), ArgsError);
}

TEST(ArgsTest, ThreadsWithoutValueIsRejected) {
    EXPECT_THROW(Args::parse(std::vector<std::string>{"d", "-j"}), ArgsError);
}

TEST(ArgsTest, UnknownFlagIsRejected) {
    EXPECT_THROW(Args::parse(std::vector<std::string>{"--bogus", "d"}), ArgsError);
    EXPECT_THROW(Args::parse(std::vector<std::string>{"-x", "d"}), ArgsError);
}

TEST(ArgsTest, HelpAndVersionNeedNoDirectory) {
    EXPECT_TRUE(Args::parse(std::vector<std::string>{"--help"}).help);
    EXPECT_TRUE(Args::parse(std::vector<std::string>{"-h"}).help);
    EXPECT_TRUE(Args::parse(std::vector<std::string>{"-V"}).version);
}

TEST(ArgsTest, ArgvOverloadSkipsProgramName) {
    char prog[] = "linecount";
    char flag[] = "-A";
    char dir[] = "tree";
    char* argv[] = {prog, flag, dir};
    const auto args = Args::parse(3, argv);
    EXPECT_EQ(args.directory, "tree");
    EXPECT_EQ(args.by_ext, true);
}

TEST(ArgsTest, UsageMentionsEveryOption) {
    const auto text = usage();
    for (const auto* opt : {"--by-ext", "--threads", "--json", "--config", "--verbose", "--help", "--version"})
        EXPECT_NE(text.find(opt), std::string::npos) << opt;
}

TEST(TokenizerTest, NegativeNumberIsAWord) {
    const auto toks = tokenize({"-j", "-3"}, {"j"});
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].type, TokenType::Flag);
    EXPECT_EQ(toks[1].type, TokenType::Word);
    EXPECT_EQ(toks[1].text, "-3");
}

TEST(TokenizerTest, BooleanFlagDoesNotConsumeNextWord) {
    const auto call = parseTokens(tokenize({"-A", "dir"}, {"j"}), {"j"});
    EXPECT_TRUE(call.has("A"));
    EXPECT_FALSE(call.value("A").has_value());
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "dir");
}
