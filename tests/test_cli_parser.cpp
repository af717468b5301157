/**
 * @file test_cli_parser.cpp
 * @brief Unit tests for the command-line option parser
 */

#include "pixschem/cli_parser.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace pixschem;

TEST(CliParserTest, PositionalArguments) {
    const char* argv[] = {"pixschem", "image.png", "out.schem", "64", "32"};
    CliParser cli;
    cli.parse(5, argv);

    EXPECT_EQ(cli.positional(), (std::vector<std::string>{"image.png", "out.schem", "64", "32"}));
}

TEST(CliParserTest, FlagsAndValues) {
    const char* argv[] = {"pixschem", "--verbose", "--threads", "4", "in.png", "--blocks=wool,glass", "out"};
    CliParser cli({"threads", "blocks"});
    cli.parse(7, argv);

    EXPECT_TRUE(cli.has("verbose"));
    EXPECT_EQ(cli.get("verbose"), "true");
    EXPECT_EQ(cli.get("threads"), "4");
    EXPECT_EQ(cli.get("blocks"), "wool,glass");
    EXPECT_EQ(cli.positional(), (std::vector<std::string>{"in.png", "out"}));
}

TEST(CliParserTest, UnregisteredOptionIsFlag) {
    const char* argv[] = {"pixschem", "--keep-aspect", "in.png"};
    CliParser cli({"threads"});
    cli.parse(3, argv);

    EXPECT_TRUE(cli.has("keep-aspect"));
    EXPECT_EQ(cli.positional(), (std::vector<std::string>{"in.png"}));
}

TEST(CliParserTest, MissingValueThrows) {
    const char* argv[] = {"pixschem", "in.png", "--threads"};
    CliParser cli({"threads"});
    EXPECT_THROW(cli.parse(3, argv), std::invalid_argument);
}

TEST(CliParserTest, DefaultForMissingKey) {
    const char* argv[] = {"pixschem"};
    CliParser cli;
    cli.parse(1, argv);

    EXPECT_FALSE(cli.has("config"));
    EXPECT_EQ(cli.get("config", "pixschem.conf"), "pixschem.conf");
    EXPECT_TRUE(cli.positional().empty());
}

TEST(CliParserTest, DoubleDashIsPositional) {
    const char* argv[] = {"pixschem", "--", "-odd-name.png"};
    CliParser cli;
    cli.parse(3, argv);

    EXPECT_EQ(cli.positional(), (std::vector<std::string>{"--", "-odd-name.png"}));
}

TEST(CliParserTest, ReparseResets) {
    const char* first[] = {"pixschem", "--verbose", "a"};
    const char* second[] = {"pixschem", "b"};
    CliParser cli;
    cli.parse(3, first);
    cli.parse(2, second);

    EXPECT_FALSE(cli.has("verbose"));
    EXPECT_EQ(cli.positional(), (std::vector<std::string>{"b"}));
}
