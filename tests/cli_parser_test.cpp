#include "cli/cli_parser.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace vqhuff {
namespace {

CliParser parse(std::vector<std::string> args) {
    args.insert(args.begin(), "vqhuff_test");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    CliParser cli;
    cli.parse(static_cast<int>(argv.size()), argv.data());
    return cli;
}

TEST(CliParser, KeyValuePairs) {
    const CliParser cli = parse({"--in", "a.pgm", "--out", "b.vqhf"});
    EXPECT_EQ(cli.get("in"), "a.pgm");
    EXPECT_EQ(cli.get("out"), "b.vqhf");
    EXPECT_FALSE(cli.has("block"));
    EXPECT_EQ(cli.get("block", "8"), "8");
}

TEST(CliParser, MultipleValuesAndFlags) {
    const CliParser cli = parse({"--levels", "16", "64", "256", "--verbose", "--out", "m.csv"});
    EXPECT_EQ(cli.get_all("levels"), std::vector<std::string>({"16", "64", "256"}));
    EXPECT_EQ(cli.get_int_list("levels", 2, 65536), std::vector<int>({16, 64, 256}));
    EXPECT_EQ(cli.get("verbose"), "true");
    EXPECT_EQ(cli.get("out"), "m.csv");
    EXPECT_TRUE(cli.get_all("missing").empty());
}

TEST(CliParser, IntegerValidation) {
    const CliParser cli = parse({"--block", "4", "--levels", "1", "--bad", "12x"});
    EXPECT_EQ(cli.get_int("block", 8, 2, 16), 4);
    EXPECT_EQ(cli.get_int("absent", 8, 2, 16), 8);
    EXPECT_THROW(cli.get_int("levels", 64, 2, 65536), std::invalid_argument);
    EXPECT_THROW(cli.get_int("bad", 0, 0, 100), std::invalid_argument);
    EXPECT_THROW(cli.get_int_list("bad", 0, 100), std::invalid_argument);
}

TEST(CliParser, LaterKeyOverridesEarlier) {
    const CliParser cli = parse({"stray", "--in", "x", "--in", "y"});
    EXPECT_EQ(cli.get_all("in"), std::vector<std::string>({"y"}));
}

} // namespace
} // namespace vqhuff
