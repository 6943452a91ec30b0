#include <gtest/gtest.h>
#include "cli/cli.hpp"

using namespace nx;

class CliArgsTest : public ::testing::Test {
protected:
    Command analyze;

    void SetUp() override {
        analyze = Command{
            "analyze",
            "Run one analysis",
            {
                {"query", "q", "Research question", "", true, false},
                {"max-articles", "m", "Maximum documents", "", false, false},
                {"limit", "l", "Page size", "20", false, false},
                {"verbose", "V", "Verbose logging", "", false, true}
            },
            [](const Args&) { return 0; }
        };
    }

    Args parse(std::vector<std::string> argv) {
        std::vector<char*> raw;
        for (auto& a : argv) raw.push_back(&a[0]);
        return CLI::parse_args(static_cast<int>(raw.size()), raw.data(), analyze);
    }
};

TEST_F(CliArgsTest, LongShortAndEqualsForms) {
    Args args = parse({"--query", "graph learning", "-m", "40", "--limit=5", "-V"});
    EXPECT_EQ(args.require("query"), "graph learning");
    EXPECT_EQ(args.get("max-articles").as_int(), 40);
    EXPECT_EQ(args.get("limit").as_int(), 5);
    EXPECT_TRUE(args.has("verbose"));
}

TEST_F(CliArgsTest, DefaultsAndOptionalInts) {
    Args args = parse({"-q", "x"});
    EXPECT_EQ(args.get("limit").as_int(), 20);
    EXPECT_FALSE(args.get("max-articles").as_optional_int().has_value());
    EXPECT_FALSE(args.has("verbose"));
    EXPECT_EQ(args.get("max-articles").as_int(7), 7);
}

TEST_F(CliArgsTest, PositionalArgumentsCollected) {
    Args args = parse({"extra", "-q", "x", "more"});
    EXPECT_EQ(args.positional, (std::vector<std::string>{"extra", "more"}));
}

TEST_F(CliArgsTest, ErrorsReported) {
    EXPECT_THROW(parse({}), std::runtime_error);
    EXPECT_THROW(parse({"-q", "x", "--unknown"}), std::runtime_error);
    EXPECT_THROW(parse({"-q"}), std::runtime_error);

    Args args = parse({"-q", "x", "-m", "forty"});
    EXPECT_THROW(args.get("max-articles").as_int(), std::runtime_error);
    EXPECT_THROW(args.get("max-articles").as_optional_int(), std::runtime_error);
}
