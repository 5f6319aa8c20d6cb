#include <gtest/gtest.h>
#include "cli/cli.hpp"

using namespace cg;

class CliTest : public ::testing::Test {
protected:
    Command generate{
        "generate",
        "Build the graph",
        {
            {"input", "i", "Corpus root", "content/blog", false, false},
            {"output", "o", "Output directory", "static/graph", false, false},
            {"max-nodes", "n", "Vocabulary size", "30", false, false},
            {"quiet", "q", "Less output", "", false, true}
        },
        [](const Args&) { return 0; },
        "[root] [outdir]",
        2
    };

    Command render{
        "render",
        "Render a graph",
        {
            {"input", "i", "Graph JSON file", "", true, false}
        },
        [](const Args&) { return 0; }
    };

    Args parse(const std::vector<std::string>& tokens, const Command& cmd) {
        storage_ = tokens;
        pointers_.clear();
        for (auto& token : storage_) {
            pointers_.push_back(token.data());
        }
        return CLI::parse_args(static_cast<int>(pointers_.size()), pointers_.data(), cmd);
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

TEST_F(CliTest, PositionalArguments) {
    Args args = parse({"posts", "public/graph"}, generate);
    ASSERT_EQ(args.positional.size(), 2u);
    EXPECT_EQ(args.option_or_positional("input", 0, "content/blog"), "posts");
    EXPECT_EQ(args.option_or_positional("output", 1, "static/graph"), "public/graph");
}

TEST_F(CliTest, DefaultsWhenNothingGiven) {
    Args args = parse({}, generate);
    EXPECT_EQ(args.option_or_positional("input", 0, "content/blog"), "content/blog");
    EXPECT_FALSE(args.has("max-nodes"));
    EXPECT_FALSE(args.get("quiet").as_flag());
}

TEST_F(CliTest, NamedOptionBeatsPositional) {
    Args args = parse({"posts", "--input", "drafts"}, generate);
    EXPECT_EQ(args.option_or_positional("input", 0, "content/blog"), "drafts");
}

TEST_F(CliTest, ShortAndEqualsForms) {
    Args args = parse({"-n", "12", "--output=site/graph", "-q"}, generate);
    EXPECT_EQ(args.get("max-nodes").as_size(), 12u);
    EXPECT_EQ(args.require("output"), "site/graph");
    EXPECT_TRUE(args.get("quiet").as_flag());
}

TEST_F(CliTest, TooManyPositionalsRejected) {
    EXPECT_THROW(parse({"a", "b", "c"}, generate), std::runtime_error);
}

TEST_F(CliTest, UnknownArgumentRejected) {
    EXPECT_THROW(parse({"--colour", "blue"}, generate), std::runtime_error);
    EXPECT_THROW(parse({"-z"}, generate), std::runtime_error);
}

TEST_F(CliTest, MissingValueRejected) {
    EXPECT_THROW(parse({"--max-nodes"}, generate), std::runtime_error);
}

TEST_F(CliTest, RequiredArgumentEnforced) {
    EXPECT_THROW(parse({}, render), std::runtime_error);
    Args args = parse({"-i", "graph.json"}, render);
    EXPECT_EQ(args.require("input"), "graph.json");
    EXPECT_THROW(args.require("output"), std::runtime_error);
}

TEST_F(CliTest, PositionalsRejectedWhenNotDeclared) {
    EXPECT_THROW(parse({"-i", "graph.json", "extra"}, render), std::runtime_error);
}

TEST(ArgValueTest, AsSizeParsesStrictly) {
    EXPECT_EQ((ArgValue{"42", true}).as_size(), 42u);
    EXPECT_EQ((ArgValue{}).as_size(7), 7u);
    EXPECT_THROW((ArgValue{"12abc", true}).as_size(), std::runtime_error);
    EXPECT_THROW((ArgValue{"-3", true}).as_size(), std::runtime_error);
    EXPECT_THROW((ArgValue{"", true}).as_size(), std::runtime_error);
}

TEST(ArgValueTest, FlagValues) {
    EXPECT_TRUE((ArgValue{"true", true}).as_flag());
    EXPECT_FALSE((ArgValue{"false", true}).as_flag());
    EXPECT_FALSE((ArgValue{}).as_flag());
}

TEST(CliRunTest, UnknownCommandFails) {
    CLI cli("conceptgraph", "1.0.0");
    std::vector<std::string> tokens = {"conceptgraph", "explode"};
    std::vector<char*> argv;
    for (auto& token : tokens) argv.push_back(token.data());
    EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 1);
}

TEST(CliRunTest, DispatchesToHandler) {
    CLI cli("conceptgraph", "1.0.0");
    int seen = -1;
    cli.register_command({
        "stats",
        "Print statistics",
        {{"input", "i", "Graph JSON file", "", true, false}},
        [&seen](const Args& args) {
            seen = args.require("input") == "graph.json" ? 1 : 0;
            return 0;
        }
    });

    std::vector<std::string> tokens = {"conceptgraph", "stats", "--input", "graph.json"};
    std::vector<char*> argv;
    for (auto& token : tokens) argv.push_back(token.data());
    EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 0);
    EXPECT_EQ(seen, 1);
}

TEST(CliRunTest, HandlerExceptionsBecomeExitCodeOne) {
    CLI cli("conceptgraph", "1.0.0");
    cli.register_command({
        "stats",
        "Print statistics",
        {},
        [](const Args&) -> int { throw std::runtime_error("boom"); }
    });

    std::vector<std::string> tokens = {"conceptgraph", "stats"};
    std::vector<char*> argv;
    for (auto& token : tokens) argv.push_back(token.data());
    EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 1);
}
