#include <gtest/gtest.h>
#include "text/tokenizer.hpp"

using namespace cg;

class TokenizerTest : public ::testing::Test {
protected:
    Tokenizer tokenizer{StopwordSet{"the"}, 3};
};

// ==========================================
// Unigram Extraction Tests
// ==========================================

TEST_F(TokenizerTest, CaseFoldsAndDropsStopwords) {
    auto words = tokenizer.extract_words("The Quick-Brown fox jumps");
    std::vector<std::string> expected = {"quick-brown", "fox", "jumps"};
    EXPECT_EQ(words, expected);
}

TEST_F(TokenizerTest, DropsShortTokens) {
    Tokenizer no_stop(StopwordSet{}, 3);
    auto words = no_stop.extract_words("an ox is big");
    std::vector<std::string> expected = {"big"};
    EXPECT_EQ(words, expected);
}

TEST_F(TokenizerTest, TrimsHyphensBeforeLengthCheck) {
    auto words = tokenizer.extract_words("--state-of-art-- -ab- x-");
    std::vector<std::string> expected = {"state-of-art"};
    EXPECT_EQ(words, expected);
}

TEST_F(TokenizerTest, KeepsApostrophesAndDigits) {
    auto words = tokenizer.extract_words("Don't ship 2024 builds");
    std::vector<std::string> expected = {"don't", "ship", "2024", "builds"};
    EXPECT_EQ(words, expected);
}

TEST_F(TokenizerTest, PunctuationSplitsWords) {
    auto words = tokenizer.extract_words("graphs, nodes; edges.");
    std::vector<std::string> expected = {"graphs", "nodes", "edges"};
    EXPECT_EQ(words, expected);
}

TEST_F(TokenizerTest, RunMustStartAlphanumeric) {
    auto words = tokenizer.extract_words("'quoted' -dash caf\xc3\xa9s");
    std::vector<std::string> expected = {"quoted'", "dash", "caf"};
    EXPECT_EQ(words, expected);
}

TEST_F(TokenizerTest, HandlesVeryLongWord) {
    std::string text = "intro " + std::string(100000, 'a') + " outro";
    auto terms = tokenizer.tokenize(text);
    ASSERT_EQ(terms.size(), 5u);
    EXPECT_EQ(terms[0], "intro");
    EXPECT_EQ(terms[2].size(), 100000u);
    EXPECT_EQ(terms[4], "outro");
}

// ==========================================
// Bigram Tests
// ==========================================

TEST_F(TokenizerTest, InterleavesBigramsAfterFirstHalf) {
    auto terms = tokenizer.tokenize("The Quick-Brown fox jumps");
    std::vector<std::string> expected = {
        "quick-brown", "quick-brown fox", "fox", "fox jumps", "jumps"
    };
    EXPECT_EQ(terms, expected);
}

TEST_F(TokenizerTest, TermCountIsTwiceUnigramsMinusOne) {
    auto words = tokenizer.extract_words("alpha beta gamma delta epsilon");
    auto terms = tokenizer.tokenize("alpha beta gamma delta epsilon");
    ASSERT_EQ(words.size(), 5u);
    EXPECT_EQ(terms.size(), 2 * words.size() - 1);
}

TEST_F(TokenizerTest, BigramsJoinSurvivorsAcrossRemovedStopwords) {
    Tokenizer english;
    auto terms = english.tokenize("graph of the nodes");
    std::vector<std::string> expected = {"graph", "graph nodes", "nodes"};
    EXPECT_EQ(terms, expected);
}

TEST_F(TokenizerTest, BigramsNeverContainStopwords) {
    Tokenizer english;
    auto terms = english.tokenize("The system was built with care and the tests were written for it");
    for (const auto& term : terms) {
        auto space = term.find(' ');
        if (space == std::string::npos) {
            EXPECT_FALSE(english.is_stopword(term)) << term;
            continue;
        }
        EXPECT_FALSE(english.is_stopword(term.substr(0, space))) << term;
        EXPECT_FALSE(english.is_stopword(term.substr(space + 1))) << term;
    }
}

TEST_F(TokenizerTest, SingleWordHasNoBigram) {
    auto terms = tokenizer.tokenize("lonely");
    ASSERT_EQ(terms.size(), 1u);
    EXPECT_EQ(terms[0], "lonely");
}

TEST_F(TokenizerTest, EmptyTextYieldsNothing) {
    EXPECT_TRUE(tokenizer.tokenize("").empty());
    EXPECT_TRUE(tokenizer.tokenize("  ... !! ").empty());
}

// ==========================================
// Helper Tests
// ==========================================

TEST(TokenizerHelpers, DefaultStopwordsCoverCommonWords) {
    auto stop = default_stopwords();
    EXPECT_EQ(stop.count("the"), 1u);
    EXPECT_EQ(stop.count("using"), 1u);
    EXPECT_EQ(stop.count("between"), 1u);
    EXPECT_EQ(stop.count("graph"), 0u);
}

TEST(TokenizerHelpers, TrimHyphens) {
    EXPECT_EQ(trim_hyphens("--abc--"), "abc");
    EXPECT_EQ(trim_hyphens("a-b"), "a-b");
    EXPECT_EQ(trim_hyphens("---"), "");
}

TEST(TokenizerHelpers, LowercasesAsciiOnly) {
    EXPECT_EQ(to_lower_ascii("MiXeD 123"), "mixed 123");
}

TEST(TokenizerHelpers, MinimumLengthIsConfigurable) {
    Tokenizer tokenizer(StopwordSet{}, 5);
    auto words = tokenizer.extract_words("tiny longer words");
    std::vector<std::string> expected = {"longer", "words"};
    EXPECT_EQ(words, expected);
}
