#include <gtest/gtest.h>
#include "graph/cooccurrence.hpp"
#include <type_traits>

using namespace cg;

class CooccurrenceTest : public ::testing::Test {
protected:
    // Ids by rank: alpha = 0, beta = 1, gamma = 2
    Vocabulary vocab = Vocabulary::from_frequencies(
        {{"alpha", 3}, {"beta", 2}, {"gamma", 1}}, 10);
};

TEST_F(CooccurrenceTest, CountsEveryPairInsideWindow) {
    CooccurrenceAccumulator acc(vocab, 12);
    acc.add_document({"alpha", "beta", "gamma"});

    const auto& table = acc.table();
    EXPECT_EQ(table.get(0, 1), 1u);
    EXPECT_EQ(table.get(0, 2), 1u);
    EXPECT_EQ(table.get(1, 2), 1u);
    EXPECT_EQ(table.occurrences, (std::vector<size_t>{1, 1, 1}));
    EXPECT_EQ(table.documents_scanned, 1u);
}

TEST_F(CooccurrenceTest, PairsAreSymmetric) {
    CooccurrenceAccumulator acc(vocab, 12);
    acc.add_document({"beta", "alpha"});
    acc.add_document({"alpha", "beta"});

    const auto& table = acc.table();
    EXPECT_EQ(table.get(0, 1), 2u);
    EXPECT_EQ(table.get(1, 0), 2u);
    ASSERT_EQ(table.pairs.size(), 1u);
    EXPECT_EQ(table.pairs.begin()->first, make_term_pair(1, 0));
}

TEST_F(CooccurrenceTest, WindowExcludesDistantTerms) {
    CooccurrenceAccumulator acc(vocab, 2);
    acc.add_document({"alpha", "beta", "gamma"});

    const auto& table = acc.table();
    EXPECT_EQ(table.get(0, 1), 1u);
    EXPECT_EQ(table.get(1, 2), 1u);
    EXPECT_EQ(table.get(0, 2), 0u);
}

TEST_F(CooccurrenceTest, OutOfVocabularyTermsLeaveNoGap) {
    CooccurrenceAccumulator acc(vocab, 2);
    acc.add_document({"alpha", "noise", "filler", "junk", "beta"});

    EXPECT_EQ(acc.table().get(0, 1), 1u);
    EXPECT_EQ(acc.map_to_ids({"alpha", "noise", "beta"}), (std::vector<size_t>{0, 1}));
}

TEST_F(CooccurrenceTest, RepeatedTermIsNotAPair) {
    CooccurrenceAccumulator acc(vocab, 12);
    acc.add_document({"alpha", "alpha", "alpha"});

    EXPECT_TRUE(acc.table().pairs.empty());
    EXPECT_EQ(acc.table().occurrences[0], 3u);
}

TEST_F(CooccurrenceTest, RepeatsInsideWindowAddUp) {
    CooccurrenceAccumulator acc(vocab, 12);
    acc.add_document({"alpha", "beta", "alpha", "beta"});

    // Four of the six position pairs mix alpha and beta
    EXPECT_EQ(acc.table().get(0, 1), 4u);
}

TEST_F(CooccurrenceTest, DocumentsDoNotShareWindows) {
    CooccurrenceAccumulator acc(vocab, 12);
    acc.add_document({"alpha"});
    acc.add_document({"beta"});

    EXPECT_EQ(acc.table().get(0, 1), 0u);
    EXPECT_EQ(acc.table().documents_scanned, 2u);
}

TEST_F(CooccurrenceTest, ZeroWindowIsRejected) {
    EXPECT_THROW(CooccurrenceAccumulator(vocab, 0), std::invalid_argument);
}

TEST_F(CooccurrenceTest, TemporaryVocabularyIsRejected) {
    static_assert(!std::is_constructible<CooccurrenceAccumulator, Vocabulary, size_t>::value,
                  "accumulator must not bind a temporary vocabulary");
    EXPECT_TRUE((std::is_constructible<CooccurrenceAccumulator, const Vocabulary&, size_t>::value));
    EXPECT_TRUE((std::is_constructible<CooccurrenceAccumulator, Vocabulary&, size_t>::value));
}

TEST_F(CooccurrenceTest, ReleaseResetsAccumulator) {
    CooccurrenceAccumulator acc(vocab, 12);
    acc.add_document({"alpha", "beta"});

    CooccurrenceTable table = acc.release();
    EXPECT_EQ(table.get(0, 1), 1u);
    EXPECT_TRUE(acc.table().pairs.empty());
    EXPECT_EQ(acc.table().occurrences.size(), vocab.size());
    EXPECT_EQ(acc.table().documents_scanned, 0u);
}

TEST_F(CooccurrenceTest, MergeAddsCounts) {
    CooccurrenceAccumulator first(vocab, 12);
    first.add_document({"alpha", "beta"});
    CooccurrenceAccumulator second(vocab, 12);
    second.add_document({"alpha", "beta", "gamma"});

    CooccurrenceTable merged = first.release();
    merged.merge(second.table());
    EXPECT_EQ(merged.get(0, 1), 2u);
    EXPECT_EQ(merged.get(1, 2), 1u);
    EXPECT_EQ(merged.occurrences[0], 2u);
    EXPECT_EQ(merged.documents_scanned, 2u);
}

TEST_F(CooccurrenceTest, EmptyVocabularyCountsNothing) {
    Vocabulary empty;
    CooccurrenceAccumulator acc(empty, 12);
    acc.add_document({"alpha", "beta"});

    EXPECT_TRUE(acc.table().pairs.empty());
    EXPECT_TRUE(acc.table().occurrences.empty());
}
