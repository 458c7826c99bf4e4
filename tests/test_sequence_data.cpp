#include <gtest/gtest.h>
#include "signrecog/errors.h"
#include "signrecog/sequence_data.h"
#include "test_helpers.h"

using namespace signrecog;
using signrecog::testing_support::make_sequence;

class SequenceDataTest : public ::testing::Test {
protected:
    void SetUp() override {
        sequences_.push_back(make_sequence(3, 0.0));
        sequences_.push_back(make_sequence(4, 1.0));
        sequences_.push_back(make_sequence(5, 2.0));
    }

    SequenceSet sequences_;
};

TEST_F(SequenceDataTest, CombineSelectedSequencesInIndexOrder) {
    CombinedSequences combined = combine_sequences({2, 0}, sequences_);

    ASSERT_EQ(combined.lengths.size(), 2u);
    EXPECT_EQ(combined.lengths[0], 5);
    EXPECT_EQ(combined.lengths[1], 3);
    EXPECT_EQ(combined.num_frames(), 8);
    EXPECT_EQ(combined.num_features(), 2);
    EXPECT_TRUE(combined.X.topRows(5).isApprox(sequences_[2]));
    EXPECT_TRUE(combined.X.bottomRows(3).isApprox(sequences_[0]));
}

TEST_F(SequenceDataTest, CombineAllKeepsEveryFrame) {
    CombinedSequences combined = combine_all(sequences_);

    EXPECT_EQ(combined.num_sequences(), 3u);
    EXPECT_EQ(combined.num_frames(), 12);
}

TEST_F(SequenceDataTest, CombineRejectsOutOfRangeIndex) {
    EXPECT_THROW(combine_sequences({0, 7}, sequences_), DataError);
}

TEST_F(SequenceDataTest, CombineRejectsMixedFeatureCounts) {
    sequences_.push_back(make_sequence(3, 0.0, 3));
    EXPECT_THROW(combine_sequences({0, 3}, sequences_), DataError);
}

TEST(WordCorpusTest, GroupsSequencesByWord) {
    WordCorpus corpus;
    corpus.add_sequence("BOOK", make_sequence(4, 0.0));
    corpus.add_sequence("CHOCOLATE", make_sequence(6, 3.0));
    corpus.add_sequence("BOOK", make_sequence(5, 0.5));

    EXPECT_EQ(corpus.num_words(), 2u);
    EXPECT_EQ(corpus.num_features(), 2);
    EXPECT_TRUE(corpus.contains("BOOK"));
    EXPECT_FALSE(corpus.contains("VEGETABLE"));

    std::vector<std::string> expected = {"BOOK", "CHOCOLATE"};
    EXPECT_EQ(corpus.words(), expected);

    EXPECT_EQ(corpus.sequences("BOOK").size(), 2u);
    const CombinedSequences& book = corpus.combined("BOOK");
    EXPECT_EQ(book.num_frames(), 9);
    EXPECT_EQ(book.lengths, (std::vector<int>{4, 5}));
}

TEST(WordCorpusTest, RejectsInconsistentFeatureCount) {
    WordCorpus corpus;
    corpus.add_sequence("BOOK", make_sequence(4, 0.0, 2));
    EXPECT_THROW(corpus.add_sequence("BOOK", make_sequence(4, 0.0, 3)), DataError);
}

TEST(WordCorpusTest, RejectsEmptySequence) {
    WordCorpus corpus;
    EXPECT_THROW(corpus.add_sequence("BOOK", Eigen::MatrixXd(0, 2)), DataError);
}

TEST(WordCorpusTest, UnknownWordThrows) {
    WordCorpus corpus;
    EXPECT_THROW(corpus.sequences("BOOK"), DataError);
    EXPECT_THROW(corpus.combined("BOOK"), DataError);
}

TEST(TestSetTest, ItemsIterateInIdOrder) {
    TestSet test_set;
    test_set.add_sequence(7, make_sequence(4, 0.0), std::string("BOOK"));
    test_set.add_sequence(2, make_sequence(3, 1.0));
    test_set.add_sequence(5, make_sequence(5, 2.0), std::string("JOHN"));

    EXPECT_EQ(test_set.size(), 3u);

    auto combined = test_set.combined_sequences();
    std::vector<int> ids;
    for (const auto& [id, data] : combined) {
        ids.push_back(id);
        EXPECT_EQ(data.lengths.size(), 1u);
    }
    EXPECT_EQ(ids, (std::vector<int>{2, 5, 7}));

    auto words = test_set.words_in_order();
    ASSERT_EQ(words.size(), 3u);
    EXPECT_FALSE(words[0].has_value());
    EXPECT_EQ(words[1], std::optional<std::string>("JOHN"));
    EXPECT_EQ(words[2], std::optional<std::string>("BOOK"));
}

TEST(TestSetTest, RejectsDuplicateId) {
    TestSet test_set;
    test_set.add_sequence(1, make_sequence(4, 0.0));
    EXPECT_THROW(test_set.add_sequence(1, make_sequence(4, 0.0)), DataError);
}
