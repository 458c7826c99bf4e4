#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Core>

namespace signrecog {

    /// All recorded sequences of one word; each matrix is frames x features
    using SequenceSet = std::vector<Eigen::MatrixXd>;

    /**
     * @brief Row-concatenated observations plus per-sequence frame counts
     *
     * The exact input format of SequenceModelTrainer::fit and
     * SequenceModel::score.
     */
    struct CombinedSequences {
        Eigen::MatrixXd X;
        std::vector<int> lengths;

        int num_frames() const { return static_cast<int>(X.rows()); }
        int num_features() const { return static_cast<int>(X.cols()); }
        size_t num_sequences() const { return lengths.size(); }
    };

    /**
     * @brief Concatenate the sequences selected by index, in index order
     * @throws DataError on out-of-range indices or mismatched feature counts
     */
    CombinedSequences combine_sequences(const std::vector<size_t>& indices,
                                        const SequenceSet& sequences);

    /// Concatenate every sequence of the set
    CombinedSequences combine_all(const SequenceSet& sequences);

    /**
     * @brief Training corpus: every word's sequences and their combined form
     *
     * Words are kept in lexicographic order so iteration is deterministic.
     */
    class WordCorpus {
    public:
        WordCorpus() = default;

        /**
         * @brief Append one sequence for a word
         * @throws DataError on an empty sequence or a feature count that
         *         differs from the sequences already stored
         */
        void add_sequence(const std::string& word, const Eigen::MatrixXd& sequence);

        bool contains(const std::string& word) const;
        std::vector<std::string> words() const;
        size_t num_words() const { return sequences_.size(); }
        int num_features() const { return num_features_; }

        /// @throws DataError for an unknown word
        const SequenceSet& sequences(const std::string& word) const;
        /// @throws DataError for an unknown word
        const CombinedSequences& combined(const std::string& word) const;

        const std::map<std::string, CombinedSequences>& all_combined() const { return combined_; }

    private:
        std::map<std::string, SequenceSet> sequences_;
        std::map<std::string, CombinedSequences> combined_;
        int num_features_ = 0;
    };

    /**
     * @brief One unlabeled (or optionally labeled) test sequence
     */
    struct TestItem {
        CombinedSequences data;
        std::optional<std::string> word;    // Ground truth, when known
    };

    /**
     * @brief Ordered collection of test sequences keyed by sequence id
     */
    class TestSet {
    public:
        TestSet() = default;

        /// @throws DataError on a duplicate id or an empty sequence
        void add_sequence(int id, const Eigen::MatrixXd& sequence,
                          const std::optional<std::string>& word = std::nullopt);

        size_t size() const { return items_.size(); }
        bool empty() const { return items_.empty(); }

        const std::map<int, TestItem>& items() const { return items_; }

        /// Combined observations of every sequence, iterated in id order
        std::map<int, CombinedSequences> combined_sequences() const;

        /// Ground-truth words in id order (nullopt where unlabeled)
        std::vector<std::optional<std::string>> words_in_order() const;

    private:
        std::map<int, TestItem> items_;
    };

} // namespace signrecog
