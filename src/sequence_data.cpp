#include "signrecog/sequence_data.h"
#include "signrecog/errors.h"
#include <numeric>

namespace signrecog {

    CombinedSequences combine_sequences(const std::vector<size_t>& indices,
                                        const SequenceSet& sequences) {
        CombinedSequences combined;
        if (indices.empty()) {
            return combined;
        }

        int total_frames = 0;
        int features = -1;
        combined.lengths.reserve(indices.size());

        for (size_t idx : indices) {
            if (idx >= sequences.size()) {
                throw DataError("Sequence index " + std::to_string(idx) + " out of range");
            }
            const Eigen::MatrixXd& seq = sequences[idx];
            if (features < 0) {
                features = static_cast<int>(seq.cols());
            } else if (seq.cols() != features) {
                throw DataError("Feature count mismatch while combining sequences");
            }
            combined.lengths.push_back(static_cast<int>(seq.rows()));
            total_frames += static_cast<int>(seq.rows());
        }

        combined.X.resize(total_frames, features);
        int row = 0;
        for (size_t idx : indices) {
            const Eigen::MatrixXd& seq = sequences[idx];
            combined.X.middleRows(row, seq.rows()) = seq;
            row += static_cast<int>(seq.rows());
        }

        return combined;
    }

    CombinedSequences combine_all(const SequenceSet& sequences) {
        std::vector<size_t> indices(sequences.size());
        std::iota(indices.begin(), indices.end(), 0);
        return combine_sequences(indices, sequences);
    }

    // WordCorpus implementation
    void WordCorpus::add_sequence(const std::string& word, const Eigen::MatrixXd& sequence) {
        if (sequence.rows() == 0 || sequence.cols() == 0) {
            throw DataError("Empty sequence for word '" + word + "'");
        }
        if (num_features_ == 0) {
            num_features_ = static_cast<int>(sequence.cols());
        } else if (sequence.cols() != num_features_) {
            throw DataError("Sequence for word '" + word + "' has " + std::to_string(sequence.cols()) +
                            " features, corpus has " + std::to_string(num_features_));
        }

        SequenceSet& set = sequences_[word];
        set.push_back(sequence);
        combined_[word] = combine_all(set);
    }

    bool WordCorpus::contains(const std::string& word) const {
        return sequences_.find(word) != sequences_.end();
    }

    std::vector<std::string> WordCorpus::words() const {
        std::vector<std::string> result;
        result.reserve(sequences_.size());
        for (const auto& [word, set] : sequences_) {
            result.push_back(word);
        }
        return result;
    }

    const SequenceSet& WordCorpus::sequences(const std::string& word) const {
        auto it = sequences_.find(word);
        if (it == sequences_.end()) {
            throw DataError("Unknown word '" + word + "'");
        }
        return it->second;
    }

    const CombinedSequences& WordCorpus::combined(const std::string& word) const {
        auto it = combined_.find(word);
        if (it == combined_.end()) {
            throw DataError("Unknown word '" + word + "'");
        }
        return it->second;
    }

    // TestSet implementation
    void TestSet::add_sequence(int id, const Eigen::MatrixXd& sequence,
                               const std::optional<std::string>& word) {
        if (sequence.rows() == 0 || sequence.cols() == 0) {
            throw DataError("Empty test sequence " + std::to_string(id));
        }
        if (items_.count(id) > 0) {
            throw DataError("Duplicate test sequence id " + std::to_string(id));
        }

        TestItem item;
        item.data.X = sequence;
        item.data.lengths.push_back(static_cast<int>(sequence.rows()));
        item.word = word;
        items_.emplace(id, std::move(item));
    }

    std::map<int, CombinedSequences> TestSet::combined_sequences() const {
        std::map<int, CombinedSequences> result;
        for (const auto& [id, item] : items_) {
            result.emplace(id, item.data);
        }
        return result;
    }

    std::vector<std::optional<std::string>> TestSet::words_in_order() const {
        std::vector<std::optional<std::string>> result;
        result.reserve(items_.size());
        for (const auto& [id, item] : items_) {
            result.push_back(item.word);
        }
        return result;
    }

} // namespace signrecog
