#pragma once

#include <string>
#include <vector>
#include <Eigen/Core>
#include "sequence_data.h"

namespace signrecog {
namespace io {

    /**
     * @brief Frames of one recorded sequence with its label
     */
    struct LabeledSequence {
        int sequence_id;
        std::string word;               // Empty for unlabeled test data
        Eigen::MatrixXd frames;         // frames x features
    };

    /**
     * @brief Parsed feature table, sequences in order of first appearance
     */
    struct FeatureTable {
        std::vector<std::string> feature_names;
        std::vector<LabeledSequence> sequences;
    };

    /**
     * @brief Reader for CSV feature tables
     *
     * Expected layout: a header line "word,sequence_id,<feature>..." followed
     * by one line per frame. Frames of a sequence are collected in file
     * order. Blank lines and lines starting with '#' are ignored.
     */
    class FeatureTableParser {
    public:
        /// @throws DataError if the file cannot be read or is malformed
        FeatureTable parse_file(const std::string& path) const;

        /// @throws DataError on malformed input
        FeatureTable parse_lines(const std::vector<std::string>& lines,
                                 const std::string& source = "<memory>") const;

    private:
        std::vector<std::string> tokenize_line(const std::string& line) const;
        std::string trim_whitespace(const std::string& str) const;
        double parse_double_field(const std::string& field, size_t line_number,
                                  const std::string& source) const;
        int parse_int_field(const std::string& field, size_t line_number,
                            const std::string& source) const;
    };

    /// Group the table's sequences by word
    WordCorpus build_word_corpus(const FeatureTable& table);

    /// Test set keyed by sequence id; non-empty words become ground truth
    TestSet build_test_set(const FeatureTable& table);

    WordCorpus load_word_corpus(const std::string& path);
    TestSet load_test_set(const std::string& path);

} // namespace io
} // namespace signrecog
