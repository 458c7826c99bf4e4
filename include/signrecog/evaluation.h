#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sequence_data.h"

namespace signrecog {
namespace recognition {

    /**
     * @brief A test sequence whose guess differs from its true word
     */
    struct Mismatch {
        int sequence_id;
        std::string expected;
        std::optional<std::string> guess;
    };

    /**
     * @brief Accuracy of a recognition pass against a labeled test set
     */
    struct RecognitionReport {
        size_t total = 0;               // Labeled sequences evaluated
        size_t correct = 0;
        double wer = 0.0;               // Word error rate, errors / total
        std::vector<Mismatch> mismatches;
    };

    /**
     * @brief Compare guesses (in test-set id order) with the test labels
     *
     * Unlabeled sequences are skipped. A missing guess counts as an error.
     *
     * @throws DataError if the guess count differs from the test-set size
     */
    RecognitionReport evaluate_guesses(const std::vector<std::optional<std::string>>& guesses,
                                       const TestSet& test_set);

    /// Human-readable summary with one line per mismatch
    std::string format_report(const RecognitionReport& report);

} // namespace recognition
} // namespace signrecog
