#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "sequence_data.h"
#include "word_models.h"

namespace signrecog {
namespace recognition {

    /// Log-likelihood of one test sequence under each word model that scored it
    using ScoreMap = std::map<std::string, double>;

    /**
     * @brief Per-sequence scores and best guesses, both in test-set id order
     */
    struct RecognitionResult {
        std::vector<ScoreMap> probabilities;
        std::vector<std::optional<std::string>> guesses;
    };

    /**
     * @brief Score every test sequence against every word model
     *
     * Null models do not participate. A model that fails to score a sequence
     * is left out of that sequence's ScoreMap. The guess is the word with
     * the strictly highest score (the first word in map order on ties), or
     * nullopt when no model scored the sequence.
     */
    RecognitionResult recognize(const ModelMap& models, const TestSet& test_set);

    RecognitionResult recognize(const ModelMap& models,
                                const std::map<int, CombinedSequences>& sequences);

} // namespace recognition
} // namespace signrecog
