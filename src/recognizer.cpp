#include "signrecog/recognizer.h"
#include "signrecog/logger.h"
#include <limits>

namespace signrecog {
namespace recognition {

    RecognitionResult recognize(const ModelMap& models, const TestSet& test_set) {
        return recognize(models, test_set.combined_sequences());
    }

    RecognitionResult recognize(const ModelMap& models,
                                const std::map<int, CombinedSequences>& sequences) {
        RecognitionResult result;
        result.probabilities.reserve(sequences.size());
        result.guesses.reserve(sequences.size());

        for (const auto& [id, test_data] : sequences) {
            ScoreMap scores;
            std::optional<std::string> best_word;
            double best_score = -std::numeric_limits<double>::infinity();

            for (const auto& [word, model] : models) {
                if (!model) {
                    continue;
                }

                double score;
                try {
                    score = model->score(test_data.X, test_data.lengths);
                } catch (const std::exception& e) {
                    SIGNRECOG_LOG_DEBUG_F("Sequence %d not scored by '%s': %s", id, word.c_str(), e.what());
                    continue;
                }

                scores[word] = score;
                if (score > best_score) {
                    best_score = score;
                    best_word = word;
                }
            }

            result.probabilities.push_back(std::move(scores));
            result.guesses.push_back(std::move(best_word));
        }

        return result;
    }

} // namespace recognition
} // namespace signrecog
