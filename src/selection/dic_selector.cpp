#include "signrecog/model_selector.h"
#include "signrecog/errors.h"
#include "signrecog/logger.h"
#include <limits>

namespace signrecog {
namespace selection {

    double DicSelector::anti_evidence(const SequenceModel& model) const {
        double total_score = 0.0;
        int word_count = 0;

        for (const auto& [other_word, other_data] : corpus_.all_combined()) {
            if (other_word == word_) {
                continue;
            }
            total_score += model.score(other_data.X, other_data.lengths);
            word_count++;
        }

        if (word_count == 0) {
            throw ScoreFailure("no competing words for anti-evidence of '" + word_ + "'");
        }
        return total_score / word_count;
    }

    ModelPtr DicSelector::select() {
        begin_selection();

        double best_score = -std::numeric_limits<double>::infinity();
        ModelPtr best_model;

        try {
            for (int n = config_.min_states; n < config_.max_states; ++n) {
                ModelPtr model = build_candidate(n);
                if (!model) {
                    continue;
                }

                try {
                    double evidence = model->score(data_.X, data_.lengths);
                    double score = evidence - anti_evidence(*model);
                    candidate_scores_.push_back({n, score});

                    if (score > best_score) {
                        best_score = score;
                        best_model = std::move(model);
                    }
                } catch (const std::exception& e) {
                    if (config_.verbose) {
                        Logger::instance().log_candidate(word_, n, false);
                    }
                    SIGNRECOG_LOG_DEBUG("DIC candidate rejected for " + word_ + ": " + e.what());
                }
            }

            if (!best_model) {
                best_model = build_candidate(config_.n_constant);
            }
        } catch (const std::exception& e) {
            SIGNRECOG_LOG_ERROR("DIC selection failed for " + word_ + ": " + e.what());
            return finish_selection(nullptr);
        }

        return finish_selection(std::move(best_model));
    }

} // namespace selection
} // namespace signrecog
