#include "signrecog/model_selector.h"
#include "signrecog/cross_validation.h"
#include "signrecog/errors.h"
#include "signrecog/logger.h"
#include <limits>

namespace signrecog {
namespace selection {

    CvSelector::FoldResult CvSelector::cross_validate(int num_states) const {
        FoldResult result{0.0, nullptr};
        double total_score = 0.0;
        int folds = 0;

        for (const FoldSplit& split : kfold_split(sequences_.size(), config_.cv_folds)) {
            CombinedSequences train = combine_sequences(split.train_indices, sequences_);
            CombinedSequences test = combine_sequences(split.test_indices, sequences_);

            // Fresh model per fold, trained on the training folds only
            result.model = trainer_.fit(topology(num_states), train.X, train.lengths);
            if (!result.model) {
                throw FitFailure("fold fit returned no model");
            }
            total_score += result.model->score(test.X, test.lengths);
            folds++;
        }

        result.average_score = total_score / folds;
        return result;
    }

    ModelPtr CvSelector::select() {
        begin_selection();

        double best_score = -std::numeric_limits<double>::infinity();
        ModelPtr best_model;

        if (config_.min_states >= config_.max_states) {
            return finish_selection(nullptr);
        }

        // Too few sequences to fold: every state count scores 0.0 with the
        // same n_constant model, so it is fitted once
        if (sequences_.size() <= static_cast<size_t>(config_.cv_folds)) {
            for (int n = config_.min_states; n < config_.max_states; ++n) {
                candidate_scores_.push_back({n, 0.0});
            }
            return finish_selection(build_candidate(config_.n_constant));
        }

        try {
            for (int n = config_.min_states; n < config_.max_states; ++n) {
                FoldResult result = cross_validate(n);
                candidate_scores_.push_back({n, result.average_score});

                if (result.average_score >= best_score) {
                    best_score = result.average_score;
                    best_model = std::move(result.model);
                }
            }
        } catch (const std::exception& e) {
            SIGNRECOG_LOG_ERROR("CV selection failed for " + word_ + ": " + e.what());
            return finish_selection(nullptr);
        }

        return finish_selection(std::move(best_model));
    }

} // namespace selection
} // namespace signrecog
