#include "signrecog/model_selector.h"
#include "signrecog/errors.h"
#include "signrecog/logger.h"
#include <cmath>
#include <limits>

namespace signrecog {
namespace selection {

    long BicSelector::free_parameters(int num_states, int num_features) {
        // Initial state occupation + transitions + diagonal Gaussian means and variances
        return static_cast<long>(num_states) * num_states +
               2L * num_states * num_features - 1;
    }

    double BicSelector::bic_score(double log_likelihood, int num_states, int num_features, long num_frames) {
        double p = static_cast<double>(free_parameters(num_states, num_features));
        return -2.0 * log_likelihood + p * std::log(static_cast<double>(num_frames));
    }

    ModelPtr BicSelector::select() {
        begin_selection();

        // Larger BIC wins; keeps the historical selection direction
        double best_score = -std::numeric_limits<double>::infinity();
        ModelPtr best_model;

        try {
            for (int n = config_.min_states; n < config_.max_states; ++n) {
                ModelPtr model = build_candidate(n);
                if (!model) {
                    continue;
                }

                try {
                    double log_likelihood = model->score(data_.X, data_.lengths);
                    double score = bic_score(log_likelihood, n, data_.num_features(), data_.num_frames());
                    candidate_scores_.push_back({n, score});

                    if (score > best_score) {
                        best_score = score;
                        best_model = std::move(model);
                    }
                } catch (const std::exception& e) {
                    if (config_.verbose) {
                        Logger::instance().log_candidate(word_, n, false);
                    }
                    SIGNRECOG_LOG_DEBUG("BIC candidate rejected for " + word_ + ": " + e.what());
                }
            }

            if (!best_model) {
                best_model = build_candidate(config_.n_constant);
            }
        } catch (const std::exception& e) {
            SIGNRECOG_LOG_ERROR("BIC selection failed for " + word_ + ": " + e.what());
            return finish_selection(nullptr);
        }

        return finish_selection(std::move(best_model));
    }

} // namespace selection
} // namespace signrecog
