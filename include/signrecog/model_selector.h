#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include "sequence_data.h"
#include "sequence_model.h"

namespace signrecog {
namespace selection {

    /**
     * @brief Parameters shared by every selection strategy
     */
    struct SelectorConfig {
        int n_constant;                 // State count of the constant strategy and fallbacks
        int min_states;                 // Inclusive lower bound of the search
        int max_states;                 // Exclusive upper bound of the search
        std::uint32_t random_seed;      // Seed passed to every fit
        bool verbose;                   // Log each candidate and the final choice
        int max_iterations;             // EM iteration cap per fit
        int cv_folds;                   // Fold count of the cross-validation strategy
        int num_threads;                // Words trained concurrently (1 = sequential)

        SelectorConfig()
            : n_constant(3)
            , min_states(2)
            , max_states(10)
            , random_seed(14)
            , verbose(false)
            , max_iterations(1000)
            , cv_folds(3)
            , num_threads(1) {}
    };

    enum class SelectorKind {
        CONSTANT,
        BIC,
        DIC,
        CV
    };

    std::string selector_kind_name(SelectorKind kind);
    std::optional<SelectorKind> parse_selector_kind(const std::string& name);

    using ModelPtr = std::unique_ptr<SequenceModel>;

    /**
     * @brief Criterion value of one successfully evaluated candidate
     */
    struct CandidateScore {
        int num_states;
        double score;
    };

    /**
     * @brief Base of the model selection strategies for a single word
     *
     * Holds the corpus, the word's training data and the selection
     * parameters. Every strategy builds its candidates through
     * build_candidate() or the same topology, so fitting semantics are
     * identical across strategies. The corpus and trainer must outlive
     * the selector.
     */
    class ModelSelector {
    public:
        /// @throws DataError if the word is not in the corpus
        ModelSelector(const WordCorpus& corpus,
                      const std::string& word,
                      const SequenceModelTrainer& trainer,
                      const SelectorConfig& config = SelectorConfig());
        virtual ~ModelSelector() = default;

        ModelSelector(const ModelSelector&) = delete;
        ModelSelector& operator=(const ModelSelector&) = delete;

        /**
         * @brief Choose the best model for the word
         * @return The chosen model, or nullptr when no candidate is usable
         */
        virtual ModelPtr select() = 0;

        virtual std::string name() const = 0;

        /**
         * @brief Fit a model with the given state count on the full word data
         * @return nullptr if fitting fails for any reason
         */
        ModelPtr build_candidate(int num_states) const;

        const std::string& word() const { return word_; }
        const SelectorConfig& config() const { return config_; }

        /// Criterion values of the candidates evaluated by the last select()
        const std::vector<CandidateScore>& candidate_scores() const { return candidate_scores_; }

        /// State count of the last selected model, 0 if select() returned nullptr
        int selected_states() const { return selected_states_; }

    protected:
        const WordCorpus& corpus_;
        std::string word_;
        const SequenceSet& sequences_;
        const CombinedSequences& data_;
        const SequenceModelTrainer& trainer_;
        SelectorConfig config_;

        std::vector<CandidateScore> candidate_scores_;
        int selected_states_ = 0;

        HmmTopology topology(int num_states) const;
        void begin_selection();
        ModelPtr finish_selection(ModelPtr model);
    };

    /**
     * @brief Always uses n_constant states
     */
    class ConstantSelector final : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        ModelPtr select() override;
        std::string name() const override { return "constant"; }
    };

    /**
     * @brief Bayesian Information Criterion over [min_states, max_states)
     *
     * BIC = -2 * logL + p * log(N) with p = n^2 + 2*n*F - 1 free parameters,
     * N training frames and F features. The candidate with the largest
     * value is kept; if none can be evaluated the n_constant model is used.
     */
    class BicSelector final : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        ModelPtr select() override;
        std::string name() const override { return "bic"; }

        static double bic_score(double log_likelihood, int num_states, int num_features, long num_frames);
        static long free_parameters(int num_states, int num_features);
    };

    /**
     * @brief Discriminative Information Criterion
     *
     * DIC = log P(own word) - mean over other words of log P(other word).
     * The candidate with the largest value is kept; if none can be
     * evaluated the n_constant model is used.
     */
    class DicSelector final : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        ModelPtr select() override;
        std::string name() const override { return "dic"; }

    private:
        /// @throws ScoreFailure when the corpus holds no other word
        double anti_evidence(const SequenceModel& model) const;
    };

    /**
     * @brief Average held-out log-likelihood over k folds of the sequences
     *
     * The model kept for each state count is the one trained on the last
     * fold. Words with no more sequences than folds score 0.0 with the
     * n_constant model. Ties go to the larger state count. A failed fold
     * aborts the selection and yields nullptr.
     */
    class CvSelector final : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        ModelPtr select() override;
        std::string name() const override { return "cv"; }

    private:
        struct FoldResult {
            double average_score;
            ModelPtr model;
        };

        /// @throws FitFailure or ScoreFailure from any fold
        FoldResult cross_validate(int num_states) const;
    };

    std::unique_ptr<ModelSelector> make_selector(SelectorKind kind,
                                                 const WordCorpus& corpus,
                                                 const std::string& word,
                                                 const SequenceModelTrainer& trainer,
                                                 const SelectorConfig& config = SelectorConfig());

} // namespace selection
} // namespace signrecog
