#include "signrecog/model_selector.h"
#include "signrecog/errors.h"
#include "signrecog/logger.h"
#include <algorithm>
#include <cctype>

namespace signrecog {
namespace selection {

    std::string selector_kind_name(SelectorKind kind) {
        switch (kind) {
            case SelectorKind::CONSTANT: return "constant";
            case SelectorKind::BIC: return "bic";
            case SelectorKind::DIC: return "dic";
            case SelectorKind::CV: return "cv";
            default: return "unknown";
        }
    }

    std::optional<SelectorKind> parse_selector_kind(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "constant") return SelectorKind::CONSTANT;
        if (lower == "bic") return SelectorKind::BIC;
        if (lower == "dic") return SelectorKind::DIC;
        if (lower == "cv") return SelectorKind::CV;
        return std::nullopt;
    }

    ModelSelector::ModelSelector(const WordCorpus& corpus,
                                 const std::string& word,
                                 const SequenceModelTrainer& trainer,
                                 const SelectorConfig& config)
        : corpus_(corpus)
        , word_(word)
        , sequences_(corpus.sequences(word))
        , data_(corpus.combined(word))
        , trainer_(trainer)
        , config_(config) {
    }

    HmmTopology ModelSelector::topology(int num_states) const {
        return HmmTopology(num_states, config_.max_iterations, config_.random_seed);
    }

    ModelPtr ModelSelector::build_candidate(int num_states) const {
        ModelPtr model;
        try {
            model = trainer_.fit(topology(num_states), data_.X, data_.lengths);
        } catch (const std::exception& e) {
            if (config_.verbose) {
                Logger::instance().log_candidate(word_, num_states, false);
            }
            SIGNRECOG_LOG_DEBUG("Candidate fit failed for " + word_ + ": " + e.what());
            return nullptr;
        }

        if (config_.verbose) {
            Logger::instance().log_candidate(word_, num_states, model != nullptr);
        }
        return model;
    }

    void ModelSelector::begin_selection() {
        candidate_scores_.clear();
        selected_states_ = 0;
    }

    ModelPtr ModelSelector::finish_selection(ModelPtr model) {
        selected_states_ = model ? model->num_states() : 0;
        if (config_.verbose) {
            Logger::instance().log_selection(word_, name(), selected_states_);
        }
        return model;
    }

    ModelPtr ConstantSelector::select() {
        begin_selection();
        return finish_selection(build_candidate(config_.n_constant));
    }

    std::unique_ptr<ModelSelector> make_selector(SelectorKind kind,
                                                 const WordCorpus& corpus,
                                                 const std::string& word,
                                                 const SequenceModelTrainer& trainer,
                                                 const SelectorConfig& config) {
        switch (kind) {
            case SelectorKind::CONSTANT:
                return std::make_unique<ConstantSelector>(corpus, word, trainer, config);
            case SelectorKind::BIC:
                return std::make_unique<BicSelector>(corpus, word, trainer, config);
            case SelectorKind::DIC:
                return std::make_unique<DicSelector>(corpus, word, trainer, config);
            case SelectorKind::CV:
                return std::make_unique<CvSelector>(corpus, word, trainer, config);
        }
        throw std::invalid_argument("Unknown selector kind");
    }

} // namespace selection
} // namespace signrecog
