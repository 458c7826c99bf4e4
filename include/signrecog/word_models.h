#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "model_selector.h"
#include "sequence_data.h"
#include "sequence_model.h"

namespace signrecog {

    /// Selected model per word; nullptr marks a word without a usable model
    using ModelMap = std::map<std::string, std::unique_ptr<SequenceModel>>;

    /**
     * @brief Outcome of selecting a model for every word of a corpus
     */
    struct TrainingSummary {
        ModelMap models;
        std::map<std::string, int> selected_states;     // 0 for exhausted words
        std::vector<std::string> exhausted_words;
        std::chrono::duration<double> elapsed{0};
    };

    /**
     * @brief Run one selector per word and collect the chosen models
     *
     * Words are independent: with config.num_threads > 1 they are spread over
     * worker threads sharing the read-only corpus and trainer.
     *
     * @param words Words to train; empty means every word of the corpus
     * @throws DataError if a requested word is not in the corpus
     */
    TrainingSummary train_word_models(const WordCorpus& corpus,
                                      selection::SelectorKind kind,
                                      const SequenceModelTrainer& trainer,
                                      const selection::SelectorConfig& config,
                                      const std::vector<std::string>& words = {});

    /**
     * @brief Model of a word that must be present
     * @throws SelectionExhausted if the word has no usable model
     */
    const SequenceModel& require_model(const ModelMap& models, const std::string& word);

} // namespace signrecog
