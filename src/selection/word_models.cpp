#include "signrecog/word_models.h"
#include "signrecog/errors.h"
#include "signrecog/logger.h"
#include <algorithm>
#include <future>
#include <mutex>

namespace signrecog {

    namespace {
        struct WordResult {
            std::string word;
            std::unique_ptr<SequenceModel> model;
            int num_states = 0;
        };

        WordResult select_for_word(const WordCorpus& corpus,
                                   selection::SelectorKind kind,
                                   const SequenceModelTrainer& trainer,
                                   const selection::SelectorConfig& config,
                                   const std::string& word) {
            auto selector = selection::make_selector(kind, corpus, word, trainer, config);
            WordResult result;
            result.word = word;
            result.model = selector->select();
            result.num_states = selector->selected_states();
            return result;
        }
    }

    TrainingSummary train_word_models(const WordCorpus& corpus,
                                      selection::SelectorKind kind,
                                      const SequenceModelTrainer& trainer,
                                      const selection::SelectorConfig& config,
                                      const std::vector<std::string>& words) {
        auto start_time = std::chrono::steady_clock::now();
        std::vector<std::string> targets = words.empty() ? corpus.words() : words;

        for (const auto& word : targets) {
            if (!corpus.contains(word)) {
                throw DataError("Unknown word '" + word + "'");
            }
        }

        TrainingSummary summary;
        std::mutex summary_mutex;

        auto store = [&summary, &summary_mutex](WordResult result) {
            std::lock_guard<std::mutex> lock(summary_mutex);
            summary.selected_states[result.word] = result.num_states;
            if (!result.model) {
                summary.exhausted_words.push_back(result.word);
            }
            summary.models[result.word] = std::move(result.model);
        };

        int num_threads = std::min(std::max(config.num_threads, 1), static_cast<int>(targets.size()));

        if (num_threads <= 1) {
            for (const auto& word : targets) {
                store(select_for_word(corpus, kind, trainer, config, word));
            }
        } else {
            auto worker = [&](const std::vector<std::string>& worker_words) {
                for (const auto& word : worker_words) {
                    store(select_for_word(corpus, kind, trainer, config, word));
                }
            };

            // Distribute words among threads
            std::vector<std::future<void>> futures;
            size_t words_per_thread = (targets.size() + num_threads - 1) / num_threads;
            for (int i = 0; i < num_threads; ++i) {
                size_t start_idx = i * words_per_thread;
                size_t end_idx = std::min(start_idx + words_per_thread, targets.size());

                if (start_idx < end_idx) {
                    std::vector<std::string> worker_words(targets.begin() + start_idx,
                                                          targets.begin() + end_idx);
                    futures.emplace_back(std::async(std::launch::async, worker, std::move(worker_words)));
                }
            }

            for (auto& future : futures) {
                future.get();
            }
        }

        std::sort(summary.exhausted_words.begin(), summary.exhausted_words.end());
        summary.elapsed = std::chrono::steady_clock::now() - start_time;

        SIGNRECOG_LOG_INFO_F("Trained %zu word models with %s selector (%zu without a model)",
                             summary.models.size(), selection::selector_kind_name(kind).c_str(),
                             summary.exhausted_words.size());
        return summary;
    }

    const SequenceModel& require_model(const ModelMap& models, const std::string& word) {
        auto it = models.find(word);
        if (it == models.end() || !it->second) {
            throw SelectionExhausted(word);
        }
        return *it->second;
    }

} // namespace signrecog
