#pragma once

#include <stdexcept>
#include <string>

namespace signrecog {

    /**
     * @brief Base class for model training, scoring and selection errors
     */
    class ModelError : public std::runtime_error {
    public:
        explicit ModelError(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief A model could not be trained for the requested state count
     *
     * Raised on non-convergence, non-finite parameters, invalid sequence
     * lengths or fewer frames than hidden states.
     */
    class FitFailure : public ModelError {
    public:
        explicit FitFailure(const std::string& message)
            : ModelError("fit failure: " + message) {}
    };

    /**
     * @brief A trained model could not evaluate the given observations
     */
    class ScoreFailure : public ModelError {
    public:
        explicit ScoreFailure(const std::string& message)
            : ModelError("score failure: " + message) {}
    };

    /**
     * @brief No candidate in the search range produced a usable model
     */
    class SelectionExhausted : public ModelError {
    public:
        explicit SelectionExhausted(const std::string& word)
            : ModelError("no usable model for word '" + word + "'")
            , word_(word) {}

        const std::string& word() const { return word_; }

    private:
        std::string word_;
    };

    /**
     * @brief Malformed corpus input (I/O, CSV parsing, inconsistent shapes)
     */
    class DataError : public std::runtime_error {
    public:
        explicit DataError(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Invalid or unreadable configuration
     */
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& message)
            : std::runtime_error(message) {}
    };

} // namespace signrecog
