#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include "recognizer_config.h"
#include "evaluation.h"
#include "word_models.h"

namespace signrecog {
namespace cli {

    /**
     * @brief CLI command types supported by the signrecog tool
     */
    enum class CliCommand {
        RECOGNIZE,      // Train word models and recognize a test set
        CONFIG,         // Write a default configuration file
        HELP,           // Show help information
        VERSION         // Show version information
    };

    /**
     * @brief CLI argument parsing result
     *
     * Optional values override the configuration file only when given.
     */
    struct CliArguments {
        CliCommand command = CliCommand::HELP;

        // Input/Output paths
        std::string train_path;
        std::string test_path;
        std::string output_path;
        std::string config_path;
        std::string log_file;

        // Selection overrides
        std::optional<std::string> selector;
        std::optional<int> min_states;
        std::optional<int> max_states;
        std::optional<int> n_constant;
        std::optional<int> seed;
        std::optional<int> threads;

        bool verbose = false;
        bool quiet = false;
        bool no_color = false;

        std::vector<std::string> errors;        // Unknown flags or bad values
    };

    /**
     * @brief CLI operation result
     */
    struct CliResult {
        bool success = false;
        int exit_code = 0;
        std::string message;
        std::vector<std::string> warnings;

        // Statistics
        size_t words_trained = 0;
        size_t words_exhausted = 0;
        size_t sequences_recognized = 0;
        std::optional<double> wer;
        std::chrono::duration<double> total_time{0};
    };

    /**
     * @brief Command-line front end: trains one model per word with the
     * chosen selector, recognizes a test set and reports the word error rate
     */
    class CliInterface {
    public:
        CliInterface() = default;
        ~CliInterface() = default;

        // Main entry point
        CliResult run(int argc, char* argv[]);

        // Command execution
        CliResult execute_recognize(const CliArguments& args);
        CliResult execute_config(const CliArguments& args);
        CliResult execute_help(const CliArguments& args);
        CliResult execute_version(const CliArguments& args);

        // Exposed for tests
        CliArguments parse_arguments(int argc, char* argv[]);
        config::RecognizerConfig create_config_from_args(const CliArguments& args);

    private:
        bool verbose_ = false;
        bool quiet_ = false;
        bool no_color_ = false;

        CliCommand parse_command(const std::string& command_str);
        bool parse_flag(const std::string& arg, const std::string& next_arg,
                        size_t& index, CliArguments& args);
        std::optional<int> parse_int(const std::string& flag, const std::string& value,
                                     CliArguments& args);

        bool validate_arguments(const CliArguments& args);

        void print_banner();
        void print_help();
        void print_version();
        void print_progress_header(const std::string& operation);
        void print_selection_table(const TrainingSummary& summary);
        void print_guess_table(const TestSet& test_set,
                               const std::vector<std::optional<std::string>>& guesses);
        void print_result_summary(const CliResult& result);

        std::string color_text(const std::string& text, const std::string& color);
        std::string format_duration(std::chrono::duration<double> duration);

        void log_error(const std::string& message);
        void log_warning(const std::string& message);
        void log_info(const std::string& message);
        void log_verbose(const std::string& message);
    };

} // namespace cli
} // namespace signrecog
