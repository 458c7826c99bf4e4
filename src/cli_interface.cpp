#include "signrecog/cli_interface.h"
#include "signrecog/corpus_io.h"
#include "signrecog/errors.h"
#include "signrecog/hmm_trainer.h"
#include "signrecog/logger.h"
#include "signrecog/recognizer.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>

namespace signrecog {
namespace cli {

namespace {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";
    const std::string GREEN = "\033[32m";
    const std::string YELLOW = "\033[33m";
    const std::string BLUE = "\033[34m";
    const std::string CYAN = "\033[36m";
    const std::string BOLD = "\033[1m";
    const std::string DIM = "\033[2m";

    const char* VERSION_STRING = "1.0.0";
}

CliResult CliInterface::run(int argc, char* argv[]) {
    CliResult result;

    try {
        CliArguments args = parse_arguments(argc, argv);

        verbose_ = args.verbose;
        quiet_ = args.quiet;
        no_color_ = args.no_color;

        if (!validate_arguments(args)) {
            result.success = false;
            result.exit_code = 1;
            result.message = "Invalid arguments provided";
            print_result_summary(result);
            return result;
        }

        switch (args.command) {
            case CliCommand::RECOGNIZE:
                result = execute_recognize(args);
                break;
            case CliCommand::CONFIG:
                result = execute_config(args);
                break;
            case CliCommand::VERSION:
                return execute_version(args);
            case CliCommand::HELP:
            default:
                return execute_help(args);
        }

    } catch (const std::exception& e) {
        result.success = false;
        result.exit_code = 1;
        result.message = std::string("Unhandled exception: ") + e.what();
        log_error(result.message);
    }

    print_result_summary(result);
    return result;
}

CliArguments CliInterface::parse_arguments(int argc, char* argv[]) {
    CliArguments args;

    if (argc < 2) {
        args.command = CliCommand::HELP;
        return args;
    }

    args.command = parse_command(argv[1]);

    for (size_t i = 2; i < static_cast<size_t>(argc); ++i) {
        std::string arg = argv[i];
        std::string next_arg = (i + 1 < static_cast<size_t>(argc)) ? argv[i + 1] : "";

        if (!parse_flag(arg, next_arg, i, args)) {
            args.errors.push_back("Unknown argument: " + arg);
        }
    }

    return args;
}

CliCommand CliInterface::parse_command(const std::string& command_str) {
    std::string cmd = command_str;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (cmd == "recognize" || cmd == "r") return CliCommand::RECOGNIZE;
    if (cmd == "config" || cmd == "cfg") return CliCommand::CONFIG;
    if (cmd == "version" || cmd == "--version") return CliCommand::VERSION;
    if (cmd == "help" || cmd == "--help" || cmd == "-h") return CliCommand::HELP;

    return CliCommand::HELP;
}

std::optional<int> CliInterface::parse_int(const std::string& flag, const std::string& value,
                                           CliArguments& args) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    args.errors.push_back("Invalid integer for " + flag + ": '" + value + "'");
    return std::nullopt;
}

bool CliInterface::parse_flag(const std::string& arg, const std::string& next_arg,
                              size_t& index, CliArguments& args) {
    auto takes_value = [&](std::string& target) {
        target = next_arg;
        ++index;
        return true;
    };
    auto takes_int = [&](std::optional<int>& target) {
        target = parse_int(arg, next_arg, args);
        ++index;
        return true;
    };

    if (arg == "--train") return takes_value(args.train_path);
    if (arg == "--test") return takes_value(args.test_path);
    if (arg == "-o" || arg == "--output") return takes_value(args.output_path);
    if (arg == "-c" || arg == "--config") return takes_value(args.config_path);
    if (arg == "--log-file") return takes_value(args.log_file);
    if (arg == "-s" || arg == "--selector") {
        args.selector = next_arg;
        ++index;
        return true;
    }
    if (arg == "--min-states") return takes_int(args.min_states);
    if (arg == "--max-states") return takes_int(args.max_states);
    if (arg == "--constant") return takes_int(args.n_constant);
    if (arg == "--seed") return takes_int(args.seed);
    if (arg == "-j" || arg == "--threads") return takes_int(args.threads);
    if (arg == "-v" || arg == "--verbose") {
        args.verbose = true;
        return true;
    }
    if (arg == "-q" || arg == "--quiet") {
        args.quiet = true;
        return true;
    }
    if (arg == "--no-color") {
        args.no_color = true;
        return true;
    }

    return false;
}

bool CliInterface::validate_arguments(const CliArguments& args) {
    for (const auto& error : args.errors) {
        log_error(error);
    }
    if (!args.errors.empty()) {
        return false;
    }

    if (args.command == CliCommand::RECOGNIZE) {
        if (args.train_path.empty()) {
            log_error("Recognize command requires --train");
            return false;
        }
        if (args.test_path.empty()) {
            log_error("Recognize command requires --test");
            return false;
        }
    }
    if (args.command == CliCommand::CONFIG && args.output_path.empty()) {
        log_error("Config command requires --output");
        return false;
    }
    if (args.selector && !selection::parse_selector_kind(*args.selector)) {
        log_error("Unknown selector: " + *args.selector + " (expected constant, bic, dic or cv)");
        return false;
    }
    if (args.seed && *args.seed < 0) {
        log_error("Seed cannot be negative");
        return false;
    }

    return true;
}

config::RecognizerConfig CliInterface::create_config_from_args(const CliArguments& args) {
    config::ConfigManager manager;
    config::RecognizerConfig config;

    if (!args.config_path.empty()) {
        log_verbose("Loading configuration from: " + args.config_path);
        config = manager.load_validated(args.config_path);
    }

    auto& sc = config.selector_config;
    if (args.selector) {
        auto kind = selection::parse_selector_kind(*args.selector);
        if (!kind) {
            throw ConfigError("Unknown selector: " + *args.selector);
        }
        config.selector = *kind;
    }
    if (args.min_states) sc.min_states = *args.min_states;
    if (args.max_states) sc.max_states = *args.max_states;
    if (args.n_constant) sc.n_constant = *args.n_constant;
    if (args.seed) sc.random_seed = static_cast<std::uint32_t>(*args.seed);
    if (args.threads) sc.num_threads = *args.threads;
    if (args.verbose) sc.verbose = true;
    if (!args.log_file.empty()) config.logging.log_file_path = args.log_file;

    auto validation = manager.validate_config(config);
    if (!validation.is_valid) {
        std::string message = "Invalid configuration:";
        for (const auto& error : validation.errors) {
            message += " " + error + ";";
        }
        throw ConfigError(message);
    }

    return config;
}

CliResult CliInterface::execute_recognize(const CliArguments& args) {
    CliResult result;
    auto start_time = std::chrono::steady_clock::now();

    try {
        auto config = create_config_from_args(args);
        config::apply_logging(config.logging);

        if (!quiet_) {
            print_progress_header("Training");
        }
        log_info("Loading training corpus: " + args.train_path);
        WordCorpus corpus = io::load_word_corpus(args.train_path);
        log_info("Loading test set: " + args.test_path);
        TestSet test_set = io::load_test_set(args.test_path);

        if (corpus.num_words() > 0 && !test_set.empty()) {
            int test_features = test_set.items().begin()->second.data.num_features();
            if (test_features != corpus.num_features()) {
                throw DataError("Test set has " + std::to_string(test_features) +
                                " features, training corpus has " +
                                std::to_string(corpus.num_features()));
            }
        }

        log_info("Selector: " + selection::selector_kind_name(config.selector) +
                 ", words: " + std::to_string(corpus.num_words()));

        hmm::GaussianHmmTrainer trainer(config.training_config);
        TrainingSummary summary = train_word_models(corpus, config.selector, trainer,
                                                    config.selector_config);
        if (!quiet_) {
            print_selection_table(summary);
        }
        for (const auto& word : summary.exhausted_words) {
            result.warnings.push_back("No usable model for word: " + word);
        }

        recognition::RecognitionResult recognition;
        {
            Logger::PerformanceTimer timer(Logger::instance(), LogLevel::DEBUG, "Recognition");
            recognition = recognition::recognize(summary.models, test_set);
        }
        if (!quiet_) {
            print_progress_header("Recognition");
            print_guess_table(test_set, recognition.guesses);
        }

        auto report = recognition::evaluate_guesses(recognition.guesses, test_set);
        if (!quiet_ && report.total > 0) {
            std::cout << recognition::format_report(report) << std::endl;
        }

        result.success = true;
        result.exit_code = 0;
        result.words_trained = summary.models.size() - summary.exhausted_words.size();
        result.words_exhausted = summary.exhausted_words.size();
        result.sequences_recognized = test_set.size();
        if (report.total > 0) {
            result.wer = report.wer;
        }
        result.message = "Recognized " + std::to_string(test_set.size()) + " sequences";

    } catch (const std::exception& e) {
        result.success = false;
        result.exit_code = 1;
        result.message = "Recognition failed: " + std::string(e.what());
        log_error(result.message);
    }

    result.total_time = std::chrono::steady_clock::now() - start_time;
    return result;
}

CliResult CliInterface::execute_config(const CliArguments& args) {
    CliResult result;

    try {
        auto config = create_config_from_args(args);
        config::ConfigManager manager;
        if (manager.save_config(args.output_path, config)) {
            result.success = true;
            result.exit_code = 0;
            result.message = "Configuration written to " + args.output_path;
        } else {
            result.success = false;
            result.exit_code = 1;
            result.message = "Cannot write configuration to " + args.output_path;
        }
    } catch (const std::exception& e) {
        result.success = false;
        result.exit_code = 1;
        result.message = "Configuration failed: " + std::string(e.what());
        log_error(result.message);
    }

    return result;
}

CliResult CliInterface::execute_help(const CliArguments&) {
    CliResult result;
    result.success = true;
    result.exit_code = 0;
    result.message = "Help information displayed";

    print_banner();
    print_help();

    return result;
}

CliResult CliInterface::execute_version(const CliArguments&) {
    CliResult result;
    result.success = true;
    result.exit_code = 0;
    result.message = "Version information displayed";

    print_version();

    return result;
}

void CliInterface::print_banner() {
    std::cout << color_text(std::string("SignRecog Word Recognizer v") + VERSION_STRING, CYAN + BOLD) << "\n\n";
}

void CliInterface::print_help() {
    std::cout << color_text("USAGE:", BOLD) << "\n";
    std::cout << "  signrecog <command> [options]\n\n";

    std::cout << color_text("COMMANDS:", BOLD) << "\n";
    std::cout << "  recognize, r     Train word models and recognize a test set\n";
    std::cout << "  config, cfg      Write a configuration file\n";
    std::cout << "  version          Show version information\n";
    std::cout << "  help             Show this help message\n\n";

    std::cout << color_text("OPTIONS:", BOLD) << "\n";
    std::cout << "  --train FILE           Training feature table (CSV)\n";
    std::cout << "  --test FILE            Test feature table (CSV)\n";
    std::cout << "  -o, --output FILE      Output configuration path\n";
    std::cout << "  -c, --config FILE      Configuration file path\n";
    std::cout << "  -s, --selector NAME    constant, bic, dic or cv (default constant)\n";
    std::cout << "  --min-states N         Smallest state count searched (default 2)\n";
    std::cout << "  --max-states N         Search stops before this count (default 10)\n";
    std::cout << "  --constant N           State count of the constant selector (default 3)\n";
    std::cout << "  --seed N               Random seed of every fit (default 14)\n";
    std::cout << "  -j, --threads N        Words trained concurrently (default 1)\n";
    std::cout << "  --log-file FILE        Also write log messages to FILE\n";
    std::cout << "  -v, --verbose          Log every candidate model\n";
    std::cout << "  -q, --quiet            Quiet mode\n";
    std::cout << "  --no-color             Disable colored output\n\n";

    std::cout << color_text("FEATURE TABLES:", BOLD) << "\n";
    std::cout << "  Header \"word,sequence_id,<feature>...\", then one line per frame.\n";
    std::cout << "  Test rows may leave the word empty.\n\n";

    std::cout << color_text("EXAMPLES:", BOLD) << "\n";
    std::cout << "  signrecog recognize --train train.csv --test test.csv --selector dic\n";
    std::cout << "  signrecog config -o recognizer.json --selector cv --max-states 15\n\n";
}

void CliInterface::print_version() {
    std::cout << "SignRecog Word Recognizer v" << VERSION_STRING << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void CliInterface::print_progress_header(const std::string& operation) {
    std::string header = "=== " + operation + " ===";
    std::cout << color_text(header, BOLD + CYAN) << std::endl;
}

void CliInterface::print_selection_table(const TrainingSummary& summary) {
    std::cout << std::left << std::setw(24) << "WORD" << "STATES\n";
    for (const auto& [word, states] : summary.selected_states) {
        std::cout << std::left << std::setw(24) << word;
        if (states > 0) {
            std::cout << states << "\n";
        } else {
            std::cout << color_text("none", YELLOW) << "\n";
        }
    }
    std::cout << "Training time: " << format_duration(summary.elapsed) << "\n\n";
}

void CliInterface::print_guess_table(const TestSet& test_set,
                                     const std::vector<std::optional<std::string>>& guesses) {
    std::cout << std::left << std::setw(8) << "ID" << std::setw(24) << "GUESS" << "TRUTH\n";

    size_t index = 0;
    for (const auto& [id, item] : test_set.items()) {
        const auto& guess = guesses[index++];
        std::string guess_text = guess ? *guess : "-";
        std::string truth_text = item.word ? *item.word : "";
        bool wrong = item.word && (!guess || *guess != *item.word);

        std::cout << std::left << std::setw(8) << id << std::setw(24) << guess_text;
        std::cout << (wrong ? color_text(truth_text, RED) : truth_text) << "\n";
    }
    std::cout << "\n";
}

void CliInterface::print_result_summary(const CliResult& result) {
    if (quiet_) return;

    std::cout << "\n" << color_text("=== SUMMARY ===", BOLD) << "\n";

    if (result.success) {
        std::cout << color_text("SUCCESS", GREEN + BOLD) << ": " << result.message << "\n";
    } else {
        std::cout << color_text("FAILED", RED + BOLD) << ": " << result.message << "\n";
    }

    if (result.words_trained + result.words_exhausted > 0) {
        std::cout << "Words trained: " << result.words_trained << "\n";
        if (result.words_exhausted > 0) {
            std::cout << color_text("Words without model: " + std::to_string(result.words_exhausted), YELLOW) << "\n";
        }
    }

    if (result.wer) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4) << *result.wer;
        std::cout << "WER: " << oss.str() << "\n";
    }

    if (result.total_time.count() > 0) {
        std::cout << "Total time: " << format_duration(result.total_time) << "\n";
    }

    for (const auto& warning : result.warnings) {
        log_warning(warning);
    }
}

std::string CliInterface::color_text(const std::string& text, const std::string& color) {
    if (no_color_) return text;
    return color + text + RESET;
}

std::string CliInterface::format_duration(std::chrono::duration<double> duration) {
    auto seconds = duration.count();

    if (seconds < 60.0) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << seconds << "s";
        return oss.str();
    } else if (seconds < 3600.0) {
        int minutes = static_cast<int>(seconds / 60);
        int secs = static_cast<int>(seconds) % 60;
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    } else {
        int hours = static_cast<int>(seconds / 3600);
        int minutes = static_cast<int>((seconds - hours * 3600) / 60);
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
}

void CliInterface::log_error(const std::string& message) {
    if (quiet_) return;
    std::cerr << color_text("[ERROR] ", RED + BOLD) << message << std::endl;
}

void CliInterface::log_warning(const std::string& message) {
    if (quiet_) return;
    std::cerr << color_text("[WARNING] ", YELLOW + BOLD) << message << std::endl;
}

void CliInterface::log_info(const std::string& message) {
    if (quiet_) return;
    std::cout << color_text("[INFO] ", BLUE) << message << std::endl;
}

void CliInterface::log_verbose(const std::string& message) {
    if (!verbose_ || quiet_) return;
    std::cout << color_text("[VERBOSE] ", DIM) << message << std::endl;
}

} // namespace cli
} // namespace signrecog
