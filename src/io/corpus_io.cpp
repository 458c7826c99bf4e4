#include "signrecog/corpus_io.h"
#include "signrecog/errors.h"
#include "signrecog/logger.h"
#include <fstream>
#include <sstream>
#include <map>

namespace signrecog {
namespace io {

    FeatureTable FeatureTableParser::parse_file(const std::string& path) const {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw DataError("Cannot open feature table: " + path);
        }

        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
        }

        FeatureTable table = parse_lines(lines, path);
        SIGNRECOG_LOG_DEBUG_F("Loaded %zu sequences with %zu features from %s",
                              table.sequences.size(), table.feature_names.size(), path.c_str());
        return table;
    }

    FeatureTable FeatureTableParser::parse_lines(const std::vector<std::string>& lines,
                                                 const std::string& source) const {
        FeatureTable table;
        bool header_seen = false;

        // Rows accumulated per sequence id, in first-appearance order
        std::map<int, size_t> sequence_index;
        std::vector<std::vector<std::vector<double>>> rows;

        for (size_t i = 0; i < lines.size(); ++i) {
            std::string trimmed = trim_whitespace(lines[i]);
            if (trimmed.empty() || trimmed[0] == '#') {
                continue;
            }

            auto tokens = tokenize_line(trimmed);

            if (!header_seen) {
                if (tokens.size() < 3 || tokens[0] != "word" || tokens[1] != "sequence_id") {
                    throw DataError(source + ":" + std::to_string(i + 1) +
                                    ": header must start with 'word,sequence_id' and name at least one feature");
                }
                table.feature_names.assign(tokens.begin() + 2, tokens.end());
                header_seen = true;
                continue;
            }

            if (tokens.size() != table.feature_names.size() + 2) {
                throw DataError(source + ":" + std::to_string(i + 1) + ": expected " +
                                std::to_string(table.feature_names.size() + 2) + " fields, got " +
                                std::to_string(tokens.size()));
            }

            std::string word = tokens[0];
            int id = parse_int_field(tokens[1], i + 1, source);

            auto it = sequence_index.find(id);
            if (it == sequence_index.end()) {
                it = sequence_index.emplace(id, table.sequences.size()).first;
                table.sequences.push_back({id, word, Eigen::MatrixXd()});
                rows.emplace_back();
            } else if (table.sequences[it->second].word != word) {
                throw DataError(source + ":" + std::to_string(i + 1) + ": sequence " +
                                std::to_string(id) + " labeled both '" +
                                table.sequences[it->second].word + "' and '" + word + "'");
            }

            std::vector<double> frame;
            frame.reserve(table.feature_names.size());
            for (size_t f = 2; f < tokens.size(); ++f) {
                frame.push_back(parse_double_field(tokens[f], i + 1, source));
            }
            rows[it->second].push_back(std::move(frame));
        }

        if (!header_seen) {
            throw DataError(source + ": missing header line");
        }

        const int num_features = static_cast<int>(table.feature_names.size());
        for (size_t s = 0; s < table.sequences.size(); ++s) {
            Eigen::MatrixXd frames(static_cast<int>(rows[s].size()), num_features);
            for (size_t r = 0; r < rows[s].size(); ++r) {
                for (int f = 0; f < num_features; ++f) {
                    frames(static_cast<int>(r), f) = rows[s][r][f];
                }
            }
            table.sequences[s].frames = std::move(frames);
        }

        return table;
    }

    std::vector<std::string> FeatureTableParser::tokenize_line(const std::string& line) const {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;

        while (std::getline(ss, token, ',')) {
            tokens.push_back(trim_whitespace(token));
        }
        if (!line.empty() && line.back() == ',') {
            tokens.emplace_back();
        }

        return tokens;
    }

    std::string FeatureTableParser::trim_whitespace(const std::string& str) const {
        size_t start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }

        size_t end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }

    double FeatureTableParser::parse_double_field(const std::string& field, size_t line_number,
                                                  const std::string& source) const {
        try {
            size_t consumed = 0;
            double value = std::stod(field, &consumed);
            if (consumed == field.size()) {
                return value;
            }
        } catch (const std::exception&) {
            // Reported below
        }
        throw DataError(source + ":" + std::to_string(line_number) + ": invalid number '" + field + "'");
    }

    int FeatureTableParser::parse_int_field(const std::string& field, size_t line_number,
                                            const std::string& source) const {
        try {
            size_t consumed = 0;
            int value = std::stoi(field, &consumed);
            if (consumed == field.size()) {
                return value;
            }
        } catch (const std::exception&) {
            // Reported below
        }
        throw DataError(source + ":" + std::to_string(line_number) + ": invalid sequence id '" + field + "'");
    }

    WordCorpus build_word_corpus(const FeatureTable& table) {
        WordCorpus corpus;
        for (const auto& sequence : table.sequences) {
            if (sequence.word.empty()) {
                throw DataError("Training sequence " + std::to_string(sequence.sequence_id) + " has no word");
            }
            corpus.add_sequence(sequence.word, sequence.frames);
        }
        return corpus;
    }

    TestSet build_test_set(const FeatureTable& table) {
        TestSet test_set;
        for (const auto& sequence : table.sequences) {
            std::optional<std::string> word;
            if (!sequence.word.empty()) {
                word = sequence.word;
            }
            test_set.add_sequence(sequence.sequence_id, sequence.frames, word);
        }
        return test_set;
    }

    WordCorpus load_word_corpus(const std::string& path) {
        return build_word_corpus(FeatureTableParser().parse_file(path));
    }

    TestSet load_test_set(const std::string& path) {
        return build_test_set(FeatureTableParser().parse_file(path));
    }

} // namespace io
} // namespace signrecog
