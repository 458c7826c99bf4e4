#include "signrecog/evaluation.h"
#include "signrecog/errors.h"
#include <iomanip>
#include <sstream>

namespace signrecog {
namespace recognition {

    RecognitionReport evaluate_guesses(const std::vector<std::optional<std::string>>& guesses,
                                       const TestSet& test_set) {
        if (guesses.size() != test_set.size()) {
            throw DataError("Got " + std::to_string(guesses.size()) + " guesses for " +
                            std::to_string(test_set.size()) + " test sequences");
        }

        RecognitionReport report;
        size_t index = 0;
        for (const auto& [id, item] : test_set.items()) {
            const std::optional<std::string>& guess = guesses[index++];
            if (!item.word) {
                continue;
            }

            report.total++;
            if (guess && *guess == *item.word) {
                report.correct++;
            } else {
                report.mismatches.push_back({id, *item.word, guess});
            }
        }

        if (report.total > 0) {
            report.wer = static_cast<double>(report.total - report.correct) / report.total;
        }
        return report;
    }

    std::string format_report(const RecognitionReport& report) {
        std::ostringstream oss;
        oss << "WER = " << std::fixed << std::setprecision(4) << report.wer << "\n";
        oss << "Correct " << report.correct << " out of " << report.total << "\n";

        if (!report.mismatches.empty()) {
            oss << std::left << std::setw(8) << "Id" << std::setw(20) << "Expected" << "Guess\n";
            for (const auto& mismatch : report.mismatches) {
                oss << std::setw(8) << mismatch.sequence_id
                    << std::setw(20) << mismatch.expected
                    << mismatch.guess.value_or("<none>") << "\n";
            }
        }
        return oss.str();
    }

} // namespace recognition
} // namespace signrecog
