#include "signrecog/cross_validation.h"
#include <stdexcept>
#include <string>

namespace signrecog {
namespace selection {

    std::vector<FoldSplit> kfold_split(size_t num_items, int num_folds) {
        if (num_folds < 2) {
            throw std::invalid_argument("k-fold requires at least 2 folds, got " + std::to_string(num_folds));
        }
        if (static_cast<size_t>(num_folds) > num_items) {
            throw std::invalid_argument("Cannot split " + std::to_string(num_items) + " items into " +
                                        std::to_string(num_folds) + " folds");
        }

        const size_t folds = static_cast<size_t>(num_folds);
        const size_t base_size = num_items / folds;
        const size_t remainder = num_items % folds;

        std::vector<FoldSplit> splits;
        splits.reserve(folds);

        size_t start = 0;
        for (size_t k = 0; k < folds; ++k) {
            size_t fold_size = base_size + (k < remainder ? 1 : 0);
            size_t stop = start + fold_size;

            FoldSplit split;
            split.test_indices.reserve(fold_size);
            split.train_indices.reserve(num_items - fold_size);
            for (size_t i = 0; i < num_items; ++i) {
                if (i >= start && i < stop) {
                    split.test_indices.push_back(i);
                } else {
                    split.train_indices.push_back(i);
                }
            }
            splits.push_back(std::move(split));
            start = stop;
        }

        return splits;
    }

} // namespace selection
} // namespace signrecog
