#pragma once

#include <vector>
#include <cstddef>

namespace signrecog {
namespace selection {

    /**
     * @brief Train/test index partition for one fold
     */
    struct FoldSplit {
        std::vector<size_t> train_indices;
        std::vector<size_t> test_indices;
    };

    /**
     * @brief Contiguous k-fold partition of [0, num_items) without shuffling
     *
     * The first num_items % num_folds folds hold one extra item. Every index
     * appears in exactly one test fold.
     *
     * @throws std::invalid_argument if num_folds < 2 or num_folds > num_items
     */
    std::vector<FoldSplit> kfold_split(size_t num_items, int num_folds);

} // namespace selection
} // namespace signrecog
