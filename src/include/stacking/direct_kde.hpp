#pragma once
#include "core/grids.hpp"
#include "stacking/dict_stacker.hpp"
#include "stacking/selection.hpp"
#include <vector>

namespace pdfstack {

constexpr double kDefaultSigThresh = 5.0;

/**
 * @brief Kernel density estimate without a precomputed dictionary
 *
 * Each selected observation is evaluated directly over the symmetric window
 * [c - o, c + o] around its nearest grid point c, o = round(sig_thresh*sigma/delta),
 * clipped to the grid. The clipped kernel is normalized by its discrete sum,
 * so it contributes its weight exactly; observations whose window is empty or
 * sums to zero are skipped.
 *
 * Throws std::invalid_argument on length mismatches.
 */
std::vector<double> kde(const std::vector<double>& values,
                        const std::vector<double>& sigmas,
                        const UniformGrid& grid,
                        const std::vector<double>& weights = {},
                        double sig_thresh = kDefaultSigThresh,
                        const SelectionPolicy& policy = SelectionPolicy(),
                        StackStats* stats = nullptr);

} // namespace pdfstack
