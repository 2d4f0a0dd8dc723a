#pragma once
#include <optional>
#include <string>
#include <vector>

namespace pdfstack {

constexpr double kDefaultWtThresh = 1e-3;
constexpr double kDefaultCdfThresh = 2e-4;

/**
 * @brief Which observations contribute to a stacked PDF
 *
 * AMPLITUDE:       keep j with w[j] > threshold * max(w)
 * CUMULATIVE_MASS: sort by weight ascending, keep those whose normalized
 *                  cumulative weight is <= 1 - threshold
 * NONE:            keep everything
 */
enum class SelectionMode {
    NONE,
    AMPLITUDE,
    CUMULATIVE_MASS
};

struct SelectionPolicy {
    SelectionMode mode = SelectionMode::AMPLITUDE;
    double threshold = kDefaultWtThresh;

    static SelectionPolicy None() { return {SelectionMode::NONE, 0.0}; }
    static SelectionPolicy Amplitude(double wt_thresh = kDefaultWtThresh) {
        return {SelectionMode::AMPLITUDE, wt_thresh};
    }
    static SelectionPolicy CumulativeMass(double cdf_thresh = kDefaultCdfThresh) {
        return {SelectionMode::CUMULATIVE_MASS, cdf_thresh};
    }
};

// First non-empty threshold wins: wt_thresh, then cdf_thresh, else NONE
SelectionPolicy make_policy(std::optional<double> wt_thresh, std::optional<double> cdf_thresh);

std::string selection_mode_to_string(SelectionMode mode);
SelectionMode string_to_selection_mode(const std::string& str);

// Indices of the observations to stack. AMPLITUDE and NONE return indices
// in input order; CUMULATIVE_MASS returns them in ascending weight order.
std::vector<int> select_observations(const std::vector<double>& weights,
                                     const SelectionPolicy& policy);

} // namespace pdfstack
