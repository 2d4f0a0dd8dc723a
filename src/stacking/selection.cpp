#include "stacking/selection.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace pdfstack {

SelectionPolicy make_policy(std::optional<double> wt_thresh, std::optional<double> cdf_thresh) {
    if (wt_thresh) return SelectionPolicy::Amplitude(*wt_thresh);
    if (cdf_thresh) return SelectionPolicy::CumulativeMass(*cdf_thresh);
    return SelectionPolicy::None();
}

std::string selection_mode_to_string(SelectionMode mode) {
    switch (mode) {
        case SelectionMode::NONE:            return "none";
        case SelectionMode::AMPLITUDE:       return "amplitude";
        case SelectionMode::CUMULATIVE_MASS: return "cumulative";
    }
    throw std::invalid_argument("unknown selection mode value " +
                                std::to_string(static_cast<int>(mode)));
}

SelectionMode string_to_selection_mode(const std::string& str) {
    if (str == "none")       return SelectionMode::NONE;
    if (str == "amplitude")  return SelectionMode::AMPLITUDE;
    if (str == "cumulative") return SelectionMode::CUMULATIVE_MASS;
    throw std::invalid_argument("unknown selection mode: " + str);
}

std::vector<int> select_observations(const std::vector<double>& weights,
                                     const SelectionPolicy& policy) {
    const int Ny = static_cast<int>(weights.size());
    std::vector<int> sel;
    if (Ny == 0) return sel;

    switch (policy.mode) {
        case SelectionMode::NONE: {
            sel.resize(Ny);
            std::iota(sel.begin(), sel.end(), 0);
            break;
        }
        case SelectionMode::AMPLITUDE: {
            const double w_max = *std::max_element(weights.begin(), weights.end());
            const double cut = policy.threshold * w_max;
            sel.reserve(Ny);
            for (int j = 0; j < Ny; ++j) {
                if (weights[j] > cut) sel.push_back(j);
            }
            break;
        }
        case SelectionMode::CUMULATIVE_MASS: {
            std::vector<int> order(Ny);
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(),
                             [&weights](int a, int b) { return weights[a] < weights[b]; });

            std::vector<double> cdf(Ny);
            double running = 0.0;
            for (int k = 0; k < Ny; ++k) {
                running += weights[order[k]];
                cdf[k] = running;
            }
            const double total = cdf[Ny - 1];
            const double cut = 1.0 - policy.threshold;
            sel.reserve(Ny);
            for (int k = 0; k < Ny; ++k) {
                if (cdf[k] / total <= cut) sel.push_back(order[k]);
            }
            break;
        }
    }
    return sel;
}

} // namespace pdfstack
