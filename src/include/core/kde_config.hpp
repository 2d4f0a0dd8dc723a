#pragma once
#include "stacking/selection.hpp"
#include "kernel/kernel_dictionary.hpp"
#include "stacking/direct_kde.hpp"
#include "stacking/dict_stacker.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace pdfstack {

/**
 * @brief Evaluation grid: n evenly spaced points from min to max
 */
struct GridConfig {
    double min = -5.0;
    double max = 5.0;
    int n = 101;
};

/**
 * @brief Sigma dictionary: n evenly spaced standard deviations
 */
struct SigmaGridConfig {
    double min = 0.05;
    double max = 0.8;
    int n = 16;
};

/**
 * @brief Kernel truncation
 */
struct KernelConfig {
    double sigma_trunc = kDefaultSigmaTrunc;  // dictionary truncation (sigmas)
    double sig_thresh = kDefaultSigThresh;    // direct KDE window (sigmas)
};

/**
 * @brief Observation selection thresholds
 */
struct SelectionConfig {
    SelectionMode mode = SelectionMode::AMPLITUDE;
    double wt_thresh = kDefaultWtThresh;
    double cdf_thresh = kDefaultCdfThresh;
};

/**
 * @brief Runtime controls
 */
struct RuntimeConfig {
    int n_workers = 1;    // stacking threads, <= 1 => serial
    int log_level = 1;    // 0: quiet, 1: summary, 2: verbose
};

/**
 * @brief Complete configuration of a stacked-PDF estimator
 *
 * The dictionary is a deterministic function of (grid, sigma, sigma_trunc),
 * so these three sections are all that is needed to rebuild it.
 */
struct KdeConfig {
    GridConfig grid;
    SigmaGridConfig sigma;
    KernelConfig kernel;
    SelectionConfig selection;
    RuntimeConfig runtime;

    void validate() const;
    SelectionPolicy selection_policy() const;
};

inline void KdeConfig::validate() const {
    if (grid.n < 2) {
        throw std::invalid_argument("KdeConfig: grid.n must be >= 2");
    }
    if (!(grid.max > grid.min)) {
        throw std::invalid_argument("KdeConfig: grid.max must be > grid.min");
    }
    if (sigma.n < 2) {
        throw std::invalid_argument("KdeConfig: sigma.n must be >= 2");
    }
    if (!(sigma.min > 0.0)) {
        throw std::invalid_argument("KdeConfig: sigma.min must be positive");
    }
    if (!(sigma.max > sigma.min)) {
        throw std::invalid_argument("KdeConfig: sigma.max must be > sigma.min");
    }
    if (!(kernel.sigma_trunc > 0.0) || !std::isfinite(kernel.sigma_trunc)) {
        throw std::invalid_argument("KdeConfig: kernel.sigma_trunc must be positive");
    }
    if (!(kernel.sig_thresh > 0.0) || !std::isfinite(kernel.sig_thresh)) {
        throw std::invalid_argument("KdeConfig: kernel.sig_thresh must be positive");
    }
    if (selection.wt_thresh < 0.0) {
        throw std::invalid_argument("KdeConfig: selection.wt_thresh must be non-negative");
    }
    if (selection.cdf_thresh < 0.0 || selection.cdf_thresh >= 1.0) {
        throw std::invalid_argument("KdeConfig: selection.cdf_thresh must be in [0, 1)");
    }
}

inline SelectionPolicy KdeConfig::selection_policy() const {
    switch (selection.mode) {
        case SelectionMode::NONE:            return SelectionPolicy::None();
        case SelectionMode::CUMULATIVE_MASS: return SelectionPolicy::CumulativeMass(selection.cdf_thresh);
        case SelectionMode::AMPLITUDE:       return SelectionPolicy::Amplitude(selection.wt_thresh);
    }
    throw std::invalid_argument("KdeConfig: unknown selection mode");
}

// Validate the configuration and build the kernel dictionary it describes
KernelDictionary build_dictionary(const KdeConfig& config);

// Apply runtime.log_level to the global Logger
void configure_logging(const KdeConfig& config);

// Stack a batch with the configured selection policy and worker count
std::vector<double> stack_configured(const KernelDictionary& dict,
                                     const KdeConfig& config,
                                     const ObservationInput& input,
                                     const std::vector<double>& weights = {},
                                     StackStats* stats = nullptr);

} // namespace pdfstack
