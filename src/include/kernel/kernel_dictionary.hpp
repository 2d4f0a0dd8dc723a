#pragma once
#include "core/grids.hpp"
#include <cstddef>
#include <vector>

namespace pdfstack {

constexpr double kDefaultSigmaTrunc = 5.0;

// Read-only view into one kernel stored in the dictionary arena
struct KernelView {
    const double* data = nullptr;
    int size = 0;

    double operator[](int i) const { return data[i]; }
    const double* begin() const { return data; }
    const double* end() const { return data + size; }
};

// Observations mapped onto (grid point, dictionary bucket) pairs
struct QuantizedBatch {
    std::vector<int> grid_indices;   // NOT clamped to [0, Ngrid)
    std::vector<int> dict_indices;   // clamped to [0, Ndict)
};

/**
 * @brief Catalog of truncated Gaussian kernels keyed by discretized sigma
 *
 * Entry i holds the Gaussian of std sigma_grid[i] sampled at grid offsets
 * -width[i]..+width[i] (2*width[i]+1 values) together with its running
 * cumulative sum. Shapes are translation invariant, so one kernel per
 * sigma bucket is pasted at any grid position by the stacking engine.
 *
 * All entries live in a single flattened arena built once at construction;
 * the dictionary is immutable afterwards and may be shared across threads.
 */
class KernelDictionary {
public:
    // Throws InvalidGrid if sigma_trunc is not positive or the widest kernel
    // does not fit around the grid's middle point
    KernelDictionary(UniformGrid grid, SigmaGrid sigma_grid,
                     double sigma_trunc = kDefaultSigmaTrunc);

    KernelDictionary(const std::vector<double>& grid,
                     const std::vector<double>& sigma_grid,
                     double sigma_trunc = kDefaultSigmaTrunc);

    const UniformGrid& grid() const { return grid_; }
    int Ngrid() const { return grid_.size(); }
    double delta() const { return grid_.delta; }

    const SigmaGrid& sigma_grid() const { return sigma_grid_; }
    int Ndict() const { return sigma_grid_.size(); }
    double dsigma() const { return sigma_grid_.dsigma; }

    double sigma_trunc() const { return sigma_trunc_; }
    int max_width() const { return max_width_; }

    // Per-entry accessors; throw std::out_of_range for i outside [0, Ndict)
    int width(int i) const;
    KernelView kernel(int i) const;
    KernelView kernel_cdf(int i) const;

    // Quantizer: nearest grid point (unclamped) and nearest sigma bucket (clamped)
    int fit_value(double value) const { return grid_.NearestIndex(value); }
    int fit_sigma(double sigma) const { return sigma_grid_.NearestIndex(sigma); }
    QuantizedBatch fit(const std::vector<double>& values,
                       const std::vector<double>& sigmas) const;

private:
    void check_entry(int i) const;

    UniformGrid grid_;
    SigmaGrid sigma_grid_;
    double sigma_trunc_;
    int max_width_ = 0;

    std::vector<int> widths_;            // Ndict half-window sizes
    std::vector<size_t> offsets_;        // Ndict arena offsets
    std::vector<double> kernel_values_;  // sum(2*w+1) kernel samples
    std::vector<double> kernel_cdf_;     // running sums, same layout
};

} // namespace pdfstack
