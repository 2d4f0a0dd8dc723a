#include "kernel/kernel_dictionary.hpp"
#include "kernel/gaussian.hpp"
#include "core/errors.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace pdfstack {

KernelDictionary::KernelDictionary(UniformGrid grid, SigmaGrid sigma_grid, double sigma_trunc)
    : grid_(std::move(grid)), sigma_grid_(std::move(sigma_grid)), sigma_trunc_(sigma_trunc)
{
    if (!(sigma_trunc_ > 0.0) || !std::isfinite(sigma_trunc_)) {
        throw InvalidGrid("sigma_trunc must be positive and finite");
    }

    const int Ndict = sigma_grid_.size();
    const int Ngrid = grid_.size();
    const int mid = Ngrid / 2;

    // First pass: window sizes and arena layout
    widths_.resize(Ndict);
    offsets_.resize(Ndict);
    size_t total = 0;
    for (int i = 0; i < Ndict; ++i) {
        double w = std::ceil(sigma_grid_[i] * sigma_trunc_ / grid_.delta);
        if (w > static_cast<double>(mid)) {
            throw InvalidGrid("kernel half-width " + std::to_string(w) +
                              " for sigma=" + std::to_string(sigma_grid_[i]) +
                              " exceeds half the grid (" + std::to_string(mid) + " points)");
        }
        widths_[i] = static_cast<int>(w);
        offsets_[i] = total;
        total += static_cast<size_t>(2 * widths_[i] + 1);
        if (widths_[i] > max_width_) max_width_ = widths_[i];
    }
    // mid + w must also stay below Ngrid (matters for even Ngrid)
    if (mid + max_width_ >= Ngrid) {
        throw InvalidGrid("kernel half-width " + std::to_string(max_width_) +
                          " does not fit in a grid of " + std::to_string(Ngrid) + " points");
    }

    // Second pass: sample each kernel around grid[mid] and accumulate its CDF
    kernel_values_.resize(total);
    kernel_cdf_.resize(total);
    for (int i = 0; i < Ndict; ++i) {
        const int w = widths_[i];
        const int n = 2 * w + 1;
        double* k = kernel_values_.data() + offsets_[i];
        double* c = kernel_cdf_.data() + offsets_[i];

        gaussian(grid_[mid], sigma_grid_[i], grid_.points.data() + (mid - w), n, k);

        double running = 0.0;
        for (int j = 0; j < n; ++j) {
            running += k[j];
            c[j] = running;
        }
    }

    Logger::get().info("KernelDictionary: Ngrid=%d delta=%g Ndict=%d dsigma=%g sigma_trunc=%g max_width=%d",
                       Ngrid, grid_.delta, Ndict, sigma_grid_.dsigma, sigma_trunc_, max_width_);
}

KernelDictionary::KernelDictionary(const std::vector<double>& grid,
                                   const std::vector<double>& sigma_grid,
                                   double sigma_trunc)
    : KernelDictionary(UniformGrid(grid), SigmaGrid(sigma_grid), sigma_trunc)
{
}

void KernelDictionary::check_entry(int i) const {
    if (i < 0 || i >= Ndict()) {
        throw std::out_of_range("KernelDictionary: entry " + std::to_string(i) +
                                " outside [0, " + std::to_string(Ndict()) + ")");
    }
}

int KernelDictionary::width(int i) const {
    check_entry(i);
    return widths_[i];
}

KernelView KernelDictionary::kernel(int i) const {
    check_entry(i);
    return {kernel_values_.data() + offsets_[i], 2 * widths_[i] + 1};
}

KernelView KernelDictionary::kernel_cdf(int i) const {
    check_entry(i);
    return {kernel_cdf_.data() + offsets_[i], 2 * widths_[i] + 1};
}

QuantizedBatch KernelDictionary::fit(const std::vector<double>& values,
                                     const std::vector<double>& sigmas) const {
    if (values.size() != sigmas.size()) {
        throw std::invalid_argument("KernelDictionary::fit: values and sigmas differ in length (" +
                                    std::to_string(values.size()) + " vs " +
                                    std::to_string(sigmas.size()) + ")");
    }

    QuantizedBatch batch;
    batch.grid_indices.resize(values.size());
    batch.dict_indices.resize(values.size());
    for (size_t j = 0; j < values.size(); ++j) {
        batch.grid_indices[j] = fit_value(values[j]);
        batch.dict_indices[j] = fit_sigma(sigmas[j]);
    }
    return batch;
}

} // namespace pdfstack
