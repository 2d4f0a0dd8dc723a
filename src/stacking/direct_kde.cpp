#include "stacking/direct_kde.hpp"
#include "kernel/gaussian.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pdfstack {

std::vector<double> kde(const std::vector<double>& values,
                        const std::vector<double>& sigmas,
                        const UniformGrid& grid,
                        const std::vector<double>& weights,
                        double sig_thresh,
                        const SelectionPolicy& policy,
                        StackStats* stats) {
    const size_t Ny = values.size();
    if (sigmas.size() != Ny) {
        throw std::invalid_argument("kde: values and sigmas differ in length (" +
                                    std::to_string(Ny) + " vs " +
                                    std::to_string(sigmas.size()) + ")");
    }
    if (!weights.empty() && weights.size() != Ny) {
        throw std::invalid_argument("kde: weights length " + std::to_string(weights.size()) +
                                    " does not match " + std::to_string(Ny) + " observations");
    }

    const long long Nx = grid.size();
    std::vector<double> pdf(Nx, 0.0);
    std::vector<double> gkde;
    gkde.reserve(Nx);

    std::vector<int> sel = weights.empty()
        ? select_observations(std::vector<double>(Ny, 1.0), policy)
        : select_observations(weights, policy);

    StackStats st;
    for (int j : sel) {
        ++st.selected;
        const double w = weights.empty() ? 1.0 : weights[j];

        // Window bounds in 64 bits: far off-grid centers and huge sigmas saturate
        const long long center = grid.NearestIndex(values[j]);
        const double offset_f = std::nearbyint(sig_thresh * sigmas[j] / grid.delta);
        const long long offset = std::isfinite(offset_f)
            ? static_cast<long long>(std::max(0.0, std::min(offset_f, static_cast<double>(Nx))))
            : Nx;
        const long long lower = std::max(center - offset, 0LL);
        const long long upper = std::min(center + offset + 1, Nx);
        if (lower >= upper) {
            ++st.skipped;
            continue;
        }

        const int n = static_cast<int>(upper - lower);
        gkde.resize(n);
        gaussian(values[j], sigmas[j], grid.points.data() + lower, n, gkde.data());

        double norm = 0.0;
        for (double v : gkde) norm += v;
        if (!(norm > 0.0) || !std::isfinite(norm)) {
            ++st.skipped;
            continue;
        }

        const double scale = w / norm;
        for (int i = 0; i < n; ++i) {
            pdf[lower + i] += scale * gkde[i];
        }
        ++st.stacked;
    }

    if (st.skipped > 0) {
        Logger::get().debug("kde: skipped %d of %d selected observations (empty or zero-sum window)",
                            st.skipped, st.selected);
    }
    if (stats) *stats = st;
    return pdf;
}

} // namespace pdfstack
