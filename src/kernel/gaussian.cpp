#include "kernel/gaussian.hpp"
#include <cmath>

namespace pdfstack {

namespace {
    constexpr double kSqrt2 = 1.41421356237309504880;
    constexpr double kSqrt2Pi = 2.50662827463100050242;
}

double normal_cdf(double z) {
    return 0.5 * (1.0 + std::erf(z / kSqrt2));
}

void gaussian(double mean, double std, const double* positions, int n, double* out) {
    const double norm = kSqrt2Pi * std;
    for (int i = 0; i < n; ++i) {
        double u = (positions[i] - mean) / std;
        out[i] = std::exp(-0.5 * u * u) / norm;
    }
}

std::vector<double> gaussian(double mean, double std, const std::vector<double>& positions) {
    std::vector<double> pdf(positions.size());
    gaussian(mean, std, positions.data(), static_cast<int>(positions.size()), pdf.data());
    return pdf;
}

std::vector<double> gaussian_bin(double mean, double std, const std::vector<double>& bin_edges) {
    if (bin_edges.size() < 2) {
        return {};
    }
    std::vector<double> amp(bin_edges.size() - 1);
    double cdf_lo = normal_cdf((bin_edges[0] - mean) / std);
    for (size_t k = 0; k + 1 < bin_edges.size(); ++k) {
        double cdf_hi = normal_cdf((bin_edges[k+1] - mean) / std);
        amp[k] = cdf_hi - cdf_lo;
        cdf_lo = cdf_hi;
    }
    return amp;
}

} // namespace pdfstack
