#include "core/grids.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace pdfstack {

namespace {
    // Relative tolerance on spacing deviations
    constexpr double kSpacingTol = 1e-6;

    // Returns the index of the first step that deviates from the first one,
    // or -1 when the sequence is uniform. The tolerance also absorbs the
    // rounding error of the differences, which scales with |v|.
    int find_nonuniform_step(const std::vector<double>& v) {
        const double step = v[1] - v[0];
        const double scale = std::max(std::fabs(v.front()), std::fabs(v.back()));
        const double tol = kSpacingTol * std::fabs(step) +
                           4.0 * std::numeric_limits<double>::epsilon() * scale;
        for (size_t i = 2; i < v.size(); ++i) {
            if (std::fabs((v[i] - v[i-1]) - step) > tol) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    // Round half to even (the default FP rounding mode), saturating so that
    // far off-grid values still produce a representable index
    int round_to_index(double x) {
        constexpr double kIndexLimit = 1 << 30;
        if (std::isnan(x)) return static_cast<int>(kIndexLimit);
        x = std::max(-kIndexLimit, std::min(x, kIndexLimit));
        return static_cast<int>(std::nearbyint(x));
    }

    std::vector<double> linspace(double lo, double hi, int n) {
        std::vector<double> v(n > 0 ? n : 0);
        if (n == 1) {
            v[0] = lo;
            return v;
        }
        const double step = (hi - lo) / (n - 1);
        for (int i = 0; i < n; ++i) {
            v[i] = lo + i * step;
        }
        if (n > 1) v[n - 1] = hi;
        return v;
    }
}

// UniformGrid implementation
UniformGrid::UniformGrid(std::vector<double> pts)
    : points(std::move(pts)), delta(0.0), min(0.0), max(0.0)
{
    if (points.size() < 2) {
        throw InvalidGrid("grid needs at least 2 points, got " + std::to_string(points.size()));
    }
    delta = points[1] - points[0];
    if (!(delta > 0.0) || !std::isfinite(delta)) {
        throw InvalidGrid("grid spacing must be positive and finite");
    }
    int bad = find_nonuniform_step(points);
    if (bad >= 0) {
        throw InvalidGrid("non-uniform spacing at index " + std::to_string(bad));
    }
    min = points.front();
    max = points.back();
}

UniformGrid UniformGrid::Linspace(double lo, double hi, int n) {
    return UniformGrid(linspace(lo, hi, n));
}

int UniformGrid::NearestIndex(double x) const {
    return round_to_index((x - points[0]) / delta);
}

// SigmaGrid implementation
SigmaGrid::SigmaGrid(std::vector<double> vals)
    : values(std::move(vals)), dsigma(0.0)
{
    if (values.size() < 2) {
        throw InvalidSigmaGrid("sigma grid needs at least 2 points, got " + std::to_string(values.size()));
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (!(values[i] > 0.0) || !std::isfinite(values[i])) {
            throw InvalidSigmaGrid("sigma must be strictly positive (index " + std::to_string(i) + ")");
        }
    }
    dsigma = values[1] - values[0];
    if (!(dsigma > 0.0)) {
        throw InvalidSigmaGrid("sigma grid must be strictly increasing");
    }
    int bad = find_nonuniform_step(values);
    if (bad >= 0) {
        throw InvalidSigmaGrid("non-uniform spacing at index " + std::to_string(bad));
    }
}

SigmaGrid SigmaGrid::Linspace(double lo, double hi, int n) {
    return SigmaGrid(linspace(lo, hi, n));
}

int SigmaGrid::NearestIndex(double sigma) const {
    int idx = round_to_index((sigma - values[0]) / dsigma);
    return std::max(0, std::min(idx, size() - 1));
}

} // namespace pdfstack
