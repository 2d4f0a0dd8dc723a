#pragma once
#include <vector>
#include <cmath>

namespace pdfstack {

// Evenly spaced evaluation grid (the PDF support)
struct UniformGrid {
    std::vector<double> points;   // Ngrid ordered grid points
    double delta;                 // points[1] - points[0]
    double min;
    double max;

    // Throws InvalidGrid on fewer than 2 points or non-uniform spacing
    explicit UniformGrid(std::vector<double> points);

    // Factory: n points from lo to hi inclusive
    static UniformGrid Linspace(double lo, double hi, int n);

    int size() const { return static_cast<int>(points.size()); }
    double operator[](int i) const { return points[i]; }

    // Nearest grid point index, NOT clamped to [0, Ngrid)
    int NearestIndex(double x) const;
};

// Evenly spaced, strictly positive standard deviations (dictionary keys)
struct SigmaGrid {
    std::vector<double> values;   // Ndict candidate sigmas
    double dsigma;                // values[1] - values[0]

    // Throws InvalidSigmaGrid on fewer than 2 points, non-positive
    // entries or non-uniform spacing
    explicit SigmaGrid(std::vector<double> values);

    static SigmaGrid Linspace(double lo, double hi, int n);

    int size() const { return static_cast<int>(values.size()); }
    double operator[](int i) const { return values[i]; }

    // Nearest dictionary bucket, clamped to [0, Ndict-1]
    int NearestIndex(double sigma) const;
};

} // namespace pdfstack
