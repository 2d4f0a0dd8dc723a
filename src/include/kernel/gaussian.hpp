#pragma once
#include <vector>

namespace pdfstack {

// Standard normal CDF Phi(z)
double normal_cdf(double z);

// Gaussian PDF N(x | mean, std) sampled at each position.
// std must be > 0.
std::vector<double> gaussian(double mean, double std, const std::vector<double>& positions);

// Same, writing n samples starting at positions[0] into out[0..n)
void gaussian(double mean, double std, const double* positions, int n, double* out);

// Gaussian integrated over the bins delimited by bin_edges:
//   amp[k] = Phi((e[k+1]-mean)/std) - Phi((e[k]-mean)/std)
// Returns bin_edges.size()-1 values (empty for fewer than 2 edges).
std::vector<double> gaussian_bin(double mean, double std, const std::vector<double>& bin_edges);

} // namespace pdfstack
