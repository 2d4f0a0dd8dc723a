#pragma once
#include "kernel/kernel_dictionary.hpp"
#include "stacking/selection.hpp"
#include <iosfwd>
#include <vector>

namespace pdfstack {

struct EquivalenceResult {
    int n_obs = 0;
    double mass_dict = 0;     // sum of the dictionary-stacked PDF
    double mass_direct = 0;   // sum of the directly evaluated PDF
    double max_abs_diff = 0;  // max_i |dict[i] - direct[i]|
    double l1_diff = 0;       // sum_i |dict[i] - direct[i]|
    double tolerance = 0;     // pass threshold applied to l1_diff / mass_direct
    bool pass = false;
};

// Stack the same batch through the dictionary and through direct evaluation
// (with sig_thresh = dict.sigma_trunc()) and compare the two PDFs.
EquivalenceResult compare_dict_direct(const KernelDictionary& dict,
                                      const std::vector<double>& values,
                                      const std::vector<double>& sigmas,
                                      const std::vector<double>& weights = {},
                                      const SelectionPolicy& policy = SelectionPolicy(),
                                      double tolerance = 0.05);

void generate_equivalence_report(std::ostream& os, const EquivalenceResult& result);

} // namespace pdfstack
