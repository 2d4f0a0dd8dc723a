#pragma once
#include <vector>

namespace pdfstack {

struct MassAudit {
    double W_in = 0;      // weight handed to the stacker (selected observations)
    double W_out = 0;     // integral (sum) of the stacked PDF
    double W_error = 0;   // relative |W_in - W_out| / W_in
};

// Sum of the selected weights (uniform 1.0 when weights is empty) against
// the sum of the stacked output
MassAudit audit_stacked_mass(const std::vector<double>& pdf,
                             const std::vector<double>& weights,
                             const std::vector<int>& selection);

bool check_mass_conservation(MassAudit& audit, double tol = 1e-6);
double compute_mass_error(const MassAudit& audit);

} // namespace pdfstack
