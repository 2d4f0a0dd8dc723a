#include "audit/mass_audit.hpp"
#include <algorithm>
#include <cmath>

namespace pdfstack {

MassAudit audit_stacked_mass(const std::vector<double>& pdf,
                             const std::vector<double>& weights,
                             const std::vector<int>& selection) {
    MassAudit audit;
    for (int j : selection) {
        audit.W_in += weights.empty() ? 1.0 : weights[j];
    }
    for (double v : pdf) {
        audit.W_out += v;
    }
    return audit;
}

double compute_mass_error(const MassAudit& audit) {
    double W_diff = std::fabs(audit.W_in - audit.W_out);
    return W_diff / std::max(std::fabs(audit.W_in), 1e-20);
}

bool check_mass_conservation(MassAudit& audit, double tol) {
    audit.W_error = compute_mass_error(audit);
    return audit.W_error < tol;
}

} // namespace pdfstack
