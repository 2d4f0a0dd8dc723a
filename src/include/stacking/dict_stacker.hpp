#pragma once
#include "kernel/kernel_dictionary.hpp"
#include "stacking/selection.hpp"
#include <optional>
#include <vector>

namespace pdfstack {

// Per-call bookkeeping
struct StackStats {
    int selected = 0;   // passed the selection policy
    int stacked = 0;    // contributed to the output
    int skipped = 0;    // degenerate window (off-grid or zero retained mass)
};

/**
 * @brief Observations in either raw or pre-quantized form
 *
 * Pre-quantized indices take precedence when both forms are present.
 */
struct ObservationInput {
    std::optional<std::vector<double>> values;
    std::optional<std::vector<double>> sigmas;
    std::optional<std::vector<int>> grid_indices;
    std::optional<std::vector<int>> dict_indices;

    ObservationInput() {}

    static ObservationInput FromValues(std::vector<double> values, std::vector<double> sigmas);
    static ObservationInput FromIndices(std::vector<int> grid_indices, std::vector<int> dict_indices);

    bool has_indices() const { return grid_indices.has_value() && dict_indices.has_value(); }
    bool has_values() const { return values.has_value() && sigmas.has_value(); }
};

// Indices of the input, quantized through dict.fit() when only raw values
// are present. Throws MissingInput if neither form is complete.
QuantizedBatch resolve_input(const KernelDictionary& dict, const ObservationInput& input);

// Paste one weighted kernel onto out[0..Ngrid), clipping at the grid edges and
// rescaling by the retained kernel mass. Returns false (and writes nothing)
// when the clipped window is empty or retains no mass.
bool paste_kernel(const KernelDictionary& dict, int pos, int idx, double weight, double* out);

/**
 * @brief Stack dictionary kernels for a batch of quantized observations
 *
 * Returns a fresh array of length dict.Ngrid(). Each selected observation
 * contributes exactly its weight (up to rounding), however much of its
 * kernel falls off the grid. An empty weights vector means uniform weights.
 *
 * Throws std::invalid_argument on length mismatches and std::out_of_range
 * for dictionary indices outside [0, Ndict).
 */
std::vector<double> stack(const KernelDictionary& dict,
                          const std::vector<int>& grid_indices,
                          const std::vector<int>& dict_indices,
                          const std::vector<double>& weights = {},
                          const SelectionPolicy& policy = SelectionPolicy(),
                          StackStats* stats = nullptr);

// Stacks resolve_input(dict, input)
std::vector<double> stack(const KernelDictionary& dict,
                          const ObservationInput& input,
                          const std::vector<double>& weights = {},
                          const SelectionPolicy& policy = SelectionPolicy(),
                          StackStats* stats = nullptr);

// Same result as stack(), with selected observations split across n_workers
// threads, each accumulating into a private buffer merged after join.
std::vector<double> stack_parallel(const KernelDictionary& dict,
                                   const std::vector<int>& grid_indices,
                                   const std::vector<int>& dict_indices,
                                   const std::vector<double>& weights,
                                   const SelectionPolicy& policy,
                                   int n_workers,
                                   StackStats* stats = nullptr);

} // namespace pdfstack
