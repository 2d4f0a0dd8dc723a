#include "stacking/dict_stacker.hpp"
#include "core/errors.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace pdfstack {

namespace {
    void check_batch(const KernelDictionary& dict,
                     const std::vector<int>& grid_indices,
                     const std::vector<int>& dict_indices,
                     const std::vector<double>& weights) {
        if (grid_indices.size() != dict_indices.size()) {
            throw std::invalid_argument("stack: grid_indices and dict_indices differ in length (" +
                                        std::to_string(grid_indices.size()) + " vs " +
                                        std::to_string(dict_indices.size()) + ")");
        }
        if (!weights.empty() && weights.size() != grid_indices.size()) {
            throw std::invalid_argument("stack: weights length " + std::to_string(weights.size()) +
                                        " does not match " + std::to_string(grid_indices.size()) +
                                        " observations");
        }
        for (size_t j = 0; j < dict_indices.size(); ++j) {
            if (dict_indices[j] < 0 || dict_indices[j] >= dict.Ndict()) {
                throw std::out_of_range("stack: dict_indices[" + std::to_string(j) + "] = " +
                                        std::to_string(dict_indices[j]) + " outside [0, " +
                                        std::to_string(dict.Ndict()) + ")");
            }
        }
    }

    std::vector<int> selection_for(const std::vector<double>& weights, size_t Ny,
                                   const SelectionPolicy& policy) {
        if (weights.empty()) {
            return select_observations(std::vector<double>(Ny, 1.0), policy);
        }
        return select_observations(weights, policy);
    }

    // Accumulate sel[begin..end) into out
    StackStats stack_range(const KernelDictionary& dict,
                           const std::vector<int>& grid_indices,
                           const std::vector<int>& dict_indices,
                           const std::vector<double>& weights,
                           const std::vector<int>& sel,
                           size_t begin, size_t end,
                           double* out) {
        StackStats st;
        for (size_t s = begin; s < end; ++s) {
            const int j = sel[s];
            const double w = weights.empty() ? 1.0 : weights[j];
            ++st.selected;
            if (paste_kernel(dict, grid_indices[j], dict_indices[j], w, out)) {
                ++st.stacked;
            } else {
                ++st.skipped;
            }
        }
        return st;
    }

    void report(const StackStats& st, StackStats* stats) {
        if (st.skipped > 0) {
            Logger::get().debug("stack: skipped %d of %d selected observations (degenerate window)",
                                st.skipped, st.selected);
        }
        if (stats) *stats = st;
    }
}

ObservationInput ObservationInput::FromValues(std::vector<double> values, std::vector<double> sigmas) {
    ObservationInput in;
    in.values = std::move(values);
    in.sigmas = std::move(sigmas);
    return in;
}

ObservationInput ObservationInput::FromIndices(std::vector<int> grid_indices, std::vector<int> dict_indices) {
    ObservationInput in;
    in.grid_indices = std::move(grid_indices);
    in.dict_indices = std::move(dict_indices);
    return in;
}

QuantizedBatch resolve_input(const KernelDictionary& dict, const ObservationInput& input) {
    if (input.has_indices()) {
        return {*input.grid_indices, *input.dict_indices};
    }
    if (input.has_values()) {
        return dict.fit(*input.values, *input.sigmas);
    }
    throw MissingInput("at least one pair of (values, sigmas) or "
                       "(grid_indices, dict_indices) must be specified");
}

bool paste_kernel(const KernelDictionary& dict, int pos, int idx, double weight, double* out) {
    const int Nx = dict.Ngrid();
    const int width = dict.width(idx);

    // Conceptual support is [pos-width, pos+width]; clip it to the grid.
    // Bounds in 64 bits so extreme pre-quantized indices cannot overflow.
    const long long first = static_cast<long long>(pos) - width;
    const long long last = static_cast<long long>(pos) + width + 1;
    const long long low_ll = std::max(first, 0LL);
    const long long high_ll = std::min(last, static_cast<long long>(Nx));
    if (low_ll >= high_ll) return false;

    // Both bounds now lie in [0, Nx]
    const int low = static_cast<int>(low_ll);
    const int high = static_cast<int>(high_ll);
    const int lpad = static_cast<int>(low_ll - first);    // samples cut on the low side, >= 0
    const int hpad = static_cast<int>(high_ll - last);    // minus samples cut on the high side, <= 0

    // Retained mass from the kernel CDF; last kept sample is 2*width + hpad
    const KernelView kernel = dict.kernel(idx);
    const KernelView kcdf = dict.kernel_cdf(idx);
    double norm = kcdf[2 * width + hpad];
    if (lpad > 0) norm -= kcdf[lpad - 1];
    if (!(norm > 0.0)) return false;

    const double scale = weight / norm;
    const double* k = kernel.data + lpad;
    for (int i = low; i < high; ++i) {
        out[i] += scale * k[i - low];
    }
    return true;
}

std::vector<double> stack(const KernelDictionary& dict,
                          const std::vector<int>& grid_indices,
                          const std::vector<int>& dict_indices,
                          const std::vector<double>& weights,
                          const SelectionPolicy& policy,
                          StackStats* stats) {
    check_batch(dict, grid_indices, dict_indices, weights);

    std::vector<double> pdf(dict.Ngrid(), 0.0);
    std::vector<int> sel = selection_for(weights, grid_indices.size(), policy);
    StackStats st = stack_range(dict, grid_indices, dict_indices, weights,
                                sel, 0, sel.size(), pdf.data());
    report(st, stats);
    return pdf;
}

std::vector<double> stack(const KernelDictionary& dict,
                          const ObservationInput& input,
                          const std::vector<double>& weights,
                          const SelectionPolicy& policy,
                          StackStats* stats) {
    QuantizedBatch batch = resolve_input(dict, input);
    return stack(dict, batch.grid_indices, batch.dict_indices, weights, policy, stats);
}

std::vector<double> stack_parallel(const KernelDictionary& dict,
                                   const std::vector<int>& grid_indices,
                                   const std::vector<int>& dict_indices,
                                   const std::vector<double>& weights,
                                   const SelectionPolicy& policy,
                                   int n_workers,
                                   StackStats* stats) {
    if (n_workers <= 1) {
        return stack(dict, grid_indices, dict_indices, weights, policy, stats);
    }
    check_batch(dict, grid_indices, dict_indices, weights);

    const int Nx = dict.Ngrid();
    std::vector<int> sel = selection_for(weights, grid_indices.size(), policy);
    const size_t n_sel = sel.size();
    // Never more threads than cores or selected observations
    const unsigned int cores = std::max(1u, std::thread::hardware_concurrency());
    const size_t max_threads = std::min<size_t>(static_cast<size_t>(n_workers), cores);
    const int n_threads = static_cast<int>(std::min<size_t>(max_threads, std::max<size_t>(n_sel, 1)));

    // Partial buffers are allocated before any thread starts
    std::vector<std::vector<double>> partial(n_threads, std::vector<double>(Nx, 0.0));
    std::vector<StackStats> partial_stats(n_threads);
    std::vector<std::thread> workers;
    workers.reserve(n_threads);

    const size_t chunk = (n_sel + n_threads - 1) / n_threads;
    try {
        for (int t = 0; t < n_threads; ++t) {
            const size_t begin = std::min(n_sel, t * chunk);
            const size_t end = std::min(n_sel, begin + chunk);
            workers.emplace_back([&, t, begin, end]() {
                partial_stats[t] = stack_range(dict, grid_indices, dict_indices, weights,
                                               sel, begin, end, partial[t].data());
            });
        }
    } catch (const std::system_error& e) {
        Logger::get().error("stack_parallel: failed to start worker %zu of %d: %s",
                            workers.size(), n_threads, e.what());
        for (auto& th : workers) {
            th.join();
        }
        throw;
    }
    for (auto& th : workers) {
        th.join();
    }

    std::vector<double> pdf(Nx, 0.0);
    StackStats st;
    for (int t = 0; t < n_threads; ++t) {
        for (int i = 0; i < Nx; ++i) {
            pdf[i] += partial[t][i];
        }
        st.selected += partial_stats[t].selected;
        st.stacked += partial_stats[t].stacked;
        st.skipped += partial_stats[t].skipped;
    }
    report(st, stats);
    return pdf;
}

} // namespace pdfstack
