#include "core/kde_config.hpp"
#include "utils/logger.hpp"

namespace pdfstack {

KernelDictionary build_dictionary(const KdeConfig& config) {
    config.validate();
    return KernelDictionary(UniformGrid::Linspace(config.grid.min, config.grid.max, config.grid.n),
                            SigmaGrid::Linspace(config.sigma.min, config.sigma.max, config.sigma.n),
                            config.kernel.sigma_trunc);
}

void configure_logging(const KdeConfig& config) {
    Logger::get().set_level(log_level_from_verbosity(config.runtime.log_level));
}

std::vector<double> stack_configured(const KernelDictionary& dict,
                                     const KdeConfig& config,
                                     const ObservationInput& input,
                                     const std::vector<double>& weights,
                                     StackStats* stats) {
    QuantizedBatch batch = resolve_input(dict, input);
    return stack_parallel(dict, batch.grid_indices, batch.dict_indices, weights,
                          config.selection_policy(), config.runtime.n_workers, stats);
}

} // namespace pdfstack
