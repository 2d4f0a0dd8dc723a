#pragma once
#include "core/kde_config.hpp"
#include "utils/logger.hpp"
#include <string>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <cctype>

namespace pdfstack {

/**
 * @brief Configuration section holding key-value pairs
 */
struct ConfigSection {
    std::unordered_map<std::string, std::string> values;

    std::string get(const std::string& key, const std::string& default_val = "") const {
        auto it = values.find(key);
        return (it != values.end()) ? it->second : default_val;
    }

    double get_double(const std::string& key, double default_val = 0.0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            try {
                return std::stod(it->second);
            } catch (const std::logic_error&) {
                Logger::get().warn("config: cannot parse '%s = %s' as a number, using default",
                                   key.c_str(), it->second.c_str());
                return default_val;
            }
        }
        return default_val;
    }

    int get_int(const std::string& key, int default_val = 0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            try {
                return std::stoi(it->second);
            } catch (const std::logic_error&) {
                Logger::get().warn("config: cannot parse '%s = %s' as an integer, using default",
                                   key.c_str(), it->second.c_str());
                return default_val;
            }
        }
        return default_val;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }
};

/**
 * @brief Simple key-value configuration file parser
 *
 * File format (INI-style with sections):
 * ```
 * [grid]
 * min = -5.0
 * max = 5.0
 * n = 101
 *
 * [sigma]
 * min = 0.05
 * max = 0.8
 * n = 16
 *
 * [kernel]
 * sigma_trunc = 5.0
 * sig_thresh = 5.0
 *
 * [selection]
 * mode = amplitude      ; amplitude, cumulative or none
 * wt_thresh = 1e-3
 * cdf_thresh = 2e-4
 *
 * [runtime]
 * n_workers = 1
 * log_level = 1
 * ```
 */
class ConfigLoader {
public:
    std::unordered_map<std::string, ConfigSection> sections;

    /**
     * @brief Load configuration from file
     */
    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        parse(file);
        return true;
    }

    /**
     * @brief Parse configuration text from a stream
     */
    void parse(std::istream& in) {
        sections.clear();
        std::string current_section = "default";

        std::string line;
        while (std::getline(in, line)) {
            // Trailing comments
            size_t comment = line.find_first_of("#;");
            if (comment != std::string::npos) {
                line = line.substr(0, comment);
            }
            line = trim(line);
            if (line.empty()) {
                continue;
            }

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                current_section = trim(line.substr(1, line.length() - 2));
                continue;
            }

            // key = value
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim(line.substr(0, pos));
                std::string value = trim(line.substr(pos + 1));

                if (value.size() >= 2 &&
                    ((value.front() == '"' && value.back() == '"') ||
                     (value.front() == '\'' && value.back() == '\''))) {
                    value = value.substr(1, value.length() - 2);
                }

                sections[current_section].values[key] = value;
            }
        }
    }

    /**
     * @brief Save configuration to file
     */
    bool save(const std::string& filename) const {
        std::ofstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        for (const auto& section_pair : sections) {
            file << "[" << section_pair.first << "]\n";
            for (const auto& value_pair : section_pair.second.values) {
                file << value_pair.first << " = " << value_pair.second << "\n";
            }
            file << "\n";
        }

        return true;
    }

    ConfigSection get_section(const std::string& name) const {
        auto it = sections.find(name);
        if (it != sections.end()) {
            return it->second;
        }
        return ConfigSection{};
    }

    bool has_section(const std::string& name) const {
        return sections.find(name) != sections.end();
    }

private:
    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
            ++start;
        }
        if (start == str.length()) {
            return "";
        }

        size_t end = str.length() - 1;
        while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
            --end;
        }

        return str.substr(start, end - start + 1);
    }
};

/**
 * @brief Build a KdeConfig from parsed sections; missing keys keep their defaults
 */
inline KdeConfig kde_config_from_loader(const ConfigLoader& loader) {
    KdeConfig config;

    ConfigSection grid_sec = loader.get_section("grid");
    config.grid.min = grid_sec.get_double("min", config.grid.min);
    config.grid.max = grid_sec.get_double("max", config.grid.max);
    config.grid.n = grid_sec.get_int("n", config.grid.n);

    ConfigSection sigma_sec = loader.get_section("sigma");
    config.sigma.min = sigma_sec.get_double("min", config.sigma.min);
    config.sigma.max = sigma_sec.get_double("max", config.sigma.max);
    config.sigma.n = sigma_sec.get_int("n", config.sigma.n);

    ConfigSection kernel_sec = loader.get_section("kernel");
    config.kernel.sigma_trunc = kernel_sec.get_double("sigma_trunc", config.kernel.sigma_trunc);
    config.kernel.sig_thresh = kernel_sec.get_double("sig_thresh", config.kernel.sig_thresh);

    ConfigSection selection_sec = loader.get_section("selection");
    if (selection_sec.has("mode")) {
        config.selection.mode = string_to_selection_mode(selection_sec.get("mode"));
    }
    config.selection.wt_thresh = selection_sec.get_double("wt_thresh", config.selection.wt_thresh);
    config.selection.cdf_thresh = selection_sec.get_double("cdf_thresh", config.selection.cdf_thresh);

    ConfigSection runtime_sec = loader.get_section("runtime");
    config.runtime.n_workers = runtime_sec.get_int("n_workers", config.runtime.n_workers);
    config.runtime.log_level = runtime_sec.get_int("log_level", config.runtime.log_level);

    return config;
}

/**
 * @brief Load KdeConfig from file
 */
inline KdeConfig load_kde_config(const std::string& filename) {
    ConfigLoader loader;
    if (!loader.load(filename)) {
        Logger::get().error("Failed to load configuration file: %s", filename.c_str());
        throw std::runtime_error("Failed to load configuration file: " + filename);
    }
    return kde_config_from_loader(loader);
}

/**
 * @brief Write KdeConfig in the format read by load_kde_config
 */
inline void write_kde_config(std::ostream& os, const KdeConfig& config) {
    std::ios::fmtflags flags = os.flags();
    std::streamsize prec = os.precision();
    os << std::setprecision(std::numeric_limits<double>::max_digits10);

    os << "# Stacked PDF estimator configuration\n\n";

    os << "[grid]\n";
    os << "min = " << config.grid.min << "\n";
    os << "max = " << config.grid.max << "\n";
    os << "n = " << config.grid.n << "\n\n";

    os << "[sigma]\n";
    os << "min = " << config.sigma.min << "\n";
    os << "max = " << config.sigma.max << "\n";
    os << "n = " << config.sigma.n << "\n\n";

    os << "[kernel]\n";
    os << "sigma_trunc = " << config.kernel.sigma_trunc << "\n";
    os << "sig_thresh = " << config.kernel.sig_thresh << "\n\n";

    os << "[selection]\n";
    os << "mode = " << selection_mode_to_string(config.selection.mode) << "\n";
    os << "wt_thresh = " << config.selection.wt_thresh << "\n";
    os << "cdf_thresh = " << config.selection.cdf_thresh << "\n\n";

    os << "[runtime]\n";
    os << "n_workers = " << config.runtime.n_workers << "\n";
    os << "log_level = " << config.runtime.log_level << "\n";

    os.flags(flags);
    os.precision(prec);
}

/**
 * @brief Save KdeConfig to file
 */
inline bool save_kde_config(const std::string& filename, const KdeConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    write_kde_config(file, config);
    return static_cast<bool>(file);
}

/**
 * @brief Print configuration summary to stream
 */
inline void print_config_summary(std::ostream& os, const KdeConfig& config) {
    os << "=== Stacked PDF Configuration ===\n";
    os << "Grid: " << config.grid.n << " points on [" << config.grid.min << ", " << config.grid.max << "]\n";
    os << "Sigma dictionary: " << config.sigma.n << " kernels on [" << config.sigma.min << ", " << config.sigma.max << "]\n";
    os << "Truncation: sigma_trunc=" << config.kernel.sigma_trunc
       << ", sig_thresh=" << config.kernel.sig_thresh << "\n";
    os << "Selection: " << selection_mode_to_string(config.selection.mode);
    if (config.selection.mode == SelectionMode::AMPLITUDE) {
        os << " (wt_thresh=" << config.selection.wt_thresh << ")";
    } else if (config.selection.mode == SelectionMode::CUMULATIVE_MASS) {
        os << " (cdf_thresh=" << config.selection.cdf_thresh << ")";
    }
    os << "\n";
    os << "Workers: " << config.runtime.n_workers << ", log_level=" << config.runtime.log_level << "\n";
    os << "=================================\n";
}

} // namespace pdfstack
