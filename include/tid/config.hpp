#pragma once

#include <tid/log.hpp>
#include <tid/result.hpp>
#include <optional>
#include <string>

namespace tid {

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

struct DiagnosticsConfig {
    // Route codec events through LogObserver
    bool trace = false;
};

// Layered configuration: global < local.
// Only fields that were explicitly set in a layer override lower layers.
struct Config {
    LogConfig logging;
    DiagnosticsConfig diagnostics;
    bool log_level_set = false;
    bool log_color_set = false;
    bool diagnostics_trace_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push settings into tid::log and the default codec observer
    void apply() const;
};

// Discover the global config file path: ~/.tid/config.toml
std::string global_config_path();

} // namespace tid
