#pragma once

#include <chartsmith/result.hpp>
#include <chartsmith/archive.hpp>
#include <chartsmith/helm.hpp>
#include <chartsmith/log.hpp>
#include <chartsmith/resolver.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace chartsmith {

// Layered configuration: global (~/.chartsmith/config.toml), then the chart's
// own .chartsmith.toml. A later layer only overrides keys it sets.
//
//   [resolver]  experimental-oci, remove
//   [helm]      binary, timeout
//   [tar]       binary, timeout
//   [log]       level, color
struct Config {
    ResolverOptions resolver;
    HelmSettings helm;
    TarSettings tar;
    bool remove = true;
    log::Level log_level = log::Info;
    bool log_color = false;

    // Track which fields were explicitly set (for merge)
    bool experimental_oci_set = false;
    bool remove_set = false;
    bool helm_binary_set = false;
    bool helm_timeout_set = false;
    bool tar_binary_set = false;
    bool tar_timeout_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Push log level and color (when set) into chartsmith::log
    void apply_logging() const;
};

// ~/.chartsmith/config.toml, empty when HOME is unset
std::string global_config_path();

// <chart_dir>/.chartsmith.toml
std::filesystem::path project_config_path(const std::filesystem::path& chart_dir);

// Load and merge the layers that exist. CHARTSMITH_NO_CONFIG=1 skips the
// global layer.
Result<Config> discover_config(const std::filesystem::path& chart_dir);

} // namespace chartsmith
