#include <chartsmith/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace chartsmith {

static Status read_timeout(const toml::table& tbl, const std::string& section,
                           int& out, bool& set) {
    auto node = tbl["timeout"];
    if (!node) return ok_status();
    auto v = node.value<int64_t>();
    if (!v || *v <= 0 || *v > std::numeric_limits<int>::max()) {
        return ChartError{ChartError::Config,
            "[" + section + "] timeout must be a positive number of seconds",
            "the largest accepted value is " +
            std::to_string(std::numeric_limits<int>::max())};
    }
    out = static_cast<int>(*v);
    set = true;
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ChartError{ChartError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [resolver] section
    if (auto resolver = doc["resolver"].as_table()) {
        if (auto v = (*resolver)["experimental-oci"].value<bool>()) {
            cfg.helm.experimental_oci = *v;
            cfg.experimental_oci_set = true;
        }
        if (auto v = (*resolver)["remove"].value<bool>()) {
            cfg.remove = *v;
            cfg.remove_set = true;
        }
    }

    // [helm] section
    if (auto helm = doc["helm"].as_table()) {
        if (auto v = (*helm)["binary"].value<std::string>()) {
            cfg.helm.binary = *v;
            cfg.helm_binary_set = true;
        }
        CHARTSMITH_TRY(read_timeout(*helm, "helm", cfg.helm.timeout_seconds,
                                    cfg.helm_timeout_set));
    }

    // [tar] section
    if (auto tar = doc["tar"].as_table()) {
        if (auto v = (*tar)["binary"].value<std::string>()) {
            cfg.tar.binary = *v;
            cfg.tar_binary_set = true;
        }
        CHARTSMITH_TRY(read_timeout(*tar, "tar", cfg.tar.timeout_seconds,
                                    cfg.tar_timeout_set));
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return ChartError{ChartError::Config,
                    "[log] unknown level '" + *v + "'",
                    "use one of trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ChartError{ChartError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto e = std::move(cfg).error();
        e.file = path;
        return e;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.experimental_oci_set) {
        helm.experimental_oci = other.helm.experimental_oci;
        experimental_oci_set = true;
    }
    if (other.remove_set) {
        remove = other.remove;
        remove_set = true;
    }
    if (other.helm_binary_set) {
        helm.binary = other.helm.binary;
        helm_binary_set = true;
    }
    if (other.helm_timeout_set) {
        helm.timeout_seconds = other.helm.timeout_seconds;
        helm_timeout_set = true;
    }
    if (other.tar_binary_set) {
        tar.binary = other.tar.binary;
        tar_binary_set = true;
    }
    if (other.tar_timeout_set) {
        tar.timeout_seconds = other.tar.timeout_seconds;
        tar_timeout_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.chartsmith/config.toml";
}

fs::path project_config_path(const fs::path& chart_dir) {
    return chart_dir / ".chartsmith.toml";
}

Result<Config> discover_config(const fs::path& chart_dir) {
    std::optional<Config> global;
    std::optional<Config> project;
    std::error_code ec;

    const char* skip = std::getenv("CHARTSMITH_NO_CONFIG");
    bool skip_global = skip && std::string(skip) == "1";

    std::string gpath = global_config_path();
    if (!skip_global && !gpath.empty() && fs::exists(gpath, ec)) {
        auto g = Config::load(gpath);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }

    fs::path ppath = project_config_path(chart_dir);
    if (fs::exists(ppath, ec)) {
        auto p = Config::load(ppath.string());
        if (p.is_err()) return std::move(p).error();
        project = std::move(p).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

} // namespace chartsmith
