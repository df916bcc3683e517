#pragma once

#include <chartsmith/result.hpp>
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace chartsmith {

constexpr const char* kManifestFile = "Chart.yaml";

// "<name>-<version>", the on-disk identity of one chart release
std::string full_name(const std::string& name, const std::string& version);

// One entry of the `dependencies` sequence
struct ChartDependency {
    std::string name;
    std::string version;
    std::string repository;       // empty when not given
    YAML::Node node;              // the whole entry, written back untouched

    std::string full_name() const;
};

// Chart.yaml
struct ChartManifest {
    std::string name;
    std::string version;
    std::vector<ChartDependency> dependencies;
    YAML::Node document;          // every key, including unknown ones

    static Result<ChartManifest> parse(const std::string& yaml_str);
    static Result<ChartManifest> load(const std::string& path);

    std::string full_name() const;

    // Same root metadata, dependencies replaced by `subset`
    ChartManifest with_dependencies(const std::vector<ChartDependency>& subset) const;

    std::string dump() const;
    Status save(const std::string& path) const;
};

} // namespace chartsmith
