#pragma once

#include <chartsmith/result.hpp>
#include <chartsmith/manifest.hpp>
#include <chartsmith/tooling.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace chartsmith {

constexpr const char* kDefaultArchiveExt = ".tgz";
constexpr const char* kSubchartsDir = "charts";

// Read-only view of one chart directory. Reload to observe on-disk changes.
class Chart {
public:
    // Fails with MissingManifest when `location` has no Chart.yaml
    static Result<Chart> load(const std::filesystem::path& location);

    const std::filesystem::path& location() const { return location_; }
    const std::string& name() const { return manifest_.name; }
    const std::string& version() const { return manifest_.version; }
    std::string fully_qualified_name() const { return manifest_.full_name(); }
    const std::vector<ChartDependency>& dependencies() const { return manifest_.dependencies; }
    const std::vector<std::string>& dependency_full_names() const { return dependency_full_names_; }
    const ChartManifest& manifest() const { return manifest_; }
    std::filesystem::path subcharts_dir() const { return location_ / kSubchartsDir; }

    // Dependency full names that `candidate` is a prefix of. An exact name
    // matches, and so does "some-dep" for a dependency "some-dep-dev-1.0".
    std::vector<std::string> match_to_dependencies(const std::string& candidate) const;

    // subcharts_dir/<full_name><ext>
    std::filesystem::path archive_path(const std::string& full_name,
                                       const std::string& ext = kDefaultArchiveExt) const;

    // Returns the archive the packager wrote
    Result<std::filesystem::path> package(ChartPackager& packager,
                                          const std::filesystem::path& destination_dir) const;

    // Unpack `archive` into `into` and return the chart directory it holds
    static Result<std::filesystem::path> extract(ArchiveCodec& codec,
                                                 const std::filesystem::path& archive,
                                                 const std::filesystem::path& into);

private:
    Chart(std::filesystem::path location, ChartManifest manifest);

    std::filesystem::path location_;
    ChartManifest manifest_;
    std::vector<std::string> dependency_full_names_;
};

} // namespace chartsmith
