#pragma once

#include <chartsmith/result.hpp>
#include <chartsmith/chart.hpp>
#include <chartsmith/source_set.hpp>
#include <chartsmith/subchart.hpp>

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace chartsmith {

// Package the source chart in place of the dependency
struct UseSource {
    ChartDependency dependency;
    const Chart* source;
};

// Let the remote fetcher download the dependency
struct FetchRemote {
    ChartDependency dependency;
};

// Keep the archive already in charts/, but look inside it for overrides
struct Recheck {
    ChartDependency dependency;
    std::filesystem::path archive;
};

using DependencyAction = std::variant<UseSource, FetchRemote, Recheck>;

using ArchiveProbe = std::function<bool(const std::filesystem::path&)>;

// One action per declared dependency of `chart`, in declaration order.
// Precedence: matching source, then `force`, then an existing archive, then
// the remote fetcher. Fails with AmbiguousSource before anything is decided
// for the offending dependency.
Result<std::vector<DependencyAction>> plan_resolution(const Chart& chart,
                                                      const SourceSet& sources,
                                                      bool force,
                                                      const std::string& ext,
                                                      const ArchiveProbe& archive_exists);

// Archive entries no declared dependency of `chart` claims, minus `keep`
// (full names).
std::vector<std::filesystem::path> plan_clean(const Chart& chart,
                                              const std::vector<SubchartEntry>& entries,
                                              const std::set<std::string>& keep = {});

} // namespace chartsmith
