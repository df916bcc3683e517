#pragma once

#include <chartsmith/result.hpp>
#include <chartsmith/chart.hpp>
#include <chartsmith/source_set.hpp>
#include <chartsmith/tooling.hpp>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace chartsmith {

struct ResolverOptions {
    std::string archive_ext = kDefaultArchiveExt;
};

// Inputs of one `update` run
struct UpdateRequest {
    std::string chart_path = ".";
    std::vector<std::string> source_paths;
    bool force = false;           // refetch dependencies that have no source
    bool remove = true;           // drop archives no dependency claims anymore
    std::string touch;            // touched when something changed (empty = none)
};

// Brings the charts/ directory of a chart up to date.
//
// Every dependency is fulfilled, in this order of precedence, by a matching
// source chart (packaged on the fly after its own dependencies are resolved),
// by a remote fetch when forced, by the archive already present, or by a
// remote fetch. Archives kept or fetched are then unpacked and searched for
// nested subchart directories a source should replace, however deep.
//
// Not reentrant: one resolver must not run two resolutions at once, and two
// resolutions must not target the same root chart concurrently.
class DependencyResolver {
public:
    DependencyResolver(ChartPackager& packager,
                       ArchiveCodec& codec,
                       RemoteFetcher& fetcher,
                       ResolverOptions options = {});

    // Returns true when anything under chart's charts/ changed
    Result<bool> resolve(const Chart& chart, const SourceSet& sources, bool force = false);

    // Replace unpacked subchart directories (recursively) by matching sources
    Result<bool> substitute(const Chart& chart, const SourceSet& sources);

    // Remove archives that no declared dependency claims, except `keep`
    // (full names)
    Status clean(const Chart& chart, const std::set<std::string>& keep = {});

    // resolve, then clean when requested, then touch when something changed
    Result<bool> update(const UpdateRequest& request);

    // Full names packaged from sources into the root chart by the last resolve()
    const std::set<std::string>& provided_archives() const { return provided_; }

    const ResolverOptions& options() const { return options_; }

private:
    Result<bool> resolve_chart(const Chart& chart, const SourceSet& sources,
                               bool force, std::set<std::string>* provided);

    Result<bool> use_source(const Chart& chart, const Chart& source,
                            const SourceSet& sources, bool force,
                            std::set<std::string>* provided);

    // Fetch `batch` in one remote call; returns the archive paths now in
    // chart's charts/
    Result<std::vector<std::filesystem::path>> fetch_batch(
        const Chart& chart, const std::vector<ChartDependency>& batch);

    Result<bool> recheck_archive(const Chart& chart,
                                 const std::filesystem::path& archive,
                                 const SourceSet& sources);

    ChartPackager& packager_;
    ArchiveCodec& codec_;
    RemoteFetcher& fetcher_;
    ResolverOptions options_;
    std::vector<std::filesystem::path> in_progress_;
    std::set<std::string> provided_;
};

} // namespace chartsmith
