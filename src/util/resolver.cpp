#include <chartsmith/resolver.hpp>
#include <chartsmith/fs_util.hpp>
#include <chartsmith/log.hpp>
#include <chartsmith/plan.hpp>
#include <chartsmith/subchart.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace chartsmith {

// Marks a chart location as being resolved for the lifetime of the guard
namespace {
struct InProgressGuard {
    std::vector<fs::path>& stack;
    InProgressGuard(std::vector<fs::path>& s, const fs::path& p) : stack(s) {
        stack.push_back(p);
    }
    ~InProgressGuard() { stack.pop_back(); }
};
} // namespace

static std::string join_full_names(const std::vector<ChartDependency>& deps) {
    std::string out;
    for (const auto& d : deps) {
        if (!out.empty()) out += ", ";
        out += d.full_name();
    }
    return out;
}

// ---------------------------------------------------------------------------
// Constructor
// ---------------------------------------------------------------------------

DependencyResolver::DependencyResolver(ChartPackager& packager,
                                       ArchiveCodec& codec,
                                       RemoteFetcher& fetcher,
                                       ResolverOptions options)
    : packager_(packager), codec_(codec), fetcher_(fetcher),
      options_(std::move(options)) {}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<bool> DependencyResolver::resolve(const Chart& chart,
                                         const SourceSet& sources,
                                         bool force) {
    provided_.clear();
    in_progress_.clear();
    return resolve_chart(chart, sources, force, &provided_);
}

Result<bool> DependencyResolver::resolve_chart(const Chart& chart,
                                               const SourceSet& sources,
                                               bool force,
                                               std::set<std::string>* provided) {
    if (std::find(in_progress_.begin(), in_progress_.end(), chart.location())
            != in_progress_.end()) {
        return ChartError{ChartError::Cycle,
            "source " + chart.fully_qualified_name() + " (" +
            chart.location().string() + ") depends on itself",
            "remove one of the sources involved in the cycle"};
    }
    InProgressGuard guard(in_progress_, chart.location());

    const std::string& ext = options_.archive_ext;
    auto plan = plan_resolution(chart, sources, force, ext,
        [](const fs::path& p) {
            std::error_code ec;
            return fs::is_regular_file(p, ec);
        });
    if (plan.is_err()) return std::move(plan).error();

    if (!chart.dependencies().empty()) {
        CHARTSMITH_TRY(ensure_directory(chart.subcharts_dir()));
    }

    bool updated = false;
    std::vector<ChartDependency> to_fetch;
    std::vector<fs::path> to_recheck;

    for (const auto& action : plan.value()) {
        if (const auto* use = std::get_if<UseSource>(&action)) {
            auto r = use_source(chart, *use->source, sources, force, provided);
            if (r.is_err()) return std::move(r).error();
            updated = true;
        } else if (const auto* fetch = std::get_if<FetchRemote>(&action)) {
            to_fetch.push_back(fetch->dependency);
        } else if (const auto* recheck = std::get_if<Recheck>(&action)) {
            to_recheck.push_back(recheck->archive);
        }
    }

    if (!to_fetch.empty()) {
        auto fetched = fetch_batch(chart, to_fetch);
        if (fetched.is_err()) return std::move(fetched).error();
        if (!fetched.value().empty()) updated = true;
        for (auto& p : fetched.value()) {
            if (std::find(to_recheck.begin(), to_recheck.end(), p) == to_recheck.end()) {
                to_recheck.push_back(std::move(p));
            }
        }
    }

    for (const auto& archive : to_recheck) {
        auto changed = recheck_archive(chart, archive, sources);
        if (changed.is_err()) return std::move(changed).error();
        if (changed.value()) updated = true;
    }

    return Result<bool>::ok(updated);
}

// ---------------------------------------------------------------------------
// use_source()
// ---------------------------------------------------------------------------

Result<bool> DependencyResolver::use_source(const Chart& chart,
                                            const Chart& source,
                                            const SourceSet& sources,
                                            bool force,
                                            std::set<std::string>* provided) {
    log::info("using %s (from %s) to fulfill a dependency of %s",
              source.fully_qualified_name().c_str(), source.location().c_str(),
              chart.fully_qualified_name().c_str());

    auto nested = resolve_chart(source, sources, force, nullptr);
    if (nested.is_err()) return std::move(nested).error();

    CHARTSMITH_TRY(source.package(packager_, chart.subcharts_dir()));
    if (provided) provided->insert(source.fully_qualified_name());
    return Result<bool>::ok(true);
}

// ---------------------------------------------------------------------------
// fetch_batch()
// ---------------------------------------------------------------------------

Result<std::vector<fs::path>> DependencyResolver::fetch_batch(
    const Chart& chart, const std::vector<ChartDependency>& batch)
{
    std::string names = join_full_names(batch);
    log::info("starting to download %s for %s", names.c_str(),
              chart.fully_qualified_name().c_str());

    auto scratch = ScratchDir::create("chartsmith-fetch");
    if (scratch.is_err()) return std::move(scratch).error();
    const fs::path& dir = scratch.value().path();

    auto partial = chart.manifest().with_dependencies(batch);
    auto produced = fetcher_.fetch(partial, dir);
    if (produced.is_err()) return std::move(produced).error();

    std::vector<fs::path> installed;
    if (!produced.value().empty()) {
        CHARTSMITH_TRY(ensure_directory(chart.subcharts_dir()));
    }
    for (const auto& file : produced.value()) {
        fs::path dst = chart.subcharts_dir() / file;
        CHARTSMITH_TRY(install_file(dir / kSubchartsDir / file, dst));
        installed.push_back(dst);
    }

    log::info("downloaded %s for %s", names.c_str(),
              chart.fully_qualified_name().c_str());
    return Result<std::vector<fs::path>>::ok(std::move(installed));
}

// ---------------------------------------------------------------------------
// recheck_archive()
// ---------------------------------------------------------------------------

Result<bool> DependencyResolver::recheck_archive(const Chart& chart,
                                                 const fs::path& archive,
                                                 const SourceSet& sources) {
    auto scratch = ScratchDir::create("chartsmith-extract");
    if (scratch.is_err()) return std::move(scratch).error();

    auto dir = Chart::extract(codec_, archive, scratch.value().path());
    if (dir.is_err()) return std::move(dir).error();

    auto dependency = Chart::load(dir.value());
    if (dependency.is_err()) return std::move(dependency).error();
    const Chart& dep_chart = dependency.value();

    auto changed = substitute(dep_chart, sources);
    if (changed.is_err()) return std::move(changed).error();
    if (!changed.value()) {
        return Result<bool>::ok(false);
    }

    log::info("in %s, substituting %s by the resolved one",
              chart.location().c_str(), dep_chart.fully_qualified_name().c_str());
    auto repackaged = dep_chart.package(packager_, chart.subcharts_dir());
    if (repackaged.is_err()) return std::move(repackaged).error();

    // The packager picks the archive name; drop the old file only when it
    // wrote somewhere else.
    if (repackaged.value() != archive) {
        log::debug("%s replaces %s", repackaged.value().c_str(), archive.c_str());
        CHARTSMITH_TRY(remove_path(archive));
    }
    return Result<bool>::ok(true);
}

// ---------------------------------------------------------------------------
// substitute()
// ---------------------------------------------------------------------------

Result<bool> DependencyResolver::substitute(const Chart& chart,
                                            const SourceSet& sources) {
    auto entries = scan_subcharts(chart.subcharts_dir(), options_.archive_ext);
    if (entries.is_err()) return std::move(entries).error();

    bool updated = false;
    for (const auto& entry : entries.value()) {
        const auto* directory = std::get_if<DirectoryForm>(&entry);
        if (!directory) {
            log::trace("leaving packaged subchart %s as is",
                       entry_path(entry).c_str());
            continue;
        }

        auto sub = Chart::load(directory->path);
        if (sub.is_err()) return std::move(sub).error();

        auto src = sources.find_one(sub.value().fully_qualified_name());
        if (src.is_err()) return std::move(src).error();

        if (src.value() != nullptr) {
            const Chart* source = src.value();
            log::info("substituting %s by the source %s from %s",
                      directory->path.c_str(), source->fully_qualified_name().c_str(),
                      source->location().c_str());
            CHARTSMITH_TRY(remove_path(directory->path));
            CHARTSMITH_TRY(copy_tree(source->location(), directory->path));
            updated = true;
            continue;
        }

        auto nested = substitute(sub.value(), sources);
        if (nested.is_err()) return std::move(nested).error();
        updated = nested.value() || updated;
    }

    return Result<bool>::ok(updated);
}

// ---------------------------------------------------------------------------
// clean()
// ---------------------------------------------------------------------------

Status DependencyResolver::clean(const Chart& chart, const std::set<std::string>& keep) {
    auto entries = scan_subcharts(chart.subcharts_dir(), options_.archive_ext);
    if (entries.is_err()) return std::move(entries).error();

    for (const auto& stale : plan_clean(chart, entries.value(), keep)) {
        log::info("removing %s, no dependency of %s needs it",
                  stale.c_str(), chart.fully_qualified_name().c_str());
        CHARTSMITH_TRY(remove_path(stale));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// update()
// ---------------------------------------------------------------------------

Result<bool> DependencyResolver::update(const UpdateRequest& request) {
    auto chart = Chart::load(request.chart_path);
    if (chart.is_err()) return std::move(chart).error();

    auto sources = SourceSet::load(request.source_paths);
    if (sources.is_err()) return std::move(sources).error();

    auto updated = resolve(chart.value(), sources.value(), request.force);
    if (updated.is_err()) return std::move(updated).error();

    if (request.remove) {
        CHARTSMITH_TRY(clean(chart.value(), provided_));
    }

    if (updated.value() && !request.touch.empty()) {
        log::info("touching %s", request.touch.c_str());
        CHARTSMITH_TRY(touch(request.touch));
    }

    return updated;
}

} // namespace chartsmith
