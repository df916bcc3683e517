#include <chartsmith/plan.hpp>
#include <chartsmith/log.hpp>

namespace fs = std::filesystem;

namespace chartsmith {

Result<std::vector<DependencyAction>> plan_resolution(const Chart& chart,
                                                      const SourceSet& sources,
                                                      bool force,
                                                      const std::string& ext,
                                                      const ArchiveProbe& archive_exists) {
    std::vector<DependencyAction> actions;
    actions.reserve(chart.dependencies().size());

    for (const auto& dep : chart.dependencies()) {
        std::string fq = dep.full_name();

        auto src = sources.find_one(fq);
        if (src.is_err()) return std::move(src).error();

        if (src.value() != nullptr) {
            actions.push_back(UseSource{dep, src.value()});
            continue;
        }

        if (force) {
            log::info("will unconditionally download %s as a dependency of %s (forced)",
                      fq.c_str(), chart.fully_qualified_name().c_str());
            actions.push_back(FetchRemote{dep});
            continue;
        }

        fs::path archive = chart.archive_path(fq, ext);
        if (archive_exists(archive)) {
            log::debug("%s%s is already a dependency of %s", fq.c_str(), ext.c_str(),
                       chart.fully_qualified_name().c_str());
            actions.push_back(Recheck{dep, archive});
            continue;
        }

        actions.push_back(FetchRemote{dep});
    }

    return Result<std::vector<DependencyAction>>::ok(std::move(actions));
}

std::vector<fs::path> plan_clean(const Chart& chart,
                                 const std::vector<SubchartEntry>& entries,
                                 const std::set<std::string>& keep) {
    std::vector<fs::path> stale;
    for (const auto& entry : entries) {
        const auto* archive = std::get_if<ArchiveForm>(&entry);
        if (!archive) continue;
        if (keep.count(archive->full_name)) continue;
        if (chart.match_to_dependencies(archive->full_name).empty()) {
            stale.push_back(archive->path);
        }
    }
    return stale;
}

} // namespace chartsmith
