#include <chartsmith/chart.hpp>
#include <chartsmith/log.hpp>

namespace fs = std::filesystem;

namespace chartsmith {

Chart::Chart(fs::path location, ChartManifest manifest)
    : location_(std::move(location)), manifest_(std::move(manifest)) {
    dependency_full_names_.reserve(manifest_.dependencies.size());
    for (const auto& dep : manifest_.dependencies) {
        dependency_full_names_.push_back(dep.full_name());
    }
}

Result<Chart> Chart::load(const fs::path& location) {
    std::error_code ec;
    fs::path abs = fs::absolute(location, ec);
    if (!ec) abs = fs::weakly_canonical(abs, ec);
    if (ec) abs = location.lexically_normal();

    fs::path manifest_path = abs / kManifestFile;
    if (!fs::is_regular_file(manifest_path, ec)) {
        return ChartError{ChartError::MissingManifest,
            "no " + std::string(kManifestFile) + " in the directory " + abs.string(),
            "a chart path must be a chart root directory, meaning with " +
            std::string(kManifestFile) + " inside"};
    }

    auto manifest = ChartManifest::load(manifest_path.string());
    if (manifest.is_err()) return std::move(manifest).error();

    return Result<Chart>::ok(Chart(std::move(abs), std::move(manifest).value()));
}

std::vector<std::string> Chart::match_to_dependencies(const std::string& candidate) const {
    std::vector<std::string> out;
    for (const auto& dep : dependency_full_names_) {
        if (dep.compare(0, candidate.size(), candidate) == 0) {
            out.push_back(dep);
        }
    }
    return out;
}

fs::path Chart::archive_path(const std::string& full_name, const std::string& ext) const {
    return subcharts_dir() / (full_name + ext);
}

Result<fs::path> Chart::package(ChartPackager& packager, const fs::path& destination_dir) const {
    log::info("packaging %s (from %s) in %s", fully_qualified_name().c_str(),
              location_.c_str(), destination_dir.c_str());
    return packager.package(location_, destination_dir);
}

Result<fs::path> Chart::extract(ArchiveCodec& codec,
                                const fs::path& archive,
                                const fs::path& into) {
    CHARTSMITH_TRY(codec.extract(archive, into));

    // A chart archive holds exactly one top-level chart directory
    fs::path found;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(into, ec)) {
        if (!entry.is_directory()) continue;
        if (!found.empty()) {
            return ChartError{ChartError::Extract,
                "archive " + archive.string() + " holds more than one top-level directory"};
        }
        found = entry.path();
    }
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot list " + into.string() + ": " + ec.message()};
    }
    if (found.empty()) {
        return ChartError{ChartError::Extract,
            "archive " + archive.string() + " holds no chart directory"};
    }
    return Result<fs::path>::ok(found);
}

} // namespace chartsmith
