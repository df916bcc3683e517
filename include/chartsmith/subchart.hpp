#pragma once

#include <chartsmith/result.hpp>
#include <chartsmith/chart.hpp>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace chartsmith {

// A dependency already unpacked as a chart directory inside charts/
struct DirectoryForm {
    std::filesystem::path path;
};

// A packaged dependency "<full_name><ext>" inside charts/
struct ArchiveForm {
    std::filesystem::path path;
    std::string full_name;
};

using SubchartEntry = std::variant<DirectoryForm, ArchiveForm>;

const std::filesystem::path& entry_path(const SubchartEntry& entry);

// Directories and `ext` archives of a charts/ directory, sorted by name.
// Hidden entries, in-flight ".partial" files and other files are skipped.
// A missing directory yields an empty list.
Result<std::vector<SubchartEntry>> scan_subcharts(const std::filesystem::path& dir,
                                                  const std::string& ext = kDefaultArchiveExt);

} // namespace chartsmith
