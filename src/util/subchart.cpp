#include <chartsmith/subchart.hpp>
#include <chartsmith/fs_util.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace chartsmith {

const fs::path& entry_path(const SubchartEntry& entry) {
    return std::visit([](const auto& e) -> const fs::path& { return e.path; }, entry);
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Result<std::vector<SubchartEntry>> scan_subcharts(const fs::path& dir,
                                                  const std::string& ext) {
    std::vector<SubchartEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<std::vector<SubchartEntry>>::ok(std::move(entries));
    }

    for (const auto& item : fs::directory_iterator(dir, ec)) {
        std::string fname = item.path().filename().string();
        if (fname.empty() || fname[0] == '.') continue;
        if (ends_with(fname, kPartialSuffix)) continue;

        std::error_code type_ec;
        if (item.is_directory(type_ec)) {
            entries.push_back(DirectoryForm{item.path()});
        } else if (item.is_regular_file(type_ec) && ends_with(fname, ext) &&
                   fname.size() > ext.size()) {
            entries.push_back(ArchiveForm{item.path(),
                                          fname.substr(0, fname.size() - ext.size())});
        }
    }
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot list " + dir.string() + ": " + ec.message()};
    }

    std::sort(entries.begin(), entries.end(),
              [](const SubchartEntry& a, const SubchartEntry& b) {
                  return entry_path(a).filename() < entry_path(b).filename();
              });
    return Result<std::vector<SubchartEntry>>::ok(std::move(entries));
}

} // namespace chartsmith
