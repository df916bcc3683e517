#pragma once

#include <chartsmith/result.hpp>
#include <chartsmith/manifest.hpp>
#include <filesystem>
#include <set>
#include <string>

namespace chartsmith {

// Turns a chart directory into an archive inside dest_dir, replacing an
// existing archive of the same name. Returns the path of the archive; its
// name is the packager's choice (helm: "<name>-<version>.tgz").
class ChartPackager {
public:
    virtual ~ChartPackager() = default;
    virtual Result<std::filesystem::path> package(const std::filesystem::path& chart_dir,
                                                  const std::filesystem::path& dest_dir) = 0;
};

// Unpacks an archive into dest_dir (which must exist)
class ArchiveCodec {
public:
    virtual ~ArchiveCodec() = default;
    virtual Status extract(const std::filesystem::path& archive,
                           const std::filesystem::path& dest_dir) = 0;
};

// Downloads every dependency listed in `partial` into <scratch_dir>/charts and
// returns the file names it wrote there.
class RemoteFetcher {
public:
    virtual ~RemoteFetcher() = default;
    virtual Result<std::set<std::string>> fetch(
        const ChartManifest& partial,
        const std::filesystem::path& scratch_dir) = 0;
};

} // namespace chartsmith
