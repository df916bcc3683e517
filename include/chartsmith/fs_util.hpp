#pragma once

#include <chartsmith/result.hpp>
#include <filesystem>
#include <string>

namespace chartsmith {

// Temporary directory removed (recursively) when the object goes out of scope,
// on success and error paths alike.
//
// Created with mkdtemp under `parent`, or under the system temp directory when
// `parent` is empty.
class ScratchDir {
public:
    static Result<ScratchDir> create(const std::string& prefix,
                                     const std::filesystem::path& parent = {});

    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ~ScratchDir();

    const std::filesystem::path& path() const { return path_; }

private:
    explicit ScratchDir(std::filesystem::path p) : path_(std::move(p)) {}
    void release();

    std::filesystem::path path_;
};

// Suffix of files being written by install_file; scans skip them.
constexpr const char* kPartialSuffix = ".partial";

// Move `src` onto `dst` so that readers only ever see the old or the new
// content. Falls back to copy-then-rename when `src` lives on another
// filesystem.
Status install_file(const std::filesystem::path& src,
                    const std::filesystem::path& dst);

// install_file across filesystems: copy to "<dst>.partial", rename that over
// `dst`, then remove `src`
Status install_copy(const std::filesystem::path& src,
                    const std::filesystem::path& dst);

// Recursive copy of a directory tree. `dst` must not exist.
Status copy_tree(const std::filesystem::path& src,
                 const std::filesystem::path& dst);

// remove_all with the error turned into a ChartError::IO
Status remove_path(const std::filesystem::path& p);

Status ensure_directory(const std::filesystem::path& p);

// Update the modification time of `p`, creating an empty file when absent
Status touch(const std::filesystem::path& p);

} // namespace chartsmith
