#include <chartsmith/fs_util.hpp>
#include <chartsmith/log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace chartsmith {

// ---------------------------------------------------------------------------
// ScratchDir
// ---------------------------------------------------------------------------

Result<ScratchDir> ScratchDir::create(const std::string& prefix,
                                      const fs::path& parent) {
    std::error_code ec;
    fs::path base = parent.empty() ? fs::temp_directory_path(ec) : parent;
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot locate temp directory: " + ec.message()};
    }

    std::string tmpl = (base / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        return ChartError{ChartError::IO,
            "cannot create scratch directory under " + base.string() +
            ": " + strerror(errno)};
    }
    return Result<ScratchDir>::ok(ScratchDir(fs::path(buf.data())));
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDir::~ScratchDir() {
    release();
}

void ScratchDir::release() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log::warn("failed to remove scratch directory %s: %s",
                  path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

// ---------------------------------------------------------------------------
// File operations
// ---------------------------------------------------------------------------

Status install_file(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) return ok_status();

    if (ec != std::errc::cross_device_link) {
        return ChartError{ChartError::IO,
            "cannot move " + src.string() + " to " + dst.string() +
            ": " + ec.message()};
    }

    return install_copy(src, dst);
}

Status install_copy(const fs::path& src, const fs::path& dst) {
    fs::path staging = dst;
    staging += kPartialSuffix;

    std::error_code ec;
    fs::copy_file(src, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return ChartError{ChartError::IO,
            "cannot copy " + src.string() + " to " + staging.string() +
            ": " + ec.message()};
    }
    fs::rename(staging, dst, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return ChartError{ChartError::IO,
            "cannot move " + staging.string() + " to " + dst.string() +
            ": " + ec.message()};
    }
    fs::remove(src, ec);
    if (ec) {
        log::warn("installed %s but could not remove %s: %s",
                  dst.c_str(), src.c_str(), ec.message().c_str());
    }
    return ok_status();
}

Status copy_tree(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    if (fs::exists(dst, ec)) {
        return ChartError{ChartError::IO,
            "copy destination already exists: " + dst.string()};
    }
    fs::copy(src, dst,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot copy " + src.string() + " to " + dst.string() +
            ": " + ec.message()};
    }
    return ok_status();
}

Status remove_path(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot remove " + p.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status ensure_directory(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot create directory " + p.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status touch(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        std::ofstream f(p);
        if (!f) {
            return ChartError{ChartError::IO, "cannot create " + p.string()};
        }
        return ok_status();
    }
    fs::last_write_time(p, fs::file_time_type::clock::now(), ec);
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot touch " + p.string() + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace chartsmith
