#include <chartsmith/archive.hpp>
#include <chartsmith/fs_util.hpp>
#include <chartsmith/log.hpp>
#include <chartsmith/process.hpp>

namespace fs = std::filesystem;

namespace chartsmith {

Status TarCodec::extract(const fs::path& archive, const fs::path& dest_dir) {
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        return ChartError{ChartError::Extract,
            "archive does not exist: " + archive.string()};
    }
    CHARTSMITH_TRY(ensure_directory(dest_dir));

    std::vector<std::string> argv{settings_.binary, "-xzf", archive.string(),
                                  "-C", dest_dir.string()};
    log::debug("running %s", join_command(argv).c_str());

    auto r = run_command(argv, "", settings_.timeout_seconds);
    if (r.is_err()) {
        return ChartError{ChartError::Extract, r.error().message};
    }
    if (r.value().exit_code != 0) {
        return ChartError{ChartError::Extract,
            "cannot extract " + archive.string() + ": " + failure_summary(r.value())};
    }
    return ok_status();
}

} // namespace chartsmith
