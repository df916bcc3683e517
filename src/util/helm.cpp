#include <chartsmith/helm.hpp>
#include <chartsmith/chart.hpp>
#include <chartsmith/fs_util.hpp>
#include <chartsmith/log.hpp>
#include <chartsmith/process.hpp>

#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace chartsmith {

static EnvOverrides helm_env(const HelmSettings& settings) {
    EnvOverrides env;
    if (settings.experimental_oci) {
        env.emplace_back("HELM_EXPERIMENTAL_OCI", "1");
    }
    return env;
}

// Run helm and turn any failure into `code`
static Status run_helm(const HelmSettings& settings,
                       const std::vector<std::string>& args,
                       ChartError::Code code) {
    std::vector<std::string> argv{settings.binary};
    argv.insert(argv.end(), args.begin(), args.end());

    log::debug("running %s", join_command(argv).c_str());
    auto r = run_command(argv, "", settings.timeout_seconds, helm_env(settings));
    if (r.is_err()) {
        auto e = std::move(r).error();
        return ChartError{code, e.message,
            "check that '" + settings.binary + "' is installed and in PATH"};
    }

    const auto& res = r.value();
    if (!res.stdout_str.empty()) {
        log::trace("%s", res.stdout_str.c_str());
    }
    if (res.exit_code != 0) {
        return ChartError{code,
            join_command(argv) + " failed: " + failure_summary(res)};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// HelmPackager
// ---------------------------------------------------------------------------

Result<fs::path> HelmPackager::package(const fs::path& chart_dir, const fs::path& dest_dir) {
    auto scratch = ScratchDir::create("chartsmith-package");
    if (scratch.is_err()) return std::move(scratch).error();
    const fs::path& out = scratch.value().path();

    CHARTSMITH_TRY(run_helm(settings_,
        {"package", chart_dir.string(), "--destination", out.string()},
        ChartError::Package));

    std::vector<fs::path> produced;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(out, ec)) {
        if (entry.is_regular_file()) produced.push_back(entry.path());
    }
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot list " + out.string() + ": " + ec.message()};
    }
    if (produced.size() != 1) {
        return ChartError{ChartError::Package,
            "helm package produced " + std::to_string(produced.size()) +
            " archives for " + chart_dir.string() + ", expected one"};
    }

    CHARTSMITH_TRY(ensure_directory(dest_dir));
    fs::path installed = dest_dir / produced.front().filename();
    CHARTSMITH_TRY(install_file(produced.front(), installed));
    return Result<fs::path>::ok(installed);
}

// ---------------------------------------------------------------------------
// HelmFetcher
// ---------------------------------------------------------------------------

Result<std::set<std::string>> HelmFetcher::fetch(const ChartManifest& partial,
                                                 const fs::path& scratch_dir) {
    CHARTSMITH_TRY(partial.save((scratch_dir / kManifestFile).string()));

    CHARTSMITH_TRY(run_helm(settings_,
        {"dependency", "update", scratch_dir.string()},
        ChartError::Fetch));

    std::set<std::string> generated;
    fs::path charts = scratch_dir / kSubchartsDir;
    std::error_code ec;
    if (!fs::is_directory(charts, ec)) {
        return Result<std::set<std::string>>::ok(std::move(generated));
    }
    for (const auto& entry : fs::directory_iterator(charts, ec)) {
        if (entry.is_regular_file()) {
            generated.insert(entry.path().filename().string());
        }
    }
    if (ec) {
        return ChartError{ChartError::IO,
            "cannot list " + charts.string() + ": " + ec.message()};
    }
    return Result<std::set<std::string>>::ok(std::move(generated));
}

} // namespace chartsmith
