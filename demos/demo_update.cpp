// demo_update.cpp
//
// Runs one dependency update against a chart directory with helm and tar
// doing the packaging, fetching and unpacking:
//
//     ./demo_update path/to/chart                     # like `helm dependency update`
//     ./demo_update path/to/chart ../lib-b ../lib-c   # package B and C from source
//     ./demo_update --force --touch=.stamp chart ../lib-b
//
// Flags: --force, --no-remove, --touch=<path>. Everything after the chart
// path is a source chart directory. Settings come from
// ~/.chartsmith/config.toml and <chart>/.chartsmith.toml.
//
// Exit code: 0 when nothing changed, 2 when something was updated, 1 on error.

#include <chartsmith/archive.hpp>
#include <chartsmith/config.hpp>
#include <chartsmith/helm.hpp>
#include <chartsmith/log.hpp>
#include <chartsmith/resolver.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace chartsmith;

static Result<UpdateRequest> request_from_args(int argc, char** argv, bool default_remove) {
    UpdateRequest req;
    req.remove = default_remove;
    bool have_chart = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--force") {
            req.force = true;
        } else if (arg == "--no-remove") {
            req.remove = false;
        } else if (arg.rfind("--touch=", 0) == 0) {
            req.touch = arg.substr(8);
        } else if (arg.rfind("--", 0) == 0) {
            return ChartError{ChartError::InvalidArg, "unknown flag " + arg,
                "usage: demo_update [--force] [--no-remove] [--touch=<path>] <chart> [source...]"};
        } else if (!have_chart) {
            req.chart_path = arg;
            have_chart = true;
        } else {
            req.source_paths.push_back(arg);
        }
    }
    return Result<UpdateRequest>::ok(std::move(req));
}

// Chart directory named on the command line, before any config is known
static std::string chart_arg(int argc, char** argv) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) return arg;
    }
    return ".";
}

static Result<bool> run(int argc, char** argv) {
    auto cfg = discover_config(chart_arg(argc, argv));
    CHARTSMITH_TRY(cfg);
    cfg.value().apply_logging();

    auto req = request_from_args(argc, argv, cfg.value().remove);
    CHARTSMITH_TRY(req);

    HelmPackager packager(cfg.value().helm);
    HelmFetcher fetcher(cfg.value().helm);
    TarCodec codec(cfg.value().tar);
    DependencyResolver resolver(packager, codec, fetcher, cfg.value().resolver);

    return resolver.update(req.value());
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    if (result.value()) {
        log::info("dependencies updated");
        return 2;
    }
    log::info("dependencies already up to date");
    return 0;
}
