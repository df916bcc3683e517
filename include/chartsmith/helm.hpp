#pragma once

#include <chartsmith/tooling.hpp>
#include <string>

namespace chartsmith {

struct HelmSettings {
    std::string binary = "helm";
    int timeout_seconds = 300;
    bool experimental_oci = true;     // exports HELM_EXPERIMENTAL_OCI=1
};

// `helm package`, written to a scratch directory and then moved into place
class HelmPackager : public ChartPackager {
public:
    explicit HelmPackager(HelmSettings settings = {}) : settings_(std::move(settings)) {}

    Result<std::filesystem::path> package(const std::filesystem::path& chart_dir,
                                          const std::filesystem::path& dest_dir) override;

private:
    HelmSettings settings_;
};

// `helm dependency update` on a partial Chart.yaml in the scratch directory
class HelmFetcher : public RemoteFetcher {
public:
    explicit HelmFetcher(HelmSettings settings = {}) : settings_(std::move(settings)) {}

    Result<std::set<std::string>> fetch(const ChartManifest& partial,
                                        const std::filesystem::path& scratch_dir) override;

private:
    HelmSettings settings_;
};

} // namespace chartsmith
