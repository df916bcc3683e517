#include <catch2/catch.hpp>
#include <chartsmith/helm.hpp>
#include <chartsmith/manifest.hpp>
#include "chart_fixtures.hpp"

using namespace chartsmith;

// A stand-in helm binary. `package` writes <name>-<version>.tgz holding the
// value of HELM_EXPERIMENTAL_OCI; `dependency update` drops one archive per
// declared dependency into charts/.
static const char* kFakeHelm = R"(#!/bin/sh
case "$1" in
package)
    name=$(sed -n 's/^name: //p' "$2/Chart.yaml")
    version=$(sed -n 's/^version: //p' "$2/Chart.yaml")
    printf '%s' "$HELM_EXPERIMENTAL_OCI" > "$4/$name-$version.tgz"
    ;;
dependency)
    mkdir -p "$3/charts"
    sed -n 's/^- name: //p; s/^  - name: //p' "$3/Chart.yaml" | while read n; do
        touch "$3/charts/$n-1.0.tgz"
    done
    ;;
esac
)";

static const char* kFailingHelm = R"(#!/bin/sh
echo "fetching index"
echo "Error: no repository definition for https://charts.example.com" >&2
exit 1
)";

static const char* kTwoArchiveHelm = R"(#!/bin/sh
touch "$4/web-1.2.0.tgz" "$4/web-1.2.0.tgz.prov"
)";

static fs::path write_script(const TempDir& td, const std::string& name,
                             const char* body) {
    td.write_file(name, body);
    fs::path p = td.path / name;
    fs::permissions(p, fs::perms::owner_all, fs::perm_options::add);
    return p;
}

TEST_CASE("HelmPackager installs the packaged archive", "[helm]") {
    TempDir td;
    fs::path chart = write_chart(td.path / "web", "web", "1.2.0");

    HelmSettings settings;
    settings.binary = write_script(td, "helm", kFakeHelm).string();
    HelmPackager packager(settings);

    auto archive = packager.package(chart, td.path / "dest");
    REQUIRE(archive.is_ok());
    REQUIRE(archive.value() == td.path / "dest" / "web-1.2.0.tgz");
    REQUIRE(list_names(td.path / "dest") == std::vector<std::string>{"web-1.2.0.tgz"});
    REQUIRE(read_text(td.path / "dest" / "web-1.2.0.tgz") == "1");
}

TEST_CASE("HelmPackager leaves HELM_EXPERIMENTAL_OCI unset when disabled", "[helm]") {
    TempDir td;
    fs::path chart = write_chart(td.path / "web", "web", "1.2.0");

    HelmSettings settings;
    settings.binary = write_script(td, "helm", kFakeHelm).string();
    settings.experimental_oci = false;
    HelmPackager packager(settings);

    // The test process itself must not carry the variable
    unsetenv("HELM_EXPERIMENTAL_OCI");
    REQUIRE(packager.package(chart, td.path / "dest").is_ok());
    REQUIRE(read_text(td.path / "dest" / "web-1.2.0.tgz").empty());
}

TEST_CASE("HelmPackager failures are Package errors", "[helm]") {
    TempDir td;
    fs::path chart = write_chart(td.path / "web", "web", "1.2.0");

    HelmSettings settings;
    settings.binary = write_script(td, "helm", kFailingHelm).string();
    HelmPackager packager(settings);

    auto r = packager.package(chart, td.path / "dest");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChartError::Package);
    REQUIRE(r.error().message.find("no repository definition") != std::string::npos);
    REQUIRE_FALSE(fs::exists(td.path / "dest"));
}

TEST_CASE("HelmPackager expects exactly one archive", "[helm]") {
    TempDir td;
    fs::path chart = write_chart(td.path / "web", "web", "1.2.0");

    HelmSettings settings;
    settings.binary = write_script(td, "helm", kTwoArchiveHelm).string();
    HelmPackager packager(settings);

    auto r = packager.package(chart, td.path / "dest");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChartError::Package);
    REQUIRE_FALSE(fs::exists(td.path / "dest"));
}

TEST_CASE("HelmFetcher lists the archives helm produced", "[helm]") {
    TempDir td;
    write_chart(td.path / "root", "root", "1.0", {{"x", "1.0"}, {"y", "1.0"}});
    auto manifest = ChartManifest::load((td.path / "root" / "Chart.yaml").string());
    REQUIRE(manifest.is_ok());

    HelmSettings settings;
    settings.binary = write_script(td, "helm", kFakeHelm).string();
    HelmFetcher fetcher(settings);

    fs::path scratch = td.path / "scratch";
    fs::create_directories(scratch);
    auto r = fetcher.fetch(manifest.value(), scratch);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::set<std::string>{"x-1.0.tgz", "y-1.0.tgz"});
    REQUIRE(fs::exists(scratch / "Chart.yaml"));
}

TEST_CASE("HelmFetcher failures are Fetch errors", "[helm]") {
    TempDir td;
    write_chart(td.path / "root", "root", "1.0", {{"x", "1.0"}});
    auto manifest = ChartManifest::load((td.path / "root" / "Chart.yaml").string());
    REQUIRE(manifest.is_ok());

    HelmSettings settings;
    settings.binary = write_script(td, "helm", kFailingHelm).string();
    HelmFetcher fetcher(settings);

    fs::path scratch = td.path / "scratch";
    fs::create_directories(scratch);
    auto r = fetcher.fetch(manifest.value(), scratch);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChartError::Fetch);
}

TEST_CASE("A missing helm binary is reported", "[helm]") {
    TempDir td;
    fs::path chart = write_chart(td.path / "web", "web", "1.2.0");

    HelmSettings settings;
    settings.binary = (td.path / "no-such-helm").string();
    HelmPackager packager(settings);

    auto r = packager.package(chart, td.path / "dest");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChartError::Package);
}
