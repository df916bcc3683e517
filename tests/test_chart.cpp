#include <catch2/catch.hpp>
#include <chartsmith/chart.hpp>
#include "chart_fixtures.hpp"

using namespace chartsmith;

TEST_CASE("load a chart directory", "[chart]") {
    TempDir td;
    write_chart(td.path / "web", "web", "0.1.0",
                {{"redis", "17.3.1"}, {"redis", "16.0.0"}, {"postgres", "12.1"}});

    auto c = Chart::load(td.path / "web");
    REQUIRE(c.is_ok());
    const Chart& chart = c.value();
    REQUIRE(chart.name() == "web");
    REQUIRE(chart.version() == "0.1.0");
    REQUIRE(chart.fully_qualified_name() == "web-0.1.0");
    REQUIRE(chart.location().is_absolute());
    REQUIRE(chart.subcharts_dir() == chart.location() / "charts");
    REQUIRE(chart.dependency_full_names() ==
            std::vector<std::string>{"redis-17.3.1", "redis-16.0.0", "postgres-12.1"});
}

TEST_CASE("load normalizes relative and dotted paths", "[chart]") {
    TempDir td;
    write_chart(td.path / "web", "web", "0.1.0");
    auto c = Chart::load(td.path / "web" / "." / ".." / "web");
    REQUIRE(c.is_ok());
    REQUIRE(c.value().location() == fs::canonical(td.path / "web"));
}

TEST_CASE("a directory without Chart.yaml is MissingManifest", "[chart]") {
    TempDir td;
    fs::create_directories(td.path / "empty");

    auto c = Chart::load(td.path / "empty");
    REQUIRE(c.is_err());
    REQUIRE(c.error().code == ChartError::MissingManifest);
    REQUIRE(c.error().message.find("Chart.yaml") != std::string::npos);

    auto missing = Chart::load(td.path / "does-not-exist");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ChartError::MissingManifest);
}

TEST_CASE("a broken Chart.yaml is a parse error", "[chart]") {
    TempDir td;
    td.write_file("bad/Chart.yaml", "name: bad\n");
    auto c = Chart::load(td.path / "bad");
    REQUIRE(c.is_err());
    REQUIRE(c.error().code == ChartError::Parse);
}

TEST_CASE("match_to_dependencies uses prefix matching", "[chart]") {
    TempDir td;
    write_chart(td.path / "web", "web", "1.0",
                {{"some-dep", "1.0"}, {"some-dep-dev", "2.0"}, {"other", "3.0"}});
    auto c = Chart::load(td.path / "web");
    REQUIRE(c.is_ok());
    const Chart& chart = c.value();

    REQUIRE(chart.match_to_dependencies("other-3.0") == std::vector<std::string>{"other-3.0"});
    REQUIRE(chart.match_to_dependencies("some-dep") ==
            std::vector<std::string>{"some-dep-1.0", "some-dep-dev-2.0"});
    REQUIRE(chart.match_to_dependencies("some-dep-dev") ==
            std::vector<std::string>{"some-dep-dev-2.0"});
    REQUIRE(chart.match_to_dependencies("other-4.0").empty());
    REQUIRE(chart.match_to_dependencies("web-1.0").empty());
}

TEST_CASE("archive_path is charts/<full name><ext>", "[chart]") {
    TempDir td;
    write_chart(td.path / "web", "web", "1.0");
    auto c = Chart::load(td.path / "web");
    REQUIRE(c.is_ok());
    REQUIRE(c.value().archive_path("redis-1.0") == c.value().subcharts_dir() / "redis-1.0.tgz");
    REQUIRE(c.value().archive_path("redis-1.0", ".tar.gz").filename() == "redis-1.0.tar.gz");
}

TEST_CASE("package delegates to the packager", "[chart]") {
    TempDir td;
    write_chart(td.path / "lib", "lib", "2.0");
    auto c = Chart::load(td.path / "lib");
    REQUIRE(c.is_ok());

    FakePackager packager(td.path / "store");
    auto archive = c.value().package(packager, td.path / "out");
    REQUIRE(archive.is_ok());
    REQUIRE(archive.value() == td.path / "out" / "lib-2.0.tgz");
    REQUIRE(packager.packaged.size() == 1);
    REQUIRE(packager.packaged[0] == c.value().location());
    REQUIRE(fs::exists(td.path / "out" / "lib-2.0.tgz"));

    packager.fail = true;
    auto failed = c.value().package(packager, td.path / "out");
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == ChartError::Package);
}

TEST_CASE("extract returns the chart directory inside the archive", "[chart]") {
    TempDir td;
    write_chart(td.path / "lib", "lib", "2.0", {}, "from-lib");
    FakePackager packager(td.path / "store");
    REQUIRE(packager.write_archive(td.path / "lib", td.path / "out").is_ok());

    FakeCodec codec;
    fs::create_directories(td.path / "x");
    auto dir = Chart::extract(codec, td.path / "out" / "lib-2.0.tgz", td.path / "x");
    REQUIRE(dir.is_ok());
    REQUIRE(dir.value() == td.path / "x" / "lib");
    REQUIRE(read_text(dir.value() / "origin") == "from-lib");
}

TEST_CASE("extract rejects archives without exactly one directory", "[chart]") {
    TempDir td;
    FakeCodec codec;

    fs::create_directories(td.path / "store" / "empty");
    td.write_file("empty.tgz", (td.path / "store" / "empty").string());
    fs::create_directories(td.path / "x1");
    auto none = Chart::extract(codec, td.path / "empty.tgz", td.path / "x1");
    REQUIRE(none.is_err());
    REQUIRE(none.error().code == ChartError::Extract);

    fs::create_directories(td.path / "store" / "two" / "a");
    fs::create_directories(td.path / "store" / "two" / "b");
    td.write_file("two.tgz", (td.path / "store" / "two").string());
    fs::create_directories(td.path / "x2");
    auto two = Chart::extract(codec, td.path / "two.tgz", td.path / "x2");
    REQUIRE(two.is_err());
    REQUIRE(two.error().code == ChartError::Extract);

    codec.fail = true;
    auto failed = Chart::extract(codec, td.path / "two.tgz", td.path / "x2");
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == ChartError::Extract);
}
