#pragma once

// Shared helpers for tests that need chart directories on disk and
// in-process stand-ins for helm and tar.

#include <chartsmith/chart.hpp>
#include <chartsmith/fs_util.hpp>
#include <chartsmith/tooling.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// RAII temp directory
// ---------------------------------------------------------------------------

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& tag = "chartsmith_test") {
        static int counter = 0;
        path = fs::temp_directory_path() / (tag + "_" + std::to_string(
            std::hash<std::string>{}(std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()))) +
            "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) const {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }
};

inline std::string read_text(const fs::path& p) {
    std::ifstream in(p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

using DepList = std::vector<std::pair<std::string, std::string>>;

// Write <dir>/Chart.yaml (and an "origin" marker file) and return dir
inline fs::path write_chart(const fs::path& dir,
                            const std::string& name,
                            const std::string& version,
                            const DepList& deps = {},
                            const std::string& origin = "") {
    fs::create_directories(dir);
    std::ofstream f(dir / "Chart.yaml");
    f << "apiVersion: v2\n"
      << "name: " << name << "\n"
      << "version: " << version << "\n";
    if (!deps.empty()) {
        f << "dependencies:\n";
        for (const auto& [n, v] : deps) {
            f << "  - name: " << n << "\n"
              << "    version: " << v << "\n"
              << "    repository: https://charts.example.com\n";
        }
    }
    f.close();
    if (!origin.empty()) {
        std::ofstream o(dir / "origin");
        o << origin;
    }
    return dir;
}

inline std::vector<std::string> list_names(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(dir, ec)) {
        names.push_back(e.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ---------------------------------------------------------------------------
// Fake tooling
//
// A fake archive is a small text file holding the path of a snapshot
// directory; the snapshot holds one copied chart directory.
// ---------------------------------------------------------------------------

class FakePackager : public chartsmith::ChartPackager {
public:
    explicit FakePackager(fs::path store) : store_(std::move(store)) {
        fs::create_directories(store_);
    }

    chartsmith::Result<fs::path> package(const fs::path& chart_dir,
                                         const fs::path& dest_dir) override {
        packaged.push_back(chart_dir);
        if (fail) {
            return chartsmith::ChartError{chartsmith::ChartError::Package,
                "fake packager failure"};
        }
        return write_archive(chart_dir, dest_dir);
    }

    // Package without recording the call
    chartsmith::Result<fs::path> write_archive(const fs::path& chart_dir,
                                               const fs::path& dest_dir) {
        auto chart = chartsmith::Chart::load(chart_dir);
        if (chart.is_err()) return std::move(chart).error();

        fs::path snapshot = store_ / ("snap" + std::to_string(next_++));
        fs::create_directories(snapshot);
        CHARTSMITH_TRY(chartsmith::copy_tree(chart_dir, snapshot / chart.value().name()));

        fs::create_directories(dest_dir);
        fs::path archive = dest_dir / (chart.value().fully_qualified_name() + ext);
        std::ofstream out(archive, std::ios::trunc);
        out << snapshot.string();
        return chartsmith::Result<fs::path>::ok(archive);
    }

    std::vector<fs::path> packaged;
    bool fail = false;
    std::string ext = ".tgz";           // extension of the archives written

private:
    fs::path store_;
    int next_ = 0;
};

class FakeCodec : public chartsmith::ArchiveCodec {
public:
    chartsmith::Status extract(const fs::path& archive,
                               const fs::path& dest_dir) override {
        extracted.push_back(archive);
        if (fail) {
            return chartsmith::ChartError{chartsmith::ChartError::Extract,
                "fake codec failure"};
        }
        fs::path snapshot = read_text(archive);
        std::error_code ec;
        for (const auto& e : fs::directory_iterator(snapshot, ec)) {
            CHARTSMITH_TRY(chartsmith::copy_tree(e.path(), dest_dir / e.path().filename()));
        }
        if (ec) {
            return chartsmith::ChartError{chartsmith::ChartError::Extract,
                "not a fake archive: " + archive.string()};
        }
        return chartsmith::ok_status();
    }

    std::vector<fs::path> extracted;
    bool fail = false;
};

// Serves charts from a catalog keyed by full name
class FakeFetcher : public chartsmith::RemoteFetcher {
public:
    explicit FakeFetcher(FakePackager& packager) : packager_(packager) {}

    void publish(const std::string& full_name, const fs::path& chart_dir) {
        catalog_[full_name] = chart_dir;
    }

    chartsmith::Result<std::set<std::string>> fetch(
        const chartsmith::ChartManifest& partial,
        const fs::path& scratch_dir) override
    {
        std::vector<std::string> batch;
        for (const auto& d : partial.dependencies) batch.push_back(d.full_name());
        batches.push_back(batch);
        manifests.push_back(partial.dump());

        if (fail) {
            return chartsmith::ChartError{chartsmith::ChartError::Fetch,
                "fake fetcher: repository unreachable"};
        }

        std::set<std::string> produced;
        for (const auto& fq : batch) {
            auto it = catalog_.find(fq);
            if (it == catalog_.end()) {
                return chartsmith::ChartError{chartsmith::ChartError::Fetch,
                    "no chart " + fq + " in repository"};
            }
            auto archive = packager_.write_archive(it->second, scratch_dir / "charts");
            if (archive.is_err()) return std::move(archive).error();
            produced.insert(archive.value().filename().string());
        }
        return chartsmith::Result<std::set<std::string>>::ok(std::move(produced));
    }

    std::vector<std::vector<std::string>> batches;
    std::vector<std::string> manifests;
    bool fail = false;

private:
    FakePackager& packager_;
    std::map<std::string, fs::path> catalog_;
};
