#pragma once

#include <chartsmith/result.hpp>
#include <chartsmith/chart.hpp>
#include <string>
#include <vector>

namespace chartsmith {

// Outcome of matching one fully-qualified name against the sources
struct SourceMatch {
    enum class Kind { None, Unique, Ambiguous };
    Kind kind = Kind::None;
    std::vector<const Chart*> candidates;   // in source order

    const Chart* chart() const {
        return kind == Kind::Unique ? candidates.front() : nullptr;
    }
};

// Caller-supplied charts used in place of fetching a dependency. A source
// named "foo" can stand for any dependency whose full name starts with "foo",
// e.g. "foo-1.0" or "foo-dev-2.3".
class SourceSet {
public:
    SourceSet() = default;
    explicit SourceSet(std::vector<Chart> charts);

    // Load every path as a Chart; the first failure (usually MissingManifest)
    // is returned.
    static Result<SourceSet> load(const std::vector<std::string>& paths);

    // Adding the same location twice keeps the first
    void add(Chart chart);

    SourceMatch match(const std::string& full_name) const;

    // nullptr when no source matches, AmbiguousSource when several do.
    // A match whose own full name differs from `full_name` is a guess and is
    // reported with log::warn.
    Result<const Chart*> find_one(const std::string& full_name) const;

    const std::vector<Chart>& charts() const { return charts_; }
    size_t size() const { return charts_.size(); }
    bool empty() const { return charts_.empty(); }

private:
    std::vector<Chart> charts_;
};

} // namespace chartsmith
