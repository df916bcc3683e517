#include <chartsmith/source_set.hpp>
#include <chartsmith/log.hpp>

namespace chartsmith {

SourceSet::SourceSet(std::vector<Chart> charts) {
    for (auto& c : charts) add(std::move(c));
}

Result<SourceSet> SourceSet::load(const std::vector<std::string>& paths) {
    SourceSet set;
    for (const auto& p : paths) {
        auto chart = Chart::load(p);
        if (chart.is_err()) return std::move(chart).error();
        set.add(std::move(chart).value());
    }
    return Result<SourceSet>::ok(std::move(set));
}

void SourceSet::add(Chart chart) {
    for (const auto& existing : charts_) {
        if (existing.location() == chart.location()) {
            log::debug("source %s given twice, ignoring the duplicate",
                       chart.location().c_str());
            return;
        }
    }
    charts_.push_back(std::move(chart));
}

SourceMatch SourceSet::match(const std::string& full_name) const {
    SourceMatch m;
    for (const auto& c : charts_) {
        if (full_name.compare(0, c.name().size(), c.name()) == 0) {
            m.candidates.push_back(&c);
        }
    }
    if (m.candidates.size() == 1) {
        m.kind = SourceMatch::Kind::Unique;
    } else if (m.candidates.size() > 1) {
        m.kind = SourceMatch::Kind::Ambiguous;
    }
    return m;
}

Result<const Chart*> SourceSet::find_one(const std::string& full_name) const {
    auto m = match(full_name);
    switch (m.kind) {
        case SourceMatch::Kind::None:
            return Result<const Chart*>::ok(nullptr);

        case SourceMatch::Kind::Ambiguous: {
            std::string names;
            for (const auto* c : m.candidates) {
                if (!names.empty()) names += ", ";
                names += c->name() + " (" + c->location().string() + ")";
            }
            return ChartError{ChartError::AmbiguousSource,
                "several sources can fulfill " + full_name + ": " + names,
                "provide only one source whose name is a prefix of " + full_name};
        }

        case SourceMatch::Kind::Unique:
            break;
    }

    const Chart* src = m.chart();
    if (src->fully_qualified_name() != full_name) {
        log::warn("guessed that the provided package %s (available at %s) "
                  "is a good candidate to fulfill the dependency %s",
                  src->fully_qualified_name().c_str(), src->location().c_str(),
                  full_name.c_str());
    }
    return Result<const Chart*>::ok(src);
}

} // namespace chartsmith
