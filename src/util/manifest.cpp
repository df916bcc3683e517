#include <chartsmith/manifest.hpp>
#include <fstream>
#include <sstream>

namespace chartsmith {

std::string full_name(const std::string& name, const std::string& version) {
    return name + "-" + version;
}

std::string ChartDependency::full_name() const {
    return chartsmith::full_name(name, version);
}

std::string ChartManifest::full_name() const {
    return chartsmith::full_name(name, version);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool scalar_string(const YAML::Node& node, std::string& out) {
    if (!node || !node.IsScalar()) return false;
    out = node.Scalar();
    return !out.empty();
}

static Result<ChartDependency> parse_dependency(const YAML::Node& node,
                                                size_t index) {
    std::string where = "dependencies[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return ChartError{ChartError::Parse, where + " must be a mapping"};
    }

    ChartDependency dep;
    if (!scalar_string(node["name"], dep.name)) {
        return ChartError{ChartError::Parse, where + " has no 'name'"};
    }
    if (!scalar_string(node["version"], dep.version)) {
        return ChartError{ChartError::Parse,
            "dependency '" + dep.name + "' has no 'version'"};
    }
    scalar_string(node["repository"], dep.repository);
    dep.node = YAML::Clone(node);

    return Result<ChartDependency>::ok(std::move(dep));
}

// ---------------------------------------------------------------------------
// ChartManifest::parse
// ---------------------------------------------------------------------------

Result<ChartManifest> ChartManifest::parse(const std::string& yaml_str) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_str);
    } catch (const YAML::Exception& e) {
        return ChartError{ChartError::Parse,
            std::string("Chart.yaml parse error: ") + e.what()};
    }

    if (!doc.IsMap()) {
        return ChartError{ChartError::Parse,
            "Chart.yaml must contain a mapping at the top level"};
    }

    ChartManifest m;
    if (!scalar_string(doc["name"], m.name)) {
        return ChartError{ChartError::Parse, "Chart.yaml has no 'name'"};
    }
    if (!scalar_string(doc["version"], m.version)) {
        return ChartError{ChartError::Parse,
            "Chart.yaml of '" + m.name + "' has no 'version'"};
    }

    const YAML::Node deps = doc["dependencies"];
    if (deps && !deps.IsNull()) {
        if (!deps.IsSequence()) {
            return ChartError{ChartError::Parse,
                "'dependencies' of '" + m.name + "' must be a sequence"};
        }
        for (size_t i = 0; i < deps.size(); i++) {
            auto dep = parse_dependency(deps[i], i);
            if (dep.is_err()) return std::move(dep).error();
            m.dependencies.push_back(std::move(dep).value());
        }
    }

    m.document = doc;
    return Result<ChartManifest>::ok(std::move(m));
}

// ---------------------------------------------------------------------------
// ChartManifest::load
// ---------------------------------------------------------------------------

Result<ChartManifest> ChartManifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ChartError{ChartError::IO,
            "cannot open manifest file: " + path};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    auto m = ChartManifest::parse(ss.str());
    if (m.is_err()) {
        auto e = std::move(m).error();
        e.file = path;
        return e;
    }
    return m;
}

// ---------------------------------------------------------------------------
// Rewriting
// ---------------------------------------------------------------------------

ChartManifest ChartManifest::with_dependencies(
    const std::vector<ChartDependency>& subset) const
{
    ChartManifest out;
    out.name = name;
    out.version = version;
    out.dependencies = subset;
    out.document = YAML::Clone(document);

    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& dep : subset) {
        if (dep.node.IsMap()) {
            seq.push_back(YAML::Clone(dep.node));
            continue;
        }
        YAML::Node entry;
        entry["name"] = dep.name;
        entry["version"] = dep.version;
        if (!dep.repository.empty()) entry["repository"] = dep.repository;
        seq.push_back(entry);
    }
    out.document["dependencies"] = seq;
    return out;
}

std::string ChartManifest::dump() const {
    YAML::Emitter emitter;
    emitter << document;
    return std::string(emitter.c_str()) + "\n";
}

Status ChartManifest::save(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return ChartError{ChartError::IO,
            "cannot write manifest file: " + path};
    }
    file << dump();
    if (!file) {
        return ChartError{ChartError::IO,
            "failed writing manifest file: " + path};
    }
    return ok_status();
}

} // namespace chartsmith
