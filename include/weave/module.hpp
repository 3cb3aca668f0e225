#pragma once

#include <weave/result.hpp>
#include <weave/version.hpp>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace weave {

// Module identity: (group, name). The group may be empty, as it is for a
// root project. Both parts use [A-Za-z0-9._-].
struct ModuleId {
    std::string group;
    std::string name;

    // "group:name" or a bare "name" (empty group)
    static Result<ModuleId> parse(const std::string& s);
    static Status validate_part(const std::string& part, const char* what);

    std::string to_string() const { return group + ":" + name; }

    bool operator==(const ModuleId& o) const {
        return group == o.group && name == o.name;
    }
    bool operator!=(const ModuleId& o) const { return !(*this == o); }
    bool operator<(const ModuleId& o) const {
        return std::tie(group, name) < std::tie(o.group, o.name);
    }
};

// What a variant provides. Two variants of different modules with the same
// id() cannot live in one graph.
struct Capability {
    std::string group;
    std::string name;
    std::string version;  // may be empty

    // "group:name[:version]"
    static Result<Capability> parse(const std::string& s);
    // The implicit capability of a module version
    static Capability of(const ModuleId& module, const Version& version);

    std::string id() const { return group + ":" + name; }
    std::string to_string() const {
        return version.empty() ? id() : id() + ":" + version;
    }

    bool operator==(const Capability& o) const {
        return group == o.group && name == o.name && version == o.version;
    }
    bool operator<(const Capability& o) const {
        return std::tie(group, name, version) < std::tie(o.group, o.name, o.version);
    }
};

// Prunes transitive edges. An empty part or "*" matches anything.
struct ExcludeRule {
    std::string group;
    std::string name;

    // "group:name", "group", "group:*", "*:name"
    static Result<ExcludeRule> parse(const std::string& s);

    bool matches(const ModuleId& m) const;
    std::string to_string() const;

    bool operator==(const ExcludeRule& o) const {
        return group == o.group && name == o.name;
    }
    bool operator<(const ExcludeRule& o) const {
        return std::tie(group, name) < std::tie(o.group, o.name);
    }
};

struct ModuleSelector {
    ModuleId module;
    VersionReq version;           // ignored for project selectors
    bool project = false;
    std::string variant;          // requested variant; empty = default
    std::optional<Capability> capability;  // requested capability

    // "project test:b", "org:x:^1.0", with "(api)" / "[cap]" suffixes
    std::string to_string() const;
    // Identity of the request; equal keys resolve to the same variant
    std::string key() const;
};

struct Dependency {
    ModuleSelector selector;
    std::vector<ExcludeRule> excludes;
};

// A concrete (module, version, variant) triple
struct VariantRef {
    ModuleId module;
    Version version;
    std::string variant;
    bool project = false;

    // "group:name:version"; this is how owners appear in failure messages
    std::string display() const {
        return module.to_string() + ":" + version.to_string();
    }
    // display() plus the variant name
    std::string to_string() const {
        return variant.empty() ? display() : display() + "(" + variant + ")";
    }

    bool operator==(const VariantRef& o) const {
        return module == o.module && version == o.version && variant == o.variant;
    }
    bool operator!=(const VariantRef& o) const { return !(*this == o); }
    bool operator<(const VariantRef& o) const {
        if (module != o.module) return module < o.module;
        if (version != o.version) return version < o.version;
        return variant < o.variant;
    }
};

// Two variants of one module version. An edge between them is not a
// module depending on itself.
inline bool sibling_variants(const VariantRef& a, const VariantRef& b) {
    return a.module == b.module && a.version == b.version && a.variant != b.variant;
}

} // namespace weave
