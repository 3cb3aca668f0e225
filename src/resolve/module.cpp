#include <weave/module.hpp>
#include <cctype>

namespace weave {

// ---------------------------------------------------------------------------
// ModuleId
// ---------------------------------------------------------------------------

Status ModuleId::validate_part(const std::string& part, const char* what) {
    for (char c : part) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            return WeaveError{WeaveError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in " + what + " '" + part + "'",
                "allowed: [a-zA-Z0-9._-]"};
        }
    }
    return ok_status();
}

Result<ModuleId> ModuleId::parse(const std::string& s) {
    if (s.empty()) {
        return WeaveError{WeaveError::InvalidArg, "empty module id"};
    }

    ModuleId id;
    size_t colon = s.find(':');
    if (colon == std::string::npos) {
        id.name = s;
    } else {
        if (s.find(':', colon + 1) != std::string::npos) {
            return WeaveError{WeaveError::InvalidArg,
                "invalid module id '" + s + "'",
                "expected 'group:name' or 'name'"};
        }
        id.group = s.substr(0, colon);
        id.name = s.substr(colon + 1);
    }

    if (id.name.empty()) {
        return WeaveError{WeaveError::InvalidArg,
            "module id '" + s + "' has an empty name"};
    }
    WEAVE_TRY(validate_part(id.group, "module group"));
    WEAVE_TRY(validate_part(id.name, "module name"));
    return Result<ModuleId>::ok(std::move(id));
}

// ---------------------------------------------------------------------------
// Capability
// ---------------------------------------------------------------------------

Result<Capability> Capability::parse(const std::string& s) {
    Capability cap;
    size_t c1 = s.find(':');
    if (c1 == std::string::npos || c1 == 0) {
        return WeaveError{WeaveError::InvalidArg,
            "invalid capability '" + s + "'",
            "expected 'group:name' or 'group:name:version'"};
    }
    cap.group = s.substr(0, c1);

    size_t c2 = s.find(':', c1 + 1);
    if (c2 == std::string::npos) {
        cap.name = s.substr(c1 + 1);
    } else {
        cap.name = s.substr(c1 + 1, c2 - c1 - 1);
        cap.version = s.substr(c2 + 1);
        if (cap.version.empty() ||
            cap.version.find(':') != std::string::npos) {
            return WeaveError{WeaveError::InvalidArg,
                "invalid capability version in '" + s + "'"};
        }
        auto v = Version::parse(cap.version);
        if (v.is_err()) return std::move(v).error();
    }

    if (cap.name.empty()) {
        return WeaveError{WeaveError::InvalidArg,
            "capability '" + s + "' has an empty name"};
    }
    WEAVE_TRY(ModuleId::validate_part(cap.group, "capability group"));
    WEAVE_TRY(ModuleId::validate_part(cap.name, "capability name"));
    return Result<Capability>::ok(std::move(cap));
}

Capability Capability::of(const ModuleId& module, const Version& version) {
    return Capability{module.group, module.name, version.to_string()};
}

// ---------------------------------------------------------------------------
// ExcludeRule
// ---------------------------------------------------------------------------

Result<ExcludeRule> ExcludeRule::parse(const std::string& s) {
    if (s.empty()) {
        return WeaveError{WeaveError::InvalidArg, "empty exclude rule"};
    }

    ExcludeRule rule;
    size_t colon = s.find(':');
    if (colon == std::string::npos) {
        rule.group = s;
    } else {
        rule.group = s.substr(0, colon);
        rule.name = s.substr(colon + 1);
    }
    if (rule.group == "*") rule.group.clear();
    if (rule.name == "*") rule.name.clear();

    if (rule.group.empty() && rule.name.empty()) {
        return WeaveError{WeaveError::InvalidArg,
            "exclude rule '" + s + "' matches every module"};
    }
    WEAVE_TRY(ModuleId::validate_part(rule.group, "exclude group"));
    WEAVE_TRY(ModuleId::validate_part(rule.name, "exclude name"));
    return Result<ExcludeRule>::ok(std::move(rule));
}

bool ExcludeRule::matches(const ModuleId& m) const {
    return (group.empty() || group == m.group) &&
           (name.empty() || name == m.name);
}

std::string ExcludeRule::to_string() const {
    return (group.empty() ? "*" : group) + ":" + (name.empty() ? "*" : name);
}

// ---------------------------------------------------------------------------
// ModuleSelector
// ---------------------------------------------------------------------------

std::string ModuleSelector::to_string() const {
    std::string s;
    if (project) {
        s = "project " + module.to_string();
    } else {
        s = module.to_string();
        std::string req = version.to_string();
        if (!req.empty()) s += ":" + req;
    }
    if (!variant.empty()) s += "(" + variant + ")";
    if (capability) s += "[" + capability->to_string() + "]";
    return s;
}

std::string ModuleSelector::key() const {
    // project selectors ignore the version requirement
    std::string k = project ? "p|" : "m|";
    k += module.to_string();
    k += '|';
    if (!project) k += version.to_string();
    k += '|';
    k += variant;
    k += '|';
    if (capability) k += capability->id();
    return k;
}

} // namespace weave
