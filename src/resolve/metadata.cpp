#include <weave/metadata.hpp>

#include <algorithm>

namespace weave {

std::vector<Capability> effective_capabilities(const VariantRef& variant,
                                               const std::vector<Capability>& declared) {
    if (!declared.empty()) {
        std::vector<Capability> caps = declared;
        std::sort(caps.begin(), caps.end());
        caps.erase(std::unique(caps.begin(), caps.end()), caps.end());
        return caps;
    }
    return {Capability::of(variant.module, variant.version)};
}

Status InMemoryMetadataSource::add_module(ModuleSpec spec) {
    for (size_t i = 0; i < spec.variants.size(); ++i) {
        for (size_t j = i + 1; j < spec.variants.size(); ++j) {
            if (spec.variants[i].name == spec.variants[j].name) {
                return WeaveError{WeaveError::Duplicate,
                    "variant '" + spec.variants[i].name + "' declared twice in " +
                    spec.id.to_string() + ":" + spec.version.to_string()};
            }
        }
    }
    if (spec.variants.empty()) {
        spec.variants.push_back(VariantSpec{"default", {}, {}});
    }

    auto existing = modules_.find(spec.id);
    if (existing != modules_.end()) {
        if (existing->second.count(spec.version)) {
            return WeaveError{WeaveError::Duplicate,
                "module " + spec.id.to_string() + ":" + spec.version.to_string() +
                " is already defined"};
        }
        if (existing->second.begin()->second.project != spec.project) {
            return WeaveError{WeaveError::Duplicate,
                "module " + spec.id.to_string() +
                " is declared both as a project and as an external module"};
        }
    }

    ModuleId id = spec.id;
    Version v = spec.version;
    modules_[id].emplace(std::move(v), std::move(spec));
    return ok_status();
}

std::vector<Version> InMemoryMetadataSource::versions(const ModuleId& module) const {
    std::vector<Version> out;
    auto it = modules_.find(module);
    if (it == modules_.end()) return out;
    for (const auto& [v, spec] : it->second) {
        out.push_back(v);
    }
    return out;
}

Result<VariantRef> InMemoryMetadataSource::resolve_selector(
    const ModuleSelector& selector) const
{
    auto it = modules_.find(selector.module);
    if (it == modules_.end() || it->second.empty()) {
        return WeaveError{WeaveError::NotFound,
            "no module named " + selector.module.to_string()};
    }

    // Highest matching version; map order is ascending
    const ModuleSpec* spec = nullptr;
    for (auto v = it->second.rbegin(); v != it->second.rend(); ++v) {
        if (selector.project || selector.version.matches(v->first)) {
            spec = &v->second;
            break;
        }
    }
    if (!spec) {
        return WeaveError{WeaveError::NotFound,
            "no version of " + selector.module.to_string() +
            " matches '" + selector.version.to_string() + "'"};
    }
    if (selector.project && !spec->project) {
        return WeaveError{WeaveError::NotFound,
            selector.module.to_string() + " is not a project"};
    }

    const VariantSpec* chosen = nullptr;
    if (selector.capability) {
        for (const auto& var : spec->variants) {
            bool provides = std::any_of(var.capabilities.begin(), var.capabilities.end(),
                [&](const Capability& c) { return c.id() == selector.capability->id(); });
            if (provides && (selector.variant.empty() || var.name == selector.variant)) {
                chosen = &var;
                break;
            }
        }
        if (!chosen) {
            return WeaveError{WeaveError::NotFound,
                "no variant of " + selector.module.to_string() +
                " provides capability " + selector.capability->id()};
        }
    } else if (!selector.variant.empty()) {
        for (const auto& var : spec->variants) {
            if (var.name == selector.variant) {
                chosen = &var;
                break;
            }
        }
        if (!chosen) {
            return WeaveError{WeaveError::NotFound,
                selector.module.to_string() + ":" + spec->version.to_string() +
                " has no variant '" + selector.variant + "'"};
        }
    } else {
        chosen = &spec->variants.front();
    }

    VariantRef ref;
    ref.module = spec->id;
    ref.version = spec->version;
    ref.variant = chosen->name;
    ref.project = spec->project;
    return Result<VariantRef>::ok(std::move(ref));
}

const VariantSpec* InMemoryMetadataSource::find_variant(const VariantRef& ref) const {
    auto it = modules_.find(ref.module);
    if (it == modules_.end()) return nullptr;
    auto v = it->second.find(ref.version);
    if (v == it->second.end()) return nullptr;
    for (const auto& var : v->second.variants) {
        if (var.name == ref.variant) return &var;
    }
    return nullptr;
}

Result<std::vector<Dependency>> InMemoryMetadataSource::declared_dependencies(
    const VariantRef& variant) const
{
    const VariantSpec* var = find_variant(variant);
    if (!var) {
        return WeaveError{WeaveError::NotFound,
            "unknown variant " + variant.to_string()};
    }
    return Result<std::vector<Dependency>>::ok(var->dependencies);
}

Result<std::vector<Capability>> InMemoryMetadataSource::declared_capabilities(
    const VariantRef& variant) const
{
    const VariantSpec* var = find_variant(variant);
    if (!var) {
        return WeaveError{WeaveError::NotFound,
            "unknown variant " + variant.to_string()};
    }
    return Result<std::vector<Capability>>::ok(var->capabilities);
}

} // namespace weave
