#pragma once

#include <weave/module.hpp>
#include <weave/result.hpp>

#include <map>
#include <string>
#include <vector>

namespace weave {

// Where module metadata comes from: build scripts, remote repositories,
// local projects. Implementations must be safe to call from several threads
// when traversal runs with more than one job.
class MetadataSource {
public:
    virtual ~MetadataSource() = default;

    // Map a selector to one concrete variant. A selector that names nothing
    // fails with WeaveError::NotFound; other codes abort the resolution.
    virtual Result<VariantRef> resolve_selector(const ModuleSelector& selector) const = 0;

    virtual Result<std::vector<Dependency>> declared_dependencies(const VariantRef& variant) const = 0;

    // Explicitly declared capabilities; empty means "only the implicit one"
    virtual Result<std::vector<Capability>> declared_capabilities(const VariantRef& variant) const = 0;
};

// Capabilities a variant exposes: the declared set, or the module's own
// (group, name, version) when nothing was declared.
std::vector<Capability> effective_capabilities(const VariantRef& variant,
                                               const std::vector<Capability>& declared);

struct VariantSpec {
    std::string name;
    std::vector<Dependency> dependencies;
    std::vector<Capability> capabilities;
};

struct ModuleSpec {
    ModuleId id;
    Version version;
    bool project = false;
    std::vector<VariantSpec> variants;  // a "default" variant is added if empty
};

// Metadata held in memory. Immutable once loading is done, so concurrent
// reads need no locking.
class InMemoryMetadataSource : public MetadataSource {
public:
    // Duplicate if the same module version was already added
    Status add_module(ModuleSpec spec);

    Result<VariantRef> resolve_selector(const ModuleSelector& selector) const override;
    Result<std::vector<Dependency>> declared_dependencies(const VariantRef& variant) const override;
    Result<std::vector<Capability>> declared_capabilities(const VariantRef& variant) const override;

    // Published versions of a module, ascending
    std::vector<Version> versions(const ModuleId& module) const;
    size_t module_count() const { return modules_.size(); }

private:
    const VariantSpec* find_variant(const VariantRef& ref) const;

    std::map<ModuleId, std::map<Version, ModuleSpec>> modules_;
};

} // namespace weave
