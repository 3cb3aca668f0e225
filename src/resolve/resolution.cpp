#include <weave/resolution.hpp>

#include <map>
#include <set>

namespace weave {

std::vector<NodeId> ResolutionResult::dependencies_of(NodeId id) const {
    std::vector<NodeId> out;
    for (const auto& e : graph_.successors(id)) out.push_back(e.to);
    return out;
}

std::optional<NodeId> ResolutionResult::find(const ModuleId& module) const {
    for (NodeId id = 0; id < graph_.node_count(); ++id) {
        if (graph_.node(id).ref.module == module) return id;
    }
    return std::nullopt;
}

std::vector<const Conflict*> ResolutionResult::unresolved_conflicts() const {
    std::vector<const Conflict*> out;
    for (const auto& c : conflicts_) {
        if (!c.resolved) out.push_back(&c);
    }
    return out;
}

std::string ResolutionResult::failure_cause() const {
    std::string cause;
    for (const Conflict* c : unresolved_conflicts()) {
        if (!cause.empty()) cause += "\n";
        cause += c->describe();
    }
    return cause;
}

WeaveError ResolutionResult::to_error() const {
    auto unresolved = unresolved_conflicts();
    if (unresolved.empty()) {
        return WeaveError{WeaveError::State, "resolution did not fail"};
    }
    return WeaveError{unresolved.front()->error_code(), failure_cause()};
}

Status ResolutionResult::check_invariants() const {
    std::map<std::string, ModuleId> cap_owner;
    std::map<ModuleId, Version> version_of;
    GraphMap<> modules;

    for (NodeId id = 0; id < graph_.node_count(); ++id) {
        const auto& node = graph_.node(id);
        for (const auto& cap : node.capabilities) {
            auto [it, inserted] = cap_owner.emplace(cap.id(), node.ref.module);
            if (!inserted && it->second != node.ref.module) {
                return WeaveError{WeaveError::CapabilityConflict,
                    "capability " + cap.id() + " is provided by both " +
                    it->second.to_string() + " and " + node.ref.module.to_string()};
            }
        }

        auto [vit, fresh] = version_of.emplace(node.ref.module, node.ref.version);
        if (!fresh && vit->second != node.ref.version) {
            return WeaveError{WeaveError::VersionConflict,
                "module " + node.ref.module.to_string() + " selected at both " +
                vit->second.to_string() + " and " + node.ref.version.to_string()};
        }

        modules.add_node(node.ref.module.to_string());
        for (const auto& e : graph_.successors(id)) {
            if (sibling_variants(node.ref, graph_.node(e.to).ref)) continue;
            modules.add_edge(node.ref.module.to_string(),
                             graph_.node(e.to).ref.module.to_string());
        }
    }

    auto cycles = modules.cycles();
    if (!cycles.empty()) {
        return WeaveError{WeaveError::CycleDetected,
            "module " + cycles.front().front() + " depends on itself"};
    }
    return ok_status();
}

} // namespace weave
