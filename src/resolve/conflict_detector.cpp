#include <weave/conflict_detector.hpp>

#include <map>
#include <set>

namespace weave {

std::vector<Conflict> ConflictDetector::detect(const ProvisionalGraph& graph) const {
    std::vector<Conflict> out = graph.conflicts;

    auto versions = version_conflicts(graph);
    out.insert(out.end(), std::make_move_iterator(versions.begin()),
               std::make_move_iterator(versions.end()));

    auto caps = capability_conflicts(graph);
    out.insert(out.end(), std::make_move_iterator(caps.begin()),
               std::make_move_iterator(caps.end()));
    return out;
}

std::vector<Conflict> ConflictDetector::version_conflicts(const ProvisionalGraph& graph) const {
    const auto& g = graph.graph;

    std::map<ModuleId, std::vector<NodeId>> by_module;
    for (NodeId id = 0; id < g.node_count(); ++id) {
        by_module[g.node(id).ref.module].push_back(id);
    }

    std::vector<Conflict> out;
    for (const auto& [module, nodes] : by_module) {
        std::set<Version> versions;
        for (NodeId id : nodes) versions.insert(g.node(id).ref.version);
        if (versions.size() < 2) continue;

        Conflict c;
        c.kind = ConflictKind::Version;
        c.subject = module.to_string();

        // Ascending version; ids already follow (version, variant) order
        for (NodeId id : nodes) {
            c.participants.push_back({id, g.node(id).ref});
        }

        std::set<NodeId> members(nodes.begin(), nodes.end());
        for (NodeId from = 0; from < g.node_count(); ++from) {
            for (const auto& e : g.successors(from)) {
                if (!members.count(e.to)) continue;
                c.requests.push_back({g.node(from).ref,
                                      e.data.dependency.selector.to_string(),
                                      g.node(e.to).ref.version});
            }
        }
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<Conflict> ConflictDetector::capability_conflicts(const ProvisionalGraph& graph) const {
    const auto& g = graph.graph;

    std::vector<Conflict> out;
    for (const auto& group : graph.capabilities.groups_with_multiple_owners()) {
        Conflict c;
        c.kind = ConflictKind::Capability;
        c.subject = group.capability_id;

        // Report the highest declared version of the shared capability
        std::vector<Capability> declared;
        for (const auto& owner : group.owners) {
            c.participants.push_back({owner.node, g.node(owner.node).ref});
            declared.push_back(owner.capability);
        }
        c.capability = highest_capability(declared);
        out.push_back(std::move(c));
    }
    return out;
}

} // namespace weave
