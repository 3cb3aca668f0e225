#pragma once

#include <weave/capability_registry.hpp>
#include <weave/conflict.hpp>
#include <weave/graph.hpp>
#include <weave/metadata.hpp>
#include <weave/result.hpp>

#include <vector>

namespace weave {

struct GraphNode {
    VariantRef ref;
    std::vector<Capability> capabilities;  // effective set
};

struct GraphEdge {
    Dependency dependency;     // as declared by the source variant
    size_t declaration = 0;    // position in the source's dependency list
};

using NodeGraph = Graph<GraphNode, GraphEdge>;

// Everything reachable from a root before any conflict is resolved. Several
// versions of one module may be present. Node 0 is the root; the remaining
// nodes are sorted by (module, version, variant) so ids do not depend on
// discovery order.
struct ProvisionalGraph {
    NodeGraph graph;
    NodeId root = 0;
    CapabilityRegistry capabilities;
    // Cycles and unresolved selectors found while building
    std::vector<Conflict> conflicts;

    std::vector<NodeId> nodes_of(const ModuleId& module) const;
};

struct BuildOptions {
    size_t jobs = 1;          // 0 = one per hardware thread
    bool fail_fast = false;   // stop scheduling work after the first unresolved selector
};

// Module-level cycles among the nodes flagged in `alive`, one conflict per
// strongly-connected component, ordered by the component's first module.
std::vector<Conflict> find_module_cycles(const NodeGraph& graph,
                                         const std::vector<bool>& alive);

class GraphBuilder {
public:
    explicit GraphBuilder(const MetadataSource& source, BuildOptions options = {});

    // Fails only when the metadata source fails for a reason other than
    // NotFound, or a worker throws; graph problems become conflicts.
    Result<ProvisionalGraph> build(const VariantRef& root) const;

    // As above, with `pinned` variants traversed as well even though nothing
    // depends on them yet. They stay unreachable from the root until version
    // selection points an edge at them.
    Result<ProvisionalGraph> build(const VariantRef& root,
                                   const std::vector<VariantRef>& pinned) const;

private:
    const MetadataSource& source_;
    BuildOptions options_;
};

} // namespace weave
