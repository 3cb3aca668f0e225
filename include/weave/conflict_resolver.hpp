#pragma once

#include <weave/conflict.hpp>
#include <weave/graph_builder.hpp>
#include <weave/policy.hpp>
#include <weave/resolution.hpp>

#include <vector>

namespace weave {

// Turns a provisional graph and its conflicts into a ResolutionResult.
//
// Version conflicts go first: each module settles on the highest version
// still requested from the reachable part of the graph, and edges to other
// versions are rewritten to the selected one. Capability conflicts among
// the survivors are then handed to the policy. Cycles are never resolved.
// Any conflict left unresolved fails the whole run.
class ConflictResolver {
public:
    explicit ConflictResolver(CapabilityPolicy policy = {});

    ResolutionResult resolve(ProvisionalGraph graph, std::vector<Conflict> conflicts) const;

    // Variants of the selected versions that redirected edges ask for but
    // `graph` lacks. resolve() sends such edges to another variant of the
    // same version; rebuilding with these pinned avoids that.
    std::vector<VariantRef> wanted_variants(const ProvisionalGraph& graph,
                                            const std::vector<Conflict>& conflicts) const;

    const CapabilityPolicy& policy() const { return policy_; }

private:
    CapabilityPolicy policy_;
};

} // namespace weave
