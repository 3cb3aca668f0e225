#pragma once

#include <weave/conflict.hpp>
#include <weave/graph_builder.hpp>

#include <vector>

namespace weave {

// Reads a provisional graph and lists what is wrong with it. Order:
// cycles, unresolved selectors (both as found by the builder), version
// conflicts by module id, capability conflicts by capability id.
class ConflictDetector {
public:
    std::vector<Conflict> detect(const ProvisionalGraph& graph) const;

    std::vector<Conflict> version_conflicts(const ProvisionalGraph& graph) const;
    std::vector<Conflict> capability_conflicts(const ProvisionalGraph& graph) const;
};

} // namespace weave
