#pragma once

#include <weave/conflict.hpp>
#include <weave/graph.hpp>
#include <weave/result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace weave {

enum class ResolutionStatus { Success, Failure };

struct ResolvedNode {
    VariantRef ref;
    std::vector<Capability> capabilities;
};

using ResolvedGraph = Graph<ResolvedNode>;

// Outcome of one resolution run. Immutable: only the resolver builds one.
// On Failure the graph holds the root alone, so no failed result ever
// exposes two owners of a capability.
class ResolutionResult {
public:
    ResolutionStatus status() const { return status_; }
    bool ok() const { return status_ == ResolutionStatus::Success; }

    NodeId root() const { return root_; }
    const ResolvedGraph& graph() const { return graph_; }
    size_t node_count() const { return graph_.node_count(); }
    const ResolvedNode& node(NodeId id) const { return graph_.node(id); }
    std::vector<NodeId> dependencies_of(NodeId id) const;

    std::optional<NodeId> find(const ModuleId& module) const;

    // Every conflict seen, resolved or not, in detection order
    const std::vector<Conflict>& conflicts() const { return conflicts_; }
    std::vector<const Conflict*> unresolved_conflicts() const;

    // Unresolved conflict descriptions, one per line; empty on success
    std::string failure_cause() const;

    // Error carrying failure_cause(), coded after the first unresolved
    // conflict. Only meaningful on Failure.
    WeaveError to_error() const;

    // Capability uniqueness, one version per module, no module cycle
    Status check_invariants() const;

private:
    friend class ConflictResolver;
    ResolutionResult() = default;

    ResolutionStatus status_ = ResolutionStatus::Failure;
    NodeId root_ = 0;
    ResolvedGraph graph_;
    std::vector<Conflict> conflicts_;
};

} // namespace weave
