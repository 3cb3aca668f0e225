#pragma once

#include <weave/module.hpp>
#include <weave/capability_registry.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace weave {

// What happens to edges that pointed at a node the policy evicted
enum class LoserEdges {
    Redirect,   // point them at the winner; self-edges disappear
    Drop,       // remove them, recording each in the conflict
};

// Never picks a winner: every capability conflict is fatal
struct RejectAll {};

// The owner declaring the highest capability version wins; a tie is no choice
struct HighestCapabilityVersion {};

// Capability id -> module that must win
struct ExplicitRules {
    std::map<std::string, ModuleId> winners;
};

using CapabilityPolicyKind = std::variant<RejectAll, HighestCapabilityVersion, ExplicitRules>;

struct CapabilityCandidate {
    NodeId node;
    VariantRef ref;
    Capability capability;
};

struct CapabilityPolicy {
    CapabilityPolicyKind kind = RejectAll{};
    LoserEdges loser_edges = LoserEdges::Redirect;

    // Index into candidates of the winner, or nullopt for "no choice".
    // Candidates arrive sorted by node.
    std::optional<size_t> choose(const std::string& capability_id,
                                 const std::vector<CapabilityCandidate>& candidates) const;

    // "reject", "highest-version", "rules"
    std::string name() const;
};

Result<LoserEdges> parse_loser_edges(const std::string& s);

} // namespace weave
