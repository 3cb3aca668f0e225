#pragma once

#include <weave/module.hpp>
#include <weave/capability_registry.hpp>

#include <optional>
#include <string>
#include <vector>

namespace weave {

enum class ConflictKind {
    Cycle,
    UnresolvedSelector,
    Version,
    Capability,
};

const char* conflict_kind_name(ConflictKind kind);

// Participant ids refer to the provisional graph, not the final one
struct ConflictParticipant {
    NodeId node;
    VariantRef ref;
};

// One edge asking for a version of the conflicting module
struct VersionRequest {
    VariantRef from;
    std::string requested;   // the selector as declared
    Version version;         // what the selector resolved to
};

struct DroppedEdge {
    VariantRef from;
    VariantRef to;
};

struct Conflict {
    ConflictKind kind = ConflictKind::Version;
    std::vector<ConflictParticipant> participants;

    // Module id (Version), capability id (Capability), selector
    // (UnresolvedSelector), or the first module of the cycle (Cycle)
    std::string subject;

    Capability capability;                // Capability
    std::vector<VersionRequest> requests;  // Version
    std::vector<ModuleId> cycle;          // Cycle: a -> b -> ... -> a

    bool resolved = false;
    std::optional<VariantRef> winner;
    std::string reason;                   // how it was resolved, or why not
    std::vector<DroppedEdge> dropped_edges;

    // The error code a failure caused by this conflict reports
    WeaveError::Code error_code() const;

    // One-line human readable description, stable across runs
    std::string describe() const;
};

// "a", "a and b", "a, b and c"
std::string join_owners(const std::vector<std::string>& names);

// The declaration with the highest version; unparsable versions rank lowest
Capability highest_capability(const std::vector<Capability>& declared);

} // namespace weave
