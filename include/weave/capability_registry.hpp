#pragma once

#include <weave/module.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace weave {

using NodeId = size_t;

// Capability id -> nodes declaring it. Only aggregates; deciding whether a
// shared capability is a conflict is the detector's job. Every method locks,
// so traversal workers can register concurrently.
class CapabilityRegistry {
public:
    struct Owner {
        NodeId node;
        ModuleId module;
        Capability capability;

        bool operator<(const Owner& o) const { return node < o.node; }
    };

    struct Group {
        std::string capability_id;
        std::vector<Owner> owners;  // sorted by node
    };

    CapabilityRegistry() = default;
    CapabilityRegistry(CapabilityRegistry&& other) noexcept;
    CapabilityRegistry& operator=(CapabilityRegistry&& other) noexcept;

    void register_node(NodeId node, const ModuleId& module,
                       const std::vector<Capability>& capabilities);

    // Capability ids owned by more than one distinct module, sorted by id
    std::vector<Group> groups_with_multiple_owners() const;

    std::vector<Owner> owners_of(const std::string& capability_id) const;

    // Renumber nodes after the graph is compacted; ids mapped to
    // `dropped` are forgotten.
    void remap(const std::vector<NodeId>& old_to_new, NodeId dropped);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Owner>> owners_;
};

} // namespace weave
