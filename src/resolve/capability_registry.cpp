#include <weave/capability_registry.hpp>

#include <algorithm>
#include <set>

namespace weave {

CapabilityRegistry::CapabilityRegistry(CapabilityRegistry&& other) noexcept {
    std::lock_guard<std::mutex> lk(other.mutex_);
    owners_ = std::move(other.owners_);
}

CapabilityRegistry& CapabilityRegistry::operator=(CapabilityRegistry&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lk(mutex_, other.mutex_);
        owners_ = std::move(other.owners_);
    }
    return *this;
}

void CapabilityRegistry::register_node(NodeId node, const ModuleId& module,
                                       const std::vector<Capability>& capabilities) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& cap : capabilities) {
        auto& owners = owners_[cap.id()];
        Owner owner{node, module, cap};
        owners.insert(std::upper_bound(owners.begin(), owners.end(), owner),
                      std::move(owner));
    }
}

std::vector<CapabilityRegistry::Group> CapabilityRegistry::groups_with_multiple_owners() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<Group> out;
    for (const auto& [id, owners] : owners_) {
        std::set<ModuleId> modules;
        for (const auto& o : owners) modules.insert(o.module);
        if (modules.size() > 1) {
            out.push_back(Group{id, owners});
        }
    }
    return out;
}

std::vector<CapabilityRegistry::Owner> CapabilityRegistry::owners_of(
    const std::string& capability_id) const
{
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = owners_.find(capability_id);
    if (it == owners_.end()) return {};
    return it->second;
}

void CapabilityRegistry::remap(const std::vector<NodeId>& old_to_new, NodeId dropped) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto it = owners_.begin(); it != owners_.end();) {
        auto& owners = it->second;
        std::vector<Owner> kept;
        for (auto& o : owners) {
            if (o.node >= old_to_new.size() || old_to_new[o.node] == dropped) continue;
            o.node = old_to_new[o.node];
            kept.push_back(std::move(o));
        }
        std::sort(kept.begin(), kept.end());
        if (kept.empty()) {
            it = owners_.erase(it);
        } else {
            owners = std::move(kept);
            ++it;
        }
    }
}

size_t CapabilityRegistry::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return owners_.size();
}

} // namespace weave
