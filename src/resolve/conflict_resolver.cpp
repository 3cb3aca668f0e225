#include <weave/conflict_resolver.hpp>
#include <weave/log.hpp>

#include <algorithm>
#include <limits>
#include <map>
#include <queue>
#include <set>

namespace weave {

namespace {

constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

// Highest of `versions`, or nullopt with `why` set when two of them have no
// order between them
std::optional<Version> highest(const std::set<Version>& versions, std::string& why) {
    std::optional<Version> best;
    for (const auto& v : versions) {
        if (!best) {
            best = v;
            continue;
        }
        auto c = Version::compare(v, *best);
        if (!c) {
            why = "versions " + best->to_string() + " and " + v.to_string() +
                  " cannot be ordered";
            return std::nullopt;
        }
        if (*c > 0) best = v;
    }
    return best;
}

std::vector<bool> reachable_mask(const NodeGraph& g, NodeId root) {
    std::vector<bool> mask(g.node_count(), false);
    for (NodeId id : g.reachable_from(root)) mask[id] = true;
    return mask;
}

class VersionSelection {
public:
    VersionSelection(NodeGraph& g, NodeId root, std::vector<Conflict>& conflicts)
        : g_(g), root_(root), conflicts_(conflicts) {}

    void run() {
        seed();
        if (selected_.empty()) return;

        if (!settle()) {
            for (const auto& entry : selected_) {
                conflicts_[conflict_of_.at(entry.first)].reason =
                    "version selection did not settle";
            }
            selected_.clear();
            return;
        }

        const ModuleId& root_module = g_.node(root_).ref.module;
        for (const auto& [module, version] : selected_) {
            auto& c = conflicts_[conflict_of_.at(module)];
            c.resolved = true;
            if (module == root_module) {
                c.winner = g_.node(root_).ref;
                c.reason = "the root's own version is fixed";
            } else {
                c.winner = g_.node(node_for(module, version, "")).ref;
                c.reason = "highest requested version";
            }
            log::debug("selected %s:%s", module.to_string().c_str(),
                       version.to_string().c_str());
        }

        size_t rewritten = 0;
        for (NodeId u = 0; u < g_.node_count(); ++u) {
            for (auto& e : g_.successors(u)) {
                NodeId t = target_of(e.to);
                if (t == e.to) continue;
                const VariantRef& asked = g_.node(e.to).ref;
                const VariantRef& got = g_.node(t).ref;
                if (asked.variant != got.variant) {
                    VariantRef want = asked;
                    want.version = got.version;
                    if (missing_.insert(want).second) {
                        auto& c = conflicts_[conflict_of_.at(asked.module)];
                        c.reason += "; " + want.display() + " has no variant '" +
                                    want.variant + "' in the graph, using '" +
                                    got.variant + "'";
                        log::debug("%s: no variant '%s', using '%s'",
                                   want.display().c_str(), want.variant.c_str(),
                                   got.variant.c_str());
                    }
                }
                e.to = t;
                ++rewritten;
            }
        }
        log::debug("rewrote %zu edge(s) to selected versions", rewritten);
    }

    // Variants of selected versions that edges asked for but the graph
    // does not hold; their edges went to another variant of that version
    const std::set<VariantRef>& missing() const { return missing_; }

private:
    // Start from the highest version present in the graph
    void seed() {
        const ModuleId& root_module = g_.node(root_).ref.module;
        for (size_t i = 0; i < conflicts_.size(); ++i) {
            auto& c = conflicts_[i];
            if (c.kind != ConflictKind::Version || c.participants.empty()) continue;
            const ModuleId& module = c.participants.front().ref.module;
            conflict_of_[module] = i;

            if (module == root_module) {
                selected_.emplace(module, g_.node(root_).ref.version);
                continue;
            }
            std::set<Version> versions;
            for (const auto& p : c.participants) versions.insert(p.ref.version);
            std::string why;
            auto best = highest(versions, why);
            if (!best) {
                c.reason = why;
                continue;
            }
            selected_.emplace(module, *best);
        }
    }

    // Re-select from the versions still requested by reachable nodes until
    // nothing moves. Returns false if it never settles.
    bool settle() {
        const ModuleId& root_module = g_.node(root_).ref.module;
        for (size_t round = 0; round <= g_.node_count(); ++round) {
            std::map<ModuleId, std::set<Version>> requested;
            std::vector<bool> seen(g_.node_count(), false);
            std::queue<NodeId> bfs;
            bfs.push(root_);
            seen[root_] = true;
            while (!bfs.empty()) {
                NodeId u = bfs.front();
                bfs.pop();
                for (const auto& e : g_.successors(u)) {
                    const auto& ref = g_.node(e.to).ref;
                    if (selected_.count(ref.module)) requested[ref.module].insert(ref.version);
                    NodeId t = target_of(e.to);
                    if (!seen[t]) {
                        seen[t] = true;
                        bfs.push(t);
                    }
                }
            }

            bool moved = false;
            for (auto it = selected_.begin(); it != selected_.end();) {
                auto req = requested.find(it->first);
                if (it->first == root_module || req == requested.end()) {
                    ++it;
                    continue;
                }
                std::string why;
                auto best = highest(req->second, why);
                if (!best) {
                    conflicts_[conflict_of_.at(it->first)].reason = why;
                    it = selected_.erase(it);
                    moved = true;
                    continue;
                }
                if (*best != it->second) {
                    it->second = *best;
                    moved = true;
                }
                ++it;
            }
            if (!moved) return true;
        }
        return false;
    }

    // Node carrying (module, version), preferring `variant`
    NodeId node_for(const ModuleId& module, const Version& version,
                    const std::string& variant) const {
        NodeId any = kNoNode;
        for (NodeId id = 0; id < g_.node_count(); ++id) {
            const auto& ref = g_.node(id).ref;
            if (ref.module != module || ref.version != version) continue;
            if (ref.variant == variant) return id;
            if (any == kNoNode) any = id;
        }
        return any;
    }

    NodeId target_of(NodeId to) const {
        const auto& ref = g_.node(to).ref;
        auto it = selected_.find(ref.module);
        if (it == selected_.end() || ref.version == it->second) return to;
        if (ref.module == g_.node(root_).ref.module && ref.variant == g_.node(root_).ref.variant) {
            return root_;
        }
        NodeId t = node_for(ref.module, it->second, ref.variant);
        return t == kNoNode ? to : t;
    }

    NodeGraph& g_;
    NodeId root_;
    std::vector<Conflict>& conflicts_;
    std::map<ModuleId, size_t> conflict_of_;
    std::map<ModuleId, Version> selected_;
    std::set<VariantRef> missing_;
};

void resolve_capabilities(NodeGraph& g, NodeId root, std::vector<Conflict>& conflicts,
                          const CapabilityPolicy& policy) {
    std::set<NodeId> evicted;
    for (auto& c : conflicts) {
        if (c.kind != ConflictKind::Capability) continue;

        auto alive = reachable_mask(g, root);
        std::vector<CapabilityCandidate> candidates;
        std::vector<ConflictParticipant> survivors;
        std::set<ModuleId> modules;
        for (const auto& p : c.participants) {
            if (!alive[p.node]) continue;
            const auto& node = g.node(p.node);
            for (const auto& cap : node.capabilities) {
                if (cap.id() == c.subject) {
                    candidates.push_back({p.node, node.ref, cap});
                    break;
                }
            }
            survivors.push_back(p);
            modules.insert(node.ref.module);
        }

        // Owners pruned by version selection no longer take part
        if (!survivors.empty()) {
            c.participants = std::move(survivors);
            std::vector<Capability> declared;
            for (const auto& cand : candidates) declared.push_back(cand.capability);
            if (!declared.empty()) c.capability = highest_capability(declared);
        }

        if (modules.size() < 2) {
            c.resolved = true;
            if (!candidates.empty()) {
                c.winner = candidates.front().ref;
                c.reason = "the other owners are no longer reachable";
            } else {
                c.reason = "no owner is reachable any more";
            }
            continue;
        }

        auto pick = policy.choose(c.subject, candidates);
        if (!pick) {
            c.reason = "capability policy '" + policy.name() + "' chose no winner";
            continue;
        }
        const CapabilityCandidate winner = candidates[*pick];
        if (evicted.count(winner.node)) {
            c.reason = winner.ref.display() + " was already evicted by another capability";
            continue;
        }

        std::set<NodeId> losers;
        for (const auto& cand : candidates) {
            if (cand.ref.module != winner.ref.module) losers.insert(cand.node);
        }
        if (losers.count(root)) {
            c.reason = "the root variant cannot be evicted";
            continue;
        }

        for (NodeId u = 0; u < g.node_count(); ++u) {
            auto& edges = g.successors(u);
            for (auto it = edges.begin(); it != edges.end();) {
                if (!losers.count(it->to)) {
                    ++it;
                    continue;
                }
                if (policy.loser_edges == LoserEdges::Redirect && u != winner.node) {
                    it->to = winner.node;
                    ++it;
                    continue;
                }
                if (policy.loser_edges == LoserEdges::Drop) {
                    c.dropped_edges.push_back({g.node(u).ref, g.node(it->to).ref});
                }
                it = edges.erase(it);
            }
        }
        evicted.insert(losers.begin(), losers.end());

        c.resolved = true;
        c.winner = winner.ref;
        c.reason = "chosen by capability policy '" + policy.name() + "'";
        log::debug("%s", c.describe().c_str());
    }
}

void settle_remaining(const NodeGraph& g, NodeId root, std::vector<Conflict>& conflicts) {
    auto alive = reachable_mask(g, root);

    // Redirected edges can close a loop the provisional graph did not have
    std::set<std::string> known;
    for (const auto& c : conflicts) {
        if (c.kind == ConflictKind::Cycle) known.insert(c.subject);
    }
    for (auto& c : find_module_cycles(g, alive)) {
        if (known.count(c.subject)) continue;
        c.reason = "introduced by redirecting capability edges";
        conflicts.push_back(std::move(c));
    }

    for (auto& c : conflicts) {
        if (c.kind != ConflictKind::UnresolvedSelector || c.participants.empty()) continue;
        if (!alive[c.participants.front().node]) {
            c.resolved = true;
            c.reason = "only required by an evicted node";
        }
    }
}

} // namespace

ConflictResolver::ConflictResolver(CapabilityPolicy policy)
    : policy_(std::move(policy)) {}

std::vector<VariantRef> ConflictResolver::wanted_variants(
    const ProvisionalGraph& graph, const std::vector<Conflict>& conflicts) const
{
    NodeGraph scratch = graph.graph;
    std::vector<Conflict> notes = conflicts;
    VersionSelection selection(scratch, graph.root, notes);
    selection.run();
    return {selection.missing().begin(), selection.missing().end()};
}

ResolutionResult ConflictResolver::resolve(ProvisionalGraph provisional,
                                           std::vector<Conflict> conflicts) const {
    NodeGraph& g = provisional.graph;
    const NodeId root = provisional.root;

    VersionSelection(g, root, conflicts).run();
    resolve_capabilities(g, root, conflicts, policy_);
    settle_remaining(g, root, conflicts);

    ResolutionResult result;
    result.root_ = 0;
    result.conflicts_ = std::move(conflicts);

    auto root_only = [&] {
        result.status_ = ResolutionStatus::Failure;
        result.graph_ = ResolvedGraph{};
        result.graph_.add_node(ResolvedNode{g.node(root).ref, g.node(root).capabilities});
    };

    bool failed = std::any_of(result.conflicts_.begin(), result.conflicts_.end(),
                              [](const Conflict& c) { return !c.resolved; });
    if (failed) {
        root_only();
        log::debug("resolution of %s failed with %zu unresolved conflict(s)",
                   g.node(root).ref.to_string().c_str(),
                   result.unresolved_conflicts().size());
        return result;
    }

    // Survivors keep their provisional order; the root stays node 0
    auto alive = reachable_mask(g, root);
    std::vector<NodeId> old_to_new(g.node_count(), kNoNode);
    for (NodeId id = 0; id < g.node_count(); ++id) {
        if (!alive[id]) continue;
        const auto& node = g.node(id);
        old_to_new[id] = result.graph_.add_node(ResolvedNode{node.ref, node.capabilities});
    }
    for (NodeId id = 0; id < g.node_count(); ++id) {
        if (!alive[id]) continue;
        std::set<NodeId> linked;
        for (const auto& e : g.successors(id)) {
            if (!linked.insert(e.to).second) continue;
            result.graph_.add_edge(old_to_new[id], old_to_new[e.to]);
        }
    }
    result.status_ = ResolutionStatus::Success;

    auto check = result.check_invariants();
    if (check.is_err()) {
        log::error("resolved graph for %s is inconsistent: %s",
                   g.node(root).ref.to_string().c_str(),
                   check.error().message.c_str());
        Conflict c;
        c.kind = check.error().code == WeaveError::CycleDetected ? ConflictKind::Cycle
               : check.error().code == WeaveError::CapabilityConflict ? ConflictKind::Capability
               : ConflictKind::Version;
        c.reason = check.error().message;
        result.conflicts_.push_back(std::move(c));
        root_only();
        return result;
    }

    log::debug("resolved %s: %zu node(s), %zu edge(s)",
               g.node(root).ref.to_string().c_str(),
               result.graph_.node_count(), result.graph_.edge_count());
    return result;
}

} // namespace weave
