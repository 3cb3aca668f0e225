#include <weave/graph_builder.hpp>
#include <weave/log.hpp>
#include <weave/parallel.hpp>

#include <algorithm>
#include <atomic>
#include <iterator>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <set>

namespace weave {

std::vector<NodeId> ProvisionalGraph::nodes_of(const ModuleId& module) const {
    std::vector<NodeId> out;
    for (NodeId id = 0; id < graph.node_count(); ++id) {
        if (graph.node(id).ref.module == module) out.push_back(id);
    }
    return out;
}

namespace {

struct NodeRecord {
    VariantRef ref;
    std::vector<Capability> capabilities;
    std::vector<Dependency> dependencies;
    std::set<ExcludeRule> excludes;      // intersection over incoming paths
    std::vector<bool> claimed;           // dependency already followed
    std::vector<std::pair<size_t, NodeId>> edges;  // (declaration, target)
};

struct SelectorOutcome {
    std::optional<VariantRef> ref;
    std::string error;   // NotFound message when ref is empty
};

struct UnresolvedEdge {
    NodeId from;
    size_t declaration;
    std::string selector;
    std::string message;
};

// Provisional node table shared by traversal workers. A single mutex guards
// every member; no method calls out while holding it.
class NodeTable {
public:
    std::pair<NodeId, bool> insert_or_get(NodeRecord record) {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = by_ref_.find(record.ref);
        if (it != by_ref_.end()) return {it->second, false};
        NodeId id = nodes_.size();
        by_ref_.emplace(record.ref, id);
        record.claimed.assign(record.dependencies.size(), false);
        nodes_.push_back(std::move(record));
        return {id, true};
    }

    std::optional<NodeId> lookup(const VariantRef& ref) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = by_ref_.find(ref);
        if (it == by_ref_.end()) return std::nullopt;
        return it->second;
    }

    // Claim every dependency of `id` that is not excluded and not yet
    // followed. `excludes` receives the node's current rule set and
    // `followed` the edges it already has.
    std::vector<std::pair<size_t, Dependency>> claim(
            NodeId id, std::set<ExcludeRule>& excludes,
            std::vector<std::pair<size_t, NodeId>>& followed) {
        std::lock_guard<std::mutex> lk(mutex_);
        NodeRecord& rec = nodes_[id];
        excludes = rec.excludes;
        followed = rec.edges;
        std::vector<std::pair<size_t, Dependency>> out;
        for (size_t i = 0; i < rec.dependencies.size(); ++i) {
            if (rec.claimed[i]) continue;
            const ModuleId& target = rec.dependencies[i].selector.module;
            bool excluded = std::any_of(rec.excludes.begin(), rec.excludes.end(),
                [&](const ExcludeRule& r) { return r.matches(target); });
            if (excluded) continue;
            rec.claimed[i] = true;
            out.emplace_back(i, rec.dependencies[i]);
        }
        return out;
    }

    // Link `from` to `to` through dependency `declaration` and narrow the
    // target's rules to those of the path through this edge.
    bool link(NodeId from, size_t declaration, NodeId to) {
        std::lock_guard<std::mutex> lk(mutex_);
        nodes_[from].edges.emplace_back(declaration, to);
        return narrow_locked(from, declaration, to);
    }

    // Re-apply an existing edge after `from` itself was narrowed. True if
    // the target's set shrank, meaning it must be expanded again.
    bool narrow_through(NodeId from, size_t declaration, NodeId to) {
        std::lock_guard<std::mutex> lk(mutex_);
        return narrow_locked(from, declaration, to);
    }

    std::optional<SelectorOutcome> cached(const std::string& key) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = selectors_.find(key);
        if (it == selectors_.end()) return std::nullopt;
        return it->second;
    }

    void cache(const std::string& key, SelectorOutcome outcome) {
        std::lock_guard<std::mutex> lk(mutex_);
        selectors_.emplace(key, std::move(outcome));
    }

    void add_unresolved(UnresolvedEdge edge) {
        std::lock_guard<std::mutex> lk(mutex_);
        unresolved_.push_back(std::move(edge));
    }

    // Keeps the first failure only
    void fail(WeaveError err) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!failure_) failure_ = std::move(err);
    }

    // Only valid once every worker has stopped
    std::vector<NodeRecord>& nodes() { return nodes_; }
    std::vector<UnresolvedEdge>& unresolved() { return unresolved_; }
    const std::optional<WeaveError>& failure() const { return failure_; }

private:
    // The rules along a path are the source's rules plus the edge's own;
    // a node keeps the intersection over every path reaching it.
    bool narrow_locked(NodeId from, size_t declaration, NodeId to) {
        const NodeRecord& src = nodes_[from];
        std::set<ExcludeRule> path = src.excludes;
        const auto& own = src.dependencies[declaration].excludes;
        path.insert(own.begin(), own.end());

        NodeRecord& rec = nodes_[to];
        std::set<ExcludeRule> narrowed;
        std::set_intersection(rec.excludes.begin(), rec.excludes.end(),
                              path.begin(), path.end(),
                              std::inserter(narrowed, narrowed.begin()));
        if (narrowed.size() == rec.excludes.size()) return false;
        rec.excludes = std::move(narrowed);
        return true;
    }

    mutable std::mutex mutex_;
    std::vector<NodeRecord> nodes_;
    std::map<VariantRef, NodeId> by_ref_;
    std::map<std::string, SelectorOutcome> selectors_;
    std::vector<UnresolvedEdge> unresolved_;
    std::optional<WeaveError> failure_;
};

class Traversal {
public:
    Traversal(const MetadataSource& source, const BuildOptions& options,
              CapabilityRegistry& registry)
        : source_(source), options_(options), registry_(registry),
          queue_(options.jobs) {}

    Status run(const VariantRef& root, const std::vector<VariantRef>& pinned) {
        WEAVE_TRY(seed(root));
        for (const auto& ref : pinned) WEAVE_TRY(seed(ref));

        auto status = queue_.run();
        if (table_.failure()) return *table_.failure();
        return status;
    }

    NodeTable& table() { return table_; }

private:
    // The first seed becomes node 0
    Status seed(const VariantRef& ref) {
        auto rec = fetch(ref);
        if (rec.is_err()) return std::move(rec).error();

        NodeRecord record = std::move(rec).value();
        ModuleId module = record.ref.module;
        std::vector<Capability> caps = record.capabilities;
        auto inserted = table_.insert_or_get(std::move(record));
        if (!inserted.second) return ok_status();
        NodeId id = inserted.first;
        registry_.register_node(id, module, caps);
        queue_.push([this, id] { expand(id); });
        return ok_status();
    }

    Result<NodeRecord> fetch(const VariantRef& ref) const {
        auto deps = source_.declared_dependencies(ref);
        if (deps.is_err()) return std::move(deps).error();
        auto caps = source_.declared_capabilities(ref);
        if (caps.is_err()) return std::move(caps).error();

        NodeRecord rec;
        rec.ref = ref;
        rec.dependencies = std::move(deps).value();
        rec.capabilities = effective_capabilities(ref, caps.value());
        return Result<NodeRecord>::ok(std::move(rec));
    }

    SelectorOutcome resolve(const ModuleSelector& selector) {
        std::string key = selector.key();
        if (auto hit = table_.cached(key)) return *hit;

        SelectorOutcome outcome;
        auto r = source_.resolve_selector(selector);
        if (r.is_ok()) {
            outcome.ref = std::move(r).value();
        } else if (r.error().code == WeaveError::NotFound) {
            outcome.error = r.error().message;
        } else {
            table_.fail(std::move(r).error());
            queue_.cancel();
            return outcome;
        }
        table_.cache(key, outcome);
        return outcome;
    }

    void expand(NodeId id) {
        if (stopped_) return;

        std::set<ExcludeRule> excludes;
        std::vector<std::pair<size_t, NodeId>> followed;
        auto deps = table_.claim(id, excludes, followed);

        // A narrower rule set reaches children that were linked earlier
        for (const auto& [decl, child] : followed) {
            if (table_.narrow_through(id, decl, child)) {
                NodeId c = child;
                queue_.push([this, c] { expand(c); });
            }
        }

        for (auto& [decl, dep] : deps) {
            SelectorOutcome target = resolve(dep.selector);
            if (!target.ref) {
                if (target.error.empty()) return;  // source failure, already recorded
                table_.add_unresolved({id, decl, dep.selector.to_string(), target.error});
                log::debug("unresolved selector %s", dep.selector.to_string().c_str());
                if (options_.fail_fast) {
                    stopped_ = true;
                    queue_.cancel();
                    return;
                }
                continue;
            }

            NodeId child;
            bool schedule = false;
            if (auto existing = table_.lookup(*target.ref)) {
                child = *existing;
            } else {
                // Metadata is fetched without holding the table lock
                auto rec = fetch(*target.ref);
                if (rec.is_err()) {
                    table_.fail(std::move(rec).error());
                    queue_.cancel();
                    return;
                }
                NodeRecord record = std::move(rec).value();
                record.excludes = excludes;
                record.excludes.insert(dep.excludes.begin(), dep.excludes.end());
                ModuleId module = record.ref.module;
                std::vector<Capability> caps = record.capabilities;

                auto [cid, created] = table_.insert_or_get(std::move(record));
                child = cid;
                if (created) {
                    registry_.register_node(cid, module, caps);
                    log::trace("discovered %s", target.ref->to_string().c_str());
                    schedule = true;
                }
            }

            if (table_.link(id, decl, child)) schedule = true;
            if (schedule) {
                queue_.push([this, child] { expand(child); });
            }
        }
    }

    const MetadataSource& source_;
    BuildOptions options_;
    CapabilityRegistry& registry_;
    NodeTable table_;
    WorkQueue queue_;
    std::atomic<bool> stopped_{false};
};

// Shortest module path from comp[0] back to itself, inside the component
std::vector<std::string> cycle_path(const GraphMap<>& modules,
                                    const std::vector<std::string>& comp) {
    const auto& g = modules.inner();
    std::set<size_t> members;
    for (const auto& name : comp) members.insert(modules.node_id(name));

    size_t start = modules.node_id(comp.front());
    std::map<size_t, size_t> parent;
    std::queue<size_t> bfs;
    bfs.push(start);
    std::optional<size_t> last;

    while (!bfs.empty() && !last) {
        size_t u = bfs.front();
        bfs.pop();
        for (const auto& e : g.successors(u)) {
            if (e.to == start) {
                last = u;
                break;
            }
            if (!members.count(e.to) || parent.count(e.to)) continue;
            parent[e.to] = u;
            bfs.push(e.to);
        }
    }

    std::vector<std::string> path;
    if (!last) return comp;
    for (size_t at = *last; at != start; at = parent[at]) {
        path.push_back(g.node(at));
    }
    path.push_back(g.node(start));
    std::reverse(path.begin(), path.end());
    path.push_back(g.node(start));
    return path;
}

} // namespace

std::vector<Conflict> find_module_cycles(const NodeGraph& graph,
                                         const std::vector<bool>& alive) {
    // Judged per module, so a chain through two versions of one module counts
    GraphMap<> modules;
    std::map<std::string, ModuleId> module_ids;
    for (NodeId id = 0; id < graph.node_count(); ++id) {
        if (!alive[id]) continue;
        const ModuleId& m = graph.node(id).ref.module;
        module_ids.emplace(m.to_string(), m);
        modules.add_node(m.to_string());
    }
    for (NodeId id = 0; id < graph.node_count(); ++id) {
        if (!alive[id]) continue;
        for (const auto& e : graph.successors(id)) {
            if (!alive[e.to]) continue;
            if (sibling_variants(graph.node(id).ref, graph.node(e.to).ref)) continue;
            modules.add_edge(graph.node(id).ref.module.to_string(),
                             graph.node(e.to).ref.module.to_string());
        }
    }

    std::vector<Conflict> out;
    for (const auto& comp : modules.cycles()) {
        Conflict c;
        c.kind = ConflictKind::Cycle;
        c.subject = comp.front();
        for (const auto& name : cycle_path(modules, comp)) {
            c.cycle.push_back(module_ids.at(name));
        }
        std::set<std::string> members(comp.begin(), comp.end());
        for (NodeId id = 0; id < graph.node_count(); ++id) {
            if (!alive[id]) continue;
            const auto& ref = graph.node(id).ref;
            if (members.count(ref.module.to_string())) {
                c.participants.push_back({id, ref});
            }
        }
        c.reason = "cycles are never resolved automatically";
        out.push_back(std::move(c));
    }
    return out;
}

GraphBuilder::GraphBuilder(const MetadataSource& source, BuildOptions options)
    : source_(source), options_(options) {}

Result<ProvisionalGraph> GraphBuilder::build(const VariantRef& root) const {
    return build(root, {});
}

Result<ProvisionalGraph> GraphBuilder::build(const VariantRef& root,
                                             const std::vector<VariantRef>& pinned) const {
    log::debug("building graph for %s (%zu pinned)", root.to_string().c_str(),
               pinned.size());

    ProvisionalGraph out;
    Traversal traversal(source_, options_, out.capabilities);
    WEAVE_TRY(traversal.run(root, pinned));

    // Workers have stopped; the table is ours alone from here on
    auto& records = traversal.table().nodes();

    // Canonical order: root first, the rest by (module, version, variant)
    std::vector<NodeId> order(records.size());
    for (NodeId i = 0; i < order.size(); ++i) order[i] = i;
    std::sort(order.begin() + 1, order.end(), [&](NodeId a, NodeId b) {
        return records[a].ref < records[b].ref;
    });
    std::vector<NodeId> old_to_new(records.size());
    for (NodeId i = 0; i < order.size(); ++i) old_to_new[order[i]] = i;

    out.capabilities.remap(old_to_new, std::numeric_limits<NodeId>::max());

    for (NodeId old : order) {
        out.graph.add_node(GraphNode{records[old].ref, records[old].capabilities});
    }
    for (NodeId old : order) {
        auto edges = records[old].edges;
        std::sort(edges.begin(), edges.end());
        for (const auto& [decl, to] : edges) {
            out.graph.add_edge(old_to_new[old], old_to_new[to],
                               GraphEdge{records[old].dependencies[decl], decl});
        }
    }
    out.root = 0;

    std::vector<bool> everything(out.graph.node_count(), true);
    out.conflicts = find_module_cycles(out.graph, everything);
    for (const auto& c : out.conflicts) {
        log::debug("%s", c.describe().c_str());
    }

    auto unresolved = traversal.table().unresolved();
    for (auto& u : unresolved) u.from = old_to_new[u.from];
    std::sort(unresolved.begin(), unresolved.end(),
              [](const UnresolvedEdge& a, const UnresolvedEdge& b) {
                  return std::tie(a.from, a.declaration) < std::tie(b.from, b.declaration);
              });
    for (const auto& u : unresolved) {
        Conflict c;
        c.kind = ConflictKind::UnresolvedSelector;
        c.subject = u.selector;
        c.participants.push_back({u.from, out.graph.node(u.from).ref});
        c.reason = u.message;
        out.conflicts.push_back(std::move(c));
    }

    log::debug("built %zu node(s), %zu edge(s) for %s",
               out.graph.node_count(), out.graph.edge_count(),
               root.to_string().c_str());
    return Result<ProvisionalGraph>::ok(std::move(out));
}

} // namespace weave
