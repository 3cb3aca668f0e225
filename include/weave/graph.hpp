#pragma once

#include <algorithm>
#include <functional>
#include <queue>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace weave {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph over a flat node table.
// Edges refer to nodes by index; nothing owns anything but the table, so
// cycles are representable.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    size_t edge_count() const {
        size_t n = 0;
        for (const auto& edges : adj_) n += edges.size();
        return n;
    }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }
    std::vector<Edge>& successors(NodeId id) { return adj_[id]; }

    // Nodes reachable from root (root included), in BFS order.
    std::vector<NodeId> reachable_from(NodeId root) const {
        std::vector<NodeId> order;
        std::vector<bool> seen(nodes_.size(), false);
        std::queue<NodeId> bfs;
        bfs.push(root);
        seen[root] = true;
        while (!bfs.empty()) {
            NodeId u = bfs.front();
            bfs.pop();
            order.push_back(u);
            for (const auto& e : adj_[u]) {
                if (!seen[e.to]) {
                    seen[e.to] = true;
                    bfs.push(e.to);
                }
            }
        }
        return order;
    }

    // Tarjan's algorithm. Returns only the components that form a cycle
    // (more than one node, or a single node with a self-edge). Each
    // component is sorted, and components are ordered by their first id.
    std::vector<std::vector<NodeId>> cycles() const {
        size_t n = nodes_.size();
        std::vector<long> index(n, -1);
        std::vector<long> low(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<NodeId> stack;
        std::vector<std::vector<NodeId>> out;
        long counter = 0;

        // Iterative to survive deep chains
        struct Frame { NodeId node; size_t next_edge; };
        for (NodeId start = 0; start < n; ++start) {
            if (index[start] >= 0) continue;
            std::vector<Frame> frames{{start, 0}};
            index[start] = low[start] = counter++;
            stack.push_back(start);
            on_stack[start] = true;

            while (!frames.empty()) {
                Frame& f = frames.back();
                if (f.next_edge < adj_[f.node].size()) {
                    NodeId w = adj_[f.node][f.next_edge++].to;
                    if (index[w] < 0) {
                        index[w] = low[w] = counter++;
                        stack.push_back(w);
                        on_stack[w] = true;
                        frames.push_back({w, 0});
                    } else if (on_stack[w]) {
                        low[f.node] = std::min(low[f.node], index[w]);
                    }
                    continue;
                }

                NodeId v = f.node;
                frames.pop_back();
                if (!frames.empty()) {
                    NodeId parent = frames.back().node;
                    low[parent] = std::min(low[parent], low[v]);
                }
                if (low[v] != index[v]) continue;

                std::vector<NodeId> comp;
                NodeId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    comp.push_back(w);
                } while (w != v);

                if (comp.size() > 1 || has_edge(v, v)) {
                    std::sort(comp.begin(), comp.end());
                    out.push_back(std::move(comp));
                }
            }
        }

        std::sort(out.begin(), out.end());
        return out;
    }

    // Tree display: format the dependency tree as a string.
    // to_string_fn converts NodeData to a display string.
    std::string tree_display(
        NodeId root,
        std::function<std::string(const NodeData&)> to_string_fn) const
    {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, visited, to_string_fn, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        std::unordered_set<NodeId>& visited,
        std::function<std::string(const NodeData&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!prefix.empty()) {
            out << (is_last ? "\\--- " : "+--- ");
        }
        out << to_string_fn(nodes_[u]);

        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            std::string child_prefix = prefix;
            if (prefix.empty()) {
                child_prefix = " ";
            } else {
                child_prefix += (is_last ? "     " : "|    ");
            }
            tree_display_impl(edges[i].to, child_prefix,
                              i == edges.size() - 1,
                              visited, to_string_fn, out);
        }
    }
};

// ---------------------------------------------------------------------------
// GraphMap: string-keyed wrapper. Used for the module-level view of a
// resolution graph, where several versions collapse into one key.
// ---------------------------------------------------------------------------

template<typename EdgeData = std::monostate>
class GraphMap {
public:
    using NodeId = typename Graph<std::string, EdgeData>::NodeId;

    NodeId add_node(const std::string& name) {
        auto it = name_to_id_.find(name);
        if (it != name_to_id_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        name_to_id_[name] = id;
        return id;
    }

    NodeId node_id(const std::string& name) const {
        return name_to_id_.at(name);
    }

    // Parallel edges between the same pair are stored once
    void add_edge(const std::string& from, const std::string& to,
                  EdgeData data = {}) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        if (graph_.has_edge(f, t)) return;
        graph_.add_edge(f, t, std::move(data));
    }

    // Cyclic components by name, each sorted, ordered lexically
    std::vector<std::vector<std::string>> cycles() const {
        std::vector<std::vector<std::string>> out;
        for (const auto& comp : graph_.cycles()) {
            std::vector<std::string> names;
            for (auto id : comp) names.push_back(graph_.node(id));
            std::sort(names.begin(), names.end());
            out.push_back(std::move(names));
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    size_t node_count() const { return graph_.node_count(); }

    const Graph<std::string, EdgeData>& inner() const { return graph_; }

private:
    Graph<std::string, EdgeData> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;
};

} // namespace weave
