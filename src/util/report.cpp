#include <weave/report.hpp>

#include <sstream>

namespace weave {

std::string render_tree(const ResolutionResult& result) {
    return result.graph().tree_display(result.root(), [](const ResolvedNode& n) {
        return n.ref.to_string();
    });
}

std::string render_conflicts(const std::vector<Conflict>& conflicts) {
    std::ostringstream out;
    for (const auto& c : conflicts) {
        out << "  [" << conflict_kind_name(c.kind) << "] " << c.describe() << "\n";
        for (const auto& d : c.dropped_edges) {
            out << "      dropped " << d.from.to_string() << " -> " << d.to.to_string() << "\n";
        }
    }
    return out.str();
}

std::string render_report(const std::string& configuration, const ResolutionResult& result) {
    std::ostringstream out;
    out << "configuration '" << configuration << "': ";
    if (result.ok()) {
        out << "resolved " << result.node_count() << " node(s)\n";
        out << render_tree(result);
    } else {
        out << "FAILED\n";
    }

    if (!result.conflicts().empty()) {
        out << "conflicts:\n" << render_conflicts(result.conflicts());
    }
    if (!result.ok()) {
        out << "cause:\n";
        std::istringstream cause(result.failure_cause());
        std::string line;
        while (std::getline(cause, line)) out << "  " << line << "\n";
    }
    return out.str();
}

} // namespace weave
