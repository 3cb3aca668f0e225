#include <weave/conflict.hpp>

#include <set>

namespace weave {

const char* conflict_kind_name(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::Cycle:              return "cycle";
        case ConflictKind::UnresolvedSelector: return "unresolved";
        case ConflictKind::Version:            return "version";
        case ConflictKind::Capability:         return "capability";
    }
    return "unknown";
}

WeaveError::Code Conflict::error_code() const {
    switch (kind) {
        case ConflictKind::Cycle:              return WeaveError::CycleDetected;
        case ConflictKind::UnresolvedSelector: return WeaveError::UnresolvedSelector;
        case ConflictKind::Version:            return WeaveError::VersionConflict;
        case ConflictKind::Capability:         return WeaveError::CapabilityConflict;
    }
    return WeaveError::State;
}

std::string join_owners(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += (i + 1 == names.size()) ? " and " : ", ";
        out += names[i];
    }
    return out;
}

Capability highest_capability(const std::vector<Capability>& declared) {
    Capability best;
    if (declared.empty()) return best;
    best = declared.front();
    for (const auto& cap : declared) {
        auto a = Version::parse(cap.version);
        auto b = Version::parse(best.version);
        if (a.is_err()) continue;
        if (b.is_err()) {
            best = cap;
            continue;
        }
        auto cmp = Version::compare(a.value(), b.value());
        if (cmp && *cmp > 0) best = cap;
    }
    return best;
}

static std::string describe_capability(const Conflict& c) {
    // One owner per module; variants of the same module print once
    std::vector<std::string> owners;
    std::set<std::string> seen;
    for (const auto& p : c.participants) {
        std::string name = p.ref.display();
        if (seen.insert(name).second) owners.push_back(name);
    }

    if (!c.resolved) {
        return "Cannot choose between " + join_owners(owners) +
               " because they provide the same capability: " +
               c.capability.to_string();
    }
    std::string s = "Capability " + c.capability.to_string() +
                    " is provided by " + join_owners(owners);
    if (c.winner) s += "; selected " + c.winner->display();
    if (!c.reason.empty()) s += " (" + c.reason + ")";
    return s;
}

static std::string describe_version(const Conflict& c) {
    std::vector<std::string> versions;
    std::set<std::string> seen;
    for (const auto& p : c.participants) {
        const std::string& v = p.ref.version.to_string();
        if (seen.insert(v).second) versions.push_back(v);
    }

    std::string s = "Conflict on " + c.subject + ": requested ";
    for (size_t i = 0; i < versions.size(); ++i) {
        if (i > 0) s += ", ";
        s += versions[i];
    }
    if (c.resolved && c.winner) {
        s += "; selected " + c.winner->version.to_string();
    } else if (!c.reason.empty()) {
        s += "; " + c.reason;
    }
    return s;
}

std::string Conflict::describe() const {
    // Raised after the fact, with nothing but a message to show
    if (participants.empty() && cycle.empty() && kind != ConflictKind::UnresolvedSelector) {
        return reason;
    }
    switch (kind) {
    case ConflictKind::Cycle: {
        std::string s = "Dependency cycle detected: ";
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0) s += " -> ";
            s += cycle[i].to_string();
        }
        return s;
    }
    case ConflictKind::UnresolvedSelector: {
        std::string s = "Could not resolve " + subject;
        if (!participants.empty()) {
            s += " required by " + participants.front().ref.display();
        }
        if (!reason.empty()) s += " (" + reason + ")";
        return s;
    }
    case ConflictKind::Version:
        return describe_version(*this);
    case ConflictKind::Capability:
        return describe_capability(*this);
    }
    return reason;
}

} // namespace weave
