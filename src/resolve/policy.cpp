#include <weave/policy.hpp>

namespace weave {

namespace {

struct Chooser {
    const std::string& capability_id;
    const std::vector<CapabilityCandidate>& candidates;

    std::optional<size_t> operator()(const RejectAll&) const {
        return std::nullopt;
    }

    std::optional<size_t> operator()(const HighestCapabilityVersion&) const {
        std::optional<size_t> best;
        std::optional<Version> best_version;
        bool tied = false;
        for (size_t i = 0; i < candidates.size(); ++i) {
            auto v = Version::parse(candidates[i].capability.version.empty()
                                        ? std::string("unspecified")
                                        : candidates[i].capability.version);
            if (v.is_err()) return std::nullopt;
            if (!best_version) {
                best = i;
                best_version = v.value();
                continue;
            }
            auto c = Version::compare(v.value(), *best_version);
            if (!c) return std::nullopt;
            if (*c > 0) {
                best = i;
                best_version = v.value();
                tied = false;
            } else if (*c == 0 && candidates[i].ref.module != candidates[*best].ref.module) {
                tied = true;
            }
        }
        if (tied) return std::nullopt;
        return best;
    }

    std::optional<size_t> operator()(const ExplicitRules& rules) const {
        auto it = rules.winners.find(capability_id);
        if (it == rules.winners.end()) return std::nullopt;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (candidates[i].ref.module == it->second) return i;
        }
        return std::nullopt;
    }
};

struct Namer {
    std::string operator()(const RejectAll&) const { return "reject"; }
    std::string operator()(const HighestCapabilityVersion&) const { return "highest-version"; }
    std::string operator()(const ExplicitRules&) const { return "rules"; }
};

} // namespace

std::optional<size_t> CapabilityPolicy::choose(
    const std::string& capability_id,
    const std::vector<CapabilityCandidate>& candidates) const
{
    if (candidates.empty()) return std::nullopt;
    return std::visit(Chooser{capability_id, candidates}, kind);
}

std::string CapabilityPolicy::name() const {
    return std::visit(Namer{}, kind);
}

Result<LoserEdges> parse_loser_edges(const std::string& s) {
    if (s == "redirect") return Result<LoserEdges>::ok(LoserEdges::Redirect);
    if (s == "drop") return Result<LoserEdges>::ok(LoserEdges::Drop);
    return WeaveError{WeaveError::Config,
        "unknown loser-edges mode '" + s + "'",
        "expected 'redirect' or 'drop'"};
}

} // namespace weave
