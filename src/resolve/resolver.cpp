#include <weave/resolver.hpp>
#include <weave/conflict_detector.hpp>
#include <weave/log.hpp>
#include <weave/parallel.hpp>

#include <optional>
#include <set>

namespace weave {

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::Idle:      return "idle";
        case RunState::Building:  return "building";
        case RunState::Detecting: return "detecting";
        case RunState::Resolving: return "resolving";
        case RunState::Succeeded: return "succeeded";
        case RunState::Failed:    return "failed";
    }
    return "unknown";
}

ResolutionRun::ResolutionRun(const MetadataSource& source, VariantRef root,
                             ResolveOptions options)
    : source_(source), root_(std::move(root)), options_(std::move(options)) {}

void ResolutionRun::transition(RunState next) {
    log::debug("%s: %s -> %s", root_.to_string().c_str(),
               run_state_name(state_), run_state_name(next));
    state_ = next;
}

Result<ResolutionResult> ResolutionRun::run() {
    if (state_ != RunState::Idle) {
        return WeaveError{WeaveError::State,
            "resolution of " + root_.to_string() + " already ran (" +
            run_state_name(state_) + ")",
            "start a new run to resolve again"};
    }

    GraphBuilder builder(source_, options_.build);
    ConflictResolver resolver(options_.policy);
    std::set<VariantRef> pinned;

    while (true) {
        transition(RunState::Building);
        std::vector<VariantRef> extra(pinned.begin(), pinned.end());
        auto built = builder.build(root_, extra);
        if (built.is_err()) {
            transition(RunState::Failed);
            return std::move(built).error();
        }
        ProvisionalGraph graph = std::move(built).value();

        transition(RunState::Detecting);
        auto conflicts = ConflictDetector{}.detect(graph);
        log::debug("%zu conflict(s) in %s", conflicts.size(), root_.to_string().c_str());

        transition(RunState::Resolving);
        auto wanted = declared_only(resolver.wanted_variants(graph, conflicts));
        if (wanted.is_err()) {
            transition(RunState::Failed);
            return std::move(wanted).error();
        }
        size_t before = pinned.size();
        pinned.insert(wanted.value().begin(), wanted.value().end());
        if (pinned.size() != before) {
            log::debug("%s: rebuilding with %zu pinned variant(s)",
                       root_.to_string().c_str(), pinned.size());
            continue;
        }

        ResolutionResult result = resolver.resolve(std::move(graph), std::move(conflicts));
        transition(result.ok() ? RunState::Succeeded : RunState::Failed);
        return Result<ResolutionResult>::ok(std::move(result));
    }
}

Result<std::vector<VariantRef>> ResolutionRun::declared_only(
    const std::vector<VariantRef>& wanted) const
{
    std::vector<VariantRef> out;
    for (const auto& ref : wanted) {
        auto deps = source_.declared_dependencies(ref);
        if (deps.is_ok()) {
            out.push_back(ref);
        } else if (deps.error().code != WeaveError::NotFound) {
            return std::move(deps).error();
        }
    }
    return Result<std::vector<VariantRef>>::ok(std::move(out));
}

Result<ResolutionResult> resolve(const MetadataSource& source, const VariantRef& root,
                                 const ResolveOptions& options) {
    ResolutionRun run(source, root, options);
    return run.run();
}

Result<std::vector<ConfigurationResult>> resolve_all(
    const MetadataSource& source,
    const std::vector<ConfigurationRequest>& requests,
    const ResolveOptions& options,
    size_t jobs)
{
    // Each slot is written by exactly one task
    std::vector<std::optional<Result<ResolutionResult>>> slots(requests.size());
    std::vector<size_t> indices(requests.size());
    for (size_t i = 0; i < indices.size(); ++i) indices[i] = i;

    auto status = parallel_run(indices, jobs, [&](size_t i) {
        log::debug("resolving configuration '%s'", requests[i].name.c_str());
        slots[i].emplace(resolve(source, requests[i].root, options));
    });
    if (status.is_err()) return std::move(status).error();

    std::vector<ConfigurationResult> out;
    out.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); ++i) {
        out.push_back(ConfigurationResult{requests[i].name, std::move(*slots[i])});
    }
    return Result<std::vector<ConfigurationResult>>::ok(std::move(out));
}

} // namespace weave
