#pragma once

#include <weave/conflict_resolver.hpp>
#include <weave/graph_builder.hpp>
#include <weave/metadata.hpp>
#include <weave/policy.hpp>
#include <weave/resolution.hpp>
#include <weave/result.hpp>

#include <string>
#include <vector>

namespace weave {

struct ResolveOptions {
    BuildOptions build;
    CapabilityPolicy policy;
};

enum class RunState {
    Idle,
    Building,
    Detecting,
    Resolving,
    Succeeded,
    Failed,
};

const char* run_state_name(RunState state);

// One resolution of one root. When version selection needs a variant the
// graph lacks, the run goes back to Building with that variant pinned.
// A finished run never restarts; to retry after the inputs change, make a
// new run.
class ResolutionRun {
public:
    ResolutionRun(const MetadataSource& source, VariantRef root, ResolveOptions options = {});

    ResolutionRun(const ResolutionRun&) = delete;
    ResolutionRun& operator=(const ResolutionRun&) = delete;

    // Build, detect, resolve. A graph that cannot be resolved is still an ok
    // Result holding a Failure; an error means the run itself broke (the
    // metadata source failed, or run() was called twice).
    Result<ResolutionResult> run();

    RunState state() const { return state_; }
    const VariantRef& root() const { return root_; }

private:
    void transition(RunState next);

    // Drop the wanted variants the source does not declare; errors other
    // than NotFound end the run
    Result<std::vector<VariantRef>> declared_only(const std::vector<VariantRef>& wanted) const;

    const MetadataSource& source_;
    VariantRef root_;
    ResolveOptions options_;
    RunState state_ = RunState::Idle;
};

// Shorthand for a single ResolutionRun
Result<ResolutionResult> resolve(const MetadataSource& source, const VariantRef& root,
                                 const ResolveOptions& options = {});

// A named bucket of dependencies, resolved independently of the others
struct ConfigurationRequest {
    std::string name;
    VariantRef root;
};

struct ConfigurationResult {
    std::string name;
    Result<ResolutionResult> outcome;
};

// Resolve every configuration on up to `jobs` threads. Results come back in
// request order; one configuration failing does not affect the others.
Result<std::vector<ConfigurationResult>> resolve_all(
    const MetadataSource& source,
    const std::vector<ConfigurationRequest>& requests,
    const ResolveOptions& options,
    size_t jobs);

} // namespace weave
