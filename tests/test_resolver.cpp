#include <catch2/catch.hpp>
#include <weave/resolver.hpp>
#include "fixtures.hpp"

using namespace weave;
using namespace weave::fixtures;

static ResolutionResult run_resolution(const MetadataSource& src, ResolveOptions opts = {},
                                       const VariantRef& root = project_ref("test", "api")) {
    auto r = resolve(src, root, opts);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static ResolveOptions rules_policy(const std::string& capability, const std::string& winner,
                                   LoserEdges edges = LoserEdges::Redirect) {
    ExplicitRules rules;
    rules.winners[capability] = mid(winner);
    ResolveOptions opts;
    opts.policy = CapabilityPolicy{rules, edges};
    return opts;
}

static ResolveOptions highest_policy(LoserEdges edges = LoserEdges::Redirect) {
    ResolveOptions opts;
    opts.policy = CapabilityPolicy{HighestCapabilityVersion{}, edges};
    return opts;
}

static std::vector<std::string> node_names(const ResolutionResult& r) {
    std::vector<std::string> out;
    for (NodeId id = 0; id < r.node_count(); ++id) out.push_back(r.node(id).ref.display());
    return out;
}

// Root project and project b both claim org:capability on their api variants
static InMemoryMetadataSource shared_capability_source() {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {project_dep("test:b", "api")},
                                      {cap("org:capability:1.0")})}));
    add(src, project("test:b", {variant("api", {}, {cap("org:capability:1.0")})}));
    return src;
}

// ===== Capability conflicts =====

TEST_CASE("shared capability without a rule fails", "[resolver]") {
    auto src = shared_capability_source();
    auto r = run_resolution(src);

    REQUIRE(r.status() == ResolutionStatus::Failure);
    REQUIRE(r.failure_cause() ==
        "Cannot choose between :test:unspecified and test:b:unspecified "
        "because they provide the same capability: org:capability:1.0");
    REQUIRE(r.to_error().code == WeaveError::CapabilityConflict);

    // A failed result holds the root alone
    REQUIRE(r.node_count() == 1);
    REQUIRE(r.node(r.root()).ref == project_ref("test", "api"));
    REQUIRE(r.unresolved_conflicts().size() == 1);
}

TEST_CASE("capability declared by one module only", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {project_dep("test:b", "api")})}));
    add(src, project("test:b", {variant("api", {}, {cap("org:capability:1.0")})}));

    auto r = run_resolution(src);
    REQUIRE(r.ok());
    REQUIRE(node_names(r) == std::vector<std::string>{":test:unspecified", "test:b:unspecified"});
    REQUIRE(r.dependencies_of(0) == std::vector<NodeId>{1});
    REQUIRE(r.conflicts().empty());
    REQUIRE(r.failure_cause().empty());
}

TEST_CASE("explicit rule keeps the root and redirects away from b", "[resolver]") {
    auto src = shared_capability_source();
    auto r = run_resolution(src, rules_policy("org:capability", "test"));

    REQUIRE(r.ok());
    REQUIRE(r.node_count() == 1);
    REQUIRE_FALSE(r.find(mid("test:b")).has_value());
    REQUIRE(r.dependencies_of(0).empty());

    REQUIRE(r.conflicts().size() == 1);
    const auto& c = r.conflicts()[0];
    REQUIRE(c.resolved);
    REQUIRE(c.winner->module == mid("test"));
    REQUIRE(c.describe() ==
        "Capability org:capability:1.0 is provided by :test:unspecified and "
        "test:b:unspecified; selected :test:unspecified "
        "(chosen by capability policy 'rules')");
}

TEST_CASE("explicit rule in drop mode records the dropped edge", "[resolver]") {
    auto src = shared_capability_source();
    auto r = run_resolution(src, rules_policy("org:capability", "test", LoserEdges::Drop));

    REQUIRE(r.ok());
    REQUIRE(r.node_count() == 1);
    const auto& c = r.conflicts()[0];
    REQUIRE(c.dropped_edges.size() == 1);
    REQUIRE(c.dropped_edges[0].from == project_ref("test", "api"));
    REQUIRE(c.dropped_edges[0].to.module == mid("test:b"));
}

TEST_CASE("the root variant cannot be evicted", "[resolver]") {
    auto src = shared_capability_source();
    auto r = run_resolution(src, rules_policy("org:capability", "test:b"));

    REQUIRE_FALSE(r.ok());
    REQUIRE(r.conflicts()[0].reason == "the root variant cannot be evicted");
    REQUIRE(r.to_error().code == WeaveError::CapabilityConflict);
}

static InMemoryMetadataSource two_loggers() {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:a"), dep("org:user")})}));
    ModuleSpec a = lib("org:a", "1.0");
    a.variants[0].capabilities = {cap("org:log:1.0")};
    add(src, a);
    ModuleSpec b = lib("org:b", "1.0");
    b.variants[0].capabilities = {cap("org:log:2.0")};
    add(src, b);
    add(src, lib("org:user", "1.0", {dep("org:b")}));
    return src;
}

TEST_CASE("redirected edges point at the winner", "[resolver]") {
    auto src = two_loggers();
    auto r = run_resolution(src, highest_policy());

    REQUIRE(r.ok());
    REQUIRE(node_names(r) == std::vector<std::string>{
        ":test:unspecified", "org:b:1.0", "org:user:1.0"});
    REQUIRE(r.dependencies_of(0) == std::vector<NodeId>{1, 2});
    REQUIRE(r.dependencies_of(2) == std::vector<NodeId>{1});
    REQUIRE(r.check_invariants().is_ok());
}

TEST_CASE("dropped edges leave the winner where it was", "[resolver]") {
    auto src = two_loggers();
    auto r = run_resolution(src, highest_policy(LoserEdges::Drop));

    REQUIRE(r.ok());
    REQUIRE(node_names(r) == std::vector<std::string>{
        ":test:unspecified", "org:b:1.0", "org:user:1.0"});
    REQUIRE(r.dependencies_of(0) == std::vector<NodeId>{2});
    REQUIRE(r.conflicts()[0].dropped_edges.size() == 1);
}

TEST_CASE("a redirect that closes a loop fails", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:a"), dep("org:b")})}));
    ModuleSpec a = lib("org:a", "1.0");
    a.variants[0].capabilities = {cap("org:log:1.0")};
    add(src, a);
    ModuleSpec b = lib("org:b", "1.0", {dep("org:c")});
    b.variants[0].capabilities = {cap("org:log:2.0")};
    add(src, b);
    add(src, lib("org:c", "1.0", {dep("org:a")}));

    auto r = run_resolution(src, highest_policy());
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.to_error().code == WeaveError::CycleDetected);
    REQUIRE(r.failure_cause() == "Dependency cycle detected: org:b -> org:c -> org:b");
}

TEST_CASE("failure names only owners that survived version selection", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:x", "1.0"), dep("org:y"), dep("org:z")})}));
    ModuleSpec x1 = lib("org:x", "1.0");
    x1.variants = {variant("default", {}, {cap("org:cap:3.0")})};
    add(src, x1);
    ModuleSpec x2 = lib("org:x", "2.0");
    x2.variants = {variant("default", {}, {cap("org:cap:1.0")})};
    add(src, x2);
    add(src, lib("org:y", "1.0", {dep("org:x", "2.0")}));
    ModuleSpec z = lib("org:z", "1.0");
    z.variants = {variant("default", {}, {cap("org:cap:1.0")})};
    add(src, z);

    auto r = run_resolution(src);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.failure_cause() ==
        "Cannot choose between org:x:2.0 and org:z:1.0 "
        "because they provide the same capability: org:cap:1.0");
    REQUIRE(r.to_error().code == WeaveError::CapabilityConflict);
}

TEST_CASE("capability conflict settled by version selection", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:a", "1.0"), dep("org:y"), dep("org:l")})}));
    ModuleSpec a1 = lib("org:a", "1.0");
    a1.variants[0].capabilities = {cap("org:a:1.0"), cap("org:log:1.0")};
    add(src, a1);
    add(src, lib("org:a", "2.0"));
    add(src, lib("org:y", "1.0", {dep("org:a", "2.0")}));
    ModuleSpec l = lib("org:l", "1.0");
    l.variants[0].capabilities = {cap("org:log:1.0")};
    add(src, l);

    auto r = run_resolution(src);
    REQUIRE(r.ok());
    REQUIRE(r.node(*r.find(mid("org:a"))).ref.version == ver("2.0"));

    const Conflict* capability = nullptr;
    for (const auto& c : r.conflicts()) {
        if (c.kind == ConflictKind::Capability) capability = &c;
    }
    REQUIRE(capability != nullptr);
    REQUIRE(capability->resolved);
    REQUIRE(capability->winner->module == mid("org:l"));
}

// ===== Version conflicts =====

TEST_CASE("highest requested version wins", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:x", "1.0"), dep("org:y")})}));
    add(src, lib("org:x", "1.0"));
    add(src, lib("org:x", "2.0"));
    add(src, lib("org:y", "1.0", {dep("org:x", "2.0")}));

    auto r = run_resolution(src);
    REQUIRE(r.ok());
    REQUIRE(node_names(r) == std::vector<std::string>{
        ":test:unspecified", "org:x:2.0", "org:y:1.0"});
    // The edge that asked for 1.0 now points at 2.0
    REQUIRE(r.dependencies_of(0) == std::vector<NodeId>{1, 2});
    REQUIRE(r.dependencies_of(2) == std::vector<NodeId>{1});

    REQUIRE(r.conflicts().size() == 1);
    REQUIRE(r.conflicts()[0].describe() == "Conflict on org:x: requested 1.0, 2.0; selected 2.0");
}

TEST_CASE("a version requested only from an evicted node does not win", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api",
        {dep("org:a", "1.0"), dep("org:b", "1.0"), dep("org:c", "1.0")})}));
    add(src, lib("org:a", "1.0", {dep("org:c", "2.0")}));
    add(src, lib("org:a", "2.0"));
    add(src, lib("org:b", "1.0", {dep("org:a", "2.0")}));
    add(src, lib("org:c", "1.0"));
    add(src, lib("org:c", "2.0"));

    auto r = run_resolution(src);
    REQUIRE(r.ok());
    REQUIRE(r.node(*r.find(mid("org:a"))).ref.version == ver("2.0"));
    REQUIRE(r.node(*r.find(mid("org:c"))).ref.version == ver("1.0"));
    REQUIRE(r.node_count() == 4);
}

TEST_CASE("unordered versions fail the run", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:x", "unspecified"), dep("org:x", "1.0")})}));
    ModuleSpec odd = lib("org:x", "1.0");
    odd.version = Version::unspecified();
    add(src, odd);
    add(src, lib("org:x", "1.0"));

    auto r = run_resolution(src);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.to_error().code == WeaveError::VersionConflict);
    REQUIRE(r.failure_cause() ==
        "Conflict on org:x: requested unspecified, 1.0; "
        "versions unspecified and 1.0 cannot be ordered");
}

// Root asks for org:x:1.0(api), org:y asks for 2.0. Both versions declare
// api and runtime unless `x2_variants` says otherwise.
static InMemoryMetadataSource two_variant_versions(
    std::vector<Dependency> y_deps,
    std::vector<VariantSpec> x2_variants = {variant("api"), variant("runtime")}) {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:x", "1.0", "api"), dep("org:y")})}));
    ModuleSpec x1 = lib("org:x", "1.0");
    x1.variants = {variant("api"), variant("runtime")};
    add(src, x1);
    ModuleSpec x2 = lib("org:x", "2.0");
    x2.variants = std::move(x2_variants);
    add(src, x2);
    add(src, lib("org:y", "1.0", std::move(y_deps)));
    add(src, lib("org:z", "1.0"));
    return src;
}

static std::vector<std::string> variant_names(const ResolutionResult& r) {
    std::vector<std::string> out;
    for (NodeId id = 0; id < r.node_count(); ++id) out.push_back(r.node(id).ref.to_string());
    return out;
}

TEST_CASE("redirect keeps the requested variant", "[resolver]") {
    auto src = two_variant_versions({dep("org:x", "2.0", "runtime"), dep("org:x", "2.0", "api")});
    auto r = run_resolution(src);
    REQUIRE(r.ok());
    REQUIRE(variant_names(r) == std::vector<std::string>{
        ":test:unspecified(api)", "org:x:2.0(api)", "org:x:2.0(runtime)", "org:y:1.0(default)"});
    REQUIRE(r.dependencies_of(0) == std::vector<NodeId>{1, 3});
}

TEST_CASE("redirect adds the requested variant of the selected version", "[resolver]") {
    // Only org:x:2.0(runtime) is requested directly; api has to be added
    auto src = two_variant_versions({dep("org:x", "2.0", "runtime")},
                                    {variant("api", {dep("org:z")}), variant("runtime")});
    for (size_t jobs : {1, 4}) {
        ResolveOptions opts;
        opts.build.jobs = jobs;
        auto r = run_resolution(src, opts);
        REQUIRE(r.ok());
        REQUIRE(variant_names(r) == std::vector<std::string>{
            ":test:unspecified(api)", "org:x:2.0(api)", "org:x:2.0(runtime)",
            "org:y:1.0(default)", "org:z:1.0(default)"});
        REQUIRE(r.dependencies_of(0) == std::vector<NodeId>{1, 3});
        // The added variant brings its own dependencies along
        REQUIRE(r.dependencies_of(1) == std::vector<NodeId>{4});
        REQUIRE(r.dependencies_of(3) == std::vector<NodeId>{2});
    }
}

TEST_CASE("redirect falls back when the selected version lacks the variant", "[resolver]") {
    auto src = two_variant_versions({dep("org:x", "2.0", "runtime")}, {variant("runtime")});
    auto r = run_resolution(src);
    REQUIRE(r.ok());
    REQUIRE(variant_names(r) == std::vector<std::string>{
        ":test:unspecified(api)", "org:x:2.0(runtime)", "org:y:1.0(default)"});
    REQUIRE(r.dependencies_of(0) == std::vector<NodeId>{1, 2});

    const Conflict* version = nullptr;
    for (const auto& c : r.conflicts()) {
        if (c.kind == ConflictKind::Version) version = &c;
    }
    REQUIRE(version != nullptr);
    REQUIRE(version->resolved);
    REQUIRE(version->reason.find("org:x:2.0 has no variant 'api'") != std::string::npos);
}

// ===== Cycles and unresolved selectors =====

TEST_CASE("cycles fail the run", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:a")})}));
    add(src, lib("org:a", "1.0", {dep("org:b")}));
    add(src, lib("org:b", "1.0", {dep("org:a")}));

    auto r = run_resolution(src);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.to_error().code == WeaveError::CycleDetected);
    REQUIRE(r.failure_cause() == "Dependency cycle detected: org:a -> org:b -> org:a");
}

TEST_CASE("unresolved selector fails the run", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:missing", "^3.0")})}));

    auto r = run_resolution(src);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.to_error().code == WeaveError::UnresolvedSelector);
    REQUIRE(r.failure_cause().find("Could not resolve org:missing:^3.0") == 0);
}

TEST_CASE("unresolved selector of an evicted node is forgiven", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:x", "1.0"), dep("org:y")})}));
    add(src, lib("org:x", "1.0", {dep("org:missing")}));
    add(src, lib("org:x", "2.0"));
    add(src, lib("org:y", "1.0", {dep("org:x", "2.0")}));

    auto r = run_resolution(src);
    REQUIRE(r.ok());
    REQUIRE(r.node_count() == 3);
    REQUIRE(r.conflicts()[0].kind == ConflictKind::UnresolvedSelector);
    REQUIRE(r.conflicts()[0].resolved);
}

TEST_CASE("failures report every unresolved conflict", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api", {dep("org:gone"), dep("org:lost")},
                                      {cap("org:capability:1.0")})}));

    auto r = run_resolution(src);
    REQUIRE(r.unresolved_conflicts().size() == 2);
    REQUIRE(r.failure_cause() ==
        "Could not resolve org:gone required by :test:unspecified (no module named org:gone)\n"
        "Could not resolve org:lost required by :test:unspecified (no module named org:lost)");
}

// ===== Whole runs =====

TEST_CASE("results do not depend on the number of jobs", "[resolver]") {
    InMemoryMetadataSource src;
    std::vector<Dependency> root_deps;
    for (int i = 0; i < 10; ++i) {
        std::string name = "org:m" + std::to_string(i);
        root_deps.push_back(dep(name));
        std::vector<Dependency> deps{dep("org:base", std::to_string(1 + i % 3) + ".0")};
        if (i + 1 < 10) deps.push_back(dep("org:m" + std::to_string(i + 1)));
        ModuleSpec m = lib(name, "1.0", deps);
        if (i % 4 == 0) m.variants[0].capabilities = {cap(name + ":1.0"), cap("org:log:1." + std::to_string(i))};
        add(src, m);
    }
    add(src, lib("org:base", "1.0"));
    add(src, lib("org:base", "2.0"));
    add(src, lib("org:base", "3.0"));
    add(src, project("test", {variant("api", root_deps)}));

    auto describe = [](const ResolutionResult& r) {
        std::string s = r.ok() ? "ok\n" : "failed\n";
        for (NodeId id = 0; id < r.node_count(); ++id) {
            s += r.node(id).ref.to_string() + ":";
            for (NodeId to : r.dependencies_of(id)) s += " " + std::to_string(to);
            s += "\n";
        }
        for (const auto& c : r.conflicts()) s += c.describe() + "\n";
        return s;
    };

    ResolveOptions serial = highest_policy();
    auto expected = describe(run_resolution(src, serial));
    REQUIRE(expected.rfind("ok\n", 0) == 0);
    for (size_t jobs : {2, 8}) {
        ResolveOptions opts = highest_policy();
        opts.build.jobs = jobs;
        for (int repeat = 0; repeat < 3; ++repeat) {
            REQUIRE(describe(run_resolution(src, opts)) == expected);
        }
    }
}

TEST_CASE("a run resolves once", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {variant("api")}));

    ResolutionRun run(src, project_ref("test", "api"));
    REQUIRE(run.state() == RunState::Idle);
    auto first = run.run();
    REQUIRE(first.is_ok());
    REQUIRE(run.state() == RunState::Succeeded);

    auto second = run.run();
    REQUIRE(second.is_err());
    REQUIRE(second.error().code == WeaveError::State);
    REQUIRE(run.state() == RunState::Succeeded);
}

TEST_CASE("a run with conflicts ends failed", "[resolver]") {
    auto src = shared_capability_source();
    ResolutionRun run(src, project_ref("test", "api"));
    auto r = run.run();
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().ok());
    REQUIRE(run.state() == RunState::Failed);
}

TEST_CASE("a run whose root is unknown ends failed", "[resolver]") {
    InMemoryMetadataSource src;
    ResolutionRun run(src, project_ref("test", "api"));
    auto r = run.run();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeaveError::NotFound);
    REQUIRE(run.state() == RunState::Failed);
    REQUIRE(std::string(run_state_name(run.state())) == "failed");
}

TEST_CASE("configurations resolve independently", "[resolver]") {
    InMemoryMetadataSource src;
    add(src, project("test", {
        variant("api", {project_dep("test:b", "api")}, {cap("org:capability:1.0")}),
        variant("runtime", {project_dep("test:b", "runtime")})}));
    add(src, project("test:b", {
        variant("api", {}, {cap("org:capability:1.0")}),
        variant("runtime")}));

    std::vector<ConfigurationRequest> requests{
        {"api", project_ref("test", "api")},
        {"runtime", project_ref("test", "runtime")},
        {"test", project_ref("test", "test")},
    };
    auto all = resolve_all(src, requests, ResolveOptions{}, 3);
    REQUIRE(all.is_ok());
    const auto& results = all.value();
    REQUIRE(results.size() == 3);

    REQUIRE(results[0].name == "api");
    REQUIRE(results[0].outcome.is_ok());
    REQUIRE_FALSE(results[0].outcome.value().ok());

    REQUIRE(results[1].name == "runtime");
    REQUIRE(results[1].outcome.is_ok());
    REQUIRE(results[1].outcome.value().ok());
    REQUIRE(results[1].outcome.value().node_count() == 2);

    // An unknown root variant breaks only its own configuration
    REQUIRE(results[2].outcome.is_err());
    REQUIRE(results[2].outcome.error().code == WeaveError::NotFound);
}
