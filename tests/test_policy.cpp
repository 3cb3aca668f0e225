#include <catch2/catch.hpp>
#include <weave/policy.hpp>
#include "fixtures.hpp"

using namespace weave;
using namespace weave::fixtures;

static CapabilityCandidate candidate(NodeId node, const std::string& module,
                                     const std::string& capability) {
    return CapabilityCandidate{node, ref(module, "1.0"), cap(capability)};
}

TEST_CASE("reject policy never chooses", "[policy]") {
    CapabilityPolicy policy;
    std::vector<CapabilityCandidate> c{candidate(0, "org:a", "org:log:1.0"),
                                       candidate(1, "org:b", "org:log:2.0")};
    REQUIRE_FALSE(policy.choose("org:log", c).has_value());
    REQUIRE(policy.name() == "reject");
}

TEST_CASE("highest capability version wins", "[policy]") {
    CapabilityPolicy policy{HighestCapabilityVersion{}, LoserEdges::Redirect};
    std::vector<CapabilityCandidate> c{candidate(0, "org:a", "org:log:1.2"),
                                       candidate(1, "org:b", "org:log:1.10"),
                                       candidate(2, "org:c", "org:log:1.9")};
    auto pick = policy.choose("org:log", c);
    REQUIRE(pick.has_value());
    REQUIRE(*pick == 1);
    REQUIRE(policy.name() == "highest-version");
}

TEST_CASE("highest capability version tie is no choice", "[policy]") {
    CapabilityPolicy policy{HighestCapabilityVersion{}, LoserEdges::Redirect};
    std::vector<CapabilityCandidate> c{candidate(0, "org:a", "org:log:2.0"),
                                       candidate(1, "org:b", "org:log:2.0")};
    REQUIRE_FALSE(policy.choose("org:log", c).has_value());
}

TEST_CASE("unordered capability versions are no choice", "[policy]") {
    CapabilityPolicy policy{HighestCapabilityVersion{}, LoserEdges::Redirect};
    std::vector<CapabilityCandidate> c{candidate(0, "org:a", "org:log:unspecified"),
                                       candidate(1, "org:b", "org:log:1.0")};
    REQUIRE_FALSE(policy.choose("org:log", c).has_value());
}

TEST_CASE("explicit rule picks the named module", "[policy]") {
    ExplicitRules rules;
    rules.winners["org:capability"] = mid("test");
    CapabilityPolicy policy{rules, LoserEdges::Drop};

    std::vector<CapabilityCandidate> c{candidate(0, "test", "org:capability:1.0"),
                                       candidate(1, "test:b", "org:capability:1.0")};
    auto pick = policy.choose("org:capability", c);
    REQUIRE(pick.has_value());
    REQUIRE(*pick == 0);
    REQUIRE(policy.name() == "rules");

    // No rule for this capability
    REQUIRE_FALSE(policy.choose("org:other", c).has_value());
}

TEST_CASE("explicit rule naming an absent module is no choice", "[policy]") {
    ExplicitRules rules;
    rules.winners["org:capability"] = mid("org:elsewhere");
    CapabilityPolicy policy{rules, LoserEdges::Redirect};
    std::vector<CapabilityCandidate> c{candidate(0, "org:a", "org:capability"),
                                       candidate(1, "org:b", "org:capability")};
    REQUIRE_FALSE(policy.choose("org:capability", c).has_value());
}

TEST_CASE("no candidates is no choice", "[policy]") {
    CapabilityPolicy policy{HighestCapabilityVersion{}, LoserEdges::Redirect};
    REQUIRE_FALSE(policy.choose("org:log", {}).has_value());
}

TEST_CASE("parse loser edge modes", "[policy]") {
    REQUIRE(parse_loser_edges("redirect").value() == LoserEdges::Redirect);
    REQUIRE(parse_loser_edges("drop").value() == LoserEdges::Drop);
    auto bad = parse_loser_edges("keep");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == WeaveError::Config);
}
