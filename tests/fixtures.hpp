#pragma once

#include <catch2/catch.hpp>
#include <weave/metadata.hpp>

#include <string>
#include <vector>

// Shorthand for building metadata in tests

namespace weave {
namespace fixtures {

inline Version ver(const std::string& s) {
    auto r = Version::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

inline ModuleId mid(const std::string& s) {
    auto r = ModuleId::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

inline Capability cap(const std::string& s) {
    auto r = Capability::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

// Dependency on "group:name", optionally constrained to `req`
inline Dependency dep(const std::string& module, const std::string& req = "",
                      const std::string& variant = "") {
    Dependency d;
    d.selector.module = mid(module);
    if (!req.empty()) {
        auto r = VersionReq::parse(req);
        REQUIRE(r.is_ok());
        d.selector.version = r.value();
    }
    d.selector.variant = variant;
    return d;
}

inline Dependency project_dep(const std::string& module, const std::string& variant = "") {
    Dependency d;
    d.selector.module = mid(module);
    d.selector.project = true;
    d.selector.variant = variant;
    return d;
}

inline Dependency excluding(Dependency d, const std::vector<std::string>& rules) {
    for (const auto& r : rules) {
        auto rule = ExcludeRule::parse(r);
        REQUIRE(rule.is_ok());
        d.excludes.push_back(rule.value());
    }
    return d;
}

inline VariantSpec variant(const std::string& name, std::vector<Dependency> deps = {},
                           std::vector<Capability> caps = {}) {
    return VariantSpec{name, std::move(deps), std::move(caps)};
}

// External module with a single "default" variant holding `deps`
inline ModuleSpec lib(const std::string& module, const std::string& version,
                      std::vector<Dependency> deps = {}) {
    ModuleSpec spec;
    spec.id = mid(module);
    spec.version = ver(version);
    spec.variants.push_back(variant("default", std::move(deps)));
    return spec;
}

inline ModuleSpec project(const std::string& module, std::vector<VariantSpec> variants) {
    ModuleSpec spec;
    spec.id = mid(module);
    spec.version = Version::unspecified();
    spec.project = true;
    spec.variants = std::move(variants);
    return spec;
}

inline VariantRef ref(const std::string& module, const std::string& version,
                      const std::string& variant_name = "default") {
    VariantRef r;
    r.module = mid(module);
    r.version = version == "unspecified" ? Version::unspecified() : ver(version);
    r.variant = variant_name;
    return r;
}

inline VariantRef project_ref(const std::string& module, const std::string& variant_name) {
    VariantRef r = ref(module, "unspecified", variant_name);
    r.project = true;
    return r;
}

inline void add(InMemoryMetadataSource& source, ModuleSpec spec) {
    auto s = source.add_module(std::move(spec));
    REQUIRE(s.is_ok());
}

} // namespace fixtures
} // namespace weave
