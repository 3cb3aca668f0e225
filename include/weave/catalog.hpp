#pragma once

#include <weave/metadata.hpp>
#include <weave/resolver.hpp>
#include <weave/result.hpp>

#include <string>
#include <vector>

namespace weave {

// Module metadata and the configurations to resolve, read from TOML:
//
//   [root]
//   name = "test"
//   configurations = ["api"]
//
//   [[module]]
//   group = "test"
//   name = "b"
//   project = true
//     [[module.variant]]
//     name = "api"
//     capabilities = ["org:capability:1.0"]
//       [[module.variant.dependency]]
//       group = "org"
//       name = "y"
//       version = "^1.0"
//
// Projects may leave the version out ("unspecified"); external modules may
// not. Without `configurations` every variant of the root is resolved.
struct Catalog {
    InMemoryMetadataSource source;
    VariantRef root;    // variant left empty
    std::vector<ConfigurationRequest> configurations;

    static Result<Catalog> load(const std::string& path);
    static Result<Catalog> parse(const std::string& toml_str);
};

} // namespace weave
