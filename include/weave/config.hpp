#pragma once

#include <weave/result.hpp>
#include <weave/log.hpp>
#include <weave/resolver.hpp>

#include <map>
#include <optional>
#include <string>

namespace weave {

// Layered configuration: global > project > local.
// Later layers override only the fields they set explicitly.
struct Config {
    size_t jobs = 1;
    bool fail_fast = false;
    std::string capability_policy = "reject";   // reject | highest-version | rules
    std::string loser_edges = "redirect";       // redirect | drop
    // capability id -> winning module id, for the "rules" policy
    std::map<std::string, std::string> capability_rules;

    log::Level log_level = log::Info;
    bool log_color = false;

    // Track which fields were explicitly set (for merge)
    bool jobs_set = false;
    bool fail_fast_set = false;
    bool capability_policy_set = false;
    bool loser_edges_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& local);

    // Options for a resolution run; fails on an unknown policy name or a
    // malformed rule
    Result<ResolveOptions> resolve_options() const;

    // Push the explicitly set log level and color into weave::log
    void apply_logging() const;
};

// Discover the global config file path: ~/.weave/config.toml
std::string global_config_path();

} // namespace weave
