#include <weave/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace weave {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeaveError{WeaveError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [resolution] section
    if (auto res = doc["resolution"].as_table()) {
        if (auto v = (*res)["jobs"].value<int64_t>()) {
            if (*v < 0) {
                return WeaveError{WeaveError::Config,
                    "resolution.jobs must not be negative",
                    "use 0 for one job per hardware thread"};
            }
            cfg.jobs = static_cast<size_t>(*v);
            cfg.jobs_set = true;
        }
        if (auto v = (*res)["fail-fast"].value<bool>()) {
            cfg.fail_fast = *v;
            cfg.fail_fast_set = true;
        }
        if (auto v = (*res)["capability-policy"].value<std::string>()) {
            cfg.capability_policy = *v;
            cfg.capability_policy_set = true;
        }
        if (auto v = (*res)["loser-edges"].value<std::string>()) {
            cfg.loser_edges = *v;
            cfg.loser_edges_set = true;
        }
    }

    // [capabilities] section: "group:name" = "group:name"
    if (auto caps = doc["capabilities"].as_table()) {
        for (const auto& [key, val] : *caps) {
            auto s = val.value<std::string>();
            if (!s) {
                return WeaveError{WeaveError::Config,
                    "capability rule '" + std::string(key) + "' must be a string",
                    "write the winning module as \"group:name\""};
            }
            cfg.capability_rules[std::string(key)] = *s;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto level = log::parse_level(*v);
            if (level.is_err()) return level.error();
            cfg.log_level = level.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeaveError{WeaveError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err() && r.error().file.empty()) r.error().file = path;
    return r;
}

void Config::merge(const Config& other) {
    if (other.jobs_set) {
        jobs = other.jobs;
        jobs_set = true;
    }
    if (other.fail_fast_set) {
        fail_fast = other.fail_fast;
        fail_fast_set = true;
    }
    if (other.capability_policy_set) {
        capability_policy = other.capability_policy;
        capability_policy_set = true;
    }
    if (other.loser_edges_set) {
        loser_edges = other.loser_edges;
        loser_edges_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }

    // Rules: other overrides this per capability
    for (const auto& [k, v] : other.capability_rules) {
        capability_rules[k] = v;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

Result<ResolveOptions> Config::resolve_options() const {
    ResolveOptions opts;
    opts.build.jobs = jobs;
    opts.build.fail_fast = fail_fast;

    auto edges = parse_loser_edges(loser_edges);
    if (edges.is_err()) return edges.error();
    opts.policy.loser_edges = edges.value();

    if (capability_policy == "reject") {
        opts.policy.kind = RejectAll{};
    } else if (capability_policy == "highest-version") {
        opts.policy.kind = HighestCapabilityVersion{};
    } else if (capability_policy == "rules") {
        ExplicitRules rules;
        for (const auto& [cap, module] : capability_rules) {
            auto id = Capability::parse(cap);
            if (id.is_err()) return id.error();
            auto winner = ModuleId::parse(module);
            if (winner.is_err()) return winner.error();
            rules.winners[id.value().id()] = winner.value();
        }
        opts.policy.kind = std::move(rules);
    } else {
        return WeaveError{WeaveError::Config,
            "unknown capability policy '" + capability_policy + "'",
            "expected 'reject', 'highest-version' or 'rules'"};
    }
    return Result<ResolveOptions>::ok(std::move(opts));
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.weave/config.toml";
}

} // namespace weave
