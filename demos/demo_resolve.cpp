// demo_resolve.cpp
//
// Resolves every configuration of a catalog file and prints the dependency
// tree and conflict report for each. Run it with:
//
//     ./demo_resolve catalog.toml                 # global config only
//     ./demo_resolve catalog.toml weave.toml      # plus a project config
//     ./demo_resolve catalog.toml weave.toml -v   # with debug logging
//
// Exit status is 0 when every configuration resolved, 1 otherwise.

#include <weave/catalog.hpp>
#include <weave/config.hpp>
#include <weave/log.hpp>
#include <weave/report.hpp>
#include <weave/resolver.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace weave;

struct Args {
    std::string catalog;
    std::string config;
    bool verbose = false;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") {
            args.verbose = true;
        } else if (args.catalog.empty()) {
            args.catalog = a;
        } else if (args.config.empty()) {
            args.config = a;
        } else {
            return WeaveError{WeaveError::InvalidArg,
                "unexpected argument: " + a,
                "usage: demo_resolve <catalog.toml> [config.toml] [-v]"};
        }
    }
    if (args.catalog.empty()) {
        return WeaveError{WeaveError::InvalidArg,
            "no catalog file specified",
            "usage: demo_resolve <catalog.toml> [config.toml] [-v]"};
    }
    return Result<Args>::ok(std::move(args));
}

// Global config if present, then the one named on the command line
Result<Config> load_config(const Args& args) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        WEAVE_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> project;
    if (!args.config.empty()) {
        auto p = Config::load(args.config);
        WEAVE_TRY(p);
        project = std::move(p).value();
    }

    return Result<Config>::ok(Config::effective(global, project, std::nullopt));
}

Result<bool> run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    WEAVE_TRY(args);

    auto config = load_config(args.value());
    WEAVE_TRY(config);
    config.value().apply_logging();
    if (args.value().verbose) log::set_level(log::Debug);

    auto options = config.value().resolve_options();
    WEAVE_TRY(options);

    log::info("loading catalog %s", args.value().catalog.c_str());
    auto catalog = Catalog::load(args.value().catalog);
    WEAVE_TRY(catalog);
    log::info("%zu module(s), %zu configuration(s) of %s",
              catalog.value().source.module_count(),
              catalog.value().configurations.size(),
              catalog.value().root.display().c_str());

    auto results = resolve_all(catalog.value().source, catalog.value().configurations,
                               options.value(), config.value().jobs);
    WEAVE_TRY(results);

    bool all_ok = true;
    for (auto& cfg : results.value()) {
        if (cfg.outcome.is_err()) {
            all_ok = false;
            log::error("configuration '%s' could not run", cfg.name.c_str());
            std::cerr << cfg.outcome.error().format() << "\n";
            continue;
        }
        const ResolutionResult& r = cfg.outcome.value();
        std::cout << render_report(cfg.name, r) << "\n";
        if (!r.ok()) {
            all_ok = false;
            log::error("configuration '%s' failed to resolve", cfg.name.c_str());
        }
    }
    return Result<bool>::ok(all_ok);
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        log::error("resolution aborted");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }
    return result.value() ? 0 : 1;
}
