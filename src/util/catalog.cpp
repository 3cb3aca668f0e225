#include <weave/catalog.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace weave {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<ModuleId> parse_module_id(const toml::table& tbl, const std::string& where) {
    auto name = tbl["name"].value<std::string>();
    if (!name) {
        return WeaveError{WeaveError::Catalog, where + " is missing 'name'"};
    }
    ModuleId id;
    id.group = tbl["group"].value_or(std::string{});
    id.name = *name;
    if (!id.group.empty()) {
        WEAVE_TRY(ModuleId::validate_part(id.group, "group"));
    }
    WEAVE_TRY(ModuleId::validate_part(id.name, "name"));
    return Result<ModuleId>::ok(std::move(id));
}

static Result<std::vector<std::string>> string_array(const toml::table& tbl,
                                                     const char* key,
                                                     const std::string& where) {
    std::vector<std::string> out;
    const auto* node = tbl.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));
    const auto* arr = node->as_array();
    if (!arr) {
        return WeaveError{WeaveError::Catalog,
            where + ": '" + key + "' must be an array of strings"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return WeaveError{WeaveError::Catalog,
                where + ": '" + key + "' must be an array of strings"};
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Result<Dependency> parse_dependency(const toml::table& tbl, const std::string& where) {
    Dependency dep;

    auto id = parse_module_id(tbl, where);
    if (id.is_err()) return std::move(id).error();
    dep.selector.module = std::move(id).value();

    dep.selector.project = tbl["project"].value_or(false);
    dep.selector.variant = tbl["variant"].value_or(std::string{});

    if (auto v = tbl["version"].value<std::string>()) {
        if (dep.selector.project) {
            return WeaveError{WeaveError::Catalog,
                where + ": project dependencies take no version",
                "remove 'version' or set project = false"};
        }
        auto req = VersionReq::parse(*v);
        if (req.is_err()) return std::move(req).error();
        dep.selector.version = std::move(req).value();
    }

    if (auto c = tbl["capability"].value<std::string>()) {
        auto cap = Capability::parse(*c);
        if (cap.is_err()) return std::move(cap).error();
        dep.selector.capability = std::move(cap).value();
    }

    auto excludes = string_array(tbl, "exclude", where);
    if (excludes.is_err()) return std::move(excludes).error();
    for (const auto& e : excludes.value()) {
        auto rule = ExcludeRule::parse(e);
        if (rule.is_err()) return std::move(rule).error();
        dep.excludes.push_back(std::move(rule).value());
    }

    return Result<Dependency>::ok(std::move(dep));
}

static Result<VariantSpec> parse_variant(const toml::table& tbl, const std::string& where) {
    VariantSpec var;
    auto name = tbl["name"].value<std::string>();
    if (!name || name->empty()) {
        return WeaveError{WeaveError::Catalog, where + ": variant is missing 'name'"};
    }
    var.name = *name;
    std::string here = where + "(" + var.name + ")";

    auto caps = string_array(tbl, "capabilities", here);
    if (caps.is_err()) return std::move(caps).error();
    for (const auto& c : caps.value()) {
        auto cap = Capability::parse(c);
        if (cap.is_err()) return std::move(cap).error();
        var.capabilities.push_back(std::move(cap).value());
    }

    if (auto deps = tbl["dependency"].as_array()) {
        for (const auto& elem : *deps) {
            const auto* dt = elem.as_table();
            if (!dt) {
                return WeaveError{WeaveError::Catalog,
                    here + ": each dependency must be a table"};
            }
            auto dep = parse_dependency(*dt, here + " dependency");
            if (dep.is_err()) return std::move(dep).error();
            var.dependencies.push_back(std::move(dep).value());
        }
    }

    return Result<VariantSpec>::ok(std::move(var));
}

static Result<ModuleSpec> parse_module(const toml::table& tbl, size_t index) {
    ModuleSpec spec;
    std::string where = "module #" + std::to_string(index + 1);

    auto id = parse_module_id(tbl, where);
    if (id.is_err()) return std::move(id).error();
    spec.id = std::move(id).value();
    where = spec.id.to_string();

    spec.project = tbl["project"].value_or(false);
    if (auto v = tbl["version"].value<std::string>()) {
        auto ver = Version::parse(*v);
        if (ver.is_err()) return std::move(ver).error();
        spec.version = std::move(ver).value();
    } else if (spec.project) {
        spec.version = Version::unspecified();
    } else {
        return WeaveError{WeaveError::Catalog,
            where + " is missing 'version'",
            "only projects may leave the version unspecified"};
    }
    where += ":" + spec.version.to_string();

    if (auto vars = tbl["variant"].as_array()) {
        for (const auto& elem : *vars) {
            const auto* vt = elem.as_table();
            if (!vt) {
                return WeaveError{WeaveError::Catalog,
                    where + ": each variant must be a table"};
            }
            auto var = parse_variant(*vt, where);
            if (var.is_err()) return std::move(var).error();
            spec.variants.push_back(std::move(var).value());
        }
    }

    return Result<ModuleSpec>::ok(std::move(spec));
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

Result<Catalog> Catalog::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeaveError{WeaveError::Parse,
            std::string("catalog TOML parse error: ") + e.what()};
    }

    Catalog cat;

    // [[module]] entries
    std::vector<ModuleSpec> specs;
    if (auto mods = doc["module"].as_array()) {
        for (size_t i = 0; i < mods->size(); ++i) {
            const auto* mt = (*mods)[i].as_table();
            if (!mt) {
                return WeaveError{WeaveError::Catalog, "each [[module]] must be a table"};
            }
            auto spec = parse_module(*mt, i);
            if (spec.is_err()) return std::move(spec).error();
            specs.push_back(std::move(spec).value());
        }
    }

    // [root]
    auto root = doc["root"].as_table();
    if (!root) {
        return WeaveError{WeaveError::Catalog,
            "catalog has no [root] section",
            "name the module to resolve under [root]"};
    }
    auto root_id = parse_module_id(*root, "[root]");
    if (root_id.is_err()) return std::move(root_id).error();

    std::optional<Version> root_version;
    if (auto v = (*root)["version"].value<std::string>()) {
        auto ver = Version::parse(*v);
        if (ver.is_err()) return std::move(ver).error();
        root_version = std::move(ver).value();
    }

    // Root: the requested version, else the highest one in the catalog
    const ModuleSpec* root_spec = nullptr;
    for (const auto& spec : specs) {
        if (spec.id != root_id.value()) continue;
        if (root_version) {
            if (spec.version == *root_version) root_spec = &spec;
        } else if (!root_spec || root_spec->version < spec.version) {
            root_spec = &spec;
        }
    }
    if (!root_spec) {
        return WeaveError{WeaveError::Catalog,
            "root module " + root_id.value().to_string() +
            (root_version ? ":" + root_version->to_string() : std::string{}) +
            " is not in the catalog"};
    }

    cat.root.module = root_spec->id;
    cat.root.version = root_spec->version;
    cat.root.project = root_spec->project;

    auto names = string_array(*root, "configurations", "[root]");
    if (names.is_err()) return std::move(names).error();
    std::vector<std::string> configurations = std::move(names).value();
    if (configurations.empty()) {
        for (const auto& var : root_spec->variants) configurations.push_back(var.name);
        if (configurations.empty()) configurations.push_back("default");
    }
    for (const auto& name : configurations) {
        bool declared = root_spec->variants.empty() ? name == "default" : false;
        for (const auto& var : root_spec->variants) {
            if (var.name == name) declared = true;
        }
        if (!declared) {
            return WeaveError{WeaveError::Catalog,
                "root " + root_spec->id.to_string() + " has no variant '" + name + "'"};
        }
        VariantRef ref = cat.root;
        ref.variant = name;
        cat.configurations.push_back(ConfigurationRequest{name, std::move(ref)});
    }

    for (auto& spec : specs) {
        WEAVE_TRY(cat.source.add_module(std::move(spec)));
    }

    return Result<Catalog>::ok(std::move(cat));
}

Result<Catalog> Catalog::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeaveError{WeaveError::IO,
            "cannot open catalog file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Catalog::parse(ss.str());
    if (r.is_err() && r.error().file.empty()) r.error().file = path;
    return r;
}

} // namespace weave
