#pragma once

#include <weave/conflict.hpp>
#include <weave/resolution.hpp>

#include <string>
#include <vector>

namespace weave {

// Dependency tree of a result, one node per line. Repeated subtrees are
// printed once and marked "(*)".
std::string render_tree(const ResolutionResult& result);

// "  [kind] description", one conflict per line, resolved ones included
std::string render_conflicts(const std::vector<Conflict>& conflicts);

// Header, tree (on success), conflicts and failure cause for one configuration
std::string render_report(const std::string& configuration, const ResolutionResult& result);

} // namespace weave
