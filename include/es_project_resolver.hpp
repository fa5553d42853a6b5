// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_project_resolver.hpp
 * @brief Workspace and project lookup.
 *
 * ResolveWorkspaceRoot maps the user's workspace selector onto a directory;
 * ResolveProject finds exactly one project definition file under it from a
 * loose name fragment.
 */

#pragma once

#include "es_name_match.hpp"
#include "es_settings.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace envstage {

struct ProjectDescriptor {
    std::string name;                      // stem of the project file
    std::string loose_pattern;             // as typed by the user
    std::filesystem::path project_file;
    std::filesystem::path project_dir;
    std::string matched_rule;
    std::vector<std::filesystem::path> candidates;
};

// Absolute selector -> itself, otherwise base / selector.
// Throws DeployError(WorkspaceNotFound) if the directory does not exist.
std::filesystem::path ResolveWorkspaceRoot(const std::string& selector,
                                           const std::filesystem::path& base);

// Project files under `root` whose filename contains `pattern` (case-insensitive).
std::vector<std::filesystem::path> FindProjectCandidates(const std::filesystem::path& root,
                                                         const std::string& pattern,
                                                         const std::vector<std::string>& extensions);

// exact-name, namespace-prefixed, shallowest-path
std::vector<MatchRule> DefaultProjectRules(const std::filesystem::path& root,
                                           const std::string& pattern,
                                           const std::string& namespace_prefix);

// Throws DeployError(ProjectNotFound) when no candidate exists.
ProjectDescriptor ResolveProject(const std::filesystem::path& root,
                                 const std::string& pattern,
                                 const Settings& settings);

ProjectDescriptor ResolveProject(const std::filesystem::path& root,
                                 const std::string& pattern,
                                 const Settings& settings,
                                 const std::vector<MatchRule>& rules);

} // namespace envstage
