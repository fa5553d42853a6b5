// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_project_resolver.cpp
 * @brief Workspace and project lookup implementation.
 */

#include "es_project_resolver.hpp"
#include "es_error.hpp"
#include "es_text.hpp"

#include <system_error>

namespace envstage {

namespace fs = std::filesystem;

fs::path ResolveWorkspaceRoot(const std::string& selector, const fs::path& base) {
    if (selector.empty()) {
        throw DeployError(ErrorKind::WorkspaceNotFound, "empty workspace selector", base);
    }
    fs::path root(selector);
    if (!root.is_absolute()) root = base / root;
    root = root.lexically_normal();

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw DeployError(ErrorKind::WorkspaceNotFound,
                          "workspace '" + selector + "' not found at " + root.string(), root);
    }
    return root;
}

std::vector<fs::path> FindProjectCandidates(const fs::path& root,
                                            const std::string& pattern,
                                            const std::vector<std::string>& extensions) {
    std::vector<fs::path> out;
    for (const auto& file : ListFilesRecursive(root)) {
        bool known = false;
        for (const auto& ext : extensions) {
            if (EqualsIgnoreCase(file.extension().string(), ext)) { known = true; break; }
        }
        if (known && ContainsIgnoreCase(file.filename().string(), pattern)) {
            out.push_back(file);
        }
    }
    return out;
}

std::vector<MatchRule> DefaultProjectRules(const fs::path& root,
                                           const std::string& pattern,
                                           const std::string& namespace_prefix) {
    std::vector<MatchRule> rules;
    rules.push_back(ExactStemRule("exact-name", pattern));
    if (!namespace_prefix.empty()) {
        rules.push_back(ExactStemRule("namespace-prefixed", namespace_prefix + pattern));
    }
    rules.push_back(ShallowestPathRule(root));
    return rules;
}

ProjectDescriptor ResolveProject(const fs::path& root,
                                 const std::string& pattern,
                                 const Settings& settings) {
    return ResolveProject(root, pattern, settings,
                          DefaultProjectRules(root, pattern, settings.namespace_prefix));
}

ProjectDescriptor ResolveProject(const fs::path& root,
                                 const std::string& pattern,
                                 const Settings& settings,
                                 const std::vector<MatchRule>& rules) {
    std::vector<fs::path> candidates = FindProjectCandidates(root, pattern, settings.project_extensions);
    if (candidates.empty()) {
        throw DeployError(ErrorKind::ProjectNotFound,
                          "no project matching '" + pattern + "' under " + root.string(), root);
    }

    auto match = SelectUnique(candidates, rules);
    if (!match) {
        throw DeployError(ErrorKind::ProjectNotFound,
                          "project '" + pattern + "' is ambiguous under " + root.string() +
                          " (" + std::to_string(candidates.size()) + " candidates)", root);
    }

    ProjectDescriptor desc;
    desc.loose_pattern = pattern;
    desc.project_file = candidates[match->index];
    desc.project_dir = desc.project_file.parent_path();
    desc.name = desc.project_file.stem().string();
    desc.matched_rule = match->rule;
    desc.candidates = std::move(candidates);
    return desc;
}

} // namespace envstage
