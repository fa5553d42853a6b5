// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_settings.hpp
 * @brief Tool settings and their JSON overlay.
 *
 * Settings holds the organisation-specific constants used by every stage
 * (domain suffix, target drive, deployment folder name, debug launcher).
 * Defaults can be overridden from a JSON file.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace envstage {

struct Settings {
    std::string domain_suffix = "corp.local";
    char target_drive = 'D';
    std::string hostname_placeholder = "localhost";
    std::string namespace_prefix = "Company.";

    std::string deploy_dir_name = ".Deploy";
    std::string target_config_name = "App.config";
    std::vector<std::string> project_extensions{ ".csproj", ".vbproj", ".fsproj" };

    std::filesystem::path workspace_base;  // empty -> DefaultWorkspaceBase()

    // {environment} and {instance} are expanded in both
    std::string start_program = "C:\\Program Files\\Company\\ServiceHost\\ServiceHost.exe";
    std::string start_arguments = "/instance:{instance} /environment:{environment}";

    int prompt_timeout_seconds = 5;
    size_t preview_bytes = 400;
};

// $HOME/Source/Workspaces (%USERPROFILE% on Windows)
std::filesystem::path DefaultWorkspaceBase();

// Overlays keys present in the JSON text onto `settings`.
// Throws DeployError(InvalidSettings) on malformed JSON or mistyped keys.
void ApplySettingsJson(const std::string& jsonText, Settings& settings);

// Reads `file` and applies it. Throws DeployError(InvalidSettings) if unreadable.
Settings LoadSettings(const std::filesystem::path& file);

// Expands {environment} and {instance} placeholders.
std::string ExpandLaunchTemplate(const std::string& tmpl,
                                 const std::string& environment,
                                 const std::string& instance);

} // namespace envstage
