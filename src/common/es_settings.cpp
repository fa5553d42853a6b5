// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_settings.cpp
 * @brief Settings loading from JSON.
 */

#include "es_settings.hpp"
#include "es_error.hpp"
#include "es_text.hpp"

#include <cctype>
#include <cstdlib>

#include <nlohmann/json.hpp>

namespace envstage {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw DeployError(ErrorKind::InvalidSettings,
                          std::string("settings key '") + key + "': " + e.what());
    }
}

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::filesystem::path DefaultWorkspaceBase() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();
    return base / "Source" / "Workspaces";
}

void ApplySettingsJson(const std::string& jsonText, Settings& settings) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw DeployError(ErrorKind::InvalidSettings, std::string("malformed settings: ") + e.what());
    }
    if (!j.is_object()) {
        throw DeployError(ErrorKind::InvalidSettings, "settings root must be a JSON object");
    }

    ReadKey(j, "domain_suffix", settings.domain_suffix);
    ReadKey(j, "hostname_placeholder", settings.hostname_placeholder);
    ReadKey(j, "namespace_prefix", settings.namespace_prefix);
    ReadKey(j, "deploy_dir_name", settings.deploy_dir_name);
    ReadKey(j, "target_config_name", settings.target_config_name);
    ReadKey(j, "project_extensions", settings.project_extensions);
    ReadKey(j, "start_program", settings.start_program);
    ReadKey(j, "start_arguments", settings.start_arguments);
    ReadKey(j, "prompt_timeout_seconds", settings.prompt_timeout_seconds);
    ReadKey(j, "preview_bytes", settings.preview_bytes);

    std::string base;
    ReadKey(j, "workspace_base", base);
    if (!base.empty()) settings.workspace_base = base;

    std::string drive;
    ReadKey(j, "target_drive", drive);
    if (!drive.empty()) {
        if (drive.size() != 1 || !std::isalpha(static_cast<unsigned char>(drive[0]))) {
            throw DeployError(ErrorKind::InvalidSettings,
                              "target_drive must be a single letter, got '" + drive + "'");
        }
        settings.target_drive = static_cast<char>(std::toupper(static_cast<unsigned char>(drive[0])));
    }

    if (settings.deploy_dir_name.empty() || settings.target_config_name.empty()) {
        throw DeployError(ErrorKind::InvalidSettings, "deploy_dir_name and target_config_name must not be empty");
    }
    if (settings.prompt_timeout_seconds < 0) {
        throw DeployError(ErrorKind::InvalidSettings, "prompt_timeout_seconds must not be negative");
    }
}

Settings LoadSettings(const std::filesystem::path& file) {
    std::string text, err;
    if (!ReadAllText(file, text, err)) {
        throw DeployError(ErrorKind::InvalidSettings, err, file);
    }
    Settings settings;
    ApplySettingsJson(text, settings);
    return settings;
}

std::string ExpandLaunchTemplate(const std::string& tmpl,
                                 const std::string& environment,
                                 const std::string& instance) {
    std::string out = tmpl;
    ReplaceAll(out, "{environment}", environment);
    ReplaceAll(out, "{instance}", instance);
    return out;
}

} // namespace envstage
