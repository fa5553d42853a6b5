// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_pipeline.hpp
 * @brief End-to-end deployment of one environment config.
 *
 * DeployPipeline resolves every artifact first (workspace, project, service
 * instance, environment config, target config, metadata documents) and only
 * then writes. Resolution failures and CorruptMetadata abort the run; other
 * metadata and startup failures end up as warnings in the summary.
 */

#pragma once

#include "es_metadata.hpp"
#include "es_settings.hpp"
#include "es_startup.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace envstage {

struct DeployRequest {
    std::string project;
    std::string environment;
    std::string service_instance;
    std::string workspace_selector;
    bool dry_run = false;
    bool offer_startup = true;
};

struct DeploySummary {
    bool dry_run = false;

    std::filesystem::path workspace_root;
    std::filesystem::path project_file;
    std::string project_rule;
    std::filesystem::path instance_folder;
    std::filesystem::path environment_file;
    std::filesystem::path target_file;
    std::string hostname;
    size_t drive_roots_rewritten = 0;

    bool target_written = false;
    std::filesystem::path backup_file;
    std::string preview;                 // dry-run only

    CopyDirectiveResult copy_directive;
    std::filesystem::path user_file;
    DebugLaunchResult debug_launch;

    std::optional<PromptAnswer> startup_answer;
    std::string startup_result;

    std::vector<std::string> notes;
    std::vector<std::string> warnings;
};

nlohmann::json SummaryToJson(const DeploySummary& summary);

class DeployPipeline {
public:
    // `prompt` and `registrar` may be null; the startup step is then skipped.
    explicit DeployPipeline(Settings settings,
                            Prompt* prompt = nullptr,
                            StartupRegistrar* registrar = nullptr)
        : settings_(std::move(settings))
        , prompt_(prompt)
        , registrar_(registrar) {}

    const Settings& settings() const { return settings_; }

    // Throws DeployError for fatal failures.
    DeploySummary Run(const DeployRequest& request);

private:
    Settings settings_;
    Prompt* prompt_{ nullptr };
    StartupRegistrar* registrar_{ nullptr };

    std::filesystem::path WorkspaceBase() const;
    void OfferStartup(DeploySummary& summary);
};

} // namespace envstage
