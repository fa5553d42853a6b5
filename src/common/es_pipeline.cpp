// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_pipeline.cpp
 * @brief Deployment pipeline orchestration and summary serialisation.
 */

#include "es_pipeline.hpp"
#include "es_config_transform.hpp"
#include "es_deploy_resolver.hpp"
#include "es_error.hpp"
#include "es_project_resolver.hpp"
#include "es_target_config.hpp"

namespace envstage {

namespace fs = std::filesystem;
using json = nlohmann::json;

nlohmann::json SummaryToJson(const DeploySummary& s) {
    json j;
    j["dry_run"] = s.dry_run;
    j["workspace_root"] = s.workspace_root.string();
    j["project"] = { {"file", s.project_file.string()}, {"rule", s.project_rule} };
    j["instance_folder"] = s.instance_folder.string();
    j["environment_file"] = s.environment_file.string();
    j["hostname"] = s.hostname;
    j["target"] = {
        {"file", s.target_file.string()},
        {"written", s.target_written},
        {"backup", s.backup_file.string()},
        {"drive_roots_rewritten", s.drive_roots_rewritten},
    };
    if (s.dry_run) j["preview"] = s.preview;

    j["copy_directive"] = {
        {"outcome", CopyDirectiveOutcomeName(s.copy_directive.outcome)},
        {"item", s.copy_directive.item_include},
        {"written", s.copy_directive.written},
    };
    j["debug_launch"] = {
        {"file", s.user_file.string()},
        {"created", s.debug_launch.document_created},
        {"changed_fields", s.debug_launch.changed_fields},
        {"written", s.debug_launch.written},
    };
    if (s.startup_answer) {
        j["startup"] = { {"answer", PromptAnswerName(*s.startup_answer)}, {"result", s.startup_result} };
    }
    j["notes"] = s.notes;
    j["warnings"] = s.warnings;
    return j;
}

fs::path DeployPipeline::WorkspaceBase() const {
    return settings_.workspace_base.empty() ? DefaultWorkspaceBase() : settings_.workspace_base;
}

DeploySummary DeployPipeline::Run(const DeployRequest& request) {
    DeploySummary summary;
    summary.dry_run = request.dry_run;

    // ---- Resolution: nothing is written until all of this succeeds ----
    summary.workspace_root = ResolveWorkspaceRoot(request.workspace_selector, WorkspaceBase());

    ProjectDescriptor project = ResolveProject(summary.workspace_root, request.project, settings_);
    summary.project_file = project.project_file;
    summary.project_rule = project.matched_rule;
    summary.notes.push_back("project " + project.project_file.string() + " (" + project.matched_rule + ")");
    if (project.matched_rule == "shallowest-path") {
        std::string others;
        for (const auto& c : project.candidates) {
            if (c != project.project_file) others += "\n  " + c.string();
        }
        summary.warnings.push_back("project '" + request.project + "' picked by path depth; other candidates:" + others);
    }

    ServiceInstance instance = ResolveServiceInstance(project.project_dir, settings_.deploy_dir_name,
                                                      request.service_instance);
    summary.instance_folder = instance.folder;
    if (!instance.exact_match) {
        summary.notes.push_back("service instance '" + request.service_instance + "' matched folder " +
                                instance.folder.filename().string());
    }

    EnvironmentConfig env = ResolveEnvironmentConfig(instance, request.environment);
    summary.environment_file = env.source_file;

    summary.target_file = FindTargetConfig(project.project_dir, settings_.target_config_name,
                                           { project.project_dir / settings_.deploy_dir_name });

    MetadataDocument project_doc(project.project_file);
    summary.user_file = UserSettingsPathFor(project.project_file);
    MetadataDocument user_doc(summary.user_file, MetadataDocument::Mode::CreateIfMissing);

    // ---- Transform ----
    TransformOptions opts;
    opts.environment = request.environment;
    opts.domain_suffix = settings_.domain_suffix;
    opts.hostname_placeholder = settings_.hostname_placeholder;
    opts.target_drive = settings_.target_drive;

    summary.hostname = ComputeHostname(request.environment, settings_.domain_suffix);
    env.transformed_content = TransformConfig(env.raw_content, opts);
    summary.drive_roots_rewritten = CountDriveRoots(env.raw_content);

    // ---- Stage target config ----
    if (request.dry_run) {
        summary.preview = MakePreview(env.transformed_content, settings_.preview_bytes);
    } else {
        StageResult staged = BackupAndWrite(summary.target_file, env.transformed_content);
        summary.target_written = staged.written;
        summary.backup_file = staged.backup_file;
        if (!staged.written) summary.notes.push_back("target config already up to date");
    }

    // ---- Metadata: sibling sub-steps, failures become warnings ----
    summary.copy_directive = EnsureCopyAlways(project_doc.project(), settings_.target_config_name);
    if (summary.copy_directive.outcome == CopyDirectiveOutcome::NotRegistered) {
        summary.warnings.push_back(settings_.target_config_name + " is not an item of " +
                                   project.project_file.filename().string() + "; copy directive left alone");
    } else if (summary.copy_directive.outcome == CopyDirectiveOutcome::Updated && !request.dry_run) {
        try {
            project_doc.Save();
            summary.copy_directive.written = true;
        } catch (const DeployError& e) {
            summary.warnings.push_back(std::string(ErrorKindName(e.kind())) + ": " + e.what());
        }
    }

    DebugLaunchSettings launch;
    launch.start_program = ExpandLaunchTemplate(settings_.start_program, request.environment, request.service_instance);
    launch.start_arguments = ExpandLaunchTemplate(settings_.start_arguments, request.environment, request.service_instance);
    summary.debug_launch = EnsureDebugLaunch(user_doc.project(), launch);
    summary.debug_launch.document_created = user_doc.is_new();
    if (summary.debug_launch.changed() && !request.dry_run) {
        try {
            user_doc.Save();
            summary.debug_launch.written = true;
        } catch (const DeployError& e) {
            summary.warnings.push_back(std::string(ErrorKindName(e.kind())) + ": " + e.what());
        }
    }

    // ---- Optional startup registration ----
    if (request.offer_startup && !request.dry_run) {
        OfferStartup(summary);
    }

    return summary;
}

void DeployPipeline::OfferStartup(DeploySummary& summary) {
    if (!prompt_ || !registrar_) return;

    const auto timeout = std::chrono::seconds(settings_.prompt_timeout_seconds);
    const PromptAnswer answer = prompt_->Ask(
        "Set " + summary.project_file.stem().string() + " as the startup project?", timeout);
    summary.startup_answer = answer;

    if (answer == PromptAnswer::TimedOut) {
        summary.notes.push_back("startup prompt timed out; defaulted to no");
        return;
    }
    if (answer != PromptAnswer::Yes) return;

    try {
        summary.startup_result = registrar_->Register(summary.workspace_root, summary.project_file);
    } catch (const DeployError& e) {
        summary.warnings.push_back(std::string(ErrorKindName(e.kind())) + ": " + e.what());
    } catch (const std::exception& e) {
        // the deployment already happened; any registrar failure is advisory
        summary.warnings.push_back(std::string(ErrorKindName(ErrorKind::ExternalFailure)) + ": " + e.what());
    }
}

} // namespace envstage
