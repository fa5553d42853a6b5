// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file envstage_cli.cpp
 * @brief envstage command-line interface.
 *
 * Provides the deploy and transform commands. Entry point for the envstage
 * executable.
 */

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include "es_config_transform.hpp"
#include "es_error.hpp"
#include "es_pipeline.hpp"
#include "es_settings.hpp"
#include "es_startup.hpp"
#include "es_text.hpp"

using namespace envstage;

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr int kUsageError = 2;

void print_usage() {
    std::cerr << R"(
envstage - environment config deployment v)" << VERSION << R"(

Usage: envstage <command> [options]

Commands:
  deploy                           Deploy an environment config into a project
      -p, --project <name>         Project name or fragment
      -e, --environment <env>      Environment name (e.g. DEV1)
      -s, --service-instance <n>   Folder under the project's deployment directory
      -w, --workspace <selector>   Workspace directory, relative to the workspace base
      --dry-run                    Resolve and preview; write nothing
      --no-prompt                  Skip the startup-project prompt
      --json                       Print the summary as JSON
      --config <file>              Settings file [default: <workspace base>/envstage.json]

  transform <file>                 Print <file> rewritten for an environment
      -e, --environment <env>      Environment name
      --config <file>              Settings file

  version                          Show version information
  help                             Show this help message

Examples:
  envstage deploy -p Kernel -e DEV1 -s Portfolio -w Main --dry-run
  envstage transform .Deploy/Portfolio/DEV1.config -e DEV1
)";
}

void print_version() {
    std::cout << "envstage version " << VERSION << "\n";
}

Settings load_settings(const std::filesystem::path& config_path) {
    if (!config_path.empty()) {
        return LoadSettings(config_path);
    }
    std::error_code ec;
    const auto fallback = DefaultWorkspaceBase() / "envstage.json";
    if (std::filesystem::exists(fallback, ec)) {
        return LoadSettings(fallback);
    }
    return Settings{};
}

void print_summary(const DeploySummary& s) {
    std::cout << (s.dry_run ? "Dry run" : "Deploy") << " summary\n";
    std::cout << "  Workspace:    " << s.workspace_root.string() << "\n";
    std::cout << "  Project:      " << s.project_file.string() << " (" << s.project_rule << ")\n";
    std::cout << "  Instance:     " << s.instance_folder.string() << "\n";
    std::cout << "  Environment:  " << s.environment_file.string() << "\n";
    std::cout << "  Hostname:     " << s.hostname << "\n";
    std::cout << "  Target:       " << s.target_file.string() << "\n";

    if (s.dry_run) {
        std::cout << "\n--- Preview ---\n" << s.preview << "\n---------------\n";
    } else if (s.target_written) {
        std::cout << "  Backup:       " << s.backup_file.string() << "\n";
    }

    std::cout << "  Copy rule:    " << CopyDirectiveOutcomeName(s.copy_directive.outcome)
              << (s.copy_directive.written ? " (saved)" : "") << "\n";
    std::cout << "  Debug launch: " << s.user_file.string();
    if (s.debug_launch.changed()) {
        std::cout << (s.dry_run ? " would change" : " updated");
        for (const auto& f : s.debug_launch.changed_fields) std::cout << " " << f;
    } else {
        std::cout << " unchanged";
    }
    std::cout << "\n";
    if (s.startup_answer && !s.startup_result.empty()) {
        std::cout << "  Startup:      " << s.startup_result << "\n";
    }

    for (const auto& n : s.notes) std::cout << "Note: " << n << "\n";
    for (const auto& w : s.warnings) std::cerr << "Warning: " << w << "\n";
}

// ============== Deploy ==============
int cmd_deploy(int argc, char* argv[]) {
    DeployRequest request;
    std::filesystem::path config_path;
    bool as_json = false;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-p" || arg == "--project") && i + 1 < argc) {
            request.project = argv[++i];
        } else if ((arg == "-e" || arg == "--environment") && i + 1 < argc) {
            request.environment = argv[++i];
        } else if ((arg == "-s" || arg == "--service-instance") && i + 1 < argc) {
            request.service_instance = argv[++i];
        } else if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
            request.workspace_selector = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--dry-run") {
            request.dry_run = true;
        } else if (arg == "--no-prompt") {
            request.offer_startup = false;
        } else if (arg == "--json") {
            as_json = true;
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return kUsageError;
        }
    }

    if (request.project.empty() || request.environment.empty() ||
        request.service_instance.empty() || request.workspace_selector.empty()) {
        std::cerr << "Error: deploy needs --project, --environment, --service-instance and --workspace\n";
        std::cerr << "Usage: envstage deploy -p <name> -e <env> -s <instance> -w <workspace> [options]\n";
        return kUsageError;
    }

    try {
        ConsolePrompt prompt;
        SolutionStartupRegistrar registrar;
        // JSON output goes to a pipe; an interactive prompt there would only stall it
        DeployPipeline pipeline(load_settings(config_path),
                                as_json ? nullptr : &prompt,
                                &registrar);
        DeploySummary summary = pipeline.Run(request);

        if (as_json) {
            std::cout << SummaryToJson(summary).dump(2) << "\n";
        } else {
            print_summary(summary);
        }
        return 0;
    } catch (const DeployError& e) {
        std::cerr << "Error: " << ErrorKindName(e.kind()) << ": " << e.what() << "\n";
        return ExitCodeFor(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Transform ==============
int cmd_transform(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Error: Missing config file\n";
        std::cerr << "Usage: envstage transform <file> -e <env> [--config <file>]\n";
        return kUsageError;
    }

    std::filesystem::path file = argv[0];
    std::filesystem::path config_path;
    std::string environment;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-e" || arg == "--environment") && i + 1 < argc) {
            environment = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return kUsageError;
        }
    }

    if (environment.empty()) {
        std::cerr << "Error: Missing --environment\n";
        return kUsageError;
    }

    try {
        const Settings settings = load_settings(config_path);

        std::string raw, err;
        if (!ReadAllText(file, raw, err)) {
            std::cerr << "Error: " << err << "\n";
            return ExitCodeFor(ErrorKind::EnvironmentConfigNotFound);
        }

        TransformOptions opts;
        opts.environment = environment;
        opts.domain_suffix = settings.domain_suffix;
        opts.hostname_placeholder = settings.hostname_placeholder;
        opts.target_drive = settings.target_drive;

        std::cout << TransformConfig(raw, opts);
        return 0;
    } catch (const DeployError& e) {
        std::cerr << "Error: " << ErrorKindName(e.kind()) << ": " << e.what() << "\n";
        return ExitCodeFor(e.kind());
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kUsageError;
    }

    std::string command = argv[1];

    if (command == "deploy") {
        return cmd_deploy(argc - 2, argv + 2);
    } else if (command == "transform") {
        return cmd_transform(argc - 2, argv + 2);
    } else if (command == "version" || command == "-v" || command == "--version") {
        print_version();
        return 0;
    } else if (command == "help" || command == "-h" || command == "--help") {
        print_usage();
        return 0;
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        print_usage();
        return kUsageError;
    }
}
