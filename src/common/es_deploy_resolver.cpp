// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_deploy_resolver.cpp
 * @brief Deployment artifact lookup implementation.
 */

#include "es_deploy_resolver.hpp"
#include "es_error.hpp"
#include "es_text.hpp"

#include <system_error>

namespace envstage {

namespace fs = std::filesystem;

ServiceInstance ResolveServiceInstance(const fs::path& project_dir,
                                       const std::string& deploy_dir_name,
                                       const std::string& instance_name) {
    const fs::path deploy_dir = project_dir / deploy_dir_name;
    std::error_code ec;
    if (!fs::is_directory(deploy_dir, ec)) {
        throw DeployError(ErrorKind::DeployDirNotFound,
                          "deployment directory not found: " + deploy_dir.string(), deploy_dir);
    }

    const auto folders = ListChildDirectories(deploy_dir);

    ServiceInstance inst;
    inst.requested_name = instance_name;

    // 1) exact name
    for (const auto& f : folders) {
        if (EqualsIgnoreCase(f.filename().string(), instance_name)) {
            inst.folder = f;
            inst.exact_match = true;
            return inst;
        }
    }
    // 2) first folder containing the name
    if (!instance_name.empty()) {
        for (const auto& f : folders) {
            if (ContainsIgnoreCase(f.filename().string(), instance_name)) {
                inst.folder = f;
                return inst;
            }
        }
    }

    throw DeployError(ErrorKind::InstanceNotFound,
                      "no service instance '" + instance_name + "' in " + deploy_dir.string(), deploy_dir);
}

EnvironmentConfig ResolveEnvironmentConfig(const ServiceInstance& instance,
                                           const std::string& environment) {
    const std::string wanted = environment + ".config";

    for (const auto& file : ListFilesRecursive(instance.folder)) {
        if (!EqualsIgnoreCase(file.filename().string(), wanted)) continue;

        EnvironmentConfig cfg;
        cfg.environment = environment;
        cfg.source_file = file;
        std::string err;
        if (!ReadAllText(file, cfg.raw_content, err)) {
            throw DeployError(ErrorKind::EnvironmentConfigNotFound, err, file);
        }
        return cfg;
    }

    throw DeployError(ErrorKind::EnvironmentConfigNotFound,
                      "no " + wanted + " under " + instance.folder.string(), instance.folder);
}

} // namespace envstage
