// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_deploy_resolver.hpp
 * @brief Deployment artifact lookup.
 *
 * Locates the service-instance folder below the project's deployment
 * directory and the `<environment>.config` file inside it. Each missing
 * piece raises its own NotFound kind.
 */

#pragma once

#include <filesystem>
#include <string>

namespace envstage {

struct ServiceInstance {
    std::string requested_name;
    std::filesystem::path folder;
    bool exact_match = false;
};

struct EnvironmentConfig {
    std::string environment;
    std::filesystem::path source_file;
    std::string raw_content;
    std::string transformed_content;
};

// Throws DeployError(DeployDirNotFound) or DeployError(InstanceNotFound).
ServiceInstance ResolveServiceInstance(const std::filesystem::path& project_dir,
                                       const std::string& deploy_dir_name,
                                       const std::string& instance_name);

// Throws DeployError(EnvironmentConfigNotFound). Leaves transformed_content empty.
EnvironmentConfig ResolveEnvironmentConfig(const ServiceInstance& instance,
                                           const std::string& environment);

} // namespace envstage
