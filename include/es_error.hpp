// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_error.hpp
 * @brief Error taxonomy for the deployment pipeline.
 *
 * DeployError carries an ErrorKind and the path that was searched or written,
 * so every failure can name the artifact the operator has to fix.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace envstage {

enum class ErrorKind {
    WorkspaceNotFound,
    ProjectNotFound,
    DeployDirNotFound,
    InstanceNotFound,
    EnvironmentConfigNotFound,
    TargetConfigNotFound,
    CorruptMetadata,
    WriteFailure,
    ExternalTimeout,
    ExternalFailure,
    InvalidEncoding,
    InvalidSettings,
};

const char* ErrorKindName(ErrorKind kind);

bool IsNotFound(ErrorKind kind);

// Process exit status for a failure of this kind.
int ExitCodeFor(ErrorKind kind);

class DeployError : public std::runtime_error {
public:
    DeployError(ErrorKind kind, const std::string& message, std::filesystem::path path = {})
        : std::runtime_error(message)
        , kind_(kind)
        , path_(std::move(path)) {}

    ErrorKind kind() const { return kind_; }
    const std::filesystem::path& path() const { return path_; }

private:
    ErrorKind kind_;
    std::filesystem::path path_;
};

} // namespace envstage
