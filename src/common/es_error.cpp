// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_error.cpp
 * @brief Error kind names and exit codes.
 */

#include "es_error.hpp"

namespace envstage {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::WorkspaceNotFound:         return "NotFound(workspace)";
    case ErrorKind::ProjectNotFound:           return "NotFound(project)";
    case ErrorKind::DeployDirNotFound:         return "NotFound(deploy-directory)";
    case ErrorKind::InstanceNotFound:          return "NotFound(instance)";
    case ErrorKind::EnvironmentConfigNotFound: return "NotFound(environment-config)";
    case ErrorKind::TargetConfigNotFound:      return "NotFound(target-config)";
    case ErrorKind::CorruptMetadata:           return "CorruptMetadata";
    case ErrorKind::WriteFailure:              return "WriteFailure";
    case ErrorKind::ExternalTimeout:           return "ExternalTimeout";
    case ErrorKind::ExternalFailure:           return "ExternalFailure";
    case ErrorKind::InvalidEncoding:           return "InvalidEncoding";
    case ErrorKind::InvalidSettings:           return "InvalidSettings";
    }
    return "Unknown";
}

bool IsNotFound(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::WorkspaceNotFound:
    case ErrorKind::ProjectNotFound:
    case ErrorKind::DeployDirNotFound:
    case ErrorKind::InstanceNotFound:
    case ErrorKind::EnvironmentConfigNotFound:
    case ErrorKind::TargetConfigNotFound:
        return true;
    default:
        return false;
    }
}

int ExitCodeFor(ErrorKind kind) {
    if (IsNotFound(kind)) return 3;
    switch (kind) {
    case ErrorKind::CorruptMetadata: return 4;
    case ErrorKind::WriteFailure:    return 5;
    case ErrorKind::InvalidEncoding: return 6;
    default:                         return 1;
    }
}

} // namespace envstage
