// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_config_transform.hpp
 * @brief Environment rewrite of deployment config text.
 *
 * Two global textual substitutions, no XML parsing:
 *   1. hostname placeholder -> <environment>.<domain_suffix>
 *   2. any drive root "X:\" -> "<target_drive>:\"
 * The transform is pure and idempotent.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace envstage {

struct TransformOptions {
    std::string environment;
    std::string domain_suffix;
    std::string hostname_placeholder = "localhost";
    char target_drive = 'D';
};

// "<environment>.<domain_suffix>", or just the environment when the suffix is empty.
std::string ComputeHostname(const std::string& environment, const std::string& domain_suffix);

bool IsValidUtf8(std::string_view text);

// Throws DeployError(InvalidEncoding) on invalid UTF-8, and
// DeployError(InvalidSettings) if the computed hostname contains the placeholder
// or the rewritten text would still contain it.
std::string TransformConfig(std::string_view raw, const TransformOptions& opts);

// Replaces every drive root with the target drive root. Returns the number replaced.
size_t RewriteDriveRoots(std::string& text, char target_drive);

size_t CountDriveRoots(std::string_view text);

// At most `max_bytes` of `text`, cut on a UTF-8 boundary, "..." appended when cut.
std::string MakePreview(std::string_view text, size_t max_bytes);

} // namespace envstage
