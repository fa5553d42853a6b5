// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_target_config.hpp
 * @brief Locating and overwriting the project's build-output config file.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace envstage {

// Looks for `name` directly in `project_dir`, then recursively (skipping
// build output and the `excluded` directories).
// Throws DeployError(TargetConfigNotFound).
std::filesystem::path FindTargetConfig(const std::filesystem::path& project_dir,
                                       const std::string& name,
                                       const std::vector<std::filesystem::path>& excluded = {});

struct StageResult {
    bool written = false;
    std::filesystem::path backup_file;  // empty when nothing was written
};

// "<file>.<YYYYMMDD-HHMMSS>.bak" beside `target`.
std::filesystem::path BackupPathFor(const std::filesystem::path& target,
                                    std::chrono::system_clock::time_point now);

// Copies `target` to its backup path, then replaces its content.
// No-op when the content is already identical.
// Throws DeployError(WriteFailure) naming the file that could not be written.
StageResult BackupAndWrite(const std::filesystem::path& target,
                           std::string_view content,
                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// Writes `content` to `path`, creating or truncating it.
bool WriteAllText(const std::filesystem::path& path, std::string_view content, std::string& err);

} // namespace envstage
