// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_text.hpp
 * @brief Small string and file helpers shared by the resolvers.
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace envstage {

std::string ToLower(std::string_view s);
bool EqualsIgnoreCase(std::string_view a, std::string_view b);
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

bool ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err);

// Directory names never searched for projects or config files (build output, VCS, tooling).
bool IsSkippedDirectory(const std::filesystem::path& dir);

// Immediate child directories of `dir`, sorted by name. Unreadable -> empty.
std::vector<std::filesystem::path> ListChildDirectories(const std::filesystem::path& dir);

// Regular files below `root` (recursive, skipping IsSkippedDirectory and
// anything in `excluded`), sorted by generic path string.
std::vector<std::filesystem::path> ListFilesRecursive(const std::filesystem::path& root,
                                                      const std::vector<std::filesystem::path>& excluded = {});

} // namespace envstage
