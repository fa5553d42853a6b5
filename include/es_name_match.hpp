// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_name_match.hpp
 * @brief Ordered disambiguation rules for loose, human-supplied names.
 *
 * A MatchRule narrows a candidate list to the entries it accepts. SelectUnique
 * runs the rules in order and stops at the first one that leaves exactly one
 * candidate. The rule list is plain data so callers can append their own.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace envstage {

struct MatchRule {
    std::string name;
    // Returns indices into `candidates` accepted by this rule.
    std::function<std::vector<size_t>(const std::vector<std::filesystem::path>& candidates)> narrow;
};

struct MatchResult {
    size_t index = 0;
    std::string rule;
};

std::optional<MatchResult> SelectUnique(const std::vector<std::filesystem::path>& candidates,
                                        const std::vector<MatchRule>& rules);

// Accepts candidates whose stem equals `name` (case-insensitive).
MatchRule ExactStemRule(std::string rule_name, std::string name);

// Accepts the candidate with the fewest path components below `root`
// (first in list order on a tie); always yields one for a non-empty list.
MatchRule ShallowestPathRule(std::filesystem::path root);

} // namespace envstage
