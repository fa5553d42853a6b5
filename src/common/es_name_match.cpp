// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_name_match.cpp
 * @brief Rule evaluation and the built-in rules.
 */

#include "es_name_match.hpp"
#include "es_text.hpp"

#include <iterator>

namespace envstage {

namespace fs = std::filesystem;

std::optional<MatchResult> SelectUnique(const std::vector<fs::path>& candidates,
                                        const std::vector<MatchRule>& rules) {
    if (candidates.empty()) return std::nullopt;
    if (candidates.size() == 1) return MatchResult{ 0, "only-candidate" };

    for (const auto& rule : rules) {
        std::vector<size_t> accepted = rule.narrow(candidates);
        if (accepted.size() == 1) {
            return MatchResult{ accepted.front(), rule.name };
        }
    }
    return std::nullopt;
}

MatchRule ExactStemRule(std::string rule_name, std::string name) {
    return MatchRule{
        std::move(rule_name),
        [name = std::move(name)](const std::vector<fs::path>& candidates) {
            std::vector<size_t> out;
            for (size_t i = 0; i < candidates.size(); ++i) {
                if (EqualsIgnoreCase(candidates[i].stem().string(), name)) out.push_back(i);
            }
            return out;
        }
    };
}

MatchRule ShallowestPathRule(fs::path root) {
    return MatchRule{
        "shallowest-path",
        [root = std::move(root)](const std::vector<fs::path>& candidates) {
            std::vector<size_t> out;
            std::ptrdiff_t best = -1;
            for (size_t i = 0; i < candidates.size(); ++i) {
                const fs::path rel = candidates[i].lexically_relative(root);
                const auto depth = std::distance(rel.begin(), rel.end());
                if (best < 0 || depth < best) {
                    best = depth;
                    out.assign(1, i);
                }
            }
            return out;
        }
    };
}

} // namespace envstage
