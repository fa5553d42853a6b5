// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_text.cpp
 * @brief Case-insensitive matching and deterministic directory walks.
 */

#include "es_text.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace envstage {

namespace fs = std::filesystem;

std::string ToLower(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

bool ReadAllText(const fs::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) { err = "cannot open: " + p.string(); return false; }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) { err = "read failed: " + p.string(); return false; }
    return true;
}

bool IsSkippedDirectory(const fs::path& dir) {
    static const char* kSkipped[] = { "bin", "obj", ".git", ".vs", "node_modules", "packages", "TestResults" };
    const std::string name = dir.filename().string();
    for (const char* s : kSkipped) {
        if (EqualsIgnoreCase(name, s)) return true;
    }
    return false;
}

std::vector<fs::path> ListChildDirectories(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_directory(sec)) out.push_back(it->path());
    }
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().generic_string() < b.filename().generic_string();
    });
    return out;
}

std::vector<fs::path> ListFilesRecursive(const fs::path& root, const std::vector<fs::path>& excluded) {
    std::vector<fs::path> out;
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return out;

    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code sec;
        if (it->is_directory(sec)) {
            const bool skip = IsSkippedDirectory(it->path()) ||
                std::find(excluded.begin(), excluded.end(), it->path()) != excluded.end();
            if (skip) it.disable_recursion_pending();
        } else if (it->is_regular_file(sec)) {
            out.push_back(it->path());
        }
        it.increment(ec);
        if (ec) break;
    }

    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });
    return out;
}

} // namespace envstage
