// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_startup.cpp
 * @brief Console prompt with deadline and solution-file startup registration.
 */

#include "es_startup.hpp"
#include "es_error.hpp"
#include "es_target_config.hpp"
#include "es_text.hpp"

#include <cerrno>
#include <iostream>
#include <regex>
#include <vector>

#ifdef _WIN32
#include <conio.h>
#include <windows.h>
#else
#include <poll.h>
#include <unistd.h>
#endif

namespace envstage {

namespace fs = std::filesystem;

const char* PromptAnswerName(PromptAnswer answer) {
    switch (answer) {
    case PromptAnswer::Yes:      return "yes";
    case PromptAnswer::No:       return "no";
    case PromptAnswer::TimedOut: return "timed-out";
    }
    return "unknown";
}

PromptAnswer ParseAnswer(const std::string& line) {
    std::string s = ToLower(line);
    while (!s.empty() && (s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t start = s.find_first_not_of(" \t");
    s = start == std::string::npos ? std::string() : s.substr(start);
    return (s == "y" || s == "yes") ? PromptAnswer::Yes : PromptAnswer::No;
}

// ============== ConsolePrompt ==============

std::optional<std::string> ReadLineUntil(const KeySource& next_key,
                                         std::chrono::steady_clock::time_point deadline) {
    std::string line;
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::nullopt;

        const int c = next_key(left);
        if (c == kNoKey) continue;
        if (c == kEndOfInput || c == '\r' || c == '\n') return line;
        if (c == '\b' || c == 127) {
            if (!line.empty()) line.pop_back();
            continue;
        }
        line.push_back(static_cast<char>(c));
    }
}

namespace {

int NextConsoleKey(std::chrono::milliseconds wait) {
#ifdef _WIN32
    const auto until = std::chrono::steady_clock::now() + wait;
    do {
        if (_kbhit()) {
            const int c = _getch();
            // function and arrow keys arrive as a two-code sequence
            if (c == 0 || c == 0xE0) {
                _getch();
                return kNoKey;
            }
            if (c != '\r' && c != '\b') _putch(c);
            return c;
        }
        Sleep(20);
    } while (std::chrono::steady_clock::now() < until);
    return kNoKey;
#else
    pollfd pfd{ STDIN_FILENO, POLLIN, 0 };
    const int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (rc <= 0) return kNoKey;  // timeout or EINTR

    unsigned char c = 0;
    const ssize_t n = ::read(STDIN_FILENO, &c, 1);
    if (n == 1) return c;
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return kNoKey;
    return kEndOfInput;
#endif
}

} // namespace

PromptAnswer ConsolePrompt::Ask(const std::string& question, std::chrono::seconds timeout) {
    std::cout << question << " [y/N] (" << timeout.count() << "s) " << std::flush;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::optional<std::string> line = ReadLineUntil(NextConsoleKey, deadline);
    std::cout << "\n";

    if (!line) return PromptAnswer::TimedOut;
    return ParseAnswer(*line);
}

// ============== Solution file ==============

namespace {

struct ProjectBlock {
    size_t begin = 0;
    size_t end = 0;     // one past the EndProject line terminator
    std::string path;   // project path as written in the solution
};

std::vector<ProjectBlock> ScanProjectBlocks(const std::string& text) {
    // Project("{type}") = "Name", "path\to\project.csproj", "{GUID}"
    static const std::regex proj_re(R"xxx(^Project\s*\("[^"]+"\)\s*=\s*"[^"]*"\s*,\s*"([^"]+)")xxx");

    std::vector<ProjectBlock> blocks;
    size_t pos = 0;
    ProjectBlock* open = nullptr;

    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        const size_t next = eol == std::string::npos ? text.size() : eol + 1;
        std::string line = text.substr(pos, next - pos);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

        if (!open) {
            std::smatch m;
            if (std::regex_search(line, m, proj_re)) {
                blocks.push_back(ProjectBlock{ pos, next, m[1].str() });
                open = &blocks.back();
            }
        } else if (line == "EndProject") {
            open->end = next;
            open = nullptr;
        }
        pos = next;
    }
    // drop a trailing block with no EndProject
    if (open) blocks.pop_back();
    return blocks;
}

std::string LeafName(const std::string& path) {
    const auto pos = path.find_last_of("\\/");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

bool MoveProjectFirst(std::string& solution_text, const std::string& project_file_name, bool& changed) {
    changed = false;
    const auto blocks = ScanProjectBlocks(solution_text);

    for (size_t i = 0; i < blocks.size(); ++i) {
        if (!EqualsIgnoreCase(LeafName(blocks[i].path), project_file_name)) continue;
        if (i == 0) return true;

        std::string block = solution_text.substr(blocks[i].begin, blocks[i].end - blocks[i].begin);
        if (block.empty() || block.back() != '\n') block += "\r\n";
        solution_text.erase(blocks[i].begin, blocks[i].end - blocks[i].begin);
        solution_text.insert(blocks[0].begin, block);
        changed = true;
        return true;
    }
    return false;
}

std::string SolutionStartupRegistrar::Register(const fs::path& workspace_root, const fs::path& project_file) {
    const std::string project_name = project_file.filename().string();

    for (const auto& file : ListFilesRecursive(workspace_root)) {
        if (!EqualsIgnoreCase(file.extension().string(), ".sln")) continue;

        std::string text, err;
        if (!ReadAllText(file, text, err)) continue;

        bool changed = false;
        if (!MoveProjectFirst(text, project_name, changed)) continue;

        if (!changed) {
            return project_name + " is already the first project in " + file.string();
        }
        if (!WriteAllText(file, text, err)) {
            throw DeployError(ErrorKind::ExternalFailure, err, file);
        }
        return project_name + " moved to the top of " + file.string();
    }

    throw DeployError(ErrorKind::ExternalFailure,
                      "no solution under " + workspace_root.string() + " references " + project_name,
                      workspace_root);
}

} // namespace envstage
