// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_startup.hpp
 * @brief Optional "make this the startup project" step.
 *
 * Prompt and StartupRegistrar are capabilities the pipeline receives from its
 * caller, so tests inject fixed answers instead of reading a keyboard.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace envstage {

enum class PromptAnswer { Yes, No, TimedOut };

const char* PromptAnswerName(PromptAnswer answer);

class Prompt {
public:
    virtual ~Prompt() = default;
    // Must return within `timeout`; TimedOut is treated as "no".
    virtual PromptAnswer Ask(const std::string& question, std::chrono::seconds timeout) = 0;
};

inline constexpr int kNoKey = -1;       // nothing arrived within the wait
inline constexpr int kEndOfInput = -2;

// Waits at most `wait` for one key; returns it, kNoKey or kEndOfInput.
using KeySource = std::function<int(std::chrono::milliseconds wait)>;

// Collects keys until Enter or end of input. Returns nullopt when the
// deadline passes first, even if part of a line was typed.
std::optional<std::string> ReadLineUntil(const KeySource& next_key,
                                         std::chrono::steady_clock::time_point deadline);

// Reads a y/n line from the console, waiting at most the timeout.
class ConsolePrompt : public Prompt {
public:
    PromptAnswer Ask(const std::string& question, std::chrono::seconds timeout) override;
};

class FixedPrompt : public Prompt {
public:
    explicit FixedPrompt(PromptAnswer answer) : answer_(answer) {}

    PromptAnswer Ask(const std::string& question, std::chrono::seconds) override {
        last_question_ = question;
        ++asked_;
        return answer_;
    }

    int asked() const { return asked_; }
    const std::string& last_question() const { return last_question_; }

private:
    PromptAnswer answer_;
    int asked_ = 0;
    std::string last_question_;
};

// Interprets a typed answer: y/yes -> Yes, anything else -> No.
PromptAnswer ParseAnswer(const std::string& line);

class StartupRegistrar {
public:
    virtual ~StartupRegistrar() = default;
    // Returns a human-readable description of what was persisted.
    // Throws DeployError(ExternalFailure) when registration is impossible.
    virtual std::string Register(const std::filesystem::path& workspace_root,
                                 const std::filesystem::path& project_file) = 0;
};

// Persists the startup project by moving its entry to the top of the
// solution file that references it.
class SolutionStartupRegistrar : public StartupRegistrar {
public:
    std::string Register(const std::filesystem::path& workspace_root,
                         const std::filesystem::path& project_file) override;
};

// Moves the Project(...)...EndProject block whose path names `project_file_name`
// in front of all other project blocks. Returns false if no block matches.
// `changed` is false when the block was already first.
bool MoveProjectFirst(std::string& solution_text, const std::string& project_file_name, bool& changed);

} // namespace envstage
