// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_metadata.hpp
 * @brief Build-copy directive and debug-launch settings in MSBuild documents.
 *
 * Both updates are read-modify-write over a parsed XML tree. Every field edit
 * is a find-or-create that reports whether it changed anything; a document is
 * saved only when at least one edit did. A document that does not parse is
 * rejected with CorruptMetadata before anything is written.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <pugixml.hpp>

namespace envstage {

inline constexpr const char* kDebugAnyCpuCondition = "'$(Configuration)|$(Platform)' == 'Debug|AnyCPU'";

enum class CopyDirectiveOutcome {
    NotRegistered,   // no item for the file; copying is left to convention
    AlreadyCorrect,
    Updated,
};

const char* CopyDirectiveOutcomeName(CopyDirectiveOutcome outcome);

struct CopyDirectiveResult {
    CopyDirectiveOutcome outcome = CopyDirectiveOutcome::NotRegistered;
    std::string item_include;       // Include/Update value of the matched item
    std::string previous_value;     // CopyToOutputDirectory before the edit
    bool written = false;
};

struct DebugLaunchSettings {
    std::string start_action = "Program";
    std::string start_program;
    std::string start_arguments;
};

struct DebugLaunchResult {
    bool document_created = false;
    bool group_created = false;
    std::vector<std::string> changed_fields;
    bool written = false;

    bool changed() const { return document_created || group_created || !changed_fields.empty(); }
};

// In-memory MSBuild document bound to its file.
class MetadataDocument {
public:
    enum class Mode { MustExist, CreateIfMissing };

    // Throws DeployError(CorruptMetadata) if the file cannot be read or parsed,
    // or its root element is not <Project>. With CreateIfMissing a missing file
    // starts as an empty <Project> document.
    explicit MetadataDocument(std::filesystem::path file, Mode mode = Mode::MustExist);

    MetadataDocument(const MetadataDocument&) = delete;
    MetadataDocument& operator=(const MetadataDocument&) = delete;

    const std::filesystem::path& file() const { return file_; }
    bool is_new() const { return is_new_; }
    pugi::xml_node project() const { return doc_.document_element(); }

    // New documents are indented; loaded ones keep their layout, line
    // endings and processing instructions.
    std::string Serialize() const;

    // Throws DeployError(WriteFailure).
    void Save() const;

private:
    std::filesystem::path file_;
    pugi::xml_document doc_;
    bool is_new_ = false;
    bool had_bom_ = false;
    std::string newline_ = "\n";
    bool had_final_newline_ = true;
};

// Find-or-create <name>value</name> under `parent`. Returns true if it changed.
bool EnsureChildText(pugi::xml_node parent, const char* name, const std::string& value);

// Item (any element under an ItemGroup) whose Include or Update names `file_name`.
pugi::xml_node FindItemForFile(pugi::xml_node project, const std::string& file_name);

// PropertyGroup whose Condition matches `condition` ignoring whitespace and case.
pugi::xml_node FindConditionGroup(pugi::xml_node project, const std::string& condition);

// Sets CopyToOutputDirectory=Always on the item for `file_name`; does not save.
CopyDirectiveResult EnsureCopyAlways(pugi::xml_node project, const std::string& file_name);

// Sets StartAction/StartProgram/StartArguments in the Debug|AnyCPU group; does not save.
DebugLaunchResult EnsureDebugLaunch(pugi::xml_node project, const DebugLaunchSettings& settings);

// File-level wrappers: load, edit, save only if changed (never when dry_run).
CopyDirectiveResult UpdateCopyDirective(const std::filesystem::path& project_file,
                                        const std::string& file_name,
                                        bool dry_run = false);

DebugLaunchResult UpdateDebugLaunch(const std::filesystem::path& user_file,
                                    const DebugLaunchSettings& settings,
                                    bool dry_run = false);

// "<project file>.user"
std::filesystem::path UserSettingsPathFor(const std::filesystem::path& project_file);

} // namespace envstage
