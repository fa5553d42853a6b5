// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_metadata.cpp
 * @brief MSBuild document editing with pugixml.
 */

#include "es_metadata.hpp"
#include "es_error.hpp"
#include "es_target_config.hpp"
#include "es_text.hpp"

#include <cctype>
#include <sstream>
#include <system_error>

namespace envstage {

namespace fs = std::filesystem;

namespace {

constexpr const char* kMsBuildNamespace = "http://schemas.microsoft.com/developer/msbuild/2003";
// whitespace nodes and raw line ends are kept so an edited file differs only where it was edited
constexpr unsigned kParseOptions = (pugi::parse_default & ~pugi::parse_eol) | pugi::parse_declaration |
                                   pugi::parse_comments | pugi::parse_pi | pugi::parse_ws_pcdata;

std::string StripSpaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        if (!std::isspace(static_cast<unsigned char>(ch))) out.push_back(ch);
    }
    return out;
}

bool IsBlank(const char* s) {
    for (; *s; ++s) {
        if (!std::isspace(static_cast<unsigned char>(*s))) return false;
    }
    return true;
}

// Appends an element laid out like its siblings. A parent without whitespace
// nodes (a new document, or single-line markup) gets a plain append.
pugi::xml_node AppendIndentedChild(pugi::xml_node parent, const char* name) {
    pugi::xml_node closing = parent.last_child();
    if (closing.type() != pugi::node_pcdata || !IsBlank(closing.value())) {
        return parent.append_child(name);
    }

    std::string indent;
    for (pugi::xml_node n = parent.first_child(); n; n = n.next_sibling()) {
        pugi::xml_node before = n.previous_sibling();
        if (n.type() == pugi::node_element && before.type() == pugi::node_pcdata && IsBlank(before.value())) {
            indent = before.value();
            break;
        }
    }
    if (indent.empty()) indent = std::string(closing.value()) + "  ";

    pugi::xml_node child = parent.insert_child_before(name, closing);
    parent.insert_child_before(pugi::node_pcdata, child).set_value(indent.c_str());
    return child;
}

// "Config\App.config" -> "App.config"
std::string LeafName(const std::string& include) {
    const auto pos = include.find_last_of("\\/");
    return pos == std::string::npos ? include : include.substr(pos + 1);
}

} // namespace

const char* CopyDirectiveOutcomeName(CopyDirectiveOutcome outcome) {
    switch (outcome) {
    case CopyDirectiveOutcome::NotRegistered:  return "not-registered";
    case CopyDirectiveOutcome::AlreadyCorrect: return "already-correct";
    case CopyDirectiveOutcome::Updated:        return "updated";
    }
    return "unknown";
}

// ============== MetadataDocument ==============

MetadataDocument::MetadataDocument(fs::path file, Mode mode)
    : file_(std::move(file)) {
    std::error_code ec;
    if (mode == Mode::CreateIfMissing && !fs::exists(file_, ec)) {
        is_new_ = true;
        auto decl = doc_.append_child(pugi::node_declaration);
        decl.append_attribute("version") = "1.0";
        decl.append_attribute("encoding") = "utf-8";
        auto root = doc_.append_child("Project");
        root.append_attribute("ToolsVersion") = "Current";
        root.append_attribute("xmlns") = kMsBuildNamespace;
        return;
    }

    std::string text, err;
    if (!ReadAllText(file_, text, err)) {
        throw DeployError(ErrorKind::CorruptMetadata, err, file_);
    }
    had_bom_ = text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0;
    newline_ = text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
    had_final_newline_ = !text.empty() && text.back() == '\n';

    pugi::xml_parse_result parsed = doc_.load_buffer(text.data(), text.size(), kParseOptions);
    if (!parsed) {
        throw DeployError(ErrorKind::CorruptMetadata,
                          file_.string() + ": " + parsed.description() +
                          " at offset " + std::to_string(parsed.offset), file_);
    }
    if (std::string(doc_.document_element().name()) != "Project") {
        throw DeployError(ErrorKind::CorruptMetadata,
                          file_.string() + ": root element is not <Project>", file_);
    }
}

std::string MetadataDocument::Serialize() const {
    std::ostringstream out;
    if (is_new_) {
        doc_.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
        return out.str();
    }

    // the parser drops whitespace between top-level nodes; everything
    // inside <Project> is printed exactly as held
    if (had_bom_) out << "\xEF\xBB\xBF";
    for (pugi::xml_node node = doc_.first_child(); node; node = node.next_sibling()) {
        if (node != doc_.first_child()) out << newline_;
        node.print(out, "", pugi::format_raw, pugi::encoding_utf8);
    }
    if (had_final_newline_) out << newline_;
    return out.str();
}

void MetadataDocument::Save() const {
    std::string err;
    if (!WriteAllText(file_, Serialize(), err)) {
        throw DeployError(ErrorKind::WriteFailure, err, file_);
    }
}

// ============== Tree edits ==============

bool EnsureChildText(pugi::xml_node parent, const char* name, const std::string& value) {
    pugi::xml_node child = parent.child(name);
    if (!child) {
        child = AppendIndentedChild(parent, name);
        child.text().set(value.c_str());
        return true;
    }
    if (value == child.text().get()) return false;
    child.text().set(value.c_str());
    return true;
}

pugi::xml_node FindItemForFile(pugi::xml_node project, const std::string& file_name) {
    for (pugi::xml_node group : project.children("ItemGroup")) {
        for (pugi::xml_node item : group.children()) {
            if (item.type() != pugi::node_element) continue;
            for (const char* attr : { "Include", "Update" }) {
                const std::string value = item.attribute(attr).value();
                if (!value.empty() && EqualsIgnoreCase(LeafName(value), file_name)) return item;
            }
        }
    }
    return {};
}

pugi::xml_node FindConditionGroup(pugi::xml_node project, const std::string& condition) {
    const std::string wanted = ToLower(StripSpaces(condition));
    for (pugi::xml_node group : project.children("PropertyGroup")) {
        if (ToLower(StripSpaces(group.attribute("Condition").value())) == wanted) return group;
    }
    return {};
}

CopyDirectiveResult EnsureCopyAlways(pugi::xml_node project, const std::string& file_name) {
    CopyDirectiveResult result;
    pugi::xml_node item = FindItemForFile(project, file_name);
    if (!item) return result;

    result.item_include = item.attribute("Include") ? item.attribute("Include").value()
                                                    : item.attribute("Update").value();

    // SDK-style projects may carry the metadata as an attribute
    if (pugi::xml_attribute attr = item.attribute("CopyToOutputDirectory")) {
        result.previous_value = attr.value();
        if (result.previous_value == "Always") {
            result.outcome = CopyDirectiveOutcome::AlreadyCorrect;
        } else {
            attr.set_value("Always");
            result.outcome = CopyDirectiveOutcome::Updated;
        }
        return result;
    }

    result.previous_value = item.child("CopyToOutputDirectory").text().get();
    result.outcome = EnsureChildText(item, "CopyToOutputDirectory", "Always")
        ? CopyDirectiveOutcome::Updated
        : CopyDirectiveOutcome::AlreadyCorrect;
    return result;
}

DebugLaunchResult EnsureDebugLaunch(pugi::xml_node project, const DebugLaunchSettings& settings) {
    DebugLaunchResult result;

    pugi::xml_node group = FindConditionGroup(project, kDebugAnyCpuCondition);
    if (!group) {
        group = AppendIndentedChild(project, "PropertyGroup");
        group.append_attribute("Condition") = kDebugAnyCpuCondition;
        // give the empty group a closing line so its properties indent below it
        pugi::xml_node ws = group.previous_sibling();
        if (ws.type() == pugi::node_pcdata) {
            group.append_child(pugi::node_pcdata).set_value(ws.value());
        }
        result.group_created = true;
    }

    if (EnsureChildText(group, "StartAction", settings.start_action))
        result.changed_fields.push_back("StartAction");
    if (EnsureChildText(group, "StartProgram", settings.start_program))
        result.changed_fields.push_back("StartProgram");
    if (EnsureChildText(group, "StartArguments", settings.start_arguments))
        result.changed_fields.push_back("StartArguments");
    return result;
}

// ============== File-level updates ==============

CopyDirectiveResult UpdateCopyDirective(const fs::path& project_file,
                                        const std::string& file_name,
                                        bool dry_run) {
    MetadataDocument doc(project_file);
    CopyDirectiveResult result = EnsureCopyAlways(doc.project(), file_name);
    if (result.outcome == CopyDirectiveOutcome::Updated && !dry_run) {
        doc.Save();
        result.written = true;
    }
    return result;
}

DebugLaunchResult UpdateDebugLaunch(const fs::path& user_file,
                                    const DebugLaunchSettings& settings,
                                    bool dry_run) {
    MetadataDocument doc(user_file, MetadataDocument::Mode::CreateIfMissing);
    DebugLaunchResult result = EnsureDebugLaunch(doc.project(), settings);
    result.document_created = doc.is_new();
    if (result.changed() && !dry_run) {
        doc.Save();
        result.written = true;
    }
    return result;
}

fs::path UserSettingsPathFor(const fs::path& project_file) {
    fs::path p = project_file;
    p += ".user";
    return p;
}

} // namespace envstage
