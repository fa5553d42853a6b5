// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_config_transform.cpp
 * @brief Environment rewrite implementation.
 */

#include "es_config_transform.hpp"
#include "es_error.hpp"

#include <cctype>
#include <cstdint>
#include <iterator>
#include <regex>

namespace envstage {

namespace {

const std::regex& DriveRootPattern() {
    static const std::regex re(R"([A-Za-z]:\\)");
    return re;
}

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string ComputeHostname(const std::string& environment, const std::string& domain_suffix) {
    if (domain_suffix.empty()) return environment;
    return environment + "." + domain_suffix;
}

bool IsValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<uint8_t>(text[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80)                { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > text.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<uint8_t>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

size_t CountDriveRoots(std::string_view text) {
    auto begin = std::cregex_iterator(text.data(), text.data() + text.size(), DriveRootPattern());
    return static_cast<size_t>(std::distance(begin, std::cregex_iterator()));
}

size_t RewriteDriveRoots(std::string& text, char target_drive) {
    const size_t count = CountDriveRoots(text);
    if (count == 0) return 0;
    std::string root;
    root += static_cast<char>(std::toupper(static_cast<unsigned char>(target_drive)));
    root += ":\\";
    text = std::regex_replace(text, DriveRootPattern(), root);
    return count;
}

std::string TransformConfig(std::string_view raw, const TransformOptions& opts) {
    if (!IsValidUtf8(raw)) {
        throw DeployError(ErrorKind::InvalidEncoding, "config text is not valid UTF-8");
    }

    const std::string hostname = ComputeHostname(opts.environment, opts.domain_suffix);
    if (!opts.hostname_placeholder.empty() && hostname.find(opts.hostname_placeholder) != std::string::npos) {
        throw DeployError(ErrorKind::InvalidSettings,
                          "hostname '" + hostname + "' contains the placeholder '" +
                          opts.hostname_placeholder + "'");
    }

    std::string out(raw);
    ReplaceAll(out, opts.hostname_placeholder, hostname);
    RewriteDriveRoots(out, opts.target_drive);

    // a replacement can run into the following text and spell the placeholder again
    if (!opts.hostname_placeholder.empty()) {
        const size_t pos = out.find(opts.hostname_placeholder);
        if (pos != std::string::npos) {
            throw DeployError(ErrorKind::InvalidSettings,
                              "rewriting '" + opts.hostname_placeholder + "' to '" + hostname +
                              "' leaves the placeholder at offset " + std::to_string(pos) +
                              " of the transformed text");
        }
    }
    return out;
}

std::string MakePreview(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) return std::string(text);
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<uint8_t>(text[cut]) & 0xC0) == 0x80) --cut;
    return std::string(text.substr(0, cut)) + "...";
}

} // namespace envstage
