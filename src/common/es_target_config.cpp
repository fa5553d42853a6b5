// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file es_target_config.cpp
 * @brief Target config lookup, backup and write.
 */

#include "es_target_config.hpp"
#include "es_error.hpp"
#include "es_text.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace envstage {

namespace fs = std::filesystem;

fs::path FindTargetConfig(const fs::path& project_dir,
                          const std::string& name,
                          const std::vector<fs::path>& excluded) {
    // 1) directly in the project directory
    std::error_code ec;
    for (fs::directory_iterator it(project_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_regular_file(sec) && EqualsIgnoreCase(it->path().filename().string(), name)) {
            return it->path();
        }
    }

    // 2) anywhere below it
    for (const auto& file : ListFilesRecursive(project_dir, excluded)) {
        if (EqualsIgnoreCase(file.filename().string(), name)) return file;
    }

    throw DeployError(ErrorKind::TargetConfigNotFound,
                      "no " + name + " under " + project_dir.string(), project_dir);
}

fs::path BackupPathFor(const fs::path& target, std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream name;
    name << target.filename().string() << "." << std::put_time(&tm_buf, "%Y%m%d-%H%M%S") << ".bak";
    return target.parent_path() / name.str();
}

bool WriteAllText(const fs::path& path, std::string_view content, std::string& err) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) { err = "cannot open for writing: " + path.string(); return false; }
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
    f.flush();
    if (!f) { err = "write failed: " + path.string(); return false; }
    return true;
}

StageResult BackupAndWrite(const fs::path& target,
                           std::string_view content,
                           std::chrono::system_clock::time_point now) {
    StageResult result;

    std::string current, err;
    if (ReadAllText(target, current, err) && current == content) {
        return result;
    }

    std::error_code ec;
    if (fs::exists(target, ec)) {
        fs::path backup = BackupPathFor(target, now);
        // two runs within the same second keep both backups
        for (int n = 1; fs::exists(backup, ec); ++n) {
            backup = BackupPathFor(target, now);
            backup += "." + std::to_string(n);
        }
        if (!fs::copy_file(target, backup, fs::copy_options::none, ec)) {
            throw DeployError(ErrorKind::WriteFailure,
                              "cannot back up " + target.string() + ": " + ec.message(), backup);
        }
        result.backup_file = backup;
    }

    if (!WriteAllText(target, content, err)) {
        throw DeployError(ErrorKind::WriteFailure, err, target);
    }
    result.written = true;
    return result;
}

} // namespace envstage
