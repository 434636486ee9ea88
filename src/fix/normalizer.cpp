/*
 * WinPath-Guard Path Normalizer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Device-literal substitution and drive-path slash conversion.
 *              See header for overview.
 */
#include <winpath-guard/fix/normalizer.hpp>
#include <winpath-guard/scan/drive_path.hpp>
#include <sstream>

namespace pathguard {

const char* describe(FixKind k) {
    switch (k) {
        case FixKind::DeviceAlias: return "device paths (/dev/stdin, /dev/stdout, /dev/stderr) replaced with fd numbers (they don't exist on Windows)";
        case FixKind::ForwardSlashes: return "backslash paths converted to forward slashes (avoids bash escape issues)";
    }
    return "?";
}

static bool replace_all(std::string& s, const std::string& from, const std::string& to) {
    bool changed = false; size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
        changed = true;
    }
    return changed;
}

bool replace_device_literals(std::string& command, const GuardOptions& opts) {
    if (!find_inline_script_marker(command, opts.inline_markers)) return false;
    bool changed = false;
    for (auto &lit : device_literals()) changed |= replace_all(command, lit.quoted, lit.descriptor);
    return changed;
}

bool convert_drive_paths(std::string& command) {
    auto cands = find_drive_paths(command);
    if (cands.empty()) return false;
    std::string out; out.reserve(command.size());
    size_t i = 0;
    for (auto &c : cands) {
        out.append(command, i, c.start - i);
        out += to_forward_slashes(command, c);
        i = c.end;
    }
    out.append(command, i, std::string::npos);
    command = std::move(out);
    return true; // every candidate holds at least one run
}

std::optional<FixOutcome> normalize(const std::string& command, const GuardOptions& opts) {
    FixOutcome fo; fo.command = command;
    if (replace_device_literals(fo.command, opts)) fo.applied.push_back(FixKind::DeviceAlias);
    if (convert_drive_paths(fo.command)) fo.applied.push_back(FixKind::ForwardSlashes);
    if (fo.applied.empty()) return std::nullopt;

    std::ostringstream note;
    note << "winpath-guard rewrote this command: ";
    for (size_t k = 0; k < fo.applied.size(); ++k) { if (k) note << "; "; note << describe(fo.applied[k]); }
    note << ". Use forward-slash paths on Windows to avoid this.";
    if (!opts.bypass_tag.empty()) note << " To bypass rewriting, add " << opts.bypass_tag << " to the command description.";
    fo.note = note.str();
    return fo;
}

} // namespace pathguard
