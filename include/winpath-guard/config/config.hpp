/*
 * WinPath-Guard configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   key=value rc file (~/.winpath-guardrc, or $WINPATH_GUARD_RC). Lines
 *   starting with '#' and blank lines are skipped, unknown keys ignored.
 *   Booleans accept 1|true|on.
 */
#pragma once
#include <string>
#include <vector>
#include "winpath-guard/scan/inline_script.hpp"

namespace pathguard {

enum class GuardMode { Fix, Check };

struct GuardConfig {
    bool enabled = true;              // enabled
    GuardMode mode = GuardMode::Fix;  // mode: fix|check
    bool color = true;                // color
    bool debug = false;               // debug
    GuardOptions options;             // inline_markers, bypass_tag
};

// Apply a single rc line. Returns false and fills warning if the line was rejected.
bool apply_config_line(GuardConfig& cfg, const std::string& line, std::string* warning = nullptr);

// Missing or unreadable file leaves the defaults.
GuardConfig load_config_file(const std::string& path, std::vector<std::string>* warnings = nullptr);

// $WINPATH_GUARD_RC, else $HOME/.winpath-guardrc, else empty.
std::string default_config_path();

std::vector<std::string> split_list(const std::string& val);

const char* to_string(GuardMode m);

} // namespace pathguard
