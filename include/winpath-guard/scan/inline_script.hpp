/*
 * WinPath-Guard inline-script and special-device vocabulary
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Substring gates shared by the normalizer and the classifier: where an
 *   inline script (node -e "...") starts, and which quoted device paths
 *   ('/dev/stdin' and friends) map to which file descriptor.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace pathguard {

std::vector<std::string> default_inline_markers();

struct GuardOptions {
    std::vector<std::string> inline_markers = default_inline_markers();
    std::string bypass_tag = "[no-rewrite]"; // named in the rewrite note
};

struct DeviceLiteral {
    const char* quoted;      // e.g. '/dev/stdin' including the quotes
    const char* descriptor;  // "0", "1" or "2"
};

// Fixed table in replacement order (stdin, stdout, stderr; single then double quotes).
const std::vector<DeviceLiteral>& device_literals();

struct DeviceLiteralMatch {
    std::size_t offset;
    DeviceLiteral literal;
};

// Offset of the earliest inline-script marker, if any.
std::optional<std::size_t> find_inline_script_marker(const std::string& command, const std::vector<std::string>& markers);

// Earliest quoted device literal in the command.
std::optional<DeviceLiteralMatch> find_device_literal(const std::string& command);

} // namespace pathguard
