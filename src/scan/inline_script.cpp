/*
 * WinPath-Guard inline-script and special-device vocabulary
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpath-guard/scan/inline_script.hpp>

namespace pathguard {

std::vector<std::string> default_inline_markers() {
    return {"node -e", "node --eval", "node -p", "node --print"};
}

const std::vector<DeviceLiteral>& device_literals() {
    static const std::vector<DeviceLiteral> table = {
        {"'/dev/stdin'", "0"},  {"\"/dev/stdin\"", "0"},
        {"'/dev/stdout'", "1"}, {"\"/dev/stdout\"", "1"},
        {"'/dev/stderr'", "2"}, {"\"/dev/stderr\"", "2"},
    };
    return table;
}

std::optional<std::size_t> find_inline_script_marker(const std::string& command, const std::vector<std::string>& markers) {
    std::optional<std::size_t> best;
    for (auto &m : markers) {
        if (m.empty()) continue;
        size_t p = command.find(m);
        if (p != std::string::npos && (!best || p < *best)) best = p;
    }
    return best;
}

std::optional<DeviceLiteralMatch> find_device_literal(const std::string& command) {
    std::optional<DeviceLiteralMatch> best;
    for (auto &lit : device_literals()) {
        size_t p = command.find(lit.quoted);
        if (p != std::string::npos && (!best || p < best->offset)) best = DeviceLiteralMatch{p, lit};
    }
    return best;
}

} // namespace pathguard
