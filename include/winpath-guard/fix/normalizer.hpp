/*
 * WinPath-Guard Path Normalizer (auto-repair)
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Rewrites a command so that it survives bash and embedded interpreters on
 *   Windows. Two fixes, applied in this order on a copy of the command:
 *     1. quoted '/dev/stdin' | '/dev/stdout' | '/dev/stderr' become 0 | 1 | 2,
 *        only when the command contains an inline-script marker (node -e ...);
 *     2. every backslash run inside a drive path becomes a single '/'.
 *   normalize() returns nullopt when nothing changed. The rewrite is
 *   idempotent: normalizing its own output always yields nullopt.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include "winpath-guard/scan/inline_script.hpp"

namespace pathguard {

enum class FixKind {
    DeviceAlias,
    ForwardSlashes
};

// Human readable label used in the rewrite note.
const char* describe(FixKind k);

struct FixOutcome {
    std::string command;          // fully rewritten command
    std::vector<FixKind> applied; // in application order
    std::string note;             // advisory text for the caller to surface
};

// nullopt means "no change, run the command as is".
std::optional<FixOutcome> normalize(const std::string& command, const GuardOptions& opts = {});

// Individual fixes; each returns true if it modified the command.
bool replace_device_literals(std::string& command, const GuardOptions& opts);
bool convert_drive_paths(std::string& command);

} // namespace pathguard
