/*
 * WinPath-Guard Hazard Classifier (diagnostic / blocking)
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Decides whether a command would corrupt a Windows drive path and explains
 *   why. Checks run in a fixed order and the first match is the verdict:
 *     SpecialDeviceAlias      quoted '/dev/stdin' etc. inside a node -e command
 *     TrailingQuoteCollision  "C:\dir\" : the \" escapes the closing quote
 *     InlineScriptEscape      single backslashes reaching node's own escapes
 *     UnquotedBackslashLoss   C:\src\file : bash strips every separator
 *   Reordering the checks changes which verdict a command gets.
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
#include <optional>
#include <cstddef>
#include "winpath-guard/scan/inline_script.hpp"

namespace pathguard {

struct HazardFinding {
    enum class Kind { SpecialDeviceAlias, TrailingQuoteCollision, InlineScriptEscape, UnquotedBackslashLoss } kind;
    std::size_t offset;     // start of the offending text in the command
    std::string matched;    // offending text as written
    std::string suggestion; // corrected form of the offending text
    std::string message;    // rendered explanation
};

// First hazard in check order, nullopt if the command is safe to run.
std::optional<HazardFinding> classify(const std::string& command, const GuardOptions& opts = {});

const char* to_string(HazardFinding::Kind k);

} // namespace pathguard
