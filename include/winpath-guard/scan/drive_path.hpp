/*
 * WinPath-Guard Drive-Path Matcher
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Finds backslash-style drive paths (C:\src\project) inside a command line.
 *   A candidate starts at the anchor <letter>:\ and greedily extends over path
 *   component bytes and backslash runs. A run of 1, 2 or 4 backslashes is one
 *   logical separator regardless of how many escaping layers it went through.
 *   Candidates are produced lazily, left to right, never overlapping.
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
#include <cstddef>

namespace pathguard {

struct BackslashRun {
    std::size_t pos;     // offset of the first backslash
    std::size_t length;  // number of consecutive backslashes
};

struct DrivePathCandidate {
    std::size_t start;               // offset of the drive letter
    std::size_t end;                 // one past the last byte (exclusive)
    std::vector<BackslashRun> runs;  // in order; never empty
};

class DrivePathMatcher {
public:
    explicit DrivePathMatcher(const std::string& input);
    // Next candidate to the right of the previous one, nullopt when exhausted.
    std::optional<DrivePathCandidate> next();
private:
    bool at_anchor(std::size_t i) const;
    bool boundary_ok(std::size_t i) const;
    DrivePathCandidate extend(std::size_t start);

    const std::string& m_input;
    std::size_t m_pos = 0;
};

std::vector<DrivePathCandidate> find_drive_paths(const std::string& input);

// ASCII alphanumerics and - _ . ~ + @ #
bool is_path_char(char c);

// Candidate text with every backslash run collapsed to a single '/'.
std::string to_forward_slashes(const std::string& input, const DrivePathCandidate& cand);

// Candidate text exactly as written in the command.
std::string candidate_text(const std::string& input, const DrivePathCandidate& cand);

} // namespace pathguard
