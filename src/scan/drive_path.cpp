/*
 * WinPath-Guard Drive-Path Matcher Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Anchor search, boundary check and greedy extension over
 *              path bytes and backslash runs. See header for details.
 */
#include <winpath-guard/scan/drive_path.hpp>
#include <utility>

namespace pathguard {

static bool is_ascii_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
static bool is_ascii_alnum(char c) { return is_ascii_alpha(c) || (c >= '0' && c <= '9'); }

bool is_path_char(char c) {
    if (is_ascii_alnum(c)) return true;
    switch (c) {
        case '-': case '_': case '.': case '~': case '+': case '@': case '#': return true;
        default: return false;
    }
}

DrivePathMatcher::DrivePathMatcher(const std::string& input) : m_input(input) {}

bool DrivePathMatcher::at_anchor(std::size_t i) const {
    return i + 2 < m_input.size() && is_ascii_alpha(m_input[i]) && m_input[i+1] == ':' && m_input[i+2] == '\\';
}

static bool is_separator(char c) { return c == '/' || c == '\\'; }

// The byte before the drive letter must not continue a word ("error:"). A
// letter reached through path bytes from an earlier "X:\" or "X:/" is the tail
// of that path ("C:\a.b:\c"), so it is not an anchor either, before or after
// the earlier path was rewritten.
bool DrivePathMatcher::boundary_ok(std::size_t i) const {
    if (i == 0) return true;
    if (is_ascii_alnum(m_input[i-1])) return false;
    std::size_t k = i;
    while (k > 0 && (is_path_char(m_input[k-1]) || is_separator(m_input[k-1]))) --k;
    // k is now the first byte of the chain; look for "X:" right before it
    if (k < 2 || m_input[k-1] != ':' || !is_separator(m_input[k])) return true;
    if (!is_ascii_alpha(m_input[k-2])) return true;
    return k >= 3 && is_ascii_alnum(m_input[k-3]);
}

DrivePathCandidate DrivePathMatcher::extend(std::size_t start) {
    DrivePathCandidate cand{start, start, {}};
    std::size_t i = start + 2; // past "X:"
    while (i < m_input.size()) {
        char c = m_input[i];
        if (c == '\\') {
            std::size_t run_start = i;
            while (i < m_input.size() && m_input[i] == '\\') ++i;
            cand.runs.push_back({run_start, i - run_start});
            // trailing separator: the run stays in the candidate, the path ends
            if (i >= m_input.size() || !is_path_char(m_input[i])) break;
        } else if (is_path_char(c)) {
            ++i;
        } else {
            break;
        }
    }
    cand.end = i;
    return cand;
}

std::optional<DrivePathCandidate> DrivePathMatcher::next() {
    while (m_pos < m_input.size()) {
        if (at_anchor(m_pos) && boundary_ok(m_pos)) {
            DrivePathCandidate cand = extend(m_pos);
            m_pos = cand.end;
            return cand;
        }
        ++m_pos;
    }
    return std::nullopt;
}

std::vector<DrivePathCandidate> find_drive_paths(const std::string& input) {
    std::vector<DrivePathCandidate> out;
    DrivePathMatcher m(input);
    while (auto cand = m.next()) out.push_back(std::move(*cand));
    return out;
}

std::string to_forward_slashes(const std::string& input, const DrivePathCandidate& cand) {
    std::string out; out.reserve(cand.end - cand.start);
    std::size_t i = cand.start;
    for (auto &run : cand.runs) {
        out.append(input, i, run.pos - i);
        out.push_back('/');
        i = run.pos + run.length;
    }
    out.append(input, i, cand.end - i);
    return out;
}

std::string candidate_text(const std::string& input, const DrivePathCandidate& cand) {
    return input.substr(cand.start, cand.end - cand.start);
}

} // namespace pathguard
