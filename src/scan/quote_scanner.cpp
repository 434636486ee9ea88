/*
 * WinPath-Guard Quote Scanner Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Single left-to-right pass over the command, see header.
 */
#include <winpath-guard/scan/quote_scanner.hpp>

namespace pathguard {

QuoteScanner::QuoteScanner(const std::string& input) : m_input(input) {}

char QuoteScanner::peek() const { return eof() ? '\0' : m_input[m_pos]; }
bool QuoteScanner::eof() const { return m_pos >= m_input.size(); }

char QuoteScanner::advance() {
    if (eof()) return '\0';
    char c = m_input[m_pos++];
    // An escaped byte is literal whatever it is; the escape never chains.
    if (m_pending_escape) { m_pending_escape = false; return c; }
    switch (c) {
        case '\\':
            if (m_state != QuoteState::SingleQuoted) m_pending_escape = true;
            break;
        case '\'':
            if (m_state == QuoteState::Unquoted) m_state = QuoteState::SingleQuoted;
            else if (m_state == QuoteState::SingleQuoted) m_state = QuoteState::Unquoted;
            break;
        case '"':
            if (m_state == QuoteState::Unquoted) m_state = QuoteState::DoubleQuoted;
            else if (m_state == QuoteState::DoubleQuoted) m_state = QuoteState::Unquoted;
            break;
        default: break;
    }
    return c;
}

std::vector<ScanPoint> scan_quote_states(const std::string& input) {
    std::vector<ScanPoint> points; points.reserve(input.size() + 1);
    QuoteScanner sc(input);
    while (!sc.eof()) { points.push_back(sc.point()); sc.advance(); }
    points.push_back(sc.point());
    return points;
}

const char* to_string(QuoteState s) {
    switch (s) {
        case QuoteState::Unquoted: return "unquoted";
        case QuoteState::SingleQuoted: return "single-quoted";
        case QuoteState::DoubleQuoted: return "double-quoted";
    }
    return "?";
}

} // namespace pathguard
