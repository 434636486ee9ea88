/*
 * WinPath-Guard Quote Scanner
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Walks a command line byte by byte tracking the shell quoting state
 *   (unquoted, '...' or "...") and whether the previous byte was an
 *   unconsumed backslash. This is not a tokenizer: it only reports, for every
 *   offset, the state before that byte is consumed. Any byte sequence is
 *   accepted; an unterminated quote is simply the residual state at the end.
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
#include <cstddef>

namespace pathguard {

enum class QuoteState {
    Unquoted,
    SingleQuoted,
    DoubleQuoted
};

// State observed before a byte is consumed.
struct ScanPoint {
    QuoteState state = QuoteState::Unquoted;
    bool pending_escape = false; // previous byte was an unconsumed backslash
};

class QuoteScanner {
public:
    explicit QuoteScanner(const std::string& input);

    // Consume one byte and return it ('\0' at eof).
    char advance();
    char peek() const;
    bool eof() const;
    std::size_t pos() const { return m_pos; }
    QuoteState state() const { return m_state; }
    bool pending_escape() const { return m_pending_escape; }
    ScanPoint point() const { return {m_state, m_pending_escape}; }

private:
    const std::string& m_input;
    std::size_t m_pos = 0;
    QuoteState m_state = QuoteState::Unquoted;
    bool m_pending_escape = false;
};

// One entry per byte plus a trailing entry with the residual state (size n+1).
std::vector<ScanPoint> scan_quote_states(const std::string& input);

const char* to_string(QuoteState s);

} // namespace pathguard
