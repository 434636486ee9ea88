/*
 * WinPath-Guard Hazard Classifier Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Ordered hazard checks over the drive-path candidates and the
 *              quote states of one command. See header for overview.
 */
#include <winpath-guard/diag/classifier.hpp>
#include <winpath-guard/scan/drive_path.hpp>
#include <winpath-guard/scan/quote_scanner.hpp>
#include <cctype>
#include <vector>

namespace pathguard {

const char* to_string(HazardFinding::Kind k) {
    switch (k) {
        case HazardFinding::Kind::SpecialDeviceAlias: return "special-device-alias";
        case HazardFinding::Kind::TrailingQuoteCollision: return "trailing-quote-collision";
        case HazardFinding::Kind::InlineScriptEscape: return "inline-script-escape";
        case HazardFinding::Kind::UnquotedBackslashLoss: return "unquoted-backslash-loss";
    }
    return "?";
}

namespace {

// Everything classify() looks at, computed once per command.
struct ScanContext {
    const std::string& command;
    std::optional<std::size_t> marker;
    std::vector<DrivePathCandidate> cands;
    std::vector<ScanPoint> states;
};

// Byte after a closing quote that was meant to end the word.
bool is_word_end(const std::string& s, std::size_t i) {
    if (i >= s.size()) return true;
    char c = s[i];
    if (std::isspace(static_cast<unsigned char>(c))) return true;
    return c=='|'||c=='&'||c==';'||c=='<'||c=='>'||c==')';
}

// What bash leaves of an unquoted path: each run of n backslashes becomes n/2.
std::string bash_unquoted_view(const std::string& cmd, const DrivePathCandidate& c) {
    std::string out; std::size_t i = c.start;
    for (auto &run : c.runs) {
        out.append(cmd, i, run.pos - i);
        out.append(run.length / 2, '\\');
        i = run.pos + run.length;
    }
    out.append(cmd, i, c.end - i);
    return out;
}

std::string escape_effect(char next) {
    switch (next) {
        case 't': return "\\t turns into a TAB";
        case 'n': return "\\n turns into a newline";
        case 'r': return "\\r turns into a carriage return";
        case 'b': return "\\b turns into a backspace";
        case 'f': return "\\f turns into a form feed";
        case 'v': return "\\v turns into a vertical tab";
        case '0': return "\\0 turns into a NUL byte";
        case 'u': return "\\u starts a unicode escape and the script fails to parse";
        case 'x': return "\\x starts a hex escape and the script fails to parse";
        default: break;
    }
    std::string s = "\\"; s.push_back(next);
    return s + " loses its backslash and the separator disappears";
}

std::string fd_usage(const char* fd) {
    std::string d = fd;
    if (d == "0") return "fs.readFileSync(0, 'utf8')";
    return "fs.writeFileSync(" + d + ", data)";
}

std::optional<HazardFinding> check_special_device(const ScanContext& ctx) {
    if (!ctx.marker) return std::nullopt;
    auto lit = find_device_literal(ctx.command);
    if (!lit) return std::nullopt;
    HazardFinding f{HazardFinding::Kind::SpecialDeviceAlias, lit->offset, lit->literal.quoted, lit->literal.descriptor, ""};
    f.message = f.matched + " does not exist on Windows: the inline script's interpreter resolves it against the current drive "
                "(C:\\dev\\...) and fails with ENOENT. Use file descriptor " + f.suggestion + " instead (in node: " +
                fd_usage(lit->literal.descriptor) + ").";
    return f;
}

// Every backslash run in [from, to) replaced by one '/'.
std::string slashes_forward(const std::string& cmd, std::size_t from, std::size_t to) {
    std::string out;
    for (std::size_t i = from; i < to; ++i) {
        if (cmd[i] != '\\') { out.push_back(cmd[i]); continue; }
        while (i + 1 < to && cmd[i+1] == '\\') ++i;
        out.push_back('/');
    }
    return out;
}

// A double-quoted string holding a drive path whose closing quote is escaped
// by the backslash before it. The path may stop early ("C:\Program Files\App\"
// ends the candidate at the space), so walk the rest of the string.
std::optional<HazardFinding> check_trailing_quote(const ScanContext& ctx) {
    const std::string& cmd = ctx.command;
    for (auto &c : ctx.cands) {
        if (ctx.states[c.start].state != QuoteState::DoubleQuoted) continue;
        for (std::size_t j = c.start; j < cmd.size() && ctx.states[j].state == QuoteState::DoubleQuoted; ++j) {
            if (cmd[j] != '"' || !ctx.states[j].pending_escape) continue;
            if (!is_word_end(cmd, j + 1)) continue;
            HazardFinding f{HazardFinding::Kind::TrailingQuoteCollision, c.start, cmd.substr(c.start, j + 1 - c.start),
                            slashes_forward(cmd, c.start, j) + "\"", ""};
            f.message = "\"" + f.matched + ": the backslash before the closing quote escapes it (\\\"), so bash keeps reading past the "
                        "intended end of the string and the rest of the command is swallowed or hits unexpected EOF. "
                        "Use forward slashes: \"" + f.suggestion;
            return f;
        }
    }
    return std::nullopt;
}

std::optional<HazardFinding> check_inline_script(const ScanContext& ctx) {
    if (!ctx.marker) return std::nullopt;
    const std::string& cmd = ctx.command;
    for (auto &c : ctx.cands) {
        if (c.start < *ctx.marker) continue;
        const BackslashRun* single = nullptr;
        for (auto &run : c.runs) {
            if (run.length != 1) continue;
            std::size_t after = run.pos + 1;
            if (!single) single = &run;
            // prefer the run whose escape letter is a real substitution
            if (after < cmd.size() && std::string("tnrbfv0ux").find(cmd[after]) != std::string::npos) { single = &run; break; }
        }
        if (!single) continue;
        std::size_t after = single->pos + 1;
        HazardFinding f{HazardFinding::Kind::InlineScriptEscape, c.start, candidate_text(cmd, c), to_forward_slashes(cmd, c), ""};
        std::string effect = (after < c.end) ? escape_effect(cmd[after]) : "the trailing backslash escapes the character after the path";
        f.message = f.matched + " is inside an inline script: the interpreter applies its own string escapes after the shell, so " + effect +
                    ". Use forward slashes: " + f.suggestion;
        return f;
    }
    return std::nullopt;
}

std::optional<HazardFinding> check_unquoted(const ScanContext& ctx) {
    const std::string& cmd = ctx.command;
    for (auto &c : ctx.cands) {
        bool unquoted = true;
        for (std::size_t i = c.start; i < c.end && unquoted; ++i) unquoted = ctx.states[i].state == QuoteState::Unquoted;
        if (!unquoted) continue;
        bool single = false;
        for (auto &run : c.runs) if (run.length == 1) { single = true; break; }
        if (!single) continue;
        HazardFinding f{HazardFinding::Kind::UnquotedBackslashLoss, c.start, candidate_text(cmd, c), to_forward_slashes(cmd, c), ""};
        f.message = f.matched + " is unquoted: bash treats each backslash as an escape and drops it, so the command receives " +
                    bash_unquoted_view(cmd, c) + ". Use forward slashes: " + f.suggestion;
        return f;
    }
    return std::nullopt;
}

} // namespace

std::optional<HazardFinding> classify(const std::string& command, const GuardOptions& opts) {
    ScanContext ctx{command, find_inline_script_marker(command, opts.inline_markers), find_drive_paths(command), {}};
    if (!ctx.marker && ctx.cands.empty()) return std::nullopt;
    ctx.states = scan_quote_states(command);

    using Check = std::optional<HazardFinding> (*)(const ScanContext&);
    static const Check checks[] = {check_special_device, check_trailing_quote, check_inline_script, check_unquoted};
    for (auto check : checks) {
        if (auto f = check(ctx)) return f;
    }
    return std::nullopt;
}

} // namespace pathguard
