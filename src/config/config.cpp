/*
 * WinPath-Guard configuration loader
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpath-guard/config/config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace pathguard {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static bool parse_bool(const std::string& val){ return val=="1"||val=="true"||val=="on"; }

std::vector<std::string> split_list(const std::string& val) {
    std::vector<std::string> out; size_t start=0;
    while (true) {
        size_t comma = val.find(',', start);
        std::string item = trim(val.substr(start, comma==std::string::npos ? std::string::npos : comma-start));
        if (!item.empty()) out.push_back(item);
        if (comma == std::string::npos) break;
        start = comma+1;
    }
    return out;
}

bool apply_config_line(GuardConfig& cfg, const std::string& raw, std::string* warning) {
    std::string line = trim(raw);
    if (line.empty() || line[0]=='#') return true;
    auto eq = line.find('=');
    if (eq == std::string::npos) { if (warning) *warning = "missing '=' in: " + line; return false; }
    auto key = trim(line.substr(0,eq)); auto val = trim(line.substr(eq+1));
    if (key=="enabled") cfg.enabled = parse_bool(val);
    else if (key=="color") cfg.color = parse_bool(val);
    else if (key=="debug") cfg.debug = parse_bool(val);
    else if (key=="bypass_tag") cfg.options.bypass_tag = val;
    else if (key=="mode") {
        if (val=="fix") cfg.mode = GuardMode::Fix;
        else if (val=="check") cfg.mode = GuardMode::Check;
        else { if (warning) *warning = "invalid mode '" + val + "' (expected fix|check)"; return false; }
    }
    else if (key=="inline_markers") {
        auto markers = split_list(val);
        if (markers.empty()) { if (warning) *warning = "inline_markers is empty, keeping defaults"; return false; }
        cfg.options.inline_markers = markers;
    }
    return true;
}

GuardConfig load_config_file(const std::string& path, std::vector<std::string>* warnings) {
    GuardConfig cfg;
    if (path.empty()) return cfg;
    std::ifstream in(path); if (!in) return cfg;
    std::string line; size_t lineno=0;
    while (std::getline(in, line)) {
        ++lineno; std::string w;
        if (!apply_config_line(cfg, line, &w) && warnings) warnings->push_back(path + ":" + std::to_string(lineno) + ": " + w);
    }
    return cfg;
}

std::string default_config_path() {
    if (const char* rc = std::getenv("WINPATH_GUARD_RC"); rc && *rc) return rc;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return "";
    return std::string(home) + "/.winpath-guardrc";
}

const char* to_string(GuardMode m) { return m==GuardMode::Fix ? "fix" : "check"; }

} // namespace pathguard
