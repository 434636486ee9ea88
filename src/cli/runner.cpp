/*
 * WinPath-Guard command runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpath-guard/cli/runner.hpp>
#include <winpath-guard/diag/classifier.hpp>
#include <winpath-guard/fix/normalizer.hpp>
#include <winpath-guard/scan/drive_path.hpp>
#include <winpath-guard/scan/quote_scanner.hpp>

namespace pathguard {

std::string apply_color(const GuardConfig& cfg, const std::string& s, const char* code){
    if(!cfg.color) return s;
    return std::string("\x1b[")+code+"m"+s+"\x1b[0m";
}

static void debug_line(const GuardConfig& cfg, std::ostream& err, const std::string& msg){
    if(cfg.debug) err << apply_color(cfg,"[DEBUG]","90") << " " << msg << "\n";
}

static void dump_scan(const GuardConfig& cfg, std::ostream& err, const std::string& command){
    if (!cfg.debug) return;
    auto cands = find_drive_paths(command);
    auto states = scan_quote_states(command);
    debug_line(cfg, err, "drive paths: " + std::to_string(cands.size()) + ", residual quote state: " + to_string(states.back().state));
    for (auto &c : cands) {
        std::string runs; for (auto &r : c.runs) { if(!runs.empty()) runs += ","; runs += std::to_string(r.length); }
        debug_line(cfg, err, "  @" + std::to_string(c.start) + " " + candidate_text(command, c) + " (" + to_string(states[c.start].state) + ", runs " + runs + ")");
    }
}

int run_fix(const GuardConfig& cfg, const std::string& command, const std::string& description,
            std::ostream& out, std::ostream& err){
    const std::string& tag = cfg.options.bypass_tag;
    if (!tag.empty() && description.find(tag)!=std::string::npos) {
        debug_line(cfg, err, "bypass tag present, command left untouched");
        return 0;
    }
    auto outcome = normalize(command, cfg.options);
    if (!outcome) { debug_line(cfg, err, "no change"); return 0; }
    out << outcome->command << std::endl;
    err << apply_color(cfg,"[winpath-guard]","1;33") << " " << outcome->note << std::endl;
    return 0;
}

int run_check(const GuardConfig& cfg, const std::string& command, std::ostream& err){
    auto finding = classify(command, cfg.options);
    if (!finding) { debug_line(cfg, err, "allow"); return 0; }
    err << apply_color(cfg,"[winpath-guard]","1;31") << " BLOCKED (" << to_string(finding->kind) << "): " << finding->message << std::endl;
    return kBlockExit;
}

int run_guard(const GuardConfig& cfg, GuardMode mode, const std::string& command, const std::string& description,
              std::ostream& out, std::ostream& err){
    if (!cfg.enabled) { debug_line(cfg, err, "disabled by config"); return 0; }
    if (command.empty()) return 0;
    dump_scan(cfg, err, command);
    return mode==GuardMode::Fix ? run_fix(cfg, command, description, out, err) : run_check(cfg, command, err);
}

} // namespace pathguard
