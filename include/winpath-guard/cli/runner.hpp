/*
 * WinPath-Guard command runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   What the winpath-guard driver does with one command once the arguments
 *   are parsed. Output goes to the given streams so callers other than main()
 *   can capture it.
 *     fix    rewritten command on out (nothing on NoChange), note on err, 0
 *     check  "[winpath-guard] BLOCKED (<kind>): <message>" on err and 2, else 0
 */
#pragma once
#include <ostream>
#include <string>
#include "winpath-guard/config/config.hpp"

namespace pathguard {

// Exit code of a check that blocks the command.
constexpr int kBlockExit = 2;

int run_fix(const GuardConfig& cfg, const std::string& command, const std::string& description,
            std::ostream& out, std::ostream& err);
int run_check(const GuardConfig& cfg, const std::string& command, std::ostream& err);

// Honors enabled=false and empty commands, then dispatches on mode.
int run_guard(const GuardConfig& cfg, GuardMode mode, const std::string& command, const std::string& description,
              std::ostream& out, std::ostream& err);

std::string apply_color(const GuardConfig& cfg, const std::string& s, const char* code);

} // namespace pathguard
