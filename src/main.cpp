/*
 * WinPath-Guard command line driver
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Usage: winpath-guard [fix|check] [--description TEXT] [--debug] [--no-color] [COMMAND...]
 *   fix    print the repaired command on stdout (nothing if unchanged), note on stderr, exit 0
 *   check  exit 2 with the diagnostic on stderr if the command is hazardous, else exit 0
 * Without COMMAND words the command is read from stdin.
 */
#include <winpath-guard/cli/runner.hpp>
#include <winpath-guard/config/config.hpp>

#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace pathguard;

static GuardConfig g_cfg;

static std::string colored(const std::string& s, const char* code){ return apply_color(g_cfg, s, code); }
static void debug_line(const std::string& msg){ if(g_cfg.debug) std::cerr << colored("[DEBUG]","90") << " " << msg << "\n"; }
static void usage(){ std::cerr << "Usage: winpath-guard [fix|check] [--description TEXT] [--debug] [--no-color] [COMMAND...]" << std::endl; }

static std::string read_stdin(){
    std::string data((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    if (!data.empty() && data.back()=='\n') data.pop_back();
    if (!data.empty() && data.back()=='\r') data.pop_back();
    return data;
}

int main(int argc, char* argv[]){
    std::vector<std::string> warnings;
    std::string rc = default_config_path();
    g_cfg = load_config_file(rc, &warnings);

    std::optional<GuardMode> mode; std::string description; std::vector<std::string> words;
    int i=1;
    if (i<argc) { std::string a=argv[i]; if(a=="fix"){ mode=GuardMode::Fix; ++i; } else if(a=="check"){ mode=GuardMode::Check; ++i; } }
    for (; i<argc; ++i) {
        std::string a=argv[i];
        if (!words.empty()) { words.push_back(a); continue; }
        if (a=="--debug"||a=="-d") g_cfg.debug=true;
        else if (a=="--no-color") g_cfg.color=false;
        else if (a=="--description") { if(i+1>=argc){ usage(); return 1; } description=argv[++i]; }
        else if (a=="--help"||a=="-h") { usage(); return 0; }
        else if (a=="--") { for(++i;i<argc;++i) words.push_back(argv[i]); }
        else if (a.size()>1 && a[0]=='-' && a[1]=='-') { std::cerr << "winpath-guard: unknown option " << a << "\n"; usage(); return 1; }
        else words.push_back(a);
    }
    for (auto &w : warnings) std::cerr << colored("[winpath-guard]","33") << " config: " << w << "\n";
    if (!mode) mode = g_cfg.mode;
    debug_line("config " + (rc.empty()?std::string("<none>"):rc) + ", mode=" + to_string(*mode));

    std::string command;
    if (words.empty()) command = read_stdin();
    else { for (size_t k=0;k<words.size();++k){ if(k) command += ' '; command += words[k]; } }
    return run_guard(g_cfg, *mode, command, description, std::cout, std::cerr);
}
