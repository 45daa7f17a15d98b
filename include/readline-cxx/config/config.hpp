/*
 * Configuration file - readline-cxx
 * key=value lines, '#' comments. Unknown keys are ignored.
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <istream>
#include <optional>
#include <string>

namespace rlcxx {

struct Config {
    std::string prompt = "> ";
    std::string continue_prompt = "..";
    std::string history_file;                // empty -> no persistence
    std::optional<std::string> word_breaks;  // unset -> Readline default
    bool catch_signals = true;
    bool catch_resize = true;
    bool color = true;
    bool debug = false;
};

// True when the application handles SIGINT or SIGWINCH itself, so reads must
// run on a worker while the main thread services the signal flags.
bool handles_own_signals(const Config& cfg);

Config parse_config(std::istream& in);
// Missing or unreadable file -> defaults.
Config load_config(const std::string& path);
// $HOME/.readline-cxxrc, empty when HOME is unset.
std::string default_config_path();

} // namespace rlcxx
