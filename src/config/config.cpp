/*
 * Configuration file - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/config/config.hpp>
#include <cstdlib>
#include <fstream>

namespace rlcxx {

static bool parse_bool(const std::string& v) { return v == "1" || v == "true" || v == "on"; }

bool handles_own_signals(const Config& cfg) { return !cfg.catch_signals || !cfg.catch_resize; }

Config parse_config(std::istream& in) {
    Config cfg;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = line.substr(0, eq);
        auto val = line.substr(eq + 1);
        if (key == "prompt") cfg.prompt = val;
        else if (key == "continue_prompt") cfg.continue_prompt = val;
        else if (key == "history_file") cfg.history_file = val;
        else if (key == "word_breaks") cfg.word_breaks = val;
        else if (key == "catch_signals") cfg.catch_signals = parse_bool(val);
        else if (key == "catch_resize") cfg.catch_resize = parse_bool(val);
        else if (key == "color") cfg.color = parse_bool(val);
        else if (key == "debug") cfg.debug = parse_bool(val);
    }
    return cfg;
}

Config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) return Config{};
    return parse_config(in);
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return std::string();
    return std::string(home) + "/.readline-cxxrc";
}

} // namespace rlcxx
