/*
 * Terminal recovery - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/term/terminal.hpp>
#include <cstdio>
#include <regex>
#include <readline/readline.h>

namespace rlcxx {

static_assert(prompt_start_ignore == RL_PROMPT_START_IGNORE, "start marker mismatch");
static_assert(prompt_end_ignore == RL_PROMPT_END_IGNORE, "end marker mismatch");

void cleanup() {
    rl_free_line_state();
    rl_cleanup_after_signal();
}

void resize() {
    FILE* out = rl_outstream ? rl_outstream : stdout;
    std::fputs("\x1b[0m", out);
    std::fflush(out);
    // screen size is probed on rl_instream, unset until Readline initializes
    if (rl_instream) rl_resize_terminal();
}

void set_catch_resize(bool enabled) { rl_catch_sigwinch = enabled ? 1 : 0; }

void set_catch_signals(bool enabled) { rl_catch_signals = enabled ? 1 : 0; }

// Short form: ESC followed by one of @-Z, '-' or '_'.
// CSI form: ESC '[' or the 8-bit CSI (U+009B, UTF-8 C2 9B), optional
// parameters (numbers or double-quoted strings separated by ';'), final @-~.
static const std::regex& escape_sequence() {
    static const std::string short_esc = "\x1b[@-Z_]|\x1b-";
    static const std::string csi_prefix = "(\x1b\\[|\xC2\x9B)";
    static const std::string csi_param = "([0-9]+|\"[^\"]*\")";
    static const std::string csi_suffix = "[@-~]";
    static const std::regex re(short_esc + "|" + csi_prefix + "(" + csi_param + "(;" + csi_param +
                               ")*)?" + csi_suffix);
    return re;
}

std::string escape_prompt(const std::string& text) {
    std::string fmt;
    fmt += prompt_start_ignore;
    fmt += "$&";
    fmt += prompt_end_ignore;
    return std::regex_replace(text, escape_sequence(), fmt);
}

} // namespace rlcxx
