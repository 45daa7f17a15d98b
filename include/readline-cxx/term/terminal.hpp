/*
 * Terminal recovery - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace rlcxx {

// Markers around non-printing prompt content (RL_PROMPT_START_IGNORE/END_IGNORE).
constexpr char prompt_start_ignore = '\001';
constexpr char prompt_end_ignore = '\002';

// Call after an asynchronous interruption abandoned a read: frees the partial
// line state and restores the terminal attributes Readline changed.
void cleanup();

// Call from the application's own SIGWINCH handling: resets inline styling,
// then lets Readline recompute the screen size.
void resize();

// Whether Readline installs its own SIGWINCH handler.
void set_catch_resize(bool enabled);
// Whether Readline installs its own SIGINT/SIGTERM/... handlers.
void set_catch_signals(bool enabled);

// Wraps every ANSI escape sequence in text with the ignore markers.
std::string escape_prompt(const std::string& text);

} // namespace rlcxx
