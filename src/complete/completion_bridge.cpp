/*
 * Completion bridge - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/complete/completion_bridge.hpp>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iostream>
#include <readline/readline.h>
#include <readline/history.h>

namespace rlcxx {

// Readline keeps a single entry function, so only one bridge is live at a time.
static CompletionBridge* g_active = nullptr;
// Readline's own word-break set, captured before the first override.
static const char* g_default_breaks = nullptr;
static bool g_default_saved = false;

static void restore_default_breaks() {
    if (g_default_saved) rl_completer_word_break_characters = g_default_breaks;
}

CompletionBridge::~CompletionBridge() {
    if (g_active != this) return;
    g_active = nullptr;
    rl_completion_entry_function = nullptr;
    if (m_word_breaks) restore_default_breaks();
}

void CompletionBridge::install() {
    g_active = this;
    rl_completion_entry_function = &CompletionBridge::entry;
    using_history();
    if (m_word_breaks) apply_word_breaks();
    else restore_default_breaks(); // may still point into a previous bridge
}

bool CompletionBridge::installed() const { return g_active == this; }

void CompletionBridge::set_word_breaks(const std::string& chars) {
    m_word_breaks = chars;
    if (installed()) apply_word_breaks();
}

void CompletionBridge::apply_word_breaks() {
    if (!g_default_saved) {
        g_default_breaks = rl_completer_word_break_characters;
        g_default_saved = true;
    }
    // points into m_word_breaks until this bridge goes away
    rl_completer_word_break_characters = m_word_breaks->data();
}

std::vector<std::string> CompletionBridge::run_completer(const std::string& word,
                                                         const std::string& line) {
    m_last_error.clear();
    if (!m_session.completer) return {};
    try {
        return m_session.completer(word, line);
    } catch (const std::exception& e) {
        // Readline has no error channel: report zero candidates
        m_last_error = e.what();
        if (m_session.debug) std::cerr << "\nreadline-cxx: completer failed: " << e.what() << "\n";
    } catch (...) {
        m_last_error = "unknown completer failure";
        if (m_session.debug) std::cerr << "\nreadline-cxx: " << m_last_error << "\n";
    }
    return {};
}

char* CompletionBridge::next(const char* text, int index, const char* line) {
    if (index == 0) {
        // the completer owns suffixes; Readline must not append a space
        rl_completion_suppress_append = 1;
        m_candidates = run_completer(text ? text : "", line ? line : "");
    }
    if (index < 0 || static_cast<std::size_t>(index) >= m_candidates.size()) {
        m_candidates.clear();
        return nullptr;
    }
    return ::strdup(m_candidates[static_cast<std::size_t>(index)].c_str());
}

char* CompletionBridge::entry(const char* text, int index) noexcept {
    if (!g_active) return nullptr;
    return g_active->next(text, index, rl_line_buffer);
}

} // namespace rlcxx
