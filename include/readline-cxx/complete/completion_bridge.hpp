/*
 * Completion bridge - readline-cxx
 * Readline pulls candidates one at a time with an increasing index; the bridge
 * calls the session completer once on index 0 and serves the cached list.
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <readline-cxx/core/session.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rlcxx {

class CompletionBridge {
public:
    explicit CompletionBridge(const Session& session) : m_session(session) {}
    ~CompletionBridge();
    CompletionBridge(const CompletionBridge&) = delete;
    CompletionBridge& operator=(const CompletionBridge&) = delete;

    // Becomes the process-wide completion entry function. Replaces any bridge
    // installed before.
    void install();
    bool installed() const;

    // Characters that delimit the word handed to the completer. Empty string
    // disables splitting: everything up to the cursor is one word.
    void set_word_breaks(const std::string& chars);
    const std::optional<std::string>& word_breaks() const { return m_word_breaks; }

    // Entry protocol. Returns a malloc'ed copy of candidate `index` (Readline
    // takes ownership) or nullptr when exhausted.
    char* next(const char* text, int index, const char* line);

    std::size_t cached() const { return m_candidates.size(); }
    const std::string& last_error() const { return m_last_error; }
private:
    static char* entry(const char* text, int index) noexcept;
    void apply_word_breaks();
    std::vector<std::string> run_completer(const std::string& word, const std::string& line);

    const Session& m_session;
    std::vector<std::string> m_candidates;
    std::optional<std::string> m_word_breaks;
    std::string m_last_error;
};

} // namespace rlcxx
