/*
 * Session settings - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <functional>
#include <string>
#include <vector>

namespace rlcxx {

// Completer hook: receives the word under completion and the whole line buffer,
// returns candidates in display order.
using Completer = std::function<std::vector<std::string>(const std::string& word,
                                                         const std::string& line)>;

// Tunables read at the start of every prompt cycle. Not synchronized: do not
// mutate while a read is in progress on another thread.
struct Session {
    std::string prompt = "> ";           // primary prompt
    std::string continue_prompt = "..";  // used after the first line of a reader
    Completer completer;                 // empty -> no candidates
    bool debug = false;                  // report completer failures on stderr
};

} // namespace rlcxx
