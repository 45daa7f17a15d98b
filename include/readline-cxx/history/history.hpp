/*
 * History adapter - readline-cxx
 * Thin layer over the Readline history list (process-wide, not thread safe).
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <system_error>

namespace rlcxx::history {

// Appends unless line is byte-identical to the current last entry. Entries are
// C strings: text after an embedded NUL is dropped before storing and comparing.
void add(const std::string& line);
// 0-based; empty string when out of range.
std::string get(int index);
void clear();
int size();

// Readline history file format. Errors carry the errno reported by Readline.
std::error_code load(const std::string& path);
std::error_code save(const std::string& path);

} // namespace rlcxx::history
