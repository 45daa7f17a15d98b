/*
 * History adapter - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/history/history.hpp>
#include <cstdio>
#include <readline/history.h>

namespace rlcxx::history {

static std::error_code native_error(int e) {
    if (e == 0) return {};
    return std::error_code(e, std::system_category());
}

void add(const std::string& line) {
    // Readline stores C strings: anything after an embedded NUL is dropped
    std::string entry = line.substr(0, line.find('\0'));
    int n = size();
    // only the previous entry is compared, not the whole list
    if (n > 0 && get(n - 1) == entry) return;
    ::add_history(entry.c_str());
}

std::string get(int index) {
    if (index < 0 || index >= size()) return std::string();
    HIST_ENTRY* e = ::history_get(history_base + index);
    if (!e || !e->line) return std::string();
    return e->line;
}

void clear() { ::clear_history(); }

int size() { return history_length; }

std::error_code load(const std::string& path) { return native_error(::read_history(path.c_str())); }

std::error_code save(const std::string& path) { return native_error(::write_history(path.c_str())); }

} // namespace rlcxx::history
