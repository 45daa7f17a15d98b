/*
 * GNU Readline line source - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/line/line_source.hpp>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <readline/readline.h>

namespace rlcxx {

namespace {
struct FreeDeleter {
    void operator()(char* p) const { std::free(p); }
};
using NativeLine = std::unique_ptr<char, FreeDeleter>;
} // namespace

LineResult read_line(const std::string& prompt) {
    NativeLine line(::readline(prompt.c_str()));
    if (!line) return LineResult{std::string(), make_error_code(InputError::EndOfInput)};
    return LineResult{std::string(line.get()), {}};
}

LineResult ReadlineSource::read_line(const std::string& prompt) {
    return rlcxx::read_line(prompt);
}

} // namespace rlcxx
