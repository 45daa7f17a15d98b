/*
 * Error codes - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <system_error>

namespace rlcxx {

enum class InputError {
    EndOfInput = 1,   // native reader returned no line (Ctrl-D on empty line)
    ReadFailed,       // source could not produce a line; caller may retry
    Interrupted,      // read abandoned after an asynchronous interruption
};

const std::error_category& input_category() noexcept;
std::error_code make_error_code(InputError e) noexcept;

} // namespace rlcxx

namespace std {
template <> struct is_error_code_enum<rlcxx::InputError> : true_type {};
} // namespace std

namespace rlcxx {

// Outcome of one prompt-and-read cycle.
struct LineResult {
    std::string text;            // line without trailing newline
    std::error_code error;       // empty on success

    bool ok() const { return !error; }
    bool eof() const { return error == InputError::EndOfInput; }
};

} // namespace rlcxx
