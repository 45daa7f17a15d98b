/*
 * Error codes - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/core/error.hpp>

namespace rlcxx {

namespace {

class InputCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "readline-cxx.input"; }
    std::string message(int ev) const override {
        switch (static_cast<InputError>(ev)) {
            case InputError::EndOfInput: return "end of input";
            case InputError::ReadFailed: return "line read failed";
            case InputError::Interrupted: return "line read interrupted";
        }
        return "unknown input error";
    }
};

} // namespace

const std::error_category& input_category() noexcept {
    static InputCategory cat;
    return cat;
}

std::error_code make_error_code(InputError e) noexcept {
    return {static_cast<int>(e), input_category()};
}

} // namespace rlcxx
