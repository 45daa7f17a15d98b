/*
 * Detached blocking read - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/line/line_source.hpp>
#include <exception>
#include <memory>
#include <thread>

namespace rlcxx {

std::future<LineResult> read_line_detached(LineSource& source, std::string prompt) {
    // shared: the worker may outlive the caller's future
    auto done = std::make_shared<std::promise<LineResult>>();
    auto fut = done->get_future();
    std::thread([&source, done, prompt = std::move(prompt)]() {
        try {
            done->set_value(source.read_line(prompt));
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    }).detach();
    return fut;
}

} // namespace rlcxx
