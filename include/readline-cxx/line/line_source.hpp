/*
 * Line sources - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <readline-cxx/core/error.hpp>
#include <deque>
#include <future>
#include <string>
#include <vector>

namespace rlcxx {

// One prompt-and-read cycle. Implementations block until a line is available.
class LineSource {
public:
    virtual ~LineSource() = default;
    virtual LineResult read_line(const std::string& prompt) = 0;
};

// Single GNU Readline call. The native buffer is released on every path.
LineResult read_line(const std::string& prompt);

class ReadlineSource : public LineSource {
public:
    LineResult read_line(const std::string& prompt) override;
};

// Canned lines for tests and scripted runs. Once the queue is drained every
// read reports end of input.
class ScriptedSource : public LineSource {
public:
    ScriptedSource() = default;
    explicit ScriptedSource(const std::vector<std::string>& lines);

    void push_line(const std::string& line);
    void push_failure(std::error_code ec); // next read fails with ec
    LineResult read_line(const std::string& prompt) override;

    const std::vector<std::string>& prompts() const { return m_prompts; }
    std::size_t pending() const { return m_items.size(); }
private:
    struct Item {
        std::string line;
        std::error_code error;
    };
    std::deque<Item> m_items;
    std::vector<std::string> m_prompts;
};

// Runs source.read_line(prompt) on a detached worker. There is no way to cancel
// the worker: on interruption call cleanup() and stop waiting on the future.
// source must stay alive for the rest of the process if the read is abandoned.
std::future<LineResult> read_line_detached(LineSource& source, std::string prompt);

} // namespace rlcxx
