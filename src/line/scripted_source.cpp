/*
 * Scripted line source - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/line/line_source.hpp>

namespace rlcxx {

ScriptedSource::ScriptedSource(const std::vector<std::string>& lines) {
    for (auto& l : lines) push_line(l);
}

void ScriptedSource::push_line(const std::string& line) { m_items.push_back(Item{line, {}}); }

void ScriptedSource::push_failure(std::error_code ec) { m_items.push_back(Item{std::string(), ec}); }

LineResult ScriptedSource::read_line(const std::string& prompt) {
    m_prompts.push_back(prompt);
    if (m_items.empty()) return LineResult{std::string(), make_error_code(InputError::EndOfInput)};
    Item it = std::move(m_items.front());
    m_items.pop_front();
    if (it.error) return LineResult{std::string(), it.error};
    return LineResult{std::move(it.line), {}};
}

} // namespace rlcxx
