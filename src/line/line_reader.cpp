/*
 * Line reader - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <readline-cxx/line/line_reader.hpp>
#include <algorithm>
#include <cstring>

namespace rlcxx {

std::error_code LineReader::fill() {
    const std::string& prompt = (m_state == ReaderState::Continuing) ? m_session.continue_prompt
                                                                     : m_session.prompt;
    LineResult r = m_source.read_line(prompt);
    if (r.eof()) m_state = ReaderState::Ended;
    if (r.error) return r.error;
    m_state = ReaderState::Continuing;
    m_buf = std::move(r.text);
    m_buf.push_back('\n');
    m_pos = 0;
    return {};
}

std::size_t LineReader::read(char* buf, std::size_t len, std::error_code& ec) {
    ec.clear();
    if (m_state == ReaderState::Ended) {
        ec = make_error_code(InputError::EndOfInput);
        return 0;
    }
    if (len == 0) return 0;
    if (m_pos >= m_buf.size()) {
        ec = fill();
        if (ec) return 0;
    }
    std::size_t n = std::min(len, m_buf.size() - m_pos);
    std::memcpy(buf, m_buf.data() + m_pos, n);
    m_pos += n;
    if (m_pos >= m_buf.size()) { m_buf.clear(); m_pos = 0; }
    return n;
}

LineStreamBuf::int_type LineStreamBuf::underflow() {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
    std::error_code ec;
    std::size_t n = m_reader.read(m_chunk, sizeof(m_chunk), ec);
    if (ec || n == 0) {
        if (ec && ec != InputError::EndOfInput) m_error = ec;
        return traits_type::eof();
    }
    setg(m_chunk, m_chunk, m_chunk + n);
    return traits_type::to_int_type(*gptr());
}

} // namespace rlcxx
