/*
 * Line reader - readline-cxx
 * Presents repeated prompts as one byte stream: first line with the primary
 * prompt, following lines with the continuation prompt, '\n' after each line.
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <readline-cxx/core/session.hpp>
#include <readline-cxx/line/line_source.hpp>
#include <streambuf>
#include <string>
#include <system_error>

namespace rlcxx {

enum class ReaderState { Start, Continuing, Ended };

class LineReader {
public:
    LineReader(const Session& session, LineSource& source)
        : m_session(session), m_source(source) {}

    // Copies up to len bytes of pending input into buf, fetching a new line
    // when nothing is pending. Returns the count copied. On failure returns 0
    // and sets ec; InputError::EndOfInput is final and repeats on every call.
    std::size_t read(char* buf, std::size_t len, std::error_code& ec);

    ReaderState state() const { return m_state; }
    std::size_t buffered() const { return m_buf.size() - m_pos; }
private:
    std::error_code fill();

    const Session& m_session;
    LineSource& m_source;
    std::string m_buf;
    std::size_t m_pos = 0;
    ReaderState m_state = ReaderState::Start;
};

// std::istream adapter over a LineReader.
class LineStreamBuf : public std::streambuf {
public:
    explicit LineStreamBuf(LineReader& reader) : m_reader(reader) {}

    // Last failure other than end of input, if any ended the stream.
    std::error_code error() const { return m_error; }
protected:
    int_type underflow() override;
private:
    LineReader& m_reader;
    char m_chunk[256];
    std::error_code m_error;
};

} // namespace rlcxx
