/*
 * Readline-backed read tests - readline-cxx
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <readline-cxx/line/line_source.hpp>
#include <readline-cxx/line/line_reader.hpp>
#include <readline-cxx/term/terminal.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <readline/readline.h>

using namespace rlcxx;

// Feeds Readline from a temporary file instead of the terminal.
class ReadlineInput : public ::testing::Test {
protected:
    void SetUp() override {
        ::setenv("INPUTRC", "/dev/null", 1);
        m_in = std::tmpfile();
        m_out = std::fopen("/dev/null", "w");
        ASSERT_NE(m_in, nullptr);
        ASSERT_NE(m_out, nullptr);
        rl_instream = m_in;
        rl_outstream = m_out;
    }
    void TearDown() override {
        rl_instream = stdin;
        rl_outstream = stdout;
        if (m_in) std::fclose(m_in);
        if (m_out) std::fclose(m_out);
    }
    void feed(const std::string& data) {
        std::fwrite(data.data(), 1, data.size(), m_in);
        std::fflush(m_in);
        std::rewind(m_in);
    }
    FILE* m_in = nullptr;
    FILE* m_out = nullptr;
};

TEST_F(ReadlineInput, LinesThenEndOfInput) {
    feed("alpha\nbeta gamma\n");
    auto r1 = read_line("> ");
    EXPECT_TRUE(r1.ok());
    EXPECT_EQ(r1.text, "alpha");
    auto r2 = read_line("> ");
    EXPECT_TRUE(r2.ok());
    EXPECT_EQ(r2.text, "beta gamma");
    auto r3 = read_line("> ");
    EXPECT_TRUE(r3.eof());
    EXPECT_EQ(r3.text, "");
}

TEST_F(ReadlineInput, PromptNotModified) {
    feed("x\n");
    const std::string prompt = "\x01\x1b[1m\x02>\x01\x1b[0m\x02 ";
    std::string copy = prompt;
    ReadlineSource src;
    auto r = src.read_line(copy);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(copy, prompt);
}

TEST_F(ReadlineInput, ReaderOverReadline) {
    feed("one\ntwo\n");
    Session s;
    ReadlineSource src;
    LineReader reader(s, src);
    LineStreamBuf buf(reader);
    std::istream in(&buf);
    std::string l, all;
    while (std::getline(in, l)) all += l + "|";
    EXPECT_EQ(all, "one|two|");
    EXPECT_EQ(reader.state(), ReaderState::Ended);
}

TEST_F(ReadlineInput, ResizeWritesResetFirst) {
    feed("warm\n");
    ASSERT_TRUE(read_line("> ").ok());
    FILE* capture = std::tmpfile();
    ASSERT_NE(capture, nullptr);
    rl_outstream = capture;
    resize();
    std::fflush(capture);
    std::rewind(capture);
    std::string out;
    char chunk[128];
    std::size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), capture)) > 0) out.append(chunk, n);
    rl_outstream = m_out;
    std::fclose(capture);
    ASSERT_GE(out.size(), 4u);
    EXPECT_EQ(out.substr(0, 4), "\x1b[0m");
}

TEST_F(ReadlineInput, ReadWorksAfterCleanup) {
    feed("before\nafter\n");
    auto r1 = read_line("> ");
    EXPECT_EQ(r1.text, "before");
    cleanup();
    auto r2 = read_line("> ");
    EXPECT_TRUE(r2.ok());
    EXPECT_EQ(r2.text, "after");
}

TEST(DetachedRead, DeliversResult) {
    ScriptedSource src({"async"});
    auto fut = read_line_detached(src, "? ");
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto r = fut.get();
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.text, "async");
    ASSERT_EQ(src.prompts().size(), 1u);
    EXPECT_EQ(src.prompts()[0], "? ");
}

TEST(DetachedRead, DeliversEndOfInput) {
    ScriptedSource src;
    auto fut = read_line_detached(src, "> ");
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(fut.get().eof());
}

TEST(InputError, Messages) {
    std::error_code ec = InputError::EndOfInput;
    EXPECT_EQ(ec.category().name(), std::string("readline-cxx.input"));
    EXPECT_EQ(ec.message(), "end of input");
    EXPECT_NE(ec, std::error_code(InputError::ReadFailed));
}
