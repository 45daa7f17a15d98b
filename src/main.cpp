// readline-cxx demo REPL: multi-line statements, completion, persistent history
#include <readline-cxx/core/error.hpp>
#include <readline-cxx/core/session.hpp>
#include <readline-cxx/line/line_source.hpp>
#include <readline-cxx/line/line_reader.hpp>
#include <readline-cxx/complete/completion_bridge.hpp>
#include <readline-cxx/history/history.hpp>
#include <readline-cxx/term/terminal.hpp>
#include <readline-cxx/config/config.hpp>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

static volatile sig_atomic_t g_interrupted = 0;
static volatile sig_atomic_t g_resized = 0;
static rlcxx::Config g_cfg;

static void sigint_handler(int) { g_interrupted = 1; }
static void sigwinch_handler(int) { g_resized = 1; }

static std::string apply_color(const std::string& s, const char* code) {
    if (!g_cfg.color) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

static const std::vector<std::string> g_commands = {
    "help", "history", "clear-history", "save", "load", "prompt", "quit"};

// Wraps another source: the blocking read runs on a detached worker so SIGINT
// and SIGWINCH can be serviced from this thread.
class InterruptibleSource : public rlcxx::LineSource {
public:
    explicit InterruptibleSource(rlcxx::LineSource& inner) : m_inner(inner) {}
    rlcxx::LineResult read_line(const std::string& prompt) override {
        auto fut = rlcxx::read_line_detached(m_inner, prompt);
        while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
            if (g_interrupted) {
                // worker stays parked on the terminal until exit
                rlcxx::cleanup();
                return rlcxx::LineResult{std::string(), make_error_code(rlcxx::InputError::Interrupted)};
            }
            if (g_resized) {
                g_resized = 0;
                rlcxx::resize();
            }
        }
        return fut.get();
    }
private:
    rlcxx::LineSource& m_inner;
};

static bool run_command(const std::string& stmt, rlcxx::Session& session) {
    std::string cmd = stmt;
    std::string arg;
    auto sp = stmt.find(' ');
    if (sp != std::string::npos) { cmd = stmt.substr(0, sp); arg = stmt.substr(sp + 1); }
    if (cmd == "quit") return false;
    if (cmd == "help") {
        std::cout << "Commands:";
        for (auto& c : g_commands) std::cout << " " << c;
        std::cout << "\nEnd a line with '\\' to continue the statement.\n";
    } else if (cmd == "history") {
        for (int i = 0; i < rlcxx::history::size(); ++i)
            std::cout << (i + 1) << "  " << rlcxx::history::get(i) << "\n";
    } else if (cmd == "clear-history") {
        rlcxx::history::clear();
    } else if (cmd == "save" || cmd == "load") {
        std::string path = arg.empty() ? g_cfg.history_file : arg;
        if (path.empty()) { std::cerr << "readline-cxx: no history file\n"; return true; }
        auto ec = (cmd == "save") ? rlcxx::history::save(path) : rlcxx::history::load(path);
        if (ec) std::cerr << "readline-cxx: " << cmd << " " << path << ": " << ec.message() << "\n";
    } else if (cmd == "prompt") {
        session.prompt = rlcxx::escape_prompt(apply_color(arg.empty() ? g_cfg.prompt : arg, "1;32"));
    } else {
        std::cout << stmt << "\n";
    }
    return true;
}

int main(int argc, char* argv[]) {
    g_cfg = rlcxx::load_config(rlcxx::default_config_path());
    std::string script;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--script" || a == "-s") && i + 1 < argc) script = argv[++i];
        else if (a == "--debug" || a == "-d") g_cfg.debug = true;
        else if (a == "--no-color") g_cfg.color = false;
    }

    rlcxx::Session session;
    session.prompt = rlcxx::escape_prompt(apply_color(g_cfg.prompt, "1;32"));
    session.continue_prompt = rlcxx::escape_prompt(apply_color(g_cfg.continue_prompt, "33"));
    session.debug = g_cfg.debug;
    session.completer = [](const std::string& word, const std::string& line) {
        std::vector<std::string> matches;
        // only the first word of a statement is a command
        std::istringstream iss(line); std::string head; iss >> head;
        if (!head.empty() && head.rfind(word, 0) != 0) return matches;
        for (auto& c : g_commands)
            if (c.rfind(word, 0) == 0) matches.push_back(c + " ");
        if (matches.size() == 1) return matches;
        // several matches: drop the separator so Readline can extend the common prefix
        for (auto& m : matches) m.pop_back();
        return matches;
    };

    rlcxx::CompletionBridge bridge(session);
    bridge.install();
    if (g_cfg.word_breaks) bridge.set_word_breaks(*g_cfg.word_breaks);

    rlcxx::set_catch_signals(g_cfg.catch_signals);
    rlcxx::set_catch_resize(g_cfg.catch_resize);
    if (!g_cfg.catch_signals) std::signal(SIGINT, sigint_handler);
    if (!g_cfg.catch_resize) std::signal(SIGWINCH, sigwinch_handler);
    // own SIGINT or SIGWINCH handling needs this thread free while Readline blocks
    bool own_signals = rlcxx::handles_own_signals(g_cfg);

    if (!g_cfg.history_file.empty()) {
        auto ec = rlcxx::history::load(g_cfg.history_file);
        if (ec && ec != std::errc::no_such_file_or_directory)
            std::cerr << "readline-cxx: cannot load " << g_cfg.history_file << ": " << ec.message() << "\n";
    }

    // the interactive source is never destroyed: an abandoned worker may still use it
    static rlcxx::ReadlineSource native;
    std::unique_ptr<rlcxx::ScriptedSource> scripted;
    std::unique_ptr<rlcxx::LineSource> interruptible;
    rlcxx::LineSource* source = nullptr;
    if (!script.empty()) {
        std::ifstream in(script);
        if (!in) { std::cerr << "readline-cxx: cannot open " << script << "\n"; return 1; }
        scripted = std::make_unique<rlcxx::ScriptedSource>();
        std::string l;
        while (std::getline(in, l)) scripted->push_line(l);
        source = scripted.get();
    } else {
        std::cout << apply_color("readline-cxx", "1;36") << " demo. Type 'help', TAB completes, 'quit' exits.\n";
        if (own_signals) {
            interruptible = std::make_unique<InterruptibleSource>(native);
            source = interruptible.get();
        } else {
            source = &native;
        }
    }

    int status = 0;
    bool running = true;
    while (running) {
        rlcxx::LineReader reader(session, *source);
        rlcxx::LineStreamBuf buf(reader);
        std::istream in(&buf);
        std::string stmt, line;
        bool got = false;
        while (std::getline(in, line)) {
            got = true;
            if (!line.empty() && line.back() == '\\') {
                line.pop_back();
                stmt += line;
                stmt += ' ';
                continue;
            }
            stmt += line;
            break;
        }
        if (buf.error() == rlcxx::InputError::Interrupted) {
            std::cout << "\nInterrupted\n";
            status = 1;
            break;
        }
        if (buf.error()) {
            std::cerr << "readline-cxx: " << buf.error().message() << "\n";
            continue;
        }
        if (!got) {
            if (script.empty()) std::cout << "\n";
            break;
        }
        if (stmt.empty()) continue;
        rlcxx::history::add(stmt);
        running = run_command(stmt, session);
    }

    if (!g_cfg.history_file.empty()) {
        auto ec = rlcxx::history::save(g_cfg.history_file);
        if (ec) std::cerr << "readline-cxx: cannot save " << g_cfg.history_file << ": " << ec.message() << "\n";
    }
    return status;
}
