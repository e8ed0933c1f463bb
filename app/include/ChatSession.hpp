/*
 * Console conversation loop
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CHAT_SESSION_HPP
#define CHAT_SESSION_HPP

#include "IProvider.hpp"
#include <istream>
#include <ostream>
#include <string>

struct ChatSessionOptions {
    std::string bot_name{"AI Assistant"};
    std::string welcome_message{"Hello! I'm your AI assistant. How can I help you today?"};
    std::string goodbye_message{"Goodbye! Have a great day!"};
    bool show_thinking_indicator{true};
};

/**
 * Reads one line at a time, hands it to the provider and prints the reply.
 *
 * Each turn is independent: nothing from earlier turns is sent to the
 * provider. The session ends on an exit keyword or end of input.
 */
class ChatSession {
public:
    enum class State {
        Running,
        Terminated,
    };

    ChatSession(const IProvider& provider,
                ChatSessionOptions options,
                std::istream& in,
                std::ostream& out);

    /**
     * Run until an exit keyword or end of input
     * @return Number of provider invocations made
     */
    int run();

    State state() const { return state_; }

    /**
     * True for "exit", "quit", "bye" and "goodbye" (trimmed, any case)
     */
    static bool is_exit_command(const std::string& input);

private:
    void print_banner();
    std::string ask_provider(const std::string& user_text);

    const IProvider& provider_;
    ChatSessionOptions options_;
    std::istream& in_;
    std::ostream& out_;
    State state_{State::Running};
};

#endif // CHAT_SESSION_HPP
