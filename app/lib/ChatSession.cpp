/*
 * Console conversation loop implementation
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ChatSession.hpp"
#include "Logger.hpp"
#include "ReplyMessages.hpp"
#include "ThinkingIndicator.hpp"
#include "Utils.hpp"

ChatSession::ChatSession(const IProvider& provider,
                         ChatSessionOptions options,
                         std::istream& in,
                         std::ostream& out)
    : provider_(provider)
    , options_(std::move(options))
    , in_(in)
    , out_(out)
{
}

bool ChatSession::is_exit_command(const std::string& input)
{
    const std::string command = Utils::to_lower(Utils::trim(input));
    return command == "exit" || command == "quit" || command == "bye" || command == "goodbye";
}

void ChatSession::print_banner()
{
    out_ << options_.bot_name << '\n'
         << std::string(50, '=') << '\n'
         << options_.welcome_message << '\n'
         << "Type 'exit', 'quit', or 'bye' to end the conversation.\n"
         << std::endl;
}

std::string ChatSession::ask_provider(const std::string& user_text)
{
    if (!options_.show_thinking_indicator) {
        return provider_.respond(user_text);
    }

    ThinkingIndicator indicator(out_, options_.bot_name + " is thinking");
    indicator.start();
    std::string reply = provider_.respond(user_text);
    indicator.stop();
    return reply;
}

int ChatSession::run()
{
    auto logger = Logger::get_logger("chat_logger");
    if (logger) {
        logger->info("Starting chatbot session with provider '{}'", provider_.id());
    }

    print_banner();

    int invocations = 0;
    std::string line;

    while (state_ == State::Running) {
        out_ << "You: " << std::flush;

        if (!std::getline(in_, line)) {
            // Input closed (e.g. piped stdin): end the session quietly
            out_ << std::endl;
            state_ = State::Terminated;
            break;
        }

        if (Utils::is_blank(line)) {
            out_ << ReplyMessages::kEnterMessage << "\n" << std::endl;
            continue;
        }

        if (is_exit_command(line)) {
            out_ << options_.bot_name << ": " << options_.goodbye_message << std::endl;
            state_ = State::Terminated;
            break;
        }

        std::string reply;
        try {
            ++invocations;
            reply = ask_provider(line);
        } catch (const std::exception& ex) {
            if (logger) {
                logger->error("Error getting AI response: {}", ex.what());
            }
            reply = ReplyMessages::kSessionError;
        }

        out_ << options_.bot_name << ": " << reply << "\n" << std::endl;
    }

    if (logger) {
        logger->info("Chatbot session ended after {} turn(s)", invocations);
    }
    return invocations;
}
