/*
 * Unit tests for the console conversation loop
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch.hpp>
#include "ChatSession.hpp"
#include "ReplyMessages.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class ScriptedProvider : public IProvider {
public:
    std::string reply = "scripted reply";
    bool should_throw = false;
    mutable std::vector<std::string> received;

    std::string id() const override { return "scripted"; }
    std::string display_name() const override { return "Scripted"; }
    bool requires_network() const override { return false; }
    bool is_configured() const override { return true; }

    LlmResponse chat(const LlmRequest& /*request*/) const override
    {
        LlmResponse response;
        response.success = true;
        response.text = reply;
        return response;
    }

    std::string respond(const std::string& user_text) const override
    {
        received.push_back(user_text);
        if (should_throw) {
            throw std::runtime_error("provider blew up");
        }
        return reply;
    }
};

ChatSessionOptions quiet_options()
{
    ChatSessionOptions options;
    options.bot_name = "Bot";
    options.show_thinking_indicator = false;
    return options;
}

bool contains(const std::string& text, const std::string& needle)
{
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Exit keywords are recognised regardless of case and padding") {
    REQUIRE(ChatSession::is_exit_command("exit"));
    REQUIRE(ChatSession::is_exit_command("  QUIT "));
    REQUIRE(ChatSession::is_exit_command("Bye"));
    REQUIRE(ChatSession::is_exit_command("goodbye"));
    REQUIRE_FALSE(ChatSession::is_exit_command("bye now"));
    REQUIRE_FALSE(ChatSession::is_exit_command(""));
}

TEST_CASE("One message then exit makes exactly one provider call") {
    ScriptedProvider provider;
    std::istringstream in("hi\nexit\n");
    std::ostringstream out;

    ChatSession session(provider, quiet_options(), in, out);
    REQUIRE(session.state() == ChatSession::State::Running);

    REQUIRE(session.run() == 1);
    REQUIRE(session.state() == ChatSession::State::Terminated);
    REQUIRE(provider.received == std::vector<std::string>{"hi"});

    const std::string transcript = out.str();
    REQUIRE(contains(transcript, "Bot: scripted reply"));
    REQUIRE(contains(transcript, "Bot: Goodbye! Have a great day!"));
}

TEST_CASE("Banner shows the bot name, welcome message and exit hint") {
    ScriptedProvider provider;
    std::istringstream in("quit\n");
    std::ostringstream out;

    auto options = quiet_options();
    options.welcome_message = "Welcome aboard.";
    ChatSession session(provider, options, in, out);
    session.run();

    const std::string transcript = out.str();
    REQUIRE(transcript.rfind("Bot\n" + std::string(50, '=') + "\nWelcome aboard.\n", 0) == 0);
    REQUIRE(contains(transcript, "Type 'exit', 'quit', or 'bye' to end the conversation."));
    REQUIRE(contains(transcript, "You: "));
}

TEST_CASE("End of input terminates the session without a keyword") {
    ScriptedProvider provider;
    std::istringstream in("first\nsecond");
    std::ostringstream out;

    ChatSession session(provider, quiet_options(), in, out);
    REQUIRE(session.run() == 2);
    REQUIRE(session.state() == ChatSession::State::Terminated);
    REQUIRE_FALSE(contains(out.str(), "Goodbye"));
}

TEST_CASE("Empty input terminates immediately") {
    ScriptedProvider provider;
    std::istringstream in("");
    std::ostringstream out;

    ChatSession session(provider, quiet_options(), in, out);
    REQUIRE(session.run() == 0);
    REQUIRE(session.state() == ChatSession::State::Terminated);
}

TEST_CASE("Blank lines prompt again without calling the provider") {
    ScriptedProvider provider;
    std::istringstream in("\n   \nbye\n");
    std::ostringstream out;

    ChatSession session(provider, quiet_options(), in, out);
    REQUIRE(session.run() == 0);
    REQUIRE(provider.received.empty());
    REQUIRE(contains(out.str(), ReplyMessages::kEnterMessage));
}

TEST_CASE("A throwing provider gets the session error reply and the loop continues") {
    ScriptedProvider provider;
    provider.should_throw = true;
    std::istringstream in("one\ntwo\nexit\n");
    std::ostringstream out;

    ChatSession session(provider, quiet_options(), in, out);
    REQUIRE(session.run() == 2);
    REQUIRE(contains(out.str(), std::string("Bot: ") + ReplyMessages::kSessionError));
    REQUIRE(session.state() == ChatSession::State::Terminated);
}

TEST_CASE("Thinking indicator output is cleared before the reply") {
    ScriptedProvider provider;
    std::istringstream in("hi\nexit\n");
    std::ostringstream out;

    auto options = quiet_options();
    options.show_thinking_indicator = true;
    ChatSession session(provider, options, in, out);
    REQUIRE(session.run() == 1);

    const std::string transcript = out.str();
    const auto label = transcript.find("Bot is thinking");
    const auto reply = transcript.find("Bot: scripted reply");
    REQUIRE(label != std::string::npos);
    REQUIRE(reply != std::string::npos);
    REQUIRE(label < reply);
    REQUIRE(contains(transcript, "\r" + std::string(50, ' ') + "\r"));
}
