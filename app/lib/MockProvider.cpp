/*
 * Offline canned-reply provider implementation
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "MockProvider.hpp"
#include "Logger.hpp"
#include "ReplyMessages.hpp"
#include "Utils.hpp"

#include <initializer_list>
#include <thread>

namespace {

bool contains_any(const std::string& text, std::initializer_list<const char*> needles)
{
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

MockProvider::MockProvider(std::chrono::milliseconds delay, unsigned int seed, Clock clock)
    : delay_(delay)
    , rng_(seed)
    , clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

const std::vector<std::string>& MockProvider::filler_phrases()
{
    static const std::vector<std::string> phrases = {
        "That's an interesting question! Let me think about that...",
        "I understand what you're asking. Here's my perspective...",
        "Great point! I'd like to add that...",
        "That's a complex topic. From what I know...",
        "I appreciate you sharing that with me.",
        "That reminds me of something similar...",
        "I can help you with that. Here's what I suggest...",
        "That's a good observation. Let me expand on that...",
        "I see where you're coming from. My thoughts are...",
        "Interesting! I hadn't considered that angle before.",
    };
    return phrases;
}

std::string MockProvider::compose_reply(const std::string& user_text) const
{
    if (Utils::is_blank(user_text)) {
        return ReplyMessages::kNoInput;
    }

    const std::string input = Utils::to_lower(user_text);

    if (contains_any(input, {"hello", "hi", "hey"})) {
        return "Hello! Nice to meet you. How can I assist you today?";
    }

    if (contains_any(input, {"bye", "goodbye", "exit"})) {
        return "Goodbye! It was nice chatting with you. Have a wonderful day!";
    }

    if (contains_any(input, {"help"})) {
        return "I'm here to help! You can ask me questions, have a conversation, or just chat. "
               "What would you like to talk about?";
    }

    if (contains_any(input, {"weather"})) {
        return "I don't have access to real-time weather data, but I hope it's nice where you are! "
               "Is there something specific about weather you'd like to discuss?";
    }

    if (contains_any(input, {"time", "date"})) {
        return "I don't have access to the current time, but it's always a good time to chat! "
               "The current system time on your machine would be: " +
               Utils::format_local_timestamp(clock_());
    }

    const auto& phrases = filler_phrases();
    std::uniform_int_distribution<std::size_t> pick(0, phrases.size() - 1);
    return phrases[pick(rng_)] + " You mentioned: '" + user_text + "'. What else would you like to know?";
}

LlmResponse MockProvider::chat(const LlmRequest& request) const
{
    std::string user_text;
    for (const auto& msg : request.messages) {
        if (msg.role == MessageRole::User) {
            user_text = msg.content;
        }
    }

    const auto start_time = std::chrono::steady_clock::now();

    LlmResponse response;
    response.provider_id = id();
    response.model_used = request.model;
    response.text = respond(user_text);
    response.success = true;
    response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    return response;
}

std::string MockProvider::respond(const std::string& user_text) const
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Using mock AI service (no provider credential configured)");
    }

    if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }

    return compose_reply(user_text);
}
