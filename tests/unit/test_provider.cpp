/*
 * Unit tests for the unified provider
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch.hpp>
#include "IProvider.hpp"
#include "ReplyMessages.hpp"
#include "UnifiedProvider.hpp"
#include "TestHelpers.hpp"

#include <string>

namespace {

ProviderSettings openai_settings()
{
    ProviderSettings settings;
    settings.model = "gpt-4";
    settings.api_key = "sk-test";
    return settings;
}

} // namespace

// =============================================================================
// Identity
// =============================================================================

TEST_CASE("UnifiedProvider reports the backend chosen from the model") {
    RecordingHttpClient http;

    UnifiedProvider openai(openai_settings(), http.client());
    REQUIRE(openai.id() == "openai");
    REQUIRE(openai.display_name() == "OpenAI");
    REQUIRE(openai.kind() == ProviderKind::OpenAI);
    REQUIRE(openai.requires_network() == true);
    REQUIRE(openai.is_configured());

    auto settings = openai_settings();
    settings.model = "claude-3-haiku";
    UnifiedProvider anthropic(settings, http.client());
    REQUIRE(anthropic.id() == "anthropic");
    REQUIRE(anthropic.kind() == ProviderKind::Anthropic);

    settings.model = "foo-bar";
    UnifiedProvider custom(settings, http.client());
    REQUIRE(custom.id() == "custom");
    REQUIRE(custom.profile().base_url == "https://api.openai.com/v1/");
}

TEST_CASE("UnifiedProvider reports NotConfigured when the model is empty") {
    RecordingHttpClient http;
    auto settings = openai_settings();
    settings.model.clear();
    settings.provider_override = ProviderKind::OpenAI;

    UnifiedProvider provider(settings, http.client());
    REQUIRE(provider.is_configured() == false);

    auto response = provider.chat(provider.build_request("hi"));
    REQUIRE_FALSE(response.success);
    REQUIRE(response.failure == FailureKind::NotConfigured);
    REQUIRE(http.requests().empty());
    REQUIRE(provider.respond("hi") == ReplyMessages::kSomethingWentWrong);
}

TEST_CASE("build_request carries the system prompt and sampling settings") {
    RecordingHttpClient http;
    auto settings = openai_settings();
    settings.max_tokens = 64;
    settings.temperature = 0.2;
    settings.timeout_ms = 5000;
    UnifiedProvider provider(settings, http.client());

    auto request = provider.build_request("What is RAII?");
    REQUIRE(request.model == "gpt-4");
    REQUIRE(request.max_tokens == 64);
    REQUIRE(request.temperature == 0.2);
    REQUIRE(request.timeout_ms == 5000);
    REQUIRE(request.messages.size() == 2);
    REQUIRE(request.messages[0].role == MessageRole::System);
    REQUIRE(request.messages[1].role == MessageRole::User);
    REQUIRE(request.messages[1].content == "What is RAII?");
}

// =============================================================================
// Success and failure mapping
// =============================================================================

TEST_CASE("UnifiedProvider returns the trimmed reply on success") {
    RecordingHttpClient http(RecordingHttpClient::ok_response(
        R"({"choices":[{"message":{"role":"assistant","content":"\nResource acquisition is initialization.\n"}}]})"));
    UnifiedProvider provider(openai_settings(), http.client());

    auto response = provider.chat(provider.build_request("What is RAII?"));
    REQUIRE(response.success);
    REQUIRE(response.failure == FailureKind::None);
    REQUIRE(response.text == "Resource acquisition is initialization.");
    REQUIRE(response.provider_id == "openai");
    REQUIRE(response.model_used == "gpt-4");

    REQUIRE(provider.respond("What is RAII?") == "Resource acquisition is initialization.");
}

TEST_CASE("HTTP error status maps to the connection trouble reply") {
    RecordingHttpClient http(RecordingHttpClient::status_response(500, R"({"error":"boom"})"));
    UnifiedProvider provider(openai_settings(), http.client());

    auto response = provider.chat(provider.build_request("hi"));
    REQUIRE_FALSE(response.success);
    REQUIRE(response.failure == FailureKind::Transport);
    REQUIRE(response.error_code == 500);

    REQUIRE(provider.respond("hi") == ReplyMessages::kConnectionTrouble);
}

TEST_CASE("Transport error without a status maps to the connection trouble reply") {
    HttpResponse unreachable;
    unreachable.error = "Couldn't connect to server";
    RecordingHttpClient http(unreachable);
    UnifiedProvider provider(openai_settings(), http.client());

    auto response = provider.chat(provider.build_request("hi"));
    REQUIRE(response.failure == FailureKind::Transport);
    REQUIRE(response.error_message.find("Couldn't connect") != std::string::npos);
    REQUIRE(provider.respond("hi") == ReplyMessages::kConnectionTrouble);
}

TEST_CASE("Successful status with empty choices maps to the not understood reply") {
    RecordingHttpClient http(RecordingHttpClient::ok_response(R"({"choices":[]})"));
    UnifiedProvider provider(openai_settings(), http.client());

    auto response = provider.chat(provider.build_request("hi"));
    REQUIRE(response.failure == FailureKind::MalformedResponse);
    REQUIRE(provider.respond("hi") == ReplyMessages::kNotUnderstood);
}

TEST_CASE("Unparseable body maps to the not understood reply") {
    RecordingHttpClient http(RecordingHttpClient::ok_response("<html>Bad Gateway</html>"));
    UnifiedProvider provider(openai_settings(), http.client());

    REQUIRE(provider.respond("hi") == ReplyMessages::kNotUnderstood);
}

TEST_CASE("Throwing transport maps to the something went wrong reply") {
    RecordingHttpClient http;
    http.throw_on_call("socket exploded");
    UnifiedProvider provider(openai_settings(), http.client());

    auto response = provider.chat(provider.build_request("hi"));
    REQUIRE(response.failure == FailureKind::Unexpected);
    REQUIRE(response.error_message.find("socket exploded") != std::string::npos);

    REQUIRE(provider.respond("hi") == ReplyMessages::kSomethingWentWrong);
}

TEST_CASE("Each respond call performs exactly one request with no retries") {
    RecordingHttpClient http(RecordingHttpClient::status_response(503));
    auto settings = openai_settings();
    settings.timeout_ms = 1234;
    UnifiedProvider provider(settings, http.client());

    provider.respond("first");
    REQUIRE(http.requests().size() == 1);
    REQUIRE(http.requests()[0].timeout_ms == 1234);

    provider.respond("second");
    REQUIRE(http.requests().size() == 2);
}

TEST_CASE("Turns are independent: earlier turns are not resent") {
    RecordingHttpClient http(RecordingHttpClient::ok_response(
        R"({"choices":[{"message":{"content":"ok"}}]})"));
    UnifiedProvider provider(openai_settings(), http.client());

    provider.respond("remember the number 42");
    provider.respond("what number?");

    REQUIRE(http.requests().size() == 2);
    REQUIRE(http.requests()[1].body.find("42") == std::string::npos);
}

TEST_CASE("reply_for maps every failure kind to a fixed sentence") {
    LlmResponse response;
    response.success = false;

    response.failure = FailureKind::Transport;
    REQUIRE(UnifiedProvider::reply_for(response) == ReplyMessages::kConnectionTrouble);
    response.failure = FailureKind::MalformedResponse;
    REQUIRE(UnifiedProvider::reply_for(response) == ReplyMessages::kNotUnderstood);
    response.failure = FailureKind::Unexpected;
    REQUIRE(UnifiedProvider::reply_for(response) == ReplyMessages::kSomethingWentWrong);
    response.failure = FailureKind::NotConfigured;
    REQUIRE(UnifiedProvider::reply_for(response) == ReplyMessages::kSomethingWentWrong);

    response.success = true;
    response.failure = FailureKind::None;
    response.text = "fine";
    REQUIRE(UnifiedProvider::reply_for(response) == "fine");
}
