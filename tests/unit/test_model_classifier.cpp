/*
 * Unit tests for model classification
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch.hpp>
#include "ModelClassifier.hpp"
#include "ProviderSettings.hpp"

TEST_CASE("Hosted model prefixes map to their providers") {
    REQUIRE(classify_model("gpt-4") == ProviderKind::OpenAI);
    REQUIRE(classify_model("gpt-3.5-turbo") == ProviderKind::OpenAI);
    REQUIRE(classify_model("o1-preview") == ProviderKind::OpenAI);
    REQUIRE(classify_model("claude-3-sonnet-20240229") == ProviderKind::Anthropic);
    REQUIRE(classify_model("gemini-1.5-flash") == ProviderKind::Gemini);
}

TEST_CASE("Classification ignores case") {
    REQUIRE(classify_model("GPT-4") == ProviderKind::OpenAI);
    REQUIRE(classify_model("Claude-3-haiku") == ProviderKind::Anthropic);
    REQUIRE(classify_model("GEMINI-pro") == ProviderKind::Gemini);
    REQUIRE(classify_model("Llama3") == ProviderKind::Ollama);
}

TEST_CASE("Local model families, tags and 'local' map to Ollama") {
    REQUIRE(classify_model("llama3.1:8b") == ProviderKind::Ollama);
    REQUIRE(classify_model("mistral:7b") == ProviderKind::Ollama);
    REQUIRE(classify_model("deepseek-coder") == ProviderKind::Ollama);
    REQUIRE(classify_model("qwen2") == ProviderKind::Ollama);
    REQUIRE(classify_model("stable-code") == ProviderKind::Ollama);
    REQUIRE(classify_model("my-local-model") == ProviderKind::Ollama);
    REQUIRE(classify_model("phi3:mini") == ProviderKind::Ollama);
}

TEST_CASE("gpt-oss is claimed by the OpenAI prefix rule first") {
    REQUIRE(classify_model("gpt-oss:20b") == ProviderKind::OpenAI);
}

TEST_CASE("Unmatched models follow the configured policy") {
    REQUIRE(classify_model("foo-bar") == ProviderKind::Custom);
    REQUIRE(classify_model("foo-bar", UnmatchedModelPolicy::CustomEndpoint) == ProviderKind::Custom);
    REQUIRE(classify_model("foo-bar", UnmatchedModelPolicy::OpenAIDefault) == ProviderKind::OpenAI);
    REQUIRE(classify_model("") == ProviderKind::Custom);
}

TEST_CASE("Policy does not affect matched models") {
    REQUIRE(classify_model("llama3", UnmatchedModelPolicy::OpenAIDefault) == ProviderKind::Ollama);
    REQUIRE(classify_model("claude-2", UnmatchedModelPolicy::OpenAIDefault) == ProviderKind::Anthropic);
}

TEST_CASE("Provider kind names parse back") {
    for (auto kind : {ProviderKind::OpenAI, ProviderKind::Anthropic, ProviderKind::Gemini,
                      ProviderKind::Ollama, ProviderKind::Custom}) {
        auto parsed = parse_provider_kind(to_string(kind));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == kind);
    }
    REQUIRE(parse_provider_kind(" Anthropic ") == ProviderKind::Anthropic);
    REQUIRE_FALSE(parse_provider_kind("auto").has_value());
    REQUIRE_FALSE(parse_provider_kind("bard").has_value());
}

TEST_CASE("Unmatched model policy names parse") {
    REQUIRE(parse_unmatched_model_policy("custom") == UnmatchedModelPolicy::CustomEndpoint);
    REQUIRE(parse_unmatched_model_policy("OpenAI") == UnmatchedModelPolicy::OpenAIDefault);
    REQUIRE_FALSE(parse_unmatched_model_policy("mock").has_value());
    REQUIRE(to_string(UnmatchedModelPolicy::OpenAIDefault) == "openai");
}

TEST_CASE("An explicit provider override skips classification") {
    ProviderSettings settings;
    settings.model = "gpt-4";
    REQUIRE(effective_provider_kind(settings) == ProviderKind::OpenAI);

    settings.provider_override = ProviderKind::Ollama;
    REQUIRE(effective_provider_kind(settings) == ProviderKind::Ollama);
}
