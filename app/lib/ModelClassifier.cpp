/*
 * Model identifier to provider classification
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ModelClassifier.hpp"
#include "Utils.hpp"

#include <array>

namespace {

constexpr std::array<const char*, 6> kOllamaPrefixes = {
    "llama", "mistral", "deepseek", "qwen", "stable-code", "gpt-oss",
};

bool has_ollama_prefix(const std::string& model)
{
    for (const char* prefix : kOllamaPrefixes) {
        if (Utils::starts_with_ci(model, prefix)) {
            return true;
        }
    }
    return false;
}

} // namespace

ProviderKind classify_model(const std::string& model, UnmatchedModelPolicy policy)
{
    if (Utils::starts_with_ci(model, "gpt-") || Utils::starts_with_ci(model, "o1-")) {
        return ProviderKind::OpenAI;
    }

    if (Utils::starts_with_ci(model, "claude-")) {
        return ProviderKind::Anthropic;
    }

    if (Utils::starts_with_ci(model, "gemini-")) {
        return ProviderKind::Gemini;
    }

    if (has_ollama_prefix(model) ||
        Utils::contains_ci(model, "local") ||
        model.find(':') != std::string::npos) {
        return ProviderKind::Ollama;
    }

    return policy == UnmatchedModelPolicy::OpenAIDefault
        ? ProviderKind::OpenAI
        : ProviderKind::Custom;
}

std::string to_string(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::OpenAI: return "openai";
        case ProviderKind::Anthropic: return "anthropic";
        case ProviderKind::Gemini: return "gemini";
        case ProviderKind::Ollama: return "ollama";
        case ProviderKind::Custom: return "custom";
    }
    return "custom";
}

std::optional<ProviderKind> parse_provider_kind(const std::string& name)
{
    const std::string value = Utils::to_lower(Utils::trim(name));
    if (value == "openai") return ProviderKind::OpenAI;
    if (value == "anthropic") return ProviderKind::Anthropic;
    if (value == "gemini") return ProviderKind::Gemini;
    if (value == "ollama") return ProviderKind::Ollama;
    if (value == "custom") return ProviderKind::Custom;
    return std::nullopt;
}

std::string to_string(UnmatchedModelPolicy policy)
{
    return policy == UnmatchedModelPolicy::OpenAIDefault ? "openai" : "custom";
}

std::optional<UnmatchedModelPolicy> parse_unmatched_model_policy(const std::string& name)
{
    const std::string value = Utils::to_lower(Utils::trim(name));
    if (value == "custom") return UnmatchedModelPolicy::CustomEndpoint;
    if (value == "openai") return UnmatchedModelPolicy::OpenAIDefault;
    return std::nullopt;
}
