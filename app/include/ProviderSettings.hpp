/*
 * Immutable provider configuration
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_SETTINGS_HPP
#define PROVIDER_SETTINGS_HPP

#include "ModelClassifier.hpp"

#include <optional>
#include <string>

constexpr const char* kDefaultSystemPrompt =
    "You are a helpful AI assistant. Provide concise and helpful responses.";

/**
 * Everything a provider needs to reach its backend.
 * Built once at startup from Settings and passed by value to providers.
 */
struct ProviderSettings {
    std::string model{"gpt-3.5-turbo"};
    std::string api_key;                     // May be empty for Ollama
    int max_tokens{150};
    double temperature{0.7};
    std::string base_url;                    // Custom OpenAI-compatible endpoint
    std::string ollama_url{"http://localhost:11434/"};
    int timeout_ms{30000};
    std::string system_prompt{kDefaultSystemPrompt};
    UnmatchedModelPolicy unmatched_policy{UnmatchedModelPolicy::CustomEndpoint};
    std::optional<ProviderKind> provider_override;  // Skips classification when set
};

/**
 * Provider kind after applying an explicit override, otherwise classification
 */
inline ProviderKind effective_provider_kind(const ProviderSettings& settings)
{
    if (settings.provider_override) {
        return *settings.provider_override;
    }
    return classify_model(settings.model, settings.unmatched_policy);
}

#endif // PROVIDER_SETTINGS_HPP
