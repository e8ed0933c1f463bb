/*
 * Per-provider wire format description
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_PROFILE_HPP
#define PROVIDER_PROFILE_HPP

#include "HttpTransport.hpp"
#include "IProvider.hpp"
#include "ModelClassifier.hpp"
#include "ProviderSettings.hpp"

#include <functional>
#include <optional>
#include <string>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

/**
 * Everything that differs between upstream chat APIs.
 *
 * UnifiedProvider runs the same POST/parse path for every provider and asks
 * the profile for the pieces that vary. Header values (API keys) are bound
 * when the profile is made and do not change afterwards.
 */
struct ProviderProfile {
    ProviderKind kind{ProviderKind::Custom};
    std::string id;                          // e.g. "openai"
    std::string display_name;                // e.g. "OpenAI"
    std::string base_url;                    // Always ends with '/'

    // Path relative to base_url, including any query string
    std::function<std::string(const LlmRequest&)> endpoint;

    // Headers sent with every request (Content-Type included)
    std::function<HttpHeaders()> headers;

    // JSON request body
    std::function<Json::Value(const LlmRequest&)> build_body;

    // Reply text, or std::nullopt when the expected field is absent
    std::function<std::optional<std::string>(const Json::Value&)> extract_reply;
};

/**
 * Build the profile for a provider kind.
 * Base URLs come from the settings for Ollama and Custom; the hosted
 * providers use their public endpoints.
 */
ProviderProfile make_provider_profile(ProviderKind kind, const ProviderSettings& settings);

/**
 * Serialize a request body the way every provider receives it (compact JSON)
 */
std::string serialize_json(const Json::Value& value);

#endif // PROVIDER_PROFILE_HPP
