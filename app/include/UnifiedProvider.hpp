/*
 * Unified provider for hosted and local chat APIs
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef UNIFIED_PROVIDER_HPP
#define UNIFIED_PROVIDER_HPP

#include "IProvider.hpp"
#include "HttpTransport.hpp"
#include "ProviderProfile.hpp"
#include "ProviderSettings.hpp"
#include <chrono>
#include <string>

/**
 * Provider that talks to OpenAI, Anthropic, Gemini, Ollama or a custom
 * OpenAI-compatible endpoint, chosen from the configured model identifier.
 *
 * The provider kind, base URL and auth headers are fixed at construction.
 * Each respond() call performs exactly one POST with no retries.
 */
class UnifiedProvider : public IProvider {
public:
    /**
     * Construct provider with configuration
     * @param settings Provider configuration (model decides the backend)
     * @param http_client Optional HTTP client for testing
     */
    explicit UnifiedProvider(ProviderSettings settings,
                             HttpClient http_client = nullptr);

    ~UnifiedProvider() override = default;

    // IProvider interface
    std::string id() const override { return profile_.id; }
    std::string display_name() const override { return profile_.display_name; }
    bool requires_network() const override { return true; }
    bool is_configured() const override;
    LlmResponse chat(const LlmRequest& request) const override;
    std::string respond(const std::string& user_text) const override;

    /**
     * Backend chosen for the configured model
     */
    ProviderKind kind() const { return profile_.kind; }

    const ProviderSettings& settings() const { return settings_; }
    const ProviderProfile& profile() const { return profile_; }

    /**
     * Build the system + user request sent for one line of user text
     */
    LlmRequest build_request(const std::string& user_text) const;

    /**
     * Map a chat result to the sentence shown to the user
     */
    static std::string reply_for(const LlmResponse& response);

private:
    HttpResponse post(const std::string& endpoint,
                      const std::string& body,
                      int timeout_ms) const;
    LlmResponse parse_chat_response(const HttpResponse& response,
                                    std::chrono::milliseconds latency) const;
    LlmResponse create_config_error(const std::string& reason) const;

    ProviderSettings settings_;
    ProviderProfile profile_;
    HttpClient http_client_;
};

#endif // UNIFIED_PROVIDER_HPP
