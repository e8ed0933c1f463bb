#pragma once

#include "HttpTransport.hpp"
#include "IProvider.hpp"
#include "ProviderSettings.hpp"
#include <chrono>
#include <memory>
#include <string>

class Settings;

/**
 * Factory for choosing the provider a chat session talks to
 */
class ProviderFactory {
public:
    /**
     * Create a provider based on the current settings
     * @param settings Application settings (environment overrides already applied)
     * @return UnifiedProvider when the backend is reachable with the configured
     *         credentials, otherwise the offline MockProvider. Never null.
     */
    static std::unique_ptr<IProvider> create_provider_from_settings(const Settings& settings);

    /**
     * Same selection rule on an already-built configuration
     * @param http_client Optional HTTP client for testing
     */
    static std::unique_ptr<IProvider> create_provider(
        const ProviderSettings& settings,
        std::chrono::milliseconds mock_delay,
        HttpClient http_client = nullptr);

    /**
     * True when the effective backend is Ollama or the API key is a real value
     */
    static bool should_use_remote_provider(const ProviderSettings& settings);

    static std::unique_ptr<IProvider> create_unified_provider(
        const ProviderSettings& settings,
        HttpClient http_client = nullptr);

    static std::unique_ptr<IProvider> create_mock_provider(
        std::chrono::milliseconds delay);
};
