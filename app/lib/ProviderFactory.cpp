#include "ProviderFactory.hpp"
#include "Logger.hpp"
#include "MockProvider.hpp"
#include "Settings.hpp"
#include "UnifiedProvider.hpp"
#include "Utils.hpp"

std::unique_ptr<IProvider> ProviderFactory::create_provider_from_settings(const Settings& settings)
{
    const int delay_ms = settings.get_mock_delay_ms() > 0 ? settings.get_mock_delay_ms() : 0;
    return create_provider(settings.to_provider_settings(), std::chrono::milliseconds(delay_ms));
}

bool ProviderFactory::should_use_remote_provider(const ProviderSettings& settings)
{
    if (effective_provider_kind(settings) == ProviderKind::Ollama) {
        return true;
    }
    return !Utils::is_placeholder_api_key(settings.api_key);
}

std::unique_ptr<IProvider> ProviderFactory::create_provider(
    const ProviderSettings& settings,
    std::chrono::milliseconds mock_delay,
    HttpClient http_client)
{
    const ProviderKind kind = effective_provider_kind(settings);
    auto logger = Logger::get_logger("core_logger");

    if (should_use_remote_provider(settings)) {
        if (logger) {
            logger->info("Model '{}' routed to {} provider", settings.model, to_string(kind));
        }
        return create_unified_provider(settings, std::move(http_client));
    }

    if (logger) {
        logger->warn("No API key configured for {} model '{}'; using offline mock replies",
                     to_string(kind), settings.model);
    }
    return create_mock_provider(mock_delay);
}

std::unique_ptr<IProvider> ProviderFactory::create_unified_provider(
    const ProviderSettings& settings,
    HttpClient http_client)
{
    return std::make_unique<UnifiedProvider>(settings, std::move(http_client));
}

std::unique_ptr<IProvider> ProviderFactory::create_mock_provider(
    std::chrono::milliseconds delay)
{
    return std::make_unique<MockProvider>(delay);
}
