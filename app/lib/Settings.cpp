#include "Settings.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>


namespace {

constexpr const char* kLlmSection = "LLM";
constexpr const char* kChatSection = "ChatBot";

void warn_invalid(const char* key, const std::string& value)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("Ignoring invalid value '{}' for {}; using default", value, key);
    }
}

int parse_int_or(const char* key, const std::string& value, int fallback)
{
    if (value.empty()) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        warn_invalid(key, value);
        return fallback;
    }
}

double parse_double_or(const char* key, const std::string& value, double fallback)
{
    if (value.empty()) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::logic_error&) {
        warn_invalid(key, value);
        return fallback;
    }
}

bool parse_bool_or(const char* key, const std::string& value, bool fallback)
{
    const std::string lowered = Utils::to_lower(value);
    if (lowered.empty()) {
        return fallback;
    }
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
        return false;
    }
    warn_invalid(key, value);
    return fallback;
}

std::optional<std::string> env_value(const char* name)
{
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

const char* provider_key_variable(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::OpenAI:
        case ProviderKind::Custom:
            return "OPENAI_API_KEY";
        case ProviderKind::Anthropic:
            return "ANTHROPIC_API_KEY";
        case ProviderKind::Gemini:
            return "GEMINI_API_KEY";
        case ProviderKind::Ollama:
            break;
    }
    return nullptr;
}

} // namespace


Settings::Settings()
    : Settings(define_config_path())
{
}


Settings::Settings(std::string config_path)
    : config_path(std::move(config_path))
{
}


std::string Settings::define_config_path()
{
    const std::string AppName = "Parley";
    if (const char* override_root = std::getenv("PARLEY_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / AppName / "config.ini").string();
    }
#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        return (std::filesystem::path(app_data) / AppName / "config.ini").string();
    }
#else
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        return (std::filesystem::path(xdg_config) / AppName / "config.ini").string();
    }
#endif
    return (std::filesystem::path(Utils::get_home_directory()) / ".config" / AppName / "config.ini").string();
}


bool Settings::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("No config file at '{}'; using defaults", config_path);
        }
        return false;
    }

    if (!config.load(config_path)) {
        return false;
    }

    provider.model = config.getValue(kLlmSection, "Model", provider.model);
    provider.api_key = config.getValue(kLlmSection, "ApiKey", provider.api_key);
    provider.max_tokens = parse_int_or("MaxTokens", config.getValue(kLlmSection, "MaxTokens"), provider.max_tokens);
    provider.temperature = parse_double_or("Temperature", config.getValue(kLlmSection, "Temperature"), provider.temperature);
    provider.base_url = config.getValue(kLlmSection, "BaseUrl", provider.base_url);
    provider.ollama_url = config.getValue(kLlmSection, "OllamaUrl", provider.ollama_url);
    timeout_seconds = parse_int_or("TimeoutSeconds", config.getValue(kLlmSection, "TimeoutSeconds"), timeout_seconds);

    const std::string provider_value = config.getValue(kLlmSection, "Provider", "auto");
    if (Utils::to_lower(provider_value) == "auto") {
        provider.provider_override.reset();
    } else if (auto kind = parse_provider_kind(provider_value)) {
        provider.provider_override = kind;
    } else {
        warn_invalid("Provider", provider_value);
    }

    const std::string policy_value = config.getValue(kLlmSection, "UnmatchedModels", "custom");
    if (auto policy = parse_unmatched_model_policy(policy_value)) {
        provider.unmatched_policy = *policy;
    } else {
        warn_invalid("UnmatchedModels", policy_value);
    }

    chat.bot_name = config.getValue(kChatSection, "Name", chat.bot_name);
    chat.welcome_message = config.getValue(kChatSection, "WelcomeMessage", chat.welcome_message);
    chat.goodbye_message = config.getValue(kChatSection, "GoodbyeMessage", chat.goodbye_message);
    mock_delay_ms = parse_int_or("MockDelayMs", config.getValue(kChatSection, "MockDelayMs"), mock_delay_ms);
    chat.show_thinking_indicator = parse_bool_or("ThinkingAnimation",
                                                 config.getValue(kChatSection, "ThinkingAnimation"),
                                                 chat.show_thinking_indicator);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded settings from '{}' (model: '{}', provider: {}, api key set: {})",
                     config_path,
                     provider.model,
                     provider.provider_override ? to_string(*provider.provider_override) : std::string("auto"),
                     !Utils::is_placeholder_api_key(provider.api_key));
    }

    return true;
}


bool Settings::save()
{
    config.setValue(kLlmSection, "Model", provider.model);
    config.setValue(kLlmSection, "ApiKey", provider.api_key);
    config.setValue(kLlmSection, "MaxTokens", std::to_string(provider.max_tokens));
    config.setValue(kLlmSection, "Temperature", std::to_string(provider.temperature));
    config.setValue(kLlmSection, "BaseUrl", provider.base_url);
    config.setValue(kLlmSection, "OllamaUrl", provider.ollama_url);
    config.setValue(kLlmSection, "TimeoutSeconds", std::to_string(timeout_seconds));
    config.setValue(kLlmSection, "Provider",
                    provider.provider_override ? to_string(*provider.provider_override) : std::string("auto"));
    config.setValue(kLlmSection, "UnmatchedModels", to_string(provider.unmatched_policy));

    config.setValue(kChatSection, "Name", chat.bot_name);
    config.setValue(kChatSection, "WelcomeMessage", chat.welcome_message);
    config.setValue(kChatSection, "GoodbyeMessage", chat.goodbye_message);
    config.setValue(kChatSection, "MockDelayMs", std::to_string(mock_delay_ms));
    config.setValue(kChatSection, "ThinkingAnimation", chat.show_thinking_indicator ? "true" : "false");

    const std::filesystem::path config_dir = std::filesystem::path(config_path).parent_path();
    if (!config_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_dir, ec);
        if (ec) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->error("Error creating configuration directory: {}", ec.message());
            }
            return false;
        }
    }

    return config.save(config_path);
}


void Settings::apply_environment_overrides()
{
    if (auto value = env_value("PARLEY_MODEL")) {
        provider.model = *value;
    }
    if (auto value = env_value("PARLEY_API_KEY")) {
        provider.api_key = *value;
    }
    if (auto value = env_value("PARLEY_BASE_URL")) {
        provider.base_url = *value;
    }
    if (auto value = env_value("PARLEY_OLLAMA_URL")) {
        provider.ollama_url = *value;
    }
}


std::string Settings::get_model() const { return provider.model; }
void Settings::set_model(const std::string& value) { provider.model = value; }

std::string Settings::get_api_key() const { return provider.api_key; }
void Settings::set_api_key(const std::string& value) { provider.api_key = value; }

std::string Settings::get_effective_api_key() const
{
    if (!Utils::is_placeholder_api_key(provider.api_key)) {
        return provider.api_key;
    }
    if (const char* variable = provider_key_variable(effective_provider_kind(provider))) {
        if (auto value = env_value(variable)) {
            return *value;
        }
    }
    return provider.api_key;
}

int Settings::get_max_tokens() const { return provider.max_tokens; }
void Settings::set_max_tokens(int value) { provider.max_tokens = value; }

double Settings::get_temperature() const { return provider.temperature; }
void Settings::set_temperature(double value) { provider.temperature = value; }

std::string Settings::get_base_url() const { return provider.base_url; }
void Settings::set_base_url(const std::string& value) { provider.base_url = value; }

std::string Settings::get_ollama_url() const { return provider.ollama_url; }
void Settings::set_ollama_url(const std::string& value) { provider.ollama_url = value; }

int Settings::get_timeout_seconds() const { return timeout_seconds; }
void Settings::set_timeout_seconds(int value) { timeout_seconds = value; }

std::optional<ProviderKind> Settings::get_provider_override() const { return provider.provider_override; }
void Settings::set_provider_override(std::optional<ProviderKind> value) { provider.provider_override = value; }

UnmatchedModelPolicy Settings::get_unmatched_model_policy() const { return provider.unmatched_policy; }
void Settings::set_unmatched_model_policy(UnmatchedModelPolicy value) { provider.unmatched_policy = value; }

std::string Settings::get_bot_name() const { return chat.bot_name; }
void Settings::set_bot_name(const std::string& value) { chat.bot_name = value; }

std::string Settings::get_welcome_message() const { return chat.welcome_message; }
void Settings::set_welcome_message(const std::string& value) { chat.welcome_message = value; }

std::string Settings::get_goodbye_message() const { return chat.goodbye_message; }
void Settings::set_goodbye_message(const std::string& value) { chat.goodbye_message = value; }

int Settings::get_mock_delay_ms() const { return mock_delay_ms; }
void Settings::set_mock_delay_ms(int value) { mock_delay_ms = value; }

bool Settings::get_thinking_animation() const { return chat.show_thinking_indicator; }
void Settings::set_thinking_animation(bool value) { chat.show_thinking_indicator = value; }


ProviderSettings Settings::to_provider_settings() const
{
    ProviderSettings result = provider;
    result.api_key = get_effective_api_key();
    result.timeout_ms = timeout_seconds > 0 ? timeout_seconds * 1000 : 30000;
    if (result.max_tokens <= 0) {
        result.max_tokens = 150;
    }
    return result;
}


ChatSessionOptions Settings::to_chat_options() const
{
    return chat;
}
