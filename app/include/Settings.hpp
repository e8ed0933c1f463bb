#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "ChatSession.hpp"
#include "IniConfig.hpp"
#include "ModelClassifier.hpp"
#include "ProviderSettings.hpp"

#include <optional>
#include <string>


class Settings
{
public:
    Settings();
    explicit Settings(std::string config_path);

    /**
     * Read the config file. Returns false (keeping defaults) when the file
     * is missing or unreadable.
     */
    bool load();
    bool save();

    /**
     * Apply PARLEY_MODEL, PARLEY_API_KEY, PARLEY_BASE_URL and PARLEY_OLLAMA_URL
     */
    void apply_environment_overrides();

    static std::string define_config_path();
    const std::string& get_config_path() const { return config_path; }

    std::string get_model() const;
    void set_model(const std::string& value);

    std::string get_api_key() const;
    void set_api_key(const std::string& value);

    /**
     * Configured key, or the provider's own environment variable
     * (OPENAI_API_KEY, ANTHROPIC_API_KEY, GEMINI_API_KEY) when the
     * configured key is empty or a placeholder
     */
    std::string get_effective_api_key() const;

    int get_max_tokens() const;
    void set_max_tokens(int value);

    double get_temperature() const;
    void set_temperature(double value);

    std::string get_base_url() const;
    void set_base_url(const std::string& value);

    std::string get_ollama_url() const;
    void set_ollama_url(const std::string& value);

    int get_timeout_seconds() const;
    void set_timeout_seconds(int value);

    std::optional<ProviderKind> get_provider_override() const;
    void set_provider_override(std::optional<ProviderKind> value);

    UnmatchedModelPolicy get_unmatched_model_policy() const;
    void set_unmatched_model_policy(UnmatchedModelPolicy value);

    std::string get_bot_name() const;
    void set_bot_name(const std::string& value);

    std::string get_welcome_message() const;
    void set_welcome_message(const std::string& value);

    std::string get_goodbye_message() const;
    void set_goodbye_message(const std::string& value);

    int get_mock_delay_ms() const;
    void set_mock_delay_ms(int value);

    bool get_thinking_animation() const;
    void set_thinking_animation(bool value);

    ProviderSettings to_provider_settings() const;
    ChatSessionOptions to_chat_options() const;

private:
    std::string config_path;
    IniConfig config;

    ProviderSettings provider;
    int timeout_seconds{30};
    ChatSessionOptions chat;
    int mock_delay_ms{500};
};

#endif // SETTINGS_HPP
