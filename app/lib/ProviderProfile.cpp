/*
 * Wire formats for OpenAI, Anthropic, Gemini, Ollama and custom endpoints
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ProviderProfile.hpp"
#include "Utils.hpp"

namespace {

constexpr const char* kOpenAIBaseUrl = "https://api.openai.com/v1/";
constexpr const char* kAnthropicBaseUrl = "https://api.anthropic.com/v1/";
constexpr const char* kGeminiBaseUrl = "https://generativelanguage.googleapis.com/v1beta/";
constexpr const char* kOllamaDefaultUrl = "http://localhost:11434/";
constexpr const char* kAnthropicVersion = "2023-06-01";

std::string with_trailing_slash(std::string url)
{
    if (!url.empty() && url.back() != '/') {
        url += '/';
    }
    return url;
}

const char* role_name(MessageRole role)
{
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

Json::Value message_json(const ChatMessage& message)
{
    Json::Value entry(Json::objectValue);
    entry["role"] = role_name(message.role);
    entry["content"] = message.content;
    return entry;
}

Json::Value messages_json(const LlmRequest& request, bool include_system)
{
    Json::Value messages(Json::arrayValue);
    for (const auto& msg : request.messages) {
        if (msg.role == MessageRole::System && !include_system) {
            continue;
        }
        messages.append(message_json(msg));
    }
    return messages;
}

// Gemini takes a single text part: the system prompt followed by the user text
std::string gemini_prompt(const LlmRequest& request)
{
    std::string system;
    std::string user;
    for (const auto& msg : request.messages) {
        if (msg.role == MessageRole::System) {
            if (!system.empty()) {
                system += ' ';
            }
            system += msg.content;
        } else if (msg.role == MessageRole::User) {
            user = msg.content;
        }
    }
    if (system.empty()) {
        return user;
    }
    return system + " User: " + user;
}

HttpHeaders json_headers()
{
    return {{"Content-Type", "application/json"}};
}

HttpHeaders bearer_headers(const std::string& api_key)
{
    HttpHeaders headers = json_headers();
    if (!api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + api_key);
    }
    return headers;
}

// Null-tolerant navigation so a malformed body never throws Json::LogicError
const Json::Value* member(const Json::Value* value, const char* key)
{
    if (!value || !value->isObject() || !value->isMember(key)) {
        return nullptr;
    }
    return &(*value)[key];
}

const Json::Value* first_element(const Json::Value* value)
{
    if (!value || !value->isArray() || value->empty()) {
        return nullptr;
    }
    return &(*value)[Json::ArrayIndex{0}];
}

std::optional<std::string> text_of(const Json::Value* value)
{
    if (!value || !value->isString()) {
        return std::nullopt;
    }
    return Utils::trim(value->asString());
}

std::optional<std::string> extract_choices_reply(const Json::Value& root)
{
    return text_of(member(member(first_element(member(&root, "choices")), "message"), "content"));
}

ProviderProfile openai_compatible_profile(ProviderKind kind,
                                          std::string id,
                                          std::string display_name,
                                          std::string base_url,
                                          const std::string& api_key)
{
    ProviderProfile profile;
    profile.kind = kind;
    profile.id = std::move(id);
    profile.display_name = std::move(display_name);
    profile.base_url = with_trailing_slash(std::move(base_url));
    profile.endpoint = [](const LlmRequest&) { return std::string("chat/completions"); };
    profile.headers = [api_key]() { return bearer_headers(api_key); };
    profile.build_body = [](const LlmRequest& request) {
        Json::Value body(Json::objectValue);
        body["model"] = request.model;
        body["messages"] = messages_json(request, true);
        body["max_tokens"] = request.max_tokens;
        body["temperature"] = request.temperature;
        return body;
    };
    profile.extract_reply = extract_choices_reply;
    return profile;
}

ProviderProfile anthropic_profile(const std::string& api_key)
{
    ProviderProfile profile;
    profile.kind = ProviderKind::Anthropic;
    profile.id = "anthropic";
    profile.display_name = "Anthropic";
    profile.base_url = kAnthropicBaseUrl;
    profile.endpoint = [](const LlmRequest&) { return std::string("messages"); };
    profile.headers = [api_key]() {
        HttpHeaders headers = json_headers();
        if (!api_key.empty()) {
            headers.emplace_back("x-api-key", api_key);
        }
        headers.emplace_back("anthropic-version", kAnthropicVersion);
        return headers;
    };
    profile.build_body = [](const LlmRequest& request) {
        Json::Value body(Json::objectValue);
        body["model"] = request.model;
        body["max_tokens"] = request.max_tokens;
        body["temperature"] = request.temperature;
        body["messages"] = messages_json(request, false);
        return body;
    };
    profile.extract_reply = [](const Json::Value& root) {
        return text_of(member(first_element(member(&root, "content")), "text"));
    };
    return profile;
}

ProviderProfile gemini_profile(const std::string& api_key)
{
    ProviderProfile profile;
    profile.kind = ProviderKind::Gemini;
    profile.id = "gemini";
    profile.display_name = "Google Gemini";
    profile.base_url = kGeminiBaseUrl;
    profile.endpoint = [api_key](const LlmRequest& request) {
        return "models/" + request.model + ":generateContent?key=" + api_key;
    };
    profile.headers = json_headers;
    profile.build_body = [](const LlmRequest& request) {
        Json::Value part(Json::objectValue);
        part["text"] = gemini_prompt(request);

        Json::Value content(Json::objectValue);
        content["parts"] = Json::Value(Json::arrayValue);
        content["parts"].append(part);

        Json::Value generation_config(Json::objectValue);
        generation_config["temperature"] = request.temperature;
        generation_config["maxOutputTokens"] = request.max_tokens;
        generation_config["topP"] = 0.8;
        generation_config["topK"] = 10;

        Json::Value body(Json::objectValue);
        body["contents"] = Json::Value(Json::arrayValue);
        body["contents"].append(content);
        body["generationConfig"] = generation_config;
        return body;
    };
    profile.extract_reply = [](const Json::Value& root) {
        const Json::Value* candidate = first_element(member(&root, "candidates"));
        return text_of(member(first_element(member(member(candidate, "content"), "parts")), "text"));
    };
    return profile;
}

ProviderProfile ollama_profile(const std::string& ollama_url)
{
    ProviderProfile profile;
    profile.kind = ProviderKind::Ollama;
    profile.id = "ollama";
    profile.display_name = "Ollama";
    profile.base_url = with_trailing_slash(ollama_url.empty() ? kOllamaDefaultUrl : ollama_url);
    profile.endpoint = [](const LlmRequest&) { return std::string("api/chat"); };
    profile.headers = json_headers;
    profile.build_body = [](const LlmRequest& request) {
        Json::Value options(Json::objectValue);
        options["temperature"] = request.temperature;
        options["num_predict"] = request.max_tokens;

        Json::Value body(Json::objectValue);
        body["model"] = request.model;
        body["messages"] = messages_json(request, true);
        body["stream"] = false;
        body["options"] = options;
        return body;
    };
    profile.extract_reply = [](const Json::Value& root) {
        return text_of(member(member(&root, "message"), "content"));
    };
    return profile;
}

} // namespace

ProviderProfile make_provider_profile(ProviderKind kind, const ProviderSettings& settings)
{
    switch (kind) {
        case ProviderKind::OpenAI:
            return openai_compatible_profile(ProviderKind::OpenAI, "openai", "OpenAI",
                                             kOpenAIBaseUrl, settings.api_key);
        case ProviderKind::Anthropic:
            return anthropic_profile(settings.api_key);
        case ProviderKind::Gemini:
            return gemini_profile(settings.api_key);
        case ProviderKind::Ollama:
            return ollama_profile(settings.ollama_url);
        case ProviderKind::Custom:
            break;
    }
    // Custom endpoints without a base URL behave like OpenAI
    const std::string base_url = settings.base_url.empty() ? kOpenAIBaseUrl : settings.base_url;
    return openai_compatible_profile(ProviderKind::Custom, "custom", "Custom endpoint",
                                     base_url, settings.api_key);
}

std::string serialize_json(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = 15;
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}
