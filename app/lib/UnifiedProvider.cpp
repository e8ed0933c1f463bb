/*
 * Unified provider implementation
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "UnifiedProvider.hpp"
#include "Logger.hpp"
#include "ReplyMessages.hpp"

#include <sstream>
#include <chrono>

UnifiedProvider::UnifiedProvider(ProviderSettings settings, HttpClient http_client)
    : settings_(std::move(settings))
    , profile_(make_provider_profile(effective_provider_kind(settings_), settings_))
    , http_client_(std::move(http_client))
{
    if (!http_client_) {
        http_client_ = curl_http_client;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("UnifiedProvider using {} at {} for model '{}'",
                     profile_.display_name, profile_.base_url, settings_.model);
    }
}

bool UnifiedProvider::is_configured() const
{
    return !profile_.base_url.empty() && !settings_.model.empty();
}

LlmRequest UnifiedProvider::build_request(const std::string& user_text) const
{
    LlmRequest request;
    request.model = settings_.model;
    request.temperature = settings_.temperature;
    request.max_tokens = settings_.max_tokens;
    request.timeout_ms = settings_.timeout_ms;
    if (!settings_.system_prompt.empty()) {
        request.messages.push_back({MessageRole::System, settings_.system_prompt});
    }
    request.messages.push_back({MessageRole::User, user_text});
    return request;
}

HttpResponse UnifiedProvider::post(const std::string& endpoint,
                                   const std::string& body,
                                   int timeout_ms) const
{
    const std::string url = profile_.base_url + endpoint;
    return http_client_(url, "POST", body, profile_.headers(), timeout_ms);
}

LlmResponse UnifiedProvider::parse_chat_response(
    const HttpResponse& http_response,
    std::chrono::milliseconds latency) const
{
    LlmResponse response;
    response.provider_id = id();
    response.model_used = settings_.model;
    response.latency = latency;
    response.error_code = http_response.status_code;

    if (!http_response.success()) {
        response.success = false;
        response.failure = FailureKind::Transport;
        response.error_message = "HTTP request failed";
        if (!http_response.error.empty()) {
            response.error_message += ": " + http_response.error;
        }
        if (http_response.status_code > 0) {
            response.error_message += " (status: " + std::to_string(http_response.status_code) + ")";
        }
        return response;
    }

    // Parse JSON response
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream response_stream(http_response.body);
    std::string errors;

    if (!Json::parseFromStream(reader_builder, response_stream, &root, &errors)) {
        response.success = false;
        response.failure = FailureKind::MalformedResponse;
        response.error_message = "Failed to parse JSON response: " + errors;
        return response;
    }

    if (auto text = profile_.extract_reply(root)) {
        response.text = std::move(*text);
        response.success = true;
    } else {
        response.success = false;
        response.failure = FailureKind::MalformedResponse;
        response.error_message = "Unexpected response format";
    }

    return response;
}

LlmResponse UnifiedProvider::create_config_error(const std::string& reason) const
{
    LlmResponse response;
    response.provider_id = id();
    response.model_used = settings_.model;
    response.success = false;
    response.failure = FailureKind::NotConfigured;
    response.error_message = "Configuration error: " + reason;
    return response;
}

LlmResponse UnifiedProvider::chat(const LlmRequest& request) const
{
    if (!is_configured()) {
        return create_config_error(profile_.display_name + " provider not configured: base URL or model missing");
    }

    const auto start_time = std::chrono::steady_clock::now();

    LlmResponse response;
    try {
        const std::string payload = serialize_json(profile_.build_body(request));
        const HttpResponse http_response = post(profile_.endpoint(request), payload, request.timeout_ms);

        const auto end_time = std::chrono::steady_clock::now();
        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        response = parse_chat_response(http_response, latency);
    } catch (const std::exception& ex) {
        response.provider_id = id();
        response.model_used = settings_.model;
        response.success = false;
        response.failure = FailureKind::Unexpected;
        response.error_message = std::string("Request failed: ") + ex.what();
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        switch (response.failure) {
            case FailureKind::None:
                logger->info("{} completed request in {}ms", profile_.display_name, response.latency.count());
                break;
            case FailureKind::Transport:
                logger->error("{} API request failed with status: {} {}",
                              profile_.display_name, response.error_code, response.error_message);
                break;
            case FailureKind::MalformedResponse:
                logger->debug("{} returned an unusable body: {}", profile_.display_name, response.error_message);
                break;
            case FailureKind::NotConfigured:
            case FailureKind::Unexpected:
                logger->error("{} error: {}", profile_.display_name, response.error_message);
                break;
        }
    }

    return response;
}

std::string UnifiedProvider::reply_for(const LlmResponse& response)
{
    if (response.success) {
        return response.text;
    }
    switch (response.failure) {
        case FailureKind::Transport: return ReplyMessages::kConnectionTrouble;
        case FailureKind::MalformedResponse: return ReplyMessages::kNotUnderstood;
        case FailureKind::None:
        case FailureKind::NotConfigured:
        case FailureKind::Unexpected:
            break;
    }
    return ReplyMessages::kSomethingWentWrong;
}

std::string UnifiedProvider::respond(const std::string& user_text) const
{
    try {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Sending request to {} with model {}", id(), settings_.model);
        }
        return reply_for(chat(build_request(user_text)));
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Error occurred while calling LLM provider: {}", ex.what());
        }
        return ReplyMessages::kSomethingWentWrong;
    }
}
