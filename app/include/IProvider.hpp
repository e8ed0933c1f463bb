/*
 * Provider abstraction for LLM chat replies
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_PROVIDER_HPP
#define I_PROVIDER_HPP

#include <memory>
#include <string>
#include <vector>
#include <chrono>

/**
 * Chat message role
 */
enum class MessageRole {
    System,
    User,
    Assistant,
};

/**
 * A single message in a chat request
 */
struct ChatMessage {
    MessageRole role;
    std::string content;
};

/**
 * Request to an LLM provider
 */
struct LlmRequest {
    std::vector<ChatMessage> messages;
    std::string model;                       // Model identifier
    double temperature{0.7};
    int max_tokens{150};
    int timeout_ms{30000};                   // 30 second default
};

/**
 * Why a chat request produced no reply text
 */
enum class FailureKind {
    None,
    NotConfigured,      // Provider lacks a base URL or model
    Transport,          // Connection failure or non-2xx status
    MalformedResponse,  // 2xx body without the expected reply field
    Unexpected,         // Any other exception during the call
};

/**
 * Response from an LLM provider
 */
struct LlmResponse {
    std::string text;
    std::string provider_id;
    std::string model_used;
    std::chrono::milliseconds latency{0};

    // Error handling
    bool success{false};
    FailureKind failure{FailureKind::None};
    int error_code{0};                       // HTTP status when one was received
    std::string error_message;
};

/**
 * Abstract interface for chat responders
 *
 * Parley talks to every backend through this interface:
 * - UnifiedProvider: OpenAI, Anthropic, Gemini, Ollama or a custom endpoint
 * - MockProvider: canned replies when no credential is configured
 */
class IProvider {
public:
    virtual ~IProvider() = default;

    /**
     * Unique identifier for this provider (e.g., "openai", "ollama", "mock")
     */
    virtual std::string id() const = 0;

    /**
     * Human-readable name for logs and the startup banner
     */
    virtual std::string display_name() const = 0;

    /**
     * Whether this provider requires network access
     */
    virtual bool requires_network() const = 0;

    /**
     * Whether this provider is configured and ready for use
     */
    virtual bool is_configured() const = 0;

    /**
     * Structured chat completion
     *
     * Failures are reported through LlmResponse::success and
     * LlmResponse::failure rather than thrown.
     */
    virtual LlmResponse chat(const LlmRequest& request) const = 0;

    /**
     * Answer one line of user text with a printable reply
     *
     * Implementations never throw; every failure becomes a fixed sentence.
     */
    virtual std::string respond(const std::string& user_text) const = 0;
};

/**
 * Type alias for provider pointers
 */
using ProviderPtr = std::shared_ptr<IProvider>;

#endif // I_PROVIDER_HPP
