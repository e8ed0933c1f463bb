/*
 * Model identifier to provider classification
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef MODEL_CLASSIFIER_HPP
#define MODEL_CLASSIFIER_HPP

#include <optional>
#include <string>

/**
 * Upstream service a model identifier is routed to
 */
enum class ProviderKind {
    OpenAI,
    Anthropic,
    Gemini,
    Ollama,
    Custom,     // OpenAI-compatible endpoint at the configured base URL
};

/**
 * What to do with model names no prefix rule recognizes
 */
enum class UnmatchedModelPolicy {
    CustomEndpoint,   // Route to ProviderKind::Custom (configured base URL)
    OpenAIDefault,    // Route to ProviderKind::OpenAI
};

/**
 * Classify a model identifier.
 *
 * Rules are case-insensitive and evaluated in order:
 *   1. "gpt-", "o1-" prefix                  -> OpenAI
 *   2. "claude-" prefix                      -> Anthropic
 *   3. "gemini-" prefix                      -> Gemini
 *   4. "llama", "mistral", "deepseek", "qwen", "stable-code", "gpt-oss" prefix,
 *      or containing "local" or ':'          -> Ollama
 *   5. anything else                         -> decided by policy
 */
ProviderKind classify_model(const std::string& model,
                            UnmatchedModelPolicy policy = UnmatchedModelPolicy::CustomEndpoint);

/**
 * Stable lower-case name ("openai", "anthropic", "gemini", "ollama", "custom")
 */
std::string to_string(ProviderKind kind);

/**
 * Parse a provider name as written in config files or on the command line
 */
std::optional<ProviderKind> parse_provider_kind(const std::string& name);

std::string to_string(UnmatchedModelPolicy policy);
std::optional<UnmatchedModelPolicy> parse_unmatched_model_policy(const std::string& name);

#endif // MODEL_CLASSIFIER_HPP
