/*
 * Offline canned-reply provider
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef MOCK_PROVIDER_HPP
#define MOCK_PROVIDER_HPP

#include "IProvider.hpp"
#include <chrono>
#include <functional>
#include <random>
#include <string>
#include <vector>

/**
 * Provider used when no credential is configured.
 *
 * Replies come from a few keyword rules and a fixed list of filler phrases;
 * nothing leaves the machine. An artificial delay imitates network latency.
 */
class MockProvider : public IProvider {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param delay Artificial latency before each reply
     * @param seed Seed for filler phrase selection
     * @param clock Optional clock for the time/date reply (for testing)
     */
    explicit MockProvider(std::chrono::milliseconds delay = std::chrono::milliseconds(500),
                          unsigned int seed = std::random_device{}(),
                          Clock clock = nullptr);

    ~MockProvider() override = default;

    // IProvider interface
    std::string id() const override { return "mock"; }
    std::string display_name() const override { return "Offline assistant"; }
    bool requires_network() const override { return false; }
    bool is_configured() const override { return true; }
    LlmResponse chat(const LlmRequest& request) const override;
    std::string respond(const std::string& user_text) const override;

    static const std::vector<std::string>& filler_phrases();

private:
    std::string compose_reply(const std::string& user_text) const;

    std::chrono::milliseconds delay_;
    mutable std::mt19937 rng_;
    Clock clock_;
};

#endif // MOCK_PROVIDER_HPP
