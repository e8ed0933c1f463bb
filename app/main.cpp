/*
 * Entry point
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ChatSession.hpp"
#include "Logger.hpp"
#include "ModelClassifier.hpp"
#include "ProviderFactory.hpp"
#include "Settings.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct ParsedArguments {
    std::optional<std::string> config_path;
    std::optional<std::string> model;
    std::optional<std::string> api_key;
    std::optional<std::string> provider;
    bool no_animation{false};
    bool verbose{false};
    bool write_config{false};
    bool help{false};
};

struct CurlCleanup {
    ~CurlCleanup() { curl_global_cleanup(); }
};

void print_usage(std::ostream& out)
{
    out << "Usage: parley [options]\n"
        << "  --config <file>     Read settings from <file>\n"
        << "  --model <id>        Model identifier (decides the provider)\n"
        << "  --api-key <key>     Provider API key\n"
        << "  --provider <kind>   auto, openai, anthropic, gemini, ollama or custom\n"
        << "  --no-animation      Disable the thinking indicator\n"
        << "  --verbose           Mirror debug logs to stderr\n"
        << "  --write-config      Save the effective settings and exit\n"
        << "  --help              Show this message\n";
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;

    auto require_value = [&](int& index, const std::string& flag) {
        if (index + 1 >= argc) {
            throw std::runtime_error("Missing value for " + flag);
        }
        return std::string(argv[++index]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            parsed.config_path = require_value(i, arg);
        } else if (arg == "--model") {
            parsed.model = require_value(i, arg);
        } else if (arg == "--api-key") {
            parsed.api_key = require_value(i, arg);
        } else if (arg == "--provider") {
            parsed.provider = require_value(i, arg);
        } else if (arg == "--no-animation") {
            parsed.no_animation = true;
        } else if (arg == "--verbose") {
            parsed.verbose = true;
        } else if (arg == "--write-config") {
            parsed.write_config = true;
        } else if (arg == "--help" || arg == "-h") {
            parsed.help = true;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return parsed;
}

void initialize_loggers(bool verbose)
{
    try {
        Logger::setup_loggers(verbose);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Failed to initialize loggers: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Failed to create log directory: " << ex.what() << std::endl;
    }
}

void apply_command_line(Settings& settings, const ParsedArguments& args)
{
    if (args.model) {
        settings.set_model(*args.model);
    }
    if (args.api_key) {
        settings.set_api_key(*args.api_key);
    }
    if (args.provider) {
        if (*args.provider == "auto") {
            settings.set_provider_override(std::nullopt);
        } else if (auto kind = parse_provider_kind(*args.provider)) {
            settings.set_provider_override(kind);
        } else {
            throw std::runtime_error("Unknown provider: " + *args.provider);
        }
    }
    if (args.no_animation) {
        settings.set_thinking_animation(false);
    }
}

Settings load_settings(const ParsedArguments& args)
{
    Settings settings = args.config_path ? Settings(*args.config_path) : Settings();

    const bool loaded = settings.load();
    if (!loaded && args.config_path && !args.write_config) {
        throw std::runtime_error("Cannot read config file: " + *args.config_path);
    }

    settings.apply_environment_overrides();
    apply_command_line(settings, args);
    return settings;
}

int run_application(const ParsedArguments& args)
{
    Settings settings = load_settings(args);

    if (args.write_config) {
        if (!settings.save()) {
            throw std::runtime_error("Failed to write config file: " + settings.get_config_path());
        }
        std::cout << "Settings written to " << settings.get_config_path() << std::endl;
        return EXIT_SUCCESS;
    }

    auto provider = ProviderFactory::create_provider_from_settings(settings);
    ChatSession session(*provider, settings.to_chat_options(), std::cin, std::cout);
    session.run();
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char** argv)
{
    ParsedArguments args;
    try {
        args = parse_command_line(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        print_usage(std::cerr);
        return EXIT_FAILURE;
    }

    if (args.help) {
        print_usage(std::cout);
        return EXIT_SUCCESS;
    }

    initialize_loggers(args.verbose);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl" << std::endl;
        return EXIT_FAILURE;
    }
    CurlCleanup curl_cleanup;

    try {
        return run_application(args);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error during startup: {}", ex.what());
        }
        std::cerr << "Error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
