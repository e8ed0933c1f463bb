#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string Utils::trim(const std::string& input)
{
    const char* whitespace = " \t\n\r\f\v";
    const auto begin = input.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(whitespace);
    return input.substr(begin, end - begin + 1);
}


std::string Utils::to_lower(std::string input)
{
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return input;
}


bool Utils::is_blank(const std::string& input)
{
    return std::all_of(input.begin(), input.end(),
                       [](unsigned char ch) { return std::isspace(ch) != 0; });
}


bool Utils::starts_with_ci(const std::string& text, const std::string& prefix)
{
    if (prefix.size() > text.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}


bool Utils::contains_ci(const std::string& text, const std::string& needle)
{
    return to_lower(text).find(to_lower(needle)) != std::string::npos;
}


std::string Utils::format_local_timestamp(std::chrono::system_clock::time_point when)
{
    const std::time_t raw = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &raw);
#else
    localtime_r(&raw, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}


bool Utils::is_placeholder_api_key(const std::string& key)
{
    const std::string value = to_lower(trim(key));
    if (value.empty()) {
        return true;
    }
    // Sample configs ship keys like "your-openai-api-key-here"
    const std::string prefix = "your-";
    const std::string suffix = "-here";
    return value.size() > prefix.size() + suffix.size() &&
           value.compare(0, prefix.size(), prefix) == 0 &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}


std::string Utils::get_home_directory()
{
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    return home ? std::string(home) : std::string(".");
}
