#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <string>

class Utils {
public:
    static std::string trim(const std::string& input);
    static std::string to_lower(std::string input);
    static bool is_blank(const std::string& input);

    // Case-insensitive (ASCII) prefix and substring checks
    static bool starts_with_ci(const std::string& text, const std::string& prefix);
    static bool contains_ci(const std::string& text, const std::string& needle);

    /**
     * Format a point in time as local "YYYY-MM-DD HH:MM:SS"
     */
    static std::string format_local_timestamp(std::chrono::system_clock::time_point when);

    /**
     * True for empty keys and sample values such as "your-openai-api-key-here"
     */
    static bool is_placeholder_api_key(const std::string& key);

    static std::string get_home_directory();
};

#endif // UTILS_HPP
