/*
 * libcurl HTTP transport
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpTransport.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

namespace {

// Helper function for curl write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response)
{
    const size_t total_size = size * nmemb;
    response->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

} // namespace

HttpResponse curl_http_client(const std::string& url,
                              const std::string& method,
                              const std::string& body,
                              const HttpHeaders& headers,
                              int timeout_ms)
{
    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

    curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header.c_str());
    }

    if (curl_headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
    }

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        if (auto logger = Logger::get_logger("core_logger")) {
            // URL omitted: Gemini carries the API key in the query string
            logger->debug("cURL {} request failed: {}", method, result.error);
        }
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        result.status_code = static_cast<int>(status);
        result.body = std::move(response_body);
    }

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    return result;
}
