/*
 * Blocking HTTP transport used by remote providers
 * Part of Parley - a console chatbot for hosted and local LLM APIs
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

struct HttpResponse {
    int status_code{0};
    std::string body;
    std::string error;      // Transport error text when no status was received
    bool success() const { return status_code >= 200 && status_code < 300; }
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * HTTP client interface for testability
 */
using HttpClient = std::function<HttpResponse(
    const std::string& url,
    const std::string& method,
    const std::string& body,
    const HttpHeaders& headers,
    int timeout_ms
)>;

/**
 * libcurl implementation of HttpClient.
 * One easy handle per call; curl_global_init() must have run.
 */
HttpResponse curl_http_client(const std::string& url,
                              const std::string& method,
                              const std::string& body,
                              const HttpHeaders& headers,
                              int timeout_ms);

#endif // HTTP_TRANSPORT_HPP
