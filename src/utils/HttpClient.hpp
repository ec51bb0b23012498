/**
 * @file HttpClient.hpp
 * @brief HTTP client for the brokerage gateway REST API
 */

#pragma once

#include <string>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <curl/curl.h>
#include "../utils/Logger.hpp"

namespace SpreadArb {

/**
 * @enum HttpMethod
 * @brief HTTP request methods
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

/**
 * @struct HttpResponse
 * @brief HTTP response data
 *
 * statusCode is 0 when the transfer itself failed.
 */
struct HttpResponse {
    int statusCode = 0;                                    ///< HTTP status code
    std::string body;                                      ///< Response body
    std::unordered_map<std::string, std::string> headers;  ///< Response headers
};

/**
 * @class HttpClient
 * @brief Synchronous libcurl wrapper, one easy handle per request
 */
class HttpClient {
public:
    /**
     * @brief Constructor
     * @param logger Logger instance
     */
    explicit HttpClient(std::shared_ptr<Logger> logger);

    /**
     * @brief Destructor
     */
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Perform a synchronous HTTP request
     * @param method HTTP method
     * @param url URL to request
     * @param headers HTTP headers
     * @param body Request body
     * @return HTTP response
     */
    HttpResponse request(HttpMethod method, const std::string& url,
                         const std::unordered_map<std::string, std::string>& headers = {},
                         const std::string& body = "");

    /**
     * @brief Set connection timeout
     * @param timeoutMs Timeout in milliseconds
     */
    void setConnectionTimeout(long timeoutMs);

    /**
     * @brief Set request timeout
     * @param timeoutMs Timeout in milliseconds
     */
    void setRequestTimeout(long timeoutMs);

    /**
     * @brief Enable or disable TLS peer and host verification
     *
     * The local Client Portal gateway serves a self-signed certificate.
     */
    void setVerifyPeer(bool verify);

    /**
     * @brief Convert HTTP method to string
     * @param method HTTP method
     * @return String representation of the HTTP method
     */
    static std::string methodToString(HttpMethod method);

private:
    void init();
    void cleanup();

    /**
     * @brief Set common curl options
     * @return Header list the caller must free after the transfer
     */
    curl_slist* setCurlOptions(CURL* curl, HttpMethod method, const std::string& url,
                               const std::unordered_map<std::string, std::string>& headers,
                               const std::string& body,
                               std::unordered_map<std::string, std::string>& responseHeaders,
                               std::string& responseBody);

    static size_t writeCallback(void* data, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(void* data, size_t size, size_t nmemb, void* userp);

    std::shared_ptr<Logger> m_logger;  ///< Logger instance
    long m_connectionTimeout;          ///< Connection timeout in milliseconds
    long m_requestTimeout;             ///< Request timeout in milliseconds
    bool m_verifyPeer;                 ///< Whether TLS certificates are verified
    bool m_initialized;                ///< Whether libcurl is initialized
    std::mutex m_mutex;                ///< Guards global init/cleanup
};

}  // namespace SpreadArb
