/**
 * @file HttpClient.cpp
 * @brief Implementation of the HttpClient class
 */

#include "../utils/HttpClient.hpp"

namespace SpreadArb {

HttpClient::HttpClient(std::shared_ptr<Logger> logger)
    : m_logger(logger),
      m_connectionTimeout(10000),
      m_requestTimeout(30000),
      m_verifyPeer(true),
      m_initialized(false) {
    init();
}

HttpClient::~HttpClient() {
    cleanup();
}

void HttpClient::init() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
        if (res != CURLE_OK) {
            m_logger->error("curl_global_init failed: {}", curl_easy_strerror(res));
            return;
        }
        m_initialized = true;
        m_logger->debug("HttpClient initialized");
    }
}

void HttpClient::cleanup() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) {
        curl_global_cleanup();
        m_initialized = false;
        m_logger->debug("HttpClient cleaned up");
    }
}

HttpResponse HttpClient::request(HttpMethod method, const std::string& url,
                                 const std::unordered_map<std::string, std::string>& headers,
                                 const std::string& body) {
    m_logger->debug("Making {} request to {}", methodToString(method), url);

    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        m_logger->error("Failed to initialize CURL");
        return response;
    }

    curl_slist* headerList = setCurlOptions(curl, method, url, headers, body,
                                            response.headers, response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        m_logger->error("CURL request to {} failed: {} - {}", url, static_cast<int>(res), curl_easy_strerror(res));
    } else {
        long statusCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
        response.statusCode = static_cast<int>(statusCode);
        m_logger->debug("Request completed with status code {}", response.statusCode);
    }

    if (headerList) {
        curl_slist_free_all(headerList);
    }
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setConnectionTimeout(long timeoutMs) {
    m_connectionTimeout = timeoutMs;
}

void HttpClient::setRequestTimeout(long timeoutMs) {
    m_requestTimeout = timeoutMs;
}

void HttpClient::setVerifyPeer(bool verify) {
    m_verifyPeer = verify;
}

curl_slist* HttpClient::setCurlOptions(CURL* curl, HttpMethod method, const std::string& url,
                                       const std::unordered_map<std::string, std::string>& headers,
                                       const std::string& body,
                                       std::unordered_map<std::string, std::string>& responseHeaders,
                                       std::string& responseBody) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, m_connectionTimeout);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_requestTimeout);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, HttpClient::writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HttpClient::headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    if (!m_verifyPeer) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    curl_slist* headerList = nullptr;
    for (const auto& header : headers) {
        std::string headerString = header.first + ": " + header.second;
        headerList = curl_slist_append(headerList, headerString.c_str());
    }

    switch (method) {
        case HttpMethod::GET:
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
            break;
        case HttpMethod::PUT:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
            if (!body.empty()) {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
            }
            break;
        case HttpMethod::DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    if (headerList) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    #ifdef DEBUG
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    #endif

    return headerList;
}

std::string HttpClient::methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::POST:   return "POST";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        default:                 return "UNKNOWN";
    }
}

size_t HttpClient::writeCallback(void* data, size_t size, size_t nmemb, void* userp) {
    size_t realSize = size * nmemb;
    std::string* responseBody = static_cast<std::string*>(userp);
    responseBody->append(static_cast<char*>(data), realSize);
    return realSize;
}

size_t HttpClient::headerCallback(void* data, size_t size, size_t nmemb, void* userp) {
    size_t realSize = size * nmemb;
    std::string header(static_cast<char*>(data), realSize);

    size_t colonPos = header.find(':');
    if (colonPos != std::string::npos) {
        std::string name = header.substr(0, colonPos);
        size_t valueStart = header.find_first_not_of(" \t", colonPos + 1);
        if (valueStart != std::string::npos) {
            std::string value = header.substr(valueStart);
            while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
                value.pop_back();
            }

            auto& headers = *static_cast<std::unordered_map<std::string, std::string>*>(userp);
            headers[name] = value;
        }
    }

    return realSize;
}

}  // namespace SpreadArb
