#include "HttpClient.h"
#include <curl/curl.h>
#include <iostream>
#include <mutex>
#include <algorithm>

// Callback function for libcurl to write received data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

HttpClient::HttpClient() {
    // curl_global_init is not thread-safe, run it exactly once per process
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

HttpClient::~HttpClient() {
    // Note: We don't call curl_global_cleanup() as it affects the whole process
    // and other threads might still be using curl
}

HttpResult HttpClient::get(const std::string& url, long timeout_sec) const {
    return perform("GET", url, nullptr, timeout_sec);
}

HttpResult HttpClient::postJson(const std::string& url, const std::string& body, long timeout_sec) const {
    return perform("POST", url, &body, timeout_sec);
}

HttpResult HttpClient::perform(const std::string& method, const std::string& url,
                               const std::string* body, long timeout_sec) const {
    HttpResult result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "[HttpClient] Failed to initialize curl for " << method << std::endl;
        result.error = "curl initialization failed";
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(timeout_sec, 5L));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    if (body != nullptr) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->length()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        result.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        result.error = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        std::cerr << "[HttpClient] " << method << " " << url << " failed: " << result.error << std::endl;
    } else {
        result.transport_ok = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
        if (result.status >= 400) {
            std::cerr << "[HttpClient] " << method << " " << url << " returned HTTP " << result.status << std::endl;
        }
    }

    if (headers) {
        curl_slist_free_all(headers);
    }
    curl_easy_cleanup(curl);

    return result;
}
