#pragma once

#include <curl/curl.h>

#include <filesystem>
#include <memory>
#include <string>

/**
 * Fetches .torrent descriptors over HTTP(S) with libcurl.
 *
 * One easy handle is reused across fetches. A failed fetch never leaves a
 * file at the destination: data goes to "<destination>.part" and is only
 * renamed once complete. Connection failures, timeouts, 429 and 5xx are
 * retried with exponential backoff.
 */
class HttpClient
{
public:
    // Descriptors are a few hundred KB at most
    static constexpr curl_off_t MAX_DESCRIPTOR_SIZE = 16 * 1024 * 1024;

    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    /**
     * @param timeoutSeconds Limit of each attempt
     * @return false on failure, see getLastError()
     */
    bool fetchFile(const std::string &url, const std::filesystem::path &destination, int timeoutSeconds = 60);

    std::string getLastError() const { return lastError_; }

    // Failed attempts before the last fetch succeeded
    int getRetryCount() const { return retryCount_; }

    // Attempts per fetch, the first one included
    void setMaxAttempts(int attempts) { maxAttempts_ = attempts; }

private:
    bool performWithRetry(const std::string &url, const std::filesystem::path &partPath);

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
    std::string lastError_;
    int retryCount_ = 0;
    int maxAttempts_ = 3;
};
