#include "http_client.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fmt/core.h>

namespace
{
    constexpr int FIRST_BACKOFF_MS = 1000;

    size_t writeToStream(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        auto *out = static_cast<std::ofstream *>(userdata);
        size_t bytes = size * nmemb;
        out->write(ptr, static_cast<std::streamsize>(bytes));

        // A short count makes libcurl abort with CURLE_WRITE_ERROR
        return out->good() ? bytes : 0;
    }

    bool isTransient(CURLcode code, long httpStatus)
    {
        switch (code)
        {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_PARTIAL_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            return true;

        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_OUT_OF_MEMORY:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_FILESIZE_EXCEEDED:
        case CURLE_WRITE_ERROR:
            return false;

        // What CURLOPT_FAILONERROR reports for 4xx/5xx
        case CURLE_HTTP_RETURNED_ERROR:
            return httpStatus == 429 || (httpStatus >= 500 && httpStatus < 600);

        default:
            return true;
        }
    }

    std::string statusText(long httpStatus)
    {
        switch (httpStatus)
        {
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 410:
            return "Gone";
        case 429:
            return "Too Many Requests";
        case 500:
            return "Internal Server Error";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown Status";
        }
    }

    // Backoff of 1s, 2s, 4s, ... with +/-20% jitter
    std::chrono::milliseconds backoffFor(int failedAttempts)
    {
        int base = FIRST_BACKOFF_MS * (1 << (failedAttempts - 1));
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> jitter(-20, 20);
        return std::chrono::milliseconds(base + base * jitter(gen) / 100);
    }
}

HttpClient::HttpClient() : curl_(curl_easy_init(), curl_easy_cleanup)
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize libcurl");
    }
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT, "TorrentStreamer/1.0");
}

HttpClient::~HttpClient() = default;

bool HttpClient::fetchFile(const std::string &url, const std::filesystem::path &destination, int timeoutSeconds)
{
    retryCount_ = 0;
    lastError_.clear();

    std::error_code ec;
    if (destination.has_parent_path())
    {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            lastError_ = fmt::format("Cannot create {}: {}", destination.parent_path().string(), ec.message());
            return false;
        }
    }

    CURL *curl = curl_.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToStream);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, MAX_DESCRIPTOR_SIZE);
    // An error page must never be saved as a descriptor
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    std::filesystem::path partPath = destination;
    partPath += ".part";

    if (!performWithRetry(url, partPath))
    {
        std::filesystem::remove(partPath, ec);
        return false;
    }

    auto size = std::filesystem::file_size(partPath, ec);
    if (ec || size == 0)
    {
        lastError_ = fmt::format("Server returned an empty torrent file for {}", url);
        std::filesystem::remove(partPath, ec);
        return false;
    }

    std::filesystem::rename(partPath, destination, ec);
    if (ec)
    {
        lastError_ = fmt::format("Cannot move {} to {}: {}", partPath.string(), destination.string(), ec.message());
        return false;
    }
    return true;
}

bool HttpClient::performWithRetry(const std::string &url, const std::filesystem::path &partPath)
{
    for (int attempt = 1;; ++attempt)
    {
        CURLcode res;
        {
            // Each attempt starts from an empty file
            std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                lastError_ = fmt::format("Cannot open file for writing: {}", partPath.string());
                return false;
            }
            curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &out);
            res = curl_easy_perform(curl_.get());
        }

        if (res == CURLE_OK)
        {
            retryCount_ = attempt - 1;
            return true;
        }

        long httpStatus = 0;
        curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &httpStatus);

        bool transient = isTransient(res, httpStatus);
        if (transient && attempt < maxAttempts_)
        {
            auto delay = backoffFor(attempt);
            fmt::print(stderr, "Fetching {} failed (attempt {}/{}): {}. Retrying in {:.1f}s...\n",
                       url, attempt, maxAttempts_, curl_easy_strerror(res), delay.count() / 1000.0);
            std::this_thread::sleep_for(delay);
            continue;
        }

        if (httpStatus >= 400)
        {
            lastError_ = fmt::format("HTTP error {}: {}", httpStatus, statusText(httpStatus));
        }
        else if (!transient)
        {
            lastError_ = fmt::format("Fetching torrent failed permanently: {}", curl_easy_strerror(res));
        }
        else
        {
            lastError_ = fmt::format("Fetching torrent failed after {} attempt(s): {}", attempt, curl_easy_strerror(res));
        }
        return false;
    }
}
