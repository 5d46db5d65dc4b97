#include "http_client.hpp"
#include "cancellation.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct DownloadSink {
    std::ofstream* out;
    std::uintmax_t written = 0;
};

size_t bodyCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t fileCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<DownloadSink*>(userp);
    sink->out->write(static_cast<const char*>(contents), static_cast<std::streamsize>(size * nmemb));
    if (!*sink->out) {
        return 0;
    }
    sink->written += size * nmemb;
    return size * nmemb;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return token->isCancelled() ? 1 : 0;
}

CurlPtr makeHandle(const std::string& url, const Credentials& credentials, bool verifyTls,
                   const CancellationToken& token, char* errorBuffer) {
    static std::once_flag globalInit;
    std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CurlPtr curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return curl;
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, credentials.user.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, credentials.password.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, verifyTls ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, verifyTls ? 2L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &token);
    return curl;
}

std::string describe(CURLcode res, const char* errorBuffer) {
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return "Transfer cancelled";
    }
    if (errorBuffer[0] != '\0') {
        return std::format("{} ({})", curl_easy_strerror(res), errorBuffer);
    }
    return curl_easy_strerror(res);
}

} // namespace

CurlHttpClient::CurlHttpClient(bool verifyTls, std::chrono::seconds requestTimeout, std::size_t chunkSize)
    : verifyTls(verifyTls), requestTimeout(requestTimeout), chunkSize(chunkSize) {}

std::expected<HttpResponse, std::string> CurlHttpClient::get(const std::string& url,
                                                             const Credentials& credentials,
                                                             const CancellationToken& token,
                                                             std::chrono::milliseconds timeout) {
    char errorBuffer[CURL_ERROR_SIZE] = {};
    CurlPtr curl = makeHandle(url, credentials, verifyTls, token, errorBuffer);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    HttpResponse response;
    // curl treats 0 as "no timeout", so the smallest bound is 1ms.
    auto limit = std::clamp<std::chrono::milliseconds>(timeout, std::chrono::milliseconds(1), requestTimeout);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(limit.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, bodyCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Request to {} failed: {}", url, describe(res, errorBuffer)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::expected<std::uintmax_t, std::string> CurlHttpClient::download(const std::string& url,
                                                                    const Credentials& credentials,
                                                                    const std::string& localPath,
                                                                    const CancellationToken& token) {
    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(std::format("Failed to open {} for writing", localPath));
    }

    char errorBuffer[CURL_ERROR_SIZE] = {};
    CurlPtr curl = makeHandle(url, credentials, verifyTls, token, errorBuffer);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    DownloadSink sink{&out};
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(chunkSize));
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(requestTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(requestTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, fileCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            return std::unexpected(std::format("Download from {} returned HTTP {}", url, status));
        }
        return std::unexpected(std::format("Download from {} failed: {}", url, describe(res, errorBuffer)));
    }

    out.close();
    if (!out) {
        return std::unexpected(std::format("Failed to finish writing {}", localPath));
    }
    return sink.written;
}
