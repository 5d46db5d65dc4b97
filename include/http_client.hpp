/**
 * @file http_client.hpp
 * @brief HTTPS access to the source host's job-control API and backup downloads.
 *
 * @note Requires libcurl.
 */

#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>
#include <expected>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include "migration_types.hpp"

class CancellationToken;

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Interface for authenticated HTTP GET requests.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Performs a GET with basic authentication and returns the whole body.
     *
     * A non-2xx status is not an error here; callers inspect HttpResponse::status.
     *
     * @param url Absolute URL.
     * @param credentials Basic-auth credentials.
     * @param token Aborts the transfer when cancelled.
     * @param timeout Upper bound on the whole request.
     * @return std::expected<HttpResponse, std::string> Response or a transport error.
     */
    virtual std::expected<HttpResponse, std::string> get(const std::string& url,
                                                         const Credentials& credentials,
                                                         const CancellationToken& token,
                                                         std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Streams a GET response body to a local file.
     *
     * @param url Absolute URL.
     * @param credentials Basic-auth credentials.
     * @param localPath File to create or truncate.
     * @param token Aborts the transfer when cancelled.
     * @return std::expected<std::uintmax_t, std::string> Bytes written, or an error for
     * transport failures, non-2xx statuses and local write failures.
     */
    virtual std::expected<std::uintmax_t, std::string> download(const std::string& url,
                                                                const Credentials& credentials,
                                                                const std::string& localPath,
                                                                const CancellationToken& token) = 0;
};

/**
 * @brief libcurl implementation of HttpClient.
 */
class CurlHttpClient : public HttpClient {
public:
    /**
     * @brief Constructs a client.
     *
     * @param verifyTls If false, self-signed certificates are accepted.
     * @param requestTimeout Longest timeout get() accepts; downloads only enforce a stall timeout.
     * @param chunkSize Receive buffer size used for downloads.
     */
    CurlHttpClient(bool verifyTls, std::chrono::seconds requestTimeout, std::size_t chunkSize);

    std::expected<HttpResponse, std::string> get(const std::string& url,
                                                 const Credentials& credentials,
                                                 const CancellationToken& token,
                                                 std::chrono::milliseconds timeout) override;

    std::expected<std::uintmax_t, std::string> download(const std::string& url,
                                                        const Credentials& credentials,
                                                        const std::string& localPath,
                                                        const CancellationToken& token) override;

private:
    bool verifyTls;
    std::chrono::seconds requestTimeout;
    std::size_t chunkSize;
};

#endif // HTTP_CLIENT_HPP
