/**
 * @file http_client.hpp
 * @brief Minimal HTTP client abstraction used to talk to the Language Server
 */

#ifndef LSQUOTA_HTTP_CLIENT_HPP
#define LSQUOTA_HTTP_CLIENT_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lsquota {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    std::string data;
    long http_code = 0;
};

/**
 * @brief Thrown when a request fails below the HTTP layer (connect, TLS, timeout)
 */
class HttpException : public std::runtime_error {
public:
    explicit HttpException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Blocking HTTP client
 *
 * A client may keep connections alive between calls. It is not safe to
 * use one instance from several threads at once.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief POST @p body to @p url
     *
     * @return Status code and body; any status is returned, not thrown
     * @throws HttpException on transport errors and timeouts
     */
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers) = 0;

    /**
     * @brief Release sockets held by the client. Further posts reopen them.
     */
    virtual void close() = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

/**
 * @brief libcurl client speaking HTTP/2 over TLS without certificate checks
 *
 * Meant for the self-signed loopback endpoint of the Language Server only.
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::chrono::milliseconds timeout);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post(const std::string& url, const std::string& body,
                      const HttpHeaders& headers) override;
    void close() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Factory producing CurlHttpClient instances with @p timeout
 */
HttpClientFactory curl_client_factory(std::chrono::milliseconds timeout);

} // namespace lsquota

#endif // LSQUOTA_HTTP_CLIENT_HPP
