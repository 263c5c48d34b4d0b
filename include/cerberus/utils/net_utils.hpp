/**
 * @file net_utils.hpp
 * @brief Minimal blocking HTTP/TCP client used by health checks and the
 *        microVM control API
 *
 * Supports three transports:
 * - plain TCP (`http://`)
 * - TLS through OpenSSL (`https://`, certificates are not verified since
 *   challenge instances serve self-signed certificates)
 * - Unix domain sockets (Firecracker's REST API)
 *
 * Requests are HTTP/1.1 with `Connection: close`. Bodies framed by
 * Content-Length or chunked transfer encoding are both understood.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace cerberus {
namespace utils {

/**
 * @class NetworkError
 * @brief Transport-level failure (resolve, connect, TLS, timeout, malformed reply)
 */
class NetworkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ParsedUrl {
    std::string scheme;   ///< "http" or "https"
    std::string host;
    int port{80};
    std::string path{"/"};
};

struct HttpResponse {
    int status_code{0};
    std::map<std::string, std::string> headers;  ///< Lower-cased names
    std::string body;
};

/**
 * @class NetUtils
 * @brief Static socket helpers
 *
 * **Thread Safety**: All methods are reentrant.
 */
class NetUtils {
public:
    /**
     * @brief Parse an http(s) URL
     * @return std::nullopt for unsupported schemes or malformed input
     */
    static std::optional<ParsedUrl> ParseUrl(const std::string& url);

    /**
     * @brief Check whether a TCP connection can be established
     */
    static bool TcpProbe(const std::string& host, int port, std::chrono::milliseconds timeout);

    /**
     * @brief Perform one HTTP request against an http(s) URL
     * @throws NetworkError on transport failure
     */
    static HttpResponse HttpRequest(const std::string& method,
                                    const std::string& url,
                                    const std::string& body,
                                    std::chrono::milliseconds timeout);

    /**
     * @brief Perform one HTTP request over a Unix domain socket
     *
     * The Host header is set to `localhost`. A non-empty body is sent as
     * `application/json`.
     *
     * @throws NetworkError on transport failure
     */
    static HttpResponse UnixSocketRequest(const std::string& socket_path,
                                          const std::string& method,
                                          const std::string& path,
                                          const std::string& body,
                                          std::chrono::milliseconds timeout);
};

} // namespace utils
} // namespace cerberus
