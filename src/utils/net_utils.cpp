/**
 * @file net_utils.cpp
 * @brief POSIX socket and OpenSSL implementation of the HTTP/TCP helpers
 *
 * Connections use a non-blocking connect() bounded by poll(), then switch to
 * blocking I/O with SO_RCVTIMEO/SO_SNDTIMEO so a stalled peer cannot hang a
 * health-check thread past its timeout.
 *
 * @date 2025
 */

#include "cerberus/utils/net_utils.hpp"
#include "cerberus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace cerberus {
namespace utils {

namespace {

/**
 * @class Connection
 * @brief RAII socket with optional TLS session
 */
class Connection {
public:
    explicit Connection(int fd) : fd_(fd) {}

    ~Connection() {
        if (ssl_ != nullptr) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
        }
        if (ctx_ != nullptr) {
            SSL_CTX_free(ctx_);
        }
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void StartTls(const std::string& server_name) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (ctx_ == nullptr) {
            throw NetworkError("SSL_CTX_new failed");
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);

        ssl_ = SSL_new(ctx_);
        if (ssl_ == nullptr) {
            throw NetworkError("SSL_new failed");
        }
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, server_name.c_str());

        if (SSL_connect(ssl_) != 1) {
            char err[256];
            ERR_error_string_n(ERR_get_error(), err, sizeof(err));
            throw NetworkError(std::string("TLS handshake failed: ") + err);
        }
    }

    void WriteAll(const std::string& data) {
        std::size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n;
            if (ssl_ != nullptr) {
                n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
            } else {
                n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            }
            if (n <= 0) {
                throw NetworkError(std::string("send failed: ") + std::strerror(errno));
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    /// @return bytes read, 0 on orderly close
    ssize_t Read(char* buf, std::size_t len) {
        ssize_t n;
        if (ssl_ != nullptr) {
            n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n <= 0) {
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN || err == SSL_ERROR_SYSCALL) {
                    return 0;
                }
                throw NetworkError("TLS read failed");
            }
            return n;
        }
        n = recv(fd_, buf, len, 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw NetworkError("read timed out");
            }
            throw NetworkError(std::string("recv failed: ") + std::strerror(errno));
        }
        return n;
    }

private:
    int fd_;
    SSL_CTX* ctx_{nullptr};
    SSL* ssl_{nullptr};
};

void SetIoTimeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

/// Non-blocking connect bounded by poll(); leaves the socket blocking on success
bool ConnectWithTimeout(int fd, const sockaddr* addr, socklen_t addrlen,
                        std::chrono::milliseconds timeout) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = connect(fd, addr, addrlen);
    if (rc != 0 && errno != EINPROGRESS) {
        return false;
    }

    if (rc != 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc <= 0) {
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            return false;
        }
    }

    fcntl(fd, F_SETFL, flags);
    return true;
}

/// @return connected socket, or -1
int OpenTcp(const std::string& host, int port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || res == nullptr) {
        return -1;
    }

    int fd = -1;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (ConnectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, timeout)) {
            break;
        }
        close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd >= 0) {
        SetIoTimeout(fd, timeout);
    }
    return fd;
}

std::string BuildRequest(const std::string& method, const std::string& host_header,
                         const std::string& path, const std::string& body) {
    std::ostringstream req;
    req << method << " " << path << " HTTP/1.1\r\n"
        << "Host: " << host_header << "\r\n"
        << "User-Agent: cerberus-orchestrator\r\n"
        << "Accept: */*\r\n"
        << "Connection: close\r\n";
    if (!body.empty()) {
        req << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    } else if (method == "PUT" || method == "POST" || method == "PATCH") {
        req << "Content-Length: 0\r\n";
    }
    req << "\r\n" << body;
    return req.str();
}

std::string DecodeChunked(const std::string& raw) {
    std::string out;
    std::size_t pos = 0;
    while (pos < raw.size()) {
        std::size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos) {
            break;
        }
        std::size_t size = std::stoul(raw.substr(pos, eol - pos), nullptr, 16);
        if (size == 0) {
            break;
        }
        pos = eol + 2;
        out.append(raw, pos, size);
        pos += size + 2;
    }
    return out;
}

/// True once @p data holds the complete message described by its headers
bool MessageComplete(const std::string& data, std::size_t header_end, const HttpResponse& resp) {
    std::size_t body_len = data.size() - header_end;
    auto cl = resp.headers.find("content-length");
    if (cl != resp.headers.end()) {
        return body_len >= std::stoul(cl->second);
    }
    auto te = resp.headers.find("transfer-encoding");
    if (te != resp.headers.end() && StringUtils::ContainsIgnoreCase(te->second, "chunked")) {
        return data.find("0\r\n\r\n", header_end) != std::string::npos;
    }
    // 1xx, 204 and 304 carry no body
    return resp.status_code == 204 || resp.status_code == 304 ||
           (resp.status_code >= 100 && resp.status_code < 200);
}

void ParseHead(const std::string& head, HttpResponse& resp) {
    auto lines = StringUtils::Split(head, '\n');
    if (lines.empty()) {
        throw NetworkError("Empty HTTP response");
    }

    std::string status_line = StringUtils::Trim(lines[0]);
    auto parts = StringUtils::Split(status_line, ' ');
    if (parts.size() < 2 || !StringUtils::StartsWith(parts[0], "HTTP/")) {
        throw NetworkError("Malformed status line: " + status_line);
    }
    try {
        resp.status_code = std::stoi(parts[1]);
    } catch (const std::exception&) {
        throw NetworkError("Malformed status code: " + parts[1]);
    }

    for (std::size_t i = 1; i < lines.size(); ++i) {
        std::string line = StringUtils::Trim(lines[i]);
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        resp.headers[StringUtils::ToLower(StringUtils::Trim(line.substr(0, colon)))] =
            StringUtils::Trim(line.substr(colon + 1));
    }
}

HttpResponse Exchange(Connection& conn, const std::string& request) {
    conn.WriteAll(request);

    HttpResponse resp;
    std::string data;
    std::size_t header_end = std::string::npos;
    char buf[4096];

    while (true) {
        ssize_t n = conn.Read(buf, sizeof(buf));
        if (n == 0) {
            break;
        }
        data.append(buf, static_cast<std::size_t>(n));

        if (header_end == std::string::npos) {
            auto sep = data.find("\r\n\r\n");
            if (sep == std::string::npos) {
                continue;
            }
            header_end = sep + 4;
            ParseHead(data.substr(0, sep), resp);
        }
        if (MessageComplete(data, header_end, resp)) {
            break;
        }
    }

    if (header_end == std::string::npos) {
        throw NetworkError("Connection closed before response headers");
    }

    std::string raw_body = data.substr(header_end);
    auto te = resp.headers.find("transfer-encoding");
    if (te != resp.headers.end() && StringUtils::ContainsIgnoreCase(te->second, "chunked")) {
        resp.body = DecodeChunked(raw_body);
    } else {
        auto cl = resp.headers.find("content-length");
        if (cl != resp.headers.end()) {
            raw_body.resize(std::min<std::size_t>(raw_body.size(), std::stoul(cl->second)));
        }
        resp.body = std::move(raw_body);
    }
    return resp;
}

} // anonymous namespace

std::optional<ParsedUrl> NetUtils::ParseUrl(const std::string& url) {
    ParsedUrl parsed;
    std::string rest;

    if (StringUtils::StartsWith(url, "http://")) {
        parsed.scheme = "http";
        parsed.port = 80;
        rest = url.substr(7);
    } else if (StringUtils::StartsWith(url, "https://")) {
        parsed.scheme = "https";
        parsed.port = 443;
        rest = url.substr(8);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parsed.path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal
        auto close_bracket = authority.find(']');
        if (close_bracket == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(1, close_bracket - 1);
        if (close_bracket + 1 < authority.size() && authority[close_bracket + 1] == ':') {
            authority = authority.substr(close_bracket + 1);
        } else {
            authority.clear();
        }
        if (!authority.empty()) {
            try {
                parsed.port = std::stoi(authority.substr(1));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parsed.host = authority.substr(0, colon);
            try {
                parsed.port = std::stoi(authority.substr(colon + 1));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else {
            parsed.host = authority;
        }
    }

    if (parsed.host.empty() || parsed.port <= 0 || parsed.port > 65535) {
        return std::nullopt;
    }
    return parsed;
}

bool NetUtils::TcpProbe(const std::string& host, int port, std::chrono::milliseconds timeout) {
    int fd = OpenTcp(host, port, timeout);
    if (fd < 0) {
        return false;
    }
    close(fd);
    return true;
}

HttpResponse NetUtils::HttpRequest(const std::string& method,
                                   const std::string& url,
                                   const std::string& body,
                                   std::chrono::milliseconds timeout) {
    auto parsed = ParseUrl(url);
    if (!parsed) {
        throw NetworkError("Unsupported URL: " + url);
    }

    int fd = OpenTcp(parsed->host, parsed->port, timeout);
    if (fd < 0) {
        throw NetworkError("Connection to " + parsed->host + ":" +
                           std::to_string(parsed->port) + " failed");
    }

    Connection conn(fd);
    if (parsed->scheme == "https") {
        conn.StartTls(parsed->host);
    }

    std::string host_header = parsed->host;
    if ((parsed->scheme == "http" && parsed->port != 80) ||
        (parsed->scheme == "https" && parsed->port != 443)) {
        host_header += ":" + std::to_string(parsed->port);
    }

    return Exchange(conn, BuildRequest(method, host_header, parsed->path, body));
}

HttpResponse NetUtils::UnixSocketRequest(const std::string& socket_path,
                                         const std::string& method,
                                         const std::string& path,
                                         const std::string& body,
                                         std::chrono::milliseconds timeout) {
    sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw NetworkError("Socket path too long: " + socket_path);
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        throw NetworkError(std::string("socket failed: ") + std::strerror(errno));
    }
    Connection conn(fd);

    if (!ConnectWithTimeout(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), timeout)) {
        throw NetworkError("Connection to " + socket_path + " failed");
    }
    SetIoTimeout(fd, timeout);

    spdlog::debug("{} {} via {}", method, path, socket_path);
    return Exchange(conn, BuildRequest(method, "localhost", path, body));
}

} // namespace utils
} // namespace cerberus
