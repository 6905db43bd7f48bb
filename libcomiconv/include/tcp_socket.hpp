/**
 * @file tcp_socket.hpp
 * @brief RAII wrapper around a blocking TCP socket.
 */

#ifndef COMICONV_TCP_SOCKET_HPP
#define COMICONV_TCP_SOCKET_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace comiconv {

/**
 * @brief A "host:port" pair.
 */
struct ServerAddress {
    std::string host;
    std::uint16_t port = 0;

    [[nodiscard]] std::string to_string() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief Parses "HOST:PORT" (the last colon separates the port).
 * @throws std::invalid_argument on a missing host or an invalid port.
 */
ServerAddress parse_server_address(const std::string& text);

/**
 * @brief Blocking IPv4/IPv6 TCP socket. Non-copyable, movable.
 *
 * All failures are reported as IoError, except recv_all(), which reports
 * an orderly close or a receive timeout by returning false so the caller can
 * decide how to classify a short read.
 */
class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(int fd) : fd_(fd) {}
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    /// Resolves `host` and connects to the first address that accepts.
    void connect(const std::string& host, std::uint16_t port);

    /// Sends exactly data.size() bytes.
    void send_all(std::span<const std::uint8_t> data);

    /// Receives exactly out.size() bytes; returns false on clean close or timeout.
    [[nodiscard]] bool recv_all(std::span<std::uint8_t> out);

    /// Receive timeout in milliseconds (0 = infinite).
    void set_recv_timeout_ms(int ms);

    /// TCP_NODELAY + keepalive.
    void tune();

    void close();

    [[nodiscard]] bool is_valid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int native() const noexcept { return fd_; }

    [[nodiscard]] std::string peer_addr() const;

private:
    int fd_ = -1;
};

} // namespace comiconv

#endif // COMICONV_TCP_SOCKET_HPP
