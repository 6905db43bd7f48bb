/**
 * @file remote_session.hpp
 * @brief Client side of the remote conversion protocol.
 */

#ifndef COMICONV_REMOTE_SESSION_HPP
#define COMICONV_REMOTE_SESSION_HPP

#include "conversion_job.hpp"
#include "sha256.hpp"
#include "tcp_socket.hpp"
#include "wire_protocol.hpp"
#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace comiconv {

class EventBus;

/**
 * @brief Counters of the last job run on a session.
 */
struct SessionStats {
    std::uint64_t bytes_sent = 0;        ///< Payload bytes uploaded
    std::uint64_t bytes_received = 0;    ///< Result bytes downloaded
    std::uint32_t expected_entries = 0;  ///< Entry count announced by the server
    std::uint32_t completed_entries = 0; ///< Progress tokens received
    Digest sent_digest{};                ///< SHA-256 of the uploaded payload
    Digest received_digest{};            ///< SHA-256 computed over the download
};

/**
 * @brief One TCP connection to a conversion server.
 *
 * @details A job runs the full exchange documented in wire_protocol.hpp:
 * handshake, job header, acknowledged upload, progress tokens, download and
 * integrity check. Several jobs may run one after another on the same
 * connection. Any failure leaves the session broken; it must be discarded and
 * the job restarted on a new session from the handshake.
 *
 * A session is owned by a single thread.
 */
class RemoteSession {
public:
    explicit RemoteSession(ServerAddress address,
                           std::chrono::milliseconds read_timeout = wire::kReadTimeout);

    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    /**
     * @brief Opens the TCP connection.
     * @throws IoError if the server cannot be reached.
     */
    void connect();

    /**
     * @brief Runs one job: uploads `payload`, waits for the conversion and
     * returns the verified result.
     *
     * @param payload The complete archive.
     * @param job Target format and parameters (clamped before sending).
     * @param bus Optional bus receiving ConversionStartEvent,
     * EntryTranscodedEvent and the transfer progress events.
     *
     * @throws UnsupportedFormat if the target format has no wire code; no
     * byte is sent in that case and the session stays usable.
     * @throws InvalidResponse on a protocol violation or handshake timeout.
     * @throws HashMismatch if the downloaded bytes do not match the announced digest.
     * @throws IoError on any other socket failure.
     */
    std::vector<std::uint8_t> transcode(std::span<const std::uint8_t> payload,
                                        const ConversionJob& job,
                                        EventBus* bus = nullptr);

    [[nodiscard]] bool connected() const noexcept { return socket_.is_valid(); }
    [[nodiscard]] bool broken() const noexcept { return broken_; }
    [[nodiscard]] bool usable() const noexcept { return connected() && !broken_; }

    [[nodiscard]] const SessionStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const ServerAddress& address() const noexcept { return address_; }

    void close();

private:
    void handshake();
    void send_job_header(const wire::JobHeader& header, const Digest& digest);
    void upload(std::span<const std::uint8_t> payload, EventBus* bus);
    std::uint32_t read_entry_count();
    void await_progress(std::uint32_t count, EventBus* bus);
    std::vector<std::uint8_t> download(EventBus* bus);

    /// Reads exactly out.size() bytes; a short read throws IoError.
    void read_exact(std::span<std::uint8_t> out, const char* what);

    ServerAddress address_;
    std::chrono::milliseconds read_timeout_;
    TcpSocket socket_;
    SessionStats stats_;
    bool broken_ = false;
};

} // namespace comiconv

#endif // COMICONV_REMOTE_SESSION_HPP
