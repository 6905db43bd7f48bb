#include "../../include/remote_session.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace comiconv {

namespace {

constexpr const char* kTag = "remote_session";

template <std::size_t N>
bool equals(const std::array<std::uint8_t, N>& got, const std::array<std::uint8_t, N>& expected) {
    return std::equal(got.begin(), got.end(), expected.begin());
}

std::string printable(std::span<const std::uint8_t> bytes) {
    std::string s;
    for (const auto b : bytes) {
        s.push_back(b >= 0x20 && b < 0x7F ? static_cast<char>(b) : '?');
    }
    return s;
}

/**
 * @brief Marks the session broken unless dismissed.
 */
class BreakGuard {
public:
    explicit BreakGuard(bool& flag) : flag_(flag) {}
    ~BreakGuard() { if (armed_) flag_ = true; }
    void dismiss() noexcept { armed_ = false; }
private:
    bool& flag_;
    bool armed_ = true;
};

} // namespace

RemoteSession::RemoteSession(ServerAddress address, const std::chrono::milliseconds read_timeout)
    : address_(std::move(address)), read_timeout_(read_timeout) {}

void RemoteSession::connect() {
    socket_.connect(address_.host, address_.port);
    socket_.set_recv_timeout_ms(static_cast<int>(read_timeout_.count()));
    broken_ = false;
    Logger::log(LogLevel::Info, "Connected to " + address_.to_string(), kTag);
}

void RemoteSession::close() {
    socket_.close();
}

std::vector<std::uint8_t> RemoteSession::transcode(std::span<const std::uint8_t> payload,
                                                   const ConversionJob& job,
                                                   EventBus* bus) {
    const auto code = wire::format_code(job.target_format);
    if (!code) {
        throw UnsupportedFormat(std::string("format ") + image_format_extension(job.target_format) +
                                " cannot be converted remotely");
    }
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw UnsupportedContainer("archive too large to offload (" + std::to_string(payload.size()) + " bytes)");
    }
    if (!usable()) {
        throw IoError("session to " + address_.to_string() + " is not connected");
    }

    BreakGuard guard(broken_);
    stats_ = SessionStats{};

    wire::JobHeader header;
    header.format = *code;
    header.speed = job.wire_speed();
    header.quality = job.wire_quality();
    header.payload_len = static_cast<std::uint32_t>(payload.size());

    stats_.sent_digest = sha256(payload);

    handshake();
    send_job_header(header, stats_.sent_digest);
    upload(payload, bus);

    const std::uint32_t entries = read_entry_count();
    if (bus) bus->publish(ConversionStartEvent{entries});
    await_progress(entries, bus);

    auto result = download(bus);

    guard.dismiss();
    Logger::log(LogLevel::Debug,
                "Job done: sent " + std::to_string(stats_.bytes_sent) + " B, received " +
                std::to_string(stats_.bytes_received) + " B, " +
                std::to_string(stats_.completed_entries) + " entries, sha256 " +
                to_hex(stats_.received_digest),
                kTag);
    return result;
}

void RemoteSession::handshake() {
    socket_.send_all(wire::kClientMagic);

    std::array<std::uint8_t, 4> reply{};
    if (!socket_.recv_all(reply)) {
        throw InvalidResponse("no handshake reply");
    }
    if (!equals(reply, wire::kServerMagic)) {
        throw InvalidResponse("unexpected handshake '" + printable(reply) + "'");
    }
}

void RemoteSession::send_job_header(const wire::JobHeader& header, const Digest& digest) {
    socket_.send_all(wire::encode_job_header(header));
    socket_.send_all(digest);
}

void RemoteSession::upload(std::span<const std::uint8_t> payload, EventBus* bus) {
    const std::uint64_t total = payload.size();
    std::size_t offset = 0;
    while (offset < payload.size()) {
        const std::size_t size = std::min(wire::kMaxChunkSize, payload.size() - offset);
        socket_.send_all(payload.subspan(offset, size));

        std::array<std::uint8_t, 2> ack{};
        read_exact(ack, "chunk acknowledgement");
        if (!equals(ack, wire::kChunkAck)) {
            throw InvalidResponse("expected chunk ack, got '" + printable(ack) + "'");
        }

        offset += size;
        stats_.bytes_sent = offset;
        if (bus) bus->publish(UploadProgressEvent{offset, total});
    }
}

std::uint32_t RemoteSession::read_entry_count() {
    std::array<std::uint8_t, 4> buf{};
    read_exact(buf, "entry count");
    stats_.expected_entries = wire::get_u32_be(buf.data());
    Logger::log(LogLevel::Debug, "Server converts " + std::to_string(stats_.expected_entries) + " entries", kTag);
    return stats_.expected_entries;
}

void RemoteSession::await_progress(const std::uint32_t count, EventBus* bus) {
    for (std::uint32_t i = 0; i < count; ++i) {
        std::array<std::uint8_t, 4> token{};
        if (!socket_.recv_all(token)) {
            throw InvalidResponse("stream ended after " + std::to_string(i) + " of " +
                                  std::to_string(count) + " progress tokens");
        }
        if (!equals(token, wire::kProgressToken)) {
            throw InvalidResponse("unexpected progress token '" + printable(token) + "'");
        }
        stats_.completed_entries = i + 1;
        if (bus) bus->publish(EntryTranscodedEvent{i});
    }
}

std::vector<std::uint8_t> RemoteSession::download(EventBus* bus) {
    std::array<std::uint8_t, 4> len_buf{};
    read_exact(len_buf, "result length");
    const std::uint32_t total = wire::get_u32_be(len_buf.data());

    Digest expected{};
    read_exact(expected, "result digest");

    std::vector<std::uint8_t> data(total);
    Sha256Hasher hasher;
    std::size_t received = 0;
    while (received < data.size()) {
        // never read past the declared length, the next job may follow on this connection
        const std::size_t size = std::min(wire::kMaxChunkSize, data.size() - received);
        const std::span<std::uint8_t> chunk(data.data() + received, size);
        read_exact(chunk, "result payload");
        hasher.update(chunk);

        received += size;
        stats_.bytes_received = received;
        if (bus) bus->publish(DownloadProgressEvent{received, total});
    }

    stats_.received_digest = hasher.digest();
    if (stats_.received_digest != expected) {
        Logger::log(LogLevel::Warning,
                    "Result digest " + to_hex(stats_.received_digest) + " does not match announced " +
                    to_hex(expected),
                    kTag);
        throw HashMismatch();
    }
    return data;
}

void RemoteSession::read_exact(std::span<std::uint8_t> out, const char* what) {
    if (!socket_.recv_all(out)) {
        throw IoError(std::string("connection to ") + address_.to_string() + " lost while reading " + what);
    }
}

} // namespace comiconv
