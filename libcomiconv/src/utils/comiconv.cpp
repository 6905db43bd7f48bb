/**
 * @file comiconv.cpp
 * @brief Implementation of the public Converter API.
 */

#include "../../include/comiconv.hpp"

#include "../../include/archive_orchestrator.hpp"
#include "../../include/codec_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"

#include <atomic>
#include <thread>
#include <utility>

namespace comiconv {

namespace {

constexpr const char* kTag = "converter";

} // namespace

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    ConverterObserver* observer_;
public:
    explicit BridgeLogSink(ConverterObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct Converter::Impl {
    CodecRegistry registry;
    EventBus eventBus;

    ConversionJob job;
    std::optional<ContainerKind> declaredKind;
    ContainerKind fallback = ContainerKind::Zip;
    bool backup = false;
    std::optional<ServerAddress> server;
    RetryPolicy retry;

    std::unique_ptr<RemoteSession> session;
    std::optional<SessionStats> lastStats;

    ConverterObserver* observer = nullptr;
    const ILogSink* bridgeSink = nullptr;
    std::atomic<bool> stopFlag{false};

    Impl() {
        setupEventBridging();
    }

    ~Impl() {
        if (bridgeSink) Logger::remove_sink(bridgeSink);
    }

    // handlers read `observer` on every call, so subscribing once is enough
    void setupEventBridging() {
        eventBus.subscribe<FileConvertStartEvent>([this](const FileConvertStartEvent& e) {
            if (observer) observer->onFileStart(e.path, e.remote);
        });
        eventBus.subscribe<ConversionStartEvent>([this](const ConversionStartEvent& e) {
            if (observer) observer->onConversionStart(e.file_count);
        });
        eventBus.subscribe<EntryTranscodedEvent>([this](const EntryTranscodedEvent& e) {
            if (observer) observer->onEntryTranscoded(e.index);
        });
        eventBus.subscribe<FileConvertCompleteEvent>([this](const FileConvertCompleteEvent& e) {
            if (observer) observer->onFileFinish(e.path, e.original_size, e.new_size);
        });
        eventBus.subscribe<FileConvertErrorEvent>([this](const FileConvertErrorEvent& e) {
            if (observer) observer->onFileError(e.path, e.error_message);
        });
        eventBus.subscribe<RetryEvent>([this](const RetryEvent& e) {
            if (observer) observer->onRetry(e.path, e.attempt, e.reason);
        });
    }

    std::vector<std::uint8_t> convertLocal(std::span<const std::uint8_t> archive) {
        ArchiveOrchestrator orchestrator(
            [this](std::span<const std::uint8_t> data, const ConversionJob& j) {
                return registry.transcode(data, j);
            },
            &eventBus);
        orchestrator.set_fallback_container(fallback);
        return orchestrator.convert(archive, job, declaredKind);
    }

    std::vector<std::uint8_t> convertRemote(std::span<const std::uint8_t> archive) {
        if (declaredKind) {
            Logger::log(LogLevel::Debug, "Declared container kind is not sent to the server", kTag);
        }
        try {
            if (!session || !session->usable()) {
                session = std::make_unique<RemoteSession>(*server);
                session->connect();
            }
            auto out = session->transcode(archive, job, &eventBus);
            lastStats = session->stats();
            return out;
        } catch (const ConversionError&) {
            // a broken session cannot be resumed, the next attempt reconnects
            if (session && (session->broken() || !session->connected())) {
                session.reset();
            }
            throw;
        }
    }

    std::vector<std::uint8_t> convertOnce(std::span<const std::uint8_t> archive) {
        return server ? convertRemote(archive) : convertLocal(archive);
    }

    std::vector<std::uint8_t> convertWithRetry(const std::filesystem::path& path,
                                               std::span<const std::uint8_t> archive) {
        const unsigned max_attempts = std::max(1U, retry.max_attempts);
        for (unsigned attempt = 1;; ++attempt) {
            try {
                return convertOnce(archive);
            } catch (const ConversionError& e) {
                if (!e.retryable() || attempt >= max_attempts || stopFlag.load()) {
                    throw;
                }
                Logger::log(LogLevel::Warning,
                            "Attempt " + std::to_string(attempt) + " of " + std::to_string(max_attempts) +
                            " failed (" + e.what() + "), retrying",
                            kTag);
                eventBus.publish(RetryEvent{path, attempt + 1, e.what()});
                std::this_thread::sleep_for(retry.delay);
            }
        }
    }
};

Converter::Converter() : impl_(std::make_unique<Impl>()) {}

Converter::~Converter() = default;

Converter::Converter(Converter&&) noexcept = default;
Converter& Converter::operator=(Converter&&) noexcept = default;

Converter& Converter::format(const ImageFormat fmt) {
    impl_->job.target_format = fmt;
    return *this;
}

Converter& Converter::quality(const int val) {
    impl_->job.quality = val;
    impl_->job = impl_->job.normalized();
    return *this;
}

Converter& Converter::speed(const int val) {
    impl_->job.speed = val;
    impl_->job = impl_->job.normalized();
    return *this;
}

Converter& Converter::threads(const unsigned val) {
    impl_->job.thread_count = val > 0 ? val : std::max(1U, std::thread::hardware_concurrency());
    return *this;
}

Converter& Converter::containerKind(const std::optional<ContainerKind> kind) {
    impl_->declaredKind = kind;
    return *this;
}

Converter& Converter::fallbackContainer(const ContainerKind kind) {
    if (!can_write_container(kind)) {
        throw std::invalid_argument("cannot write " + container_kind_to_string(kind) + " archives");
    }
    impl_->fallback = kind;
    return *this;
}

Converter& Converter::backup(const bool val) {
    impl_->backup = val;
    return *this;
}

Converter& Converter::server(const std::string& address) {
    if (address.empty()) {
        impl_->server.reset();
    } else {
        impl_->server = parse_server_address(address);
    }
    impl_->session.reset();
    return *this;
}

Converter& Converter::retryPolicy(const RetryPolicy policy) {
    impl_->retry = policy;
    return *this;
}

const ConversionJob& Converter::job() const noexcept {
    return impl_->job;
}

void Converter::setObserver(ConverterObserver* observer) {
    if (impl_->bridgeSink) {
        Logger::remove_sink(impl_->bridgeSink);
        impl_->bridgeSink = nullptr;
    }
    impl_->observer = observer;

    // inject bridge sink if observer is present
    if (observer) {
        auto sink = std::make_unique<BridgeLogSink>(observer);
        impl_->bridgeSink = sink.get();
        Logger::add_sink(std::move(sink));
    }
}

EventBus& Converter::events() noexcept {
    return impl_->eventBus;
}

std::optional<SessionStats> Converter::lastSessionStats() const {
    return impl_->lastStats;
}

std::vector<std::uint8_t> Converter::convert(std::span<const std::uint8_t> archive) {
    return impl_->convertWithRetry({}, archive);
}

void Converter::convertFile(const std::filesystem::path& path) {
    const auto start = std::chrono::steady_clock::now();
    impl_->eventBus.publish(FileConvertStartEvent{path, impl_->server.has_value()});
    Logger::log(LogLevel::Info, "Converting " + path.string(), kTag);

    try {
        ScratchDirectory scratch(path, "run");
        const std::vector<std::uint8_t> input = read_file(path);
        const std::vector<std::uint8_t> output = impl_->convertWithRetry(path, input);

        // stage the result so the original is untouched until it is complete
        const auto staged = scratch.file(path.filename().string());
        write_file(staged, output);

        auto bak = path;
        bak += ".bak";
        if (impl_->backup) {
            move_file(path, bak);
            Logger::log(LogLevel::Debug, "Backup written: " + bak.string(), kTag);
        }
        try {
            move_file(staged, path);
        } catch (const IoError&) {
            if (impl_->backup) move_file(bak, path);
            throw;
        }

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        Logger::log(LogLevel::Info,
                    "Converted " + path.string() + " (" + std::to_string(input.size()) + " -> " +
                    std::to_string(output.size()) + " bytes)",
                    kTag);
        impl_->eventBus.publish(FileConvertCompleteEvent{path, input.size(), output.size(), duration});
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Conversion of " + path.string() + " failed: " + e.what(), kTag);
        impl_->eventBus.publish(FileConvertErrorEvent{path, e.what()});
        throw;
    }
}

std::size_t Converter::convertFiles(const std::vector<std::filesystem::path>& paths) {
    std::size_t failed = 0;
    for (const auto& path : paths) {
        if (impl_->stopFlag.load()) {
            Logger::log(LogLevel::Info, "Stop requested, skipping remaining files", kTag);
            break;
        }
        try {
            convertFile(path);
        } catch (const std::exception&) {
            // already logged and published by convertFile
            ++failed;
        }
    }
    return failed;
}

void Converter::stop() {
    impl_->stopFlag.store(true);
}

bool Converter::stopped() const noexcept {
    return impl_->stopFlag.load();
}

} // namespace comiconv
