#include "../../include/archive_orchestrator.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <utility>

namespace comiconv {

namespace {

constexpr const char* kTag = "orchestrator";

} // namespace

std::string replace_extension(const std::string& entry_path, const std::string& extension) {
    const auto slash = entry_path.find_last_of('/');
    const std::size_t name_start = slash == std::string::npos ? 0 : slash + 1;
    const auto dot = entry_path.find_last_of('.');
    if (dot == std::string::npos || dot < name_start) {
        return entry_path + "." + extension;
    }
    return entry_path.substr(0, dot) + "." + extension;
}

void correlate_results(std::vector<ArchiveEntry>& entries, std::vector<TranscodeResult> results,
                       const std::string& extension) {
    std::vector<std::optional<std::vector<std::uint8_t>>> encoded(entries.size());
    for (auto& r : results) {
        if (r.index >= entries.size() || !entries[r.index].is_file()) {
            throw ConsistencyError("result for unknown entry " + std::to_string(r.index));
        }
        if (encoded[r.index]) {
            throw ConsistencyError("duplicate result for entry " + std::to_string(r.index));
        }
        encoded[r.index] = std::move(r.encoded_bytes);
    }
    // check everything before touching entries, a throw leaves them as read
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].is_file() && !encoded[i]) {
            throw ConsistencyError("missing result for entry " + std::to_string(i) + " (" + entries[i].path + ")");
        }
    }
    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto& entry = entries[i];
        if (!entry.is_file()) continue;
        entry.content = std::move(*encoded[i]);
        entry.path = replace_extension(entry.path, extension);
    }
}

ArchiveOrchestrator::ArchiveOrchestrator(TranscodeFn transcode, EventBus* bus)
    : transcode_(std::move(transcode)), bus_(bus) {}

std::vector<std::uint8_t> ArchiveOrchestrator::convert(std::span<const std::uint8_t> archive,
                                                       const ConversionJob& job,
                                                       const std::optional<ContainerKind> declared) {
    const ConversionJob normalized = job.normalized();

    // Phase 1: enumerate
    ArchiveContents contents = ArchiveContainer::read(archive, declared);
    const std::size_t file_count = contents.file_count();
    Logger::log(LogLevel::Info,
                "Converting " + std::to_string(file_count) + " images of a " +
                container_kind_to_string(contents.kind) + " archive to " +
                image_format_extension(normalized.target_format),
                kTag);
    if (bus_) bus_->publish(ConversionStartEvent{file_count});

    // Phase 2: transcode
    std::vector<TranscodeTask> tasks;
    tasks.reserve(file_count);
    for (std::size_t i = 0; i < contents.entries.size(); ++i) {
        if (contents.entries[i].is_file()) {
            tasks.push_back(TranscodeTask{i, contents.entries[i].content});
        }
    }

    const WorkerPool pool(transcode_, bus_);
    std::vector<TranscodeResult> results = pool.run(tasks, normalized);

    // Phase 3: correlate by index
    correlate_results(contents.entries, std::move(results), image_format_extension(normalized.target_format));

    // Phase 4: rebuild
    ContainerKind out_kind = contents.kind;
    if (!can_write_container(out_kind)) {
        out_kind = fallback_;
        Logger::log(LogLevel::Info,
                    "Non writable format (" + container_kind_to_string(contents.kind) + "), rebuilding as " +
                    container_kind_to_string(out_kind),
                    kTag);
    }
    auto out = ArchiveContainer::write(contents.entries, out_kind);
    last_output_kind_ = out_kind;

    Logger::log(LogLevel::Debug,
                "Rebuilt archive: " + std::to_string(archive.size()) + " -> " + std::to_string(out.size()) + " bytes",
                kTag);
    return out;
}

} // namespace comiconv
