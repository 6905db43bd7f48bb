#include "../../include/archive_container.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <memory>
#include <string>

namespace comiconv {

namespace {

constexpr const char* kTag = "archive_container";

struct ArchiveReadDeleter {
    void operator()(archive* a) const { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(archive* a) const { archive_write_free(a); }
};
struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const { archive_entry_free(e); }
};

using ReadHandle = std::unique_ptr<archive, ArchiveReadDeleter>;
using WriteHandle = std::unique_ptr<archive, ArchiveWriteDeleter>;
using EntryHandle = std::unique_ptr<archive_entry, ArchiveEntryDeleter>;

std::string error_string(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

ContainerKind kind_from_libarchive(const int format) {
    switch (format & ARCHIVE_FORMAT_BASE_MASK) {
        case ARCHIVE_FORMAT_ZIP:    return ContainerKind::Zip;
        case ARCHIVE_FORMAT_TAR:    return ContainerKind::Tar;
        case ARCHIVE_FORMAT_7ZIP:   return ContainerKind::SevenZip;
        case ARCHIVE_FORMAT_RAR:
        case ARCHIVE_FORMAT_RAR_V5: return ContainerKind::Rar;
        default:                    return ContainerKind::Unknown;
    }
}

/**
 * @brief Opens a reader over `data` with the formats of `kind` enabled
 * (all four when Unknown).
 */
ReadHandle open_reader(std::span<const std::uint8_t> data, const ContainerKind kind) {
    ReadHandle a(archive_read_new());
    if (!a) throw UnsupportedContainer("archive_read_new failed");

    archive_read_support_filter_all(a.get());
    const bool any = kind == ContainerKind::Unknown;
    if (any || kind == ContainerKind::Zip)      archive_read_support_format_zip(a.get());
    if (any || kind == ContainerKind::Tar)      archive_read_support_format_tar(a.get());
    if (any || kind == ContainerKind::SevenZip) archive_read_support_format_7zip(a.get());
    if (any || kind == ContainerKind::Rar) {
        archive_read_support_format_rar(a.get());
        archive_read_support_format_rar5(a.get());
    }
    archive_read_set_options(a.get(), "hdrcharset=UTF-8");

    const int r = archive_read_open_memory(a.get(), data.data(), data.size());
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "libarchive: " + error_string(a.get()), kTag);
    } else if (r != ARCHIVE_OK) {
        throw UnsupportedContainer("cannot open archive: " + error_string(a.get()));
    }
    return a;
}

std::vector<std::uint8_t> read_entry_data(archive* a, archive_entry* entry) {
    std::vector<std::uint8_t> content;
    if (archive_entry_size_is_set(entry)) {
        content.reserve(static_cast<std::size_t>(std::max<la_int64_t>(archive_entry_size(entry), 0)));
    }
    std::uint8_t buffer[64 * 1024];
    la_ssize_t n;
    while ((n = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
        content.insert(content.end(), buffer, buffer + n);
    }
    if (n < 0) {
        throw UnsupportedContainer(std::string("cannot read ") + archive_entry_pathname(entry) + ": " + error_string(a));
    }
    return content;
}

la_ssize_t append_to_vector(archive*, void* client_data, const void* buffer, const size_t length) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(client_data);
    const auto* p = static_cast<const std::uint8_t*>(buffer);
    out->insert(out->end(), p, p + length);
    return static_cast<la_ssize_t>(length);
}

int set_write_format(archive* a, const ContainerKind kind) {
    switch (kind) {
        case ContainerKind::Zip: {
            int r = archive_write_set_format_zip(a);
            if (r == ARCHIVE_OK) {
                archive_write_set_format_option(a, "zip", "compression", "deflate");
            }
            return r;
        }
        case ContainerKind::Tar:
            return archive_write_set_format_pax_restricted(a);
        case ContainerKind::SevenZip:
            return archive_write_set_format_7zip(a);
        default:
            return ARCHIVE_FATAL;
    }
}

} // namespace

std::size_t ArchiveContents::file_count() const noexcept {
    return static_cast<std::size_t>(std::ranges::count_if(entries, [](const ArchiveEntry& e) { return e.is_file(); }));
}

ContainerKind ArchiveContainer::detect(std::span<const std::uint8_t> data) {
    try {
        ReadHandle a = open_reader(data, ContainerKind::Unknown);
        archive_entry* entry = nullptr;
        const int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_OK || r == ARCHIVE_WARN || r == ARCHIVE_EOF) {
            if (const auto kind = kind_from_libarchive(archive_format(a.get())); kind != ContainerKind::Unknown) {
                return kind;
            }
        }
    } catch (const UnsupportedContainer& e) {
        Logger::log(LogLevel::Debug, std::string("libarchive detection failed: ") + e.what(), kTag);
    }

    const std::string mime = MimeDetector::detect(data);
    if (const auto it = mime_to_container.find(mime); it != mime_to_container.end()) {
        Logger::log(LogLevel::Debug, "Container detected by libmagic: " + mime, kTag);
        return it->second;
    }
    return ContainerKind::Unknown;
}

ArchiveContents ArchiveContainer::read(std::span<const std::uint8_t> data,
                                       const std::optional<ContainerKind> declared) {
    ArchiveContents contents;
    contents.kind = declared ? *declared : detect(data);
    if (contents.kind == ContainerKind::Unknown) {
        throw UnsupportedContainer("unrecognised archive format");
    }

    ReadHandle a = open_reader(data, contents.kind);
    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "libarchive: " + error_string(a.get()), kTag);
        }
        const char* name = archive_entry_pathname_utf8(entry);
        if (!name) name = archive_entry_pathname(entry);
        if (!name || !*name) {
            throw UnsupportedContainer("archive entry without a name");
        }

        ArchiveEntry e;
        e.path = name;
        e.mtime = archive_entry_mtime_is_set(entry) ? archive_entry_mtime(entry) : 0;

        const auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            e.kind = EntryKind::Directory;
            archive_read_data_skip(a.get());
        } else if (type == AE_IFREG || type == 0) {
            e.kind = EntryKind::File;
            e.content = read_entry_data(a.get(), entry);
        } else {
            Logger::log(LogLevel::Warning, "Skipping special entry: " + e.path, kTag);
            archive_read_data_skip(a.get());
            continue;
        }
        contents.entries.push_back(std::move(e));
    }
    if (r != ARCHIVE_EOF) {
        throw UnsupportedContainer("corrupted " + container_kind_to_string(contents.kind) +
                                   " archive: " + error_string(a.get()));
    }

    Logger::log(LogLevel::Debug,
                "Read " + std::to_string(contents.entries.size()) + " entries (" +
                std::to_string(contents.file_count()) + " files) from " +
                container_kind_to_string(contents.kind) + " archive",
                kTag);
    return contents;
}

std::vector<std::uint8_t> ArchiveContainer::write(const std::vector<ArchiveEntry>& entries,
                                                  const ContainerKind kind) {
    if (!can_write_container(kind)) {
        throw UnsupportedContainer("cannot write " + container_kind_to_string(kind) + " archives");
    }

    WriteHandle a(archive_write_new());
    if (!a) throw UnsupportedContainer("archive_write_new failed");

    if (set_write_format(a.get(), kind) != ARCHIVE_OK) {
        throw UnsupportedContainer("setting format failed: " + error_string(a.get()));
    }
    archive_write_set_bytes_in_last_block(a.get(), 1);

    std::vector<std::uint8_t> out;
    if (archive_write_open(a.get(), &out, nullptr, append_to_vector, nullptr) != ARCHIVE_OK) {
        throw UnsupportedContainer("archive_write_open: " + error_string(a.get()));
    }

    for (const auto& e : entries) {
        EntryHandle entry(archive_entry_new());
        if (!entry) throw UnsupportedContainer("archive_entry_new failed");

        archive_entry_set_pathname_utf8(entry.get(), e.path.c_str());
        archive_entry_set_mtime(entry.get(), e.mtime, 0);
        if (e.kind == EntryKind::Directory) {
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), 0755);
        } else {
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(e.content.size()));
        }

        int r = archive_write_header(a.get(), entry.get());
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "libarchive: " + error_string(a.get()), kTag);
        } else if (r != ARCHIVE_OK) {
            throw UnsupportedContainer("archive_write_header for " + e.path + ": " + error_string(a.get()));
        }

        if (e.is_file() && !e.content.empty()) {
            const la_ssize_t wrote = archive_write_data(a.get(), e.content.data(), e.content.size());
            if (wrote < 0 || static_cast<std::size_t>(wrote) != e.content.size()) {
                throw UnsupportedContainer("archive_write_data for " + e.path + ": " + error_string(a.get()));
            }
        }
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw UnsupportedContainer("archive_write_close: " + error_string(a.get()));
    }
    return out;
}

} // namespace comiconv
