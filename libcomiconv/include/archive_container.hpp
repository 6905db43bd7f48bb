/**
 * @file archive_container.hpp
 * @brief In-memory reading and writing of comic book archives through libarchive.
 */

#ifndef COMICONV_ARCHIVE_CONTAINER_HPP
#define COMICONV_ARCHIVE_CONTAINER_HPP

#include "container_kind.hpp"
#include <cstdint>
#include <ctime>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace comiconv {

enum class EntryKind {
    File,
    Directory
};

/**
 * @brief One record of an archive.
 *
 * An entry is identified by its position in enumeration order. Directories
 * carry no content.
 */
struct ArchiveEntry {
    std::string path;                  ///< Path inside the archive, '/' separated
    EntryKind kind = EntryKind::File;
    std::vector<std::uint8_t> content; ///< File bytes; empty for directories
    std::time_t mtime = 0;             ///< Modification time, 0 if unknown

    [[nodiscard]] bool is_file() const noexcept { return kind == EntryKind::File; }
};

/**
 * @brief The entries of an archive together with the kind it was read as.
 */
struct ArchiveContents {
    ContainerKind kind = ContainerKind::Unknown;
    std::vector<ArchiveEntry> entries;

    /// @return Number of non-directory entries.
    [[nodiscard]] std::size_t file_count() const noexcept;
};

/**
 * @brief Reads and writes zip, tar, 7z and (read-only) rar archives held in memory.
 *
 * @details Only these four formats are enabled in libarchive, so anything
 * else (including a corrupted archive) is rejected with UnsupportedContainer.
 * Compression filters (gzip, bzip2, xz...) are accepted on input; output is
 * never filtered.
 */
class ArchiveContainer {
public:
    /**
     * @brief Identify the container kind of archive bytes.
     *
     * libarchive is tried first; libmagic is consulted when it cannot tell.
     * @return The kind, or ContainerKind::Unknown.
     */
    [[nodiscard]] static ContainerKind detect(std::span<const std::uint8_t> data);

    /**
     * @brief Enumerate all entries of an archive, in archive order.
     *
     * @param data The archive bytes.
     * @param declared Container kind forced by the caller; auto-detected if empty.
     * @throws UnsupportedContainer if the kind is unknown or the archive is unreadable.
     */
    [[nodiscard]] static ArchiveContents read(std::span<const std::uint8_t> data,
                                              std::optional<ContainerKind> declared = std::nullopt);

    /**
     * @brief Build an archive from entries, preserving their order.
     *
     * @param entries Entries to write; directory records are written as given.
     * @param kind A writable container kind (see can_write_container).
     * @throws UnsupportedContainer if the kind cannot be written or libarchive fails.
     */
    [[nodiscard]] static std::vector<std::uint8_t> write(const std::vector<ArchiveEntry>& entries,
                                                         ContainerKind kind);
};

} // namespace comiconv

#endif // COMICONV_ARCHIVE_CONTAINER_HPP
