/**
 * @file container_kind.hpp
 * @brief Enumeration of the archive container kinds and helper conversions.
 *
 * comiconv handles the four container kinds comic books are distributed
 * in: zip (.cbz), tar (.cbt), 7z (.cb7) and rar (.cbr, read-only).
 */

#ifndef COMICONV_CONTAINER_KIND_HPP
#define COMICONV_CONTAINER_KIND_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_map>

namespace comiconv {

enum class ContainerKind {
    Zip,
    Tar,
    SevenZip,
    Rar,
    Unknown
};

///< Map linking MIME type strings reported by libmagic to container kinds.
inline const std::unordered_map<std::string, ContainerKind> mime_to_container = {
    { "application/zip",               ContainerKind::Zip },
    { "application/x-zip-compressed",  ContainerKind::Zip },
    { "application/vnd.comicbook+zip", ContainerKind::Zip },
    { "application/x-tar",             ContainerKind::Tar },
    { "application/vnd.comicbook+tar", ContainerKind::Tar },
    { "application/x-7z-compressed",   ContainerKind::SevenZip },
    { "application/vnd.rar",           ContainerKind::Rar },
    { "application/x-rar",             ContainerKind::Rar },
    { "application/x-rar-compressed",  ContainerKind::Rar },
    { "application/vnd.comicbook-rar", ContainerKind::Rar },
    { "application/x-cbr",             ContainerKind::Rar },
};

/**
 * @brief Converts a ContainerKind to its lowercase name ("zip", "tar", "7z", "rar").
 */
inline std::string container_kind_to_string(const ContainerKind kind) {
    switch (kind) {
        case ContainerKind::Zip:      return "zip";
        case ContainerKind::Tar:      return "tar";
        case ContainerKind::SevenZip: return "7z";
        case ContainerKind::Rar:      return "rar";
        default:                      return "unknown";
    }
}

/**
 * @brief Parses a container name or extension. Case-insensitive, leading dot allowed.
 * @return The kind, or std::nullopt if not one of the four supported kinds.
 */
inline std::optional<ContainerKind> parse_container_kind(const std::string& str) {
    std::string s = str;
    if (!s.empty() && s.front() == '.') s.erase(0, 1);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (s == "zip" || s == "cbz") return ContainerKind::Zip;
    if (s == "tar" || s == "cbt") return ContainerKind::Tar;
    if (s == "7z"  || s == "cb7") return ContainerKind::SevenZip;
    if (s == "rar" || s == "cbr") return ContainerKind::Rar;
    return std::nullopt;
}

/**
 * @brief Checks if libarchive can write this kind. RAR is read-only.
 */
inline bool can_write_container(const ContainerKind kind) {
    switch (kind) {
        case ContainerKind::Zip:
        case ContainerKind::Tar:
        case ContainerKind::SevenZip:
            return true;
        default:
            return false;
    }
}

} // namespace comiconv

#endif // COMICONV_CONTAINER_KIND_HPP
