#include <magic.h>

#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <string>

namespace {

struct MagicDeleter {
    void operator()(magic_set* m) const { magic_close(m); }
};

using MagicHandle = std::unique_ptr<magic_set, MagicDeleter>;

MagicHandle open_magic() {
    MagicHandle magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return nullptr;
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic.get()), "libmagic");
        return nullptr;
    }
    return magic;
}

} // namespace

std::string comiconv::MimeDetector::detect(std::span<const std::uint8_t> data)
{
    if (data.empty()) return {};
    // a magic_t is not thread-safe, workers each open their own
    const MagicHandle magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
}
