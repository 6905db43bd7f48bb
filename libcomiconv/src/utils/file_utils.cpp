#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace comiconv {

    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            Logger::log(LogLevel::Error, "Cannot open file: " + path.string(), "file_utils");
            throw IoError("cannot open " + path.string());
        }
        std::vector<std::uint8_t> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw IoError("failed reading " + path.string());
        }
        return buf;
    }

    void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            Logger::log(LogLevel::Error, "Cannot open file in write mode: " + path.string(), "file_utils");
            throw IoError("cannot create " + path.string());
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            throw IoError("failed writing " + path.string());
        }
    }

    std::filesystem::path sibling_temp_path(const std::filesystem::path& target) {
        return target.parent_path() /
               ("." + target.filename().string() + ".comiconv-" + RandomUtils::random_suffix());
    }

    void copy_then_rename(const std::filesystem::path& from, const std::filesystem::path& to) {
        const auto partial = sibling_temp_path(to);
        std::error_code ec;
        std::filesystem::copy_file(from, partial, ec);
        if (!ec) {
            std::filesystem::rename(partial, to, ec);
        }
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(partial, rm_ec);
            throw IoError("cannot move " + from.string() + " to " + to.string() + ": " + ec.message());
        }
        std::filesystem::remove(from, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove " + from.string() + " (" + ec.message() + ")",
                        "file_utils");
        }
    }

    void move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (!ec) return;

        // the copy lands next to `to`, so `to` is only ever replaced by a rename
        Logger::log(LogLevel::Debug, "Rename failed (" + ec.message() + "), copying beside " + to.string(),
                    "file_utils");
        copy_then_rename(from, to);
    }

    ScratchDirectory::ScratchDirectory(const std::filesystem::path& input_path, const std::string& prefix) {
        const auto base_tmp = std::filesystem::temp_directory_path() / ("comiconv-" + prefix);

        std::error_code ec;
        std::filesystem::create_directories(base_tmp, ec);

        const std::string dir_name = prefix + "_" + input_path.stem().string() + "_" + RandomUtils::random_suffix();
        dir_ = base_tmp / dir_name;

        // create_directory (not create_directories) fails if another run owns the name
        if (!std::filesystem::create_directory(dir_, ec) || ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir_.string() + " (" + ec.message() + ")",
                "file_utils");
            throw IoError("cannot create scratch directory " + dir_.string());
        }
        Logger::log(LogLevel::Debug, "Created scratch dir: " + dir_.string(), "file_utils");
    }

    ScratchDirectory::~ScratchDirectory() {
        cleanup_temp_dir(dir_);
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

} // namespace comiconv
