#ifndef COMICONV_FILE_UTILS_HPP
#define COMICONV_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace comiconv {

    /**
     * @brief Reads a whole file into memory.
     * @throws IoError if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file(const std::filesystem::path &path);

    /**
     * @brief Writes a buffer to a file, truncating it.
     * @throws IoError on failure.
     */
    void write_file(const std::filesystem::path &path, std::span<const std::uint8_t> data);

    /**
     * @brief A unique hidden path beside `target`: "{dir}/.{name}.comiconv-{random}".
     */
    [[nodiscard]] std::filesystem::path sibling_temp_path(const std::filesystem::path &target);

    /**
     * @brief Copies `from` to a sibling temp file of `to`, renames that over
     * `to` and removes `from`.
     *
     * `to` is either left untouched or replaced whole; a failed copy only
     * removes the partial sibling.
     * @throws IoError if the copy or the rename fails.
     */
    void copy_then_rename(const std::filesystem::path &from, const std::filesystem::path &to);

    /**
     * @brief Moves `from` over `to` with a rename, or with copy_then_rename()
     * when `from` is on another filesystem.
     * @throws IoError if neither works.
     */
    void move_file(const std::filesystem::path &from, const std::filesystem::path &to);

    /**
     * @brief A uniquely named directory owned by one conversion run.
     *
     * Created under the system temp path as
     * "comiconv-{prefix}/{prefix}_{stem}_{random}" and removed with all its
     * contents when the object is destroyed, on success and error paths
     * alike. Two runs never share a directory, even for the same input.
     */
    class ScratchDirectory {
    public:
        /**
         * @param input_path The input file (its stem is part of the name).
         * @param prefix A short prefix naming the purpose (e.g. "run").
         * @throws IoError if the directory cannot be created.
         */
        ScratchDirectory(const std::filesystem::path &input_path, const std::string &prefix);
        ~ScratchDirectory();

        ScratchDirectory(const ScratchDirectory&) = delete;
        ScratchDirectory& operator=(const ScratchDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return dir_; }

        /// @return A path inside the directory.
        [[nodiscard]] std::filesystem::path file(const std::string& name) const { return dir_ / name; }

    private:
        std::filesystem::path dir_;
    };

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

} // namespace comiconv

#endif // COMICONV_FILE_UTILS_HPP
