#include "cli_parser.hpp"
#include "../../../libcomiconv/include/tcp_socket.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <stdexcept>
#include <thread>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Encoding ---
    app.add_option("-s,--speed", settings.speed,
                   "Encoder speed, 0 (slowest) to 10 (fastest); 0 to 2 for png.")
        ->default_val(settings.speed);

    app.add_option("-q,--quality", settings.quality,
                   "Target quality, 0 to 100. Ignored by lossless formats.")
        ->default_val(settings.quality);

    app.add_option_function<std::string>("-f,--format",
            [&settings](const std::string& str) {
                // validated by check() below
                settings.format = *comiconv::parse_image_format(str);
            },
            "Target image format: avif, webp, png, jpeg, jxl.")
        ->default_str("avif")
        ->check([](const std::string& str) {
            if (!comiconv::parse_image_format(str)) {
                return "Invalid format: '" + str + "'. Must be one of: avif, webp, png, jpeg, jxl.";
            }
            return std::string();
        });

    app.add_option_function<std::string>("-a,--archive",
            [&settings](const std::string& str) {
                settings.archive = comiconv::parse_container_kind(str);
            },
            "Treat inputs as this container kind instead of detecting it: zip, tar, 7z, rar.")
        ->check([](const std::string& str) {
            if (!comiconv::parse_container_kind(str)) {
                return "Invalid archive kind: '" + str + "'. Must be one of: zip, tar, 7z, rar.";
            }
            return std::string();
        });

    settings.num_threads = std::max(1U, std::thread::hardware_concurrency());
    app.add_option("-t,--threads", settings.num_threads,
                   "Threads to use for local conversion.")
        ->default_val(settings.num_threads)
        ->check(CLI::PositiveNumber);

    // --- Flags ---
    app.add_flag("--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_flag("--backup", settings.backup,
                 "Keep the original file as FILE.bak.");

    // --- Remote ---
    app.add_option("--server", settings.server,
                   "Offload conversion to a server at HOST:PORT.")
        ->check([](const std::string& str) {
            try {
                (void)comiconv::parse_server_address(str);
            } catch (const std::invalid_argument& e) {
                return std::string(e.what());
            }
            return std::string();
        });

    app.add_option("--retries", settings.retries,
                   "Retry a file this many times after connection or protocol errors.")
        ->default_val(settings.retries)
        ->check(CLI::Range(0U, Settings::kMaxRetries));

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Console log level: ERROR, WARNING, INFO, DEBUG.")
        ->default_val("ERROR")
        ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Log file path.")
        ->default_val(settings.log_file.string());

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more comic book archives (cbz, cbt, cb7, cbr).")
        ->required()
        ->check(CLI::ExistingFile);
}
