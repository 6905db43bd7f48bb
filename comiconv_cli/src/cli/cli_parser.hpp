#ifndef COMICONV_CLI_PARSER_HPP
#define COMICONV_CLI_PARSER_HPP

#include "../../../libcomiconv/include/container_kind.hpp"
#include "../../../libcomiconv/include/image_format.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    int speed = 3;
    int quality = 30;
    comiconv::ImageFormat format = comiconv::ImageFormat::Avif;
    std::optional<comiconv::ContainerKind> archive;
    unsigned num_threads = 1;

    bool quiet = false;
    bool backup = false;

    std::string server;
    static constexpr unsigned kMaxRetries = 100;
    unsigned retries = 0;

    std::string log_level = "ERROR";
    std::filesystem::path log_file = "comiconv.log";

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // COMICONV_CLI_PARSER_HPP
