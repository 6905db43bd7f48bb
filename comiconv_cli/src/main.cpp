#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/terminal.hpp"
#include "../../libcomiconv/include/comiconv.hpp"
#include "../../libcomiconv/include/event_bus.hpp"
#include "../../libcomiconv/include/events.hpp"
#include "../../libcomiconv/include/logger.hpp"

using namespace comiconv;
namespace fs = std::filesystem;

// simple progress bar printer, `label` names the current phase
inline void print_progress_bar(const std::string& label, const std::uint64_t done, const std::uint64_t total,
                               const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 60u ? term_width - 60u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r" << label << " [";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

static std::atomic<bool> interrupted{false};
static Converter* g_converter = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (g_converter) {
            g_converter->stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

int main(int argc, char* argv[]) {

    CLI::App app{"comiconv: convert the images of comic book archives."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
    if (!fileSink->is_open()) {
        std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
    }
    Logger::add_sink(std::move(fileSink));

    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    Converter converter;
    try {
        converter.format(settings.format)
                 .quality(settings.quality)
                 .speed(settings.speed)
                 .threads(settings.num_threads)
                 .containerKind(settings.archive)
                 .backup(settings.backup)
                 .server(settings.server)
                 .retryPolicy(RetryPolicy{settings.retries + 1, std::chrono::milliseconds(500)});
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Invalid configuration: " << e.what() << RESET << std::endl;
        return 1;
    }

    // progress tracking, handlers may run on worker threads
    std::mutex print_mtx;
    const std::size_t file_total = settings.inputs.size();
    std::size_t file_index = 0;
    std::uint64_t entries_total = 0;
    std::uint64_t entries_done = 0;
    auto start_file = std::chrono::steady_clock::now();

    auto elapsed = [&] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_file).count();
    };
    auto counter = [&] {
        return "[" + std::to_string(file_index) + "/" + std::to_string(file_total) + "]";
    };

    EventBus& bus = converter.events();

    bus.subscribe<FileConvertStartEvent>([&](const FileConvertStartEvent& e) {
        std::lock_guard lock(print_mtx);
        ++file_index;
        entries_total = 0;
        entries_done = 0;
        start_file = std::chrono::steady_clock::now();
        if (!settings.quiet) {
            std::cerr << CYAN << counter() << " Converting " << e.path.filename().string()
                      << (e.remote ? " on " + settings.server : std::string()) << "..." << RESET << std::endl;
        }
    });

    bus.subscribe<UploadProgressEvent>([&](const UploadProgressEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(print_mtx);
        print_progress_bar("upload  ", e.sent, e.total, elapsed());
        if (e.sent == e.total) std::cerr << std::endl;
    });

    bus.subscribe<ConversionStartEvent>([&](const ConversionStartEvent& e) {
        std::lock_guard lock(print_mtx);
        entries_total = e.file_count;
        entries_done = 0;
        if (!settings.quiet) {
            print_progress_bar("convert ", 0, entries_total, elapsed());
            if (entries_total == 0) std::cerr << std::endl;
        }
    });

    bus.subscribe<EntryTranscodedEvent>([&](const EntryTranscodedEvent&) {
        std::lock_guard lock(print_mtx);
        ++entries_done;
        if (!settings.quiet) {
            print_progress_bar("convert ", entries_done, entries_total, elapsed());
            if (entries_done == entries_total) std::cerr << std::endl;
        }
    });

    bus.subscribe<DownloadProgressEvent>([&](const DownloadProgressEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(print_mtx);
        print_progress_bar("download", e.received, e.total, elapsed());
        if (e.received == e.total) std::cerr << std::endl;
    });

    bus.subscribe<RetryEvent>([&](const RetryEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(print_mtx);
        std::cerr << YELLOW << "\n" << counter() << " Retrying " << e.path.filename().string()
                  << " (attempt " << e.attempt << "): " << e.reason << RESET << std::endl;
    });

    bus.subscribe<FileConvertCompleteEvent>([&](const FileConvertCompleteEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(print_mtx);
        std::cerr << GREEN << counter() << " [DONE] " << e.path.filename().string()
                  << " (" << e.original_size << " -> " << e.new_size << " bytes, "
                  << std::fixed << std::setprecision(1)
                  << static_cast<double>(e.duration.count()) / 1000.0 << "s)"
                  << RESET << std::endl;
    });

    bus.subscribe<FileConvertErrorEvent>([&](const FileConvertErrorEvent& e) {
        std::lock_guard lock(print_mtx);
        std::cerr << RED << "\n" << counter() << " [FAILED] " << e.path.filename().string()
                  << ": " << e.error_message << RESET << std::endl;
    });

    g_converter = &converter;
    const std::size_t failed = converter.convertFiles(settings.inputs);
    g_converter = nullptr;

    if (const auto stats = converter.lastSessionStats(); stats) {
        Logger::log(LogLevel::Debug,
                    "Last remote job: " + std::to_string(stats->bytes_sent) + " bytes sent, " +
                    std::to_string(stats->bytes_received) + " bytes received, " +
                    std::to_string(stats->completed_entries) + "/" +
                    std::to_string(stats->expected_entries) + " entries",
                    "main");
    }

    if (interrupted.load()) {
        std::cerr << CYAN << "\n[INTERRUPT] Stopped." << RESET << std::endl;
        return 130; // standard exit code for SIGINT
    }
    if (failed > 0) {
        Logger::log(LogLevel::Error, std::to_string(failed) + " of " + std::to_string(file_total) +
                    " files failed", "main");
        return 1;
    }
    return 0;
}
