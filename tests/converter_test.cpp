#include <gtest/gtest.h>
#include "../libcomiconv/include/comiconv.hpp"
#include "../libcomiconv/include/errors.hpp"
#include "../libcomiconv/include/event_bus.hpp"
#include "../libcomiconv/include/events.hpp"
#include "../libcomiconv/include/file_utils.hpp"
#include "fake_server.hpp"
#include "test_helpers.hpp"
#include <atomic>

using namespace comiconv;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::vector<std::uint8_t> two_page_zip() {
    return ArchiveContainer::write({
        test::file_entry("001.png", test::make_png(12, 12)),
        test::file_entry("002.png", test::make_png(6, 9)),
    }, ContainerKind::Zip);
}

struct RecordingObserver : ConverterObserver {
    std::atomic<int> started{0};
    std::atomic<int> finished{0};
    std::atomic<int> failed{0};
    std::atomic<int> entries{0};
    std::atomic<int> logs{0};
    std::size_t announced = 0;

    void onFileStart(const fs::path&, bool) override { ++started; }
    void onConversionStart(const std::size_t n) override { announced = n; }
    void onEntryTranscoded(std::size_t) override { ++entries; }
    void onFileFinish(const fs::path&, uintmax_t, uintmax_t) override { ++finished; }
    void onFileError(const fs::path&, const std::string&) override { ++failed; }
    void onLog(int, const std::string&, const std::string&) override { ++logs; }
};

} // namespace

TEST(ConverterTest, SettersClampAndValidate) {
    Converter c;
    c.quality(500).speed(-3).threads(0);
    EXPECT_EQ(c.job().quality, 100);
    EXPECT_EQ(c.job().speed, 0);
    EXPECT_GE(c.job().thread_count, 1U);
    EXPECT_EQ(c.job().target_format, ImageFormat::Avif);

    EXPECT_THROW(c.server("no-port"), std::invalid_argument);
    EXPECT_THROW(c.fallbackContainer(ContainerKind::Rar), std::invalid_argument);
    EXPECT_NO_THROW(c.server(""));
    EXPECT_FALSE(c.lastSessionStats().has_value());
}

TEST(ConverterTest, ConvertFileReplacesInPlaceAndKeepsBackup) {
    const ScratchDirectory dir("converter", "test");
    const fs::path book = dir.file("issue1.cbz");
    const auto original = two_page_zip();
    write_file(book, original);

    RecordingObserver observer;
    Converter c;
    c.format(ImageFormat::Jpeg).quality(70).threads(2).backup(true);
    c.setObserver(&observer);
    c.convertFile(book);
    c.setObserver(nullptr);

    fs::path bak = book;
    bak += ".bak";
    ASSERT_TRUE(fs::exists(bak));
    EXPECT_EQ(read_file(bak), original);

    const auto contents = ArchiveContainer::read(read_file(book));
    EXPECT_EQ(contents.kind, ContainerKind::Zip);
    ASSERT_EQ(contents.entries.size(), 2U);
    EXPECT_EQ(contents.entries[0].path, "001.jpg");
    EXPECT_EQ(contents.entries[1].path, "002.jpg");
    EXPECT_EQ(sniff_image_format(contents.entries[1].content), ImageFormat::Jpeg);

    EXPECT_EQ(observer.started.load(), 1);
    EXPECT_EQ(observer.finished.load(), 1);
    EXPECT_EQ(observer.failed.load(), 0);
    EXPECT_EQ(observer.announced, 2U);
    EXPECT_EQ(observer.entries.load(), 2);
    EXPECT_GT(observer.logs.load(), 0);
}

TEST(ConverterTest, FailedFilesAreCountedAndLeftUntouched) {
    const ScratchDirectory dir("converter", "test");
    const fs::path good = dir.file("good.cbz");
    const fs::path bad = dir.file("bad.cbz");
    write_file(good, two_page_zip());
    const auto garbage = test::bytes_of("definitely not a comic book archive");
    write_file(bad, garbage);

    Converter c;
    c.format(ImageFormat::Png).backup(true);
    std::vector<std::string> errors;
    c.events().subscribe<FileConvertErrorEvent>([&](const FileConvertErrorEvent& e) {
        errors.push_back(e.path.filename().string());
    });

    const std::size_t failed = c.convertFiles({bad, dir.file("missing.cbz"), good});
    EXPECT_EQ(failed, 2U);
    EXPECT_EQ(errors, (std::vector<std::string>{"bad.cbz", "missing.cbz"}));
    EXPECT_EQ(read_file(bad), garbage);
    EXPECT_FALSE(fs::exists(dir.file("bad.cbz.bak")));
    EXPECT_TRUE(fs::exists(dir.file("good.cbz.bak")));
}

TEST(ConverterTest, StopSkipsRemainingFiles) {
    const ScratchDirectory dir("converter", "test");
    const fs::path book = dir.file("book.cbz");
    const auto original = two_page_zip();
    write_file(book, original);

    Converter c;
    c.stop();
    EXPECT_TRUE(c.stopped());
    EXPECT_EQ(c.convertFiles({book}), 0U);
    EXPECT_EQ(read_file(book), original);
}

TEST(ConverterTest, RemoteRetryAfterDisconnectSucceeds) {
    const std::vector<std::uint8_t> payload(300 * 1024, 0x5A);
    test::FakeServer server({
        [](TcpSocket& conn) {
            test::expect_handshake(conn);
            (void)test::read_job_header(conn);
            (void)test::read_n(conn, 100);
        },
        [](TcpSocket& conn) { (void)test::serve_reversing_job(conn, 2); },
    });

    Converter c;
    c.format(ImageFormat::Webp)
     .server(server.address_string())
     .retryPolicy(RetryPolicy{3, 0ms});

    std::vector<unsigned> attempts;
    c.events().subscribe<RetryEvent>([&](const RetryEvent& e) { attempts.push_back(e.attempt); });

    const auto out = c.convert(payload);
    server.join();
    ASSERT_TRUE(server.error().empty()) << server.error();

    EXPECT_EQ(out.size(), payload.size());
    EXPECT_EQ(attempts, (std::vector<unsigned>{2}));
    const auto stats = c.lastSessionStats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->expected_entries, 2U);
    EXPECT_EQ(stats->bytes_sent, payload.size());
}

TEST(ConverterTest, RemoteRetriesStopAtTheLimit) {
    auto bad_magic = [](TcpSocket& conn) {
        (void)test::read_n(conn, 4);
        const std::array<std::uint8_t, 4> nope = {'n', 'o', 'p', 'e'};
        conn.send_all(nope);
    };
    test::FakeServer server({bad_magic, bad_magic});

    Converter c;
    c.server(server.address_string()).retryPolicy(RetryPolicy{2, 0ms});
    int retries = 0;
    c.events().subscribe<RetryEvent>([&](const RetryEvent&) { ++retries; });

    EXPECT_THROW((void)c.convert(test::bytes_of("archive")), InvalidResponse);
    EXPECT_EQ(retries, 1);
}

TEST(ConverterTest, RemoteJpegXlIsNotRetried) {
    test::FakeServer server({[](TcpSocket& conn) {
        std::array<std::uint8_t, 1> b{};
        (void)conn.recv_all(b);
    }});

    Converter c;
    c.format(ImageFormat::JpegXl).server(server.address_string()).retryPolicy(RetryPolicy{5, 0ms});
    int retries = 0;
    c.events().subscribe<RetryEvent>([&](const RetryEvent&) { ++retries; });

    EXPECT_THROW((void)c.convert(test::bytes_of("archive")), UnsupportedFormat);
    EXPECT_EQ(retries, 0);
    c.server("");
    server.join();
}
