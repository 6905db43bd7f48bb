#include <gtest/gtest.h>
#include "../libcomiconv/include/archive_orchestrator.hpp"
#include "../libcomiconv/include/codec_registry.hpp"
#include "../libcomiconv/include/errors.hpp"
#include "../libcomiconv/include/event_bus.hpp"
#include "../libcomiconv/include/events.hpp"
#include "test_helpers.hpp"
#include <atomic>

using namespace comiconv;

namespace {

TranscodeFn registry_fn(const CodecRegistry& registry) {
    return [&registry](std::span<const std::uint8_t> data, const ConversionJob& job) {
        return registry.transcode(data, job);
    };
}

std::vector<std::uint8_t> comic_zip() {
    return ArchiveContainer::write({
        test::file_entry("001.png", test::make_png(16, 16)),
        test::dir_entry("extras/"),
        test::file_entry("extras/002.png", test::make_png(8, 24)),
    }, ContainerKind::Zip);
}

} // namespace

TEST(ReplaceExtensionTest, ChangesOnlyTheFileName) {
    EXPECT_EQ(replace_extension("page.png", "avif"), "page.avif");
    EXPECT_EQ(replace_extension("a/b/page.png", "jpg"), "a/b/page.jpg");
    EXPECT_EQ(replace_extension("v1.2/page", "webp"), "v1.2/page.webp");
    EXPECT_EQ(replace_extension("page", "png"), "page.png");
    EXPECT_EQ(replace_extension("archive.tar.png", "jxl"), "archive.tar.jxl");
}

TEST(ArchiveOrchestratorTest, ConvertsEveryImageAndKeepsLayout) {
    const CodecRegistry registry;
    EventBus bus;
    std::size_t announced = 0;
    std::atomic<std::size_t> transcoded{0};
    bus.subscribe<ConversionStartEvent>([&](const ConversionStartEvent& e) { announced = e.file_count; });
    bus.subscribe<EntryTranscodedEvent>([&](const EntryTranscodedEvent&) { ++transcoded; });

    ArchiveOrchestrator orchestrator(registry_fn(registry), &bus);
    ConversionJob job;
    job.target_format = ImageFormat::Jpeg;
    job.quality = 80;
    job.thread_count = 2;

    const auto out = orchestrator.convert(comic_zip(), job);
    EXPECT_EQ(orchestrator.last_output_kind(), ContainerKind::Zip);
    EXPECT_EQ(announced, 2U);
    EXPECT_EQ(transcoded.load(), 2U);

    const auto contents = ArchiveContainer::read(out);
    EXPECT_EQ(contents.kind, ContainerKind::Zip);
    ASSERT_EQ(contents.entries.size(), 3U);
    EXPECT_EQ(contents.entries[0].path, "001.jpg");
    EXPECT_EQ(contents.entries[1].kind, EntryKind::Directory);
    EXPECT_EQ(contents.entries[2].path, "extras/002.jpg");
    EXPECT_EQ(sniff_image_format(contents.entries[0].content), ImageFormat::Jpeg);
    EXPECT_EQ(sniff_image_format(contents.entries[2].content), ImageFormat::Jpeg);

    const auto page = registry.find(ImageFormat::Jpeg)->decode(contents.entries[2].content);
    EXPECT_EQ(page.width, 8U);
    EXPECT_EQ(page.height, 24U);
}

TEST(ArchiveOrchestratorTest, KeepsContainerKind) {
    const CodecRegistry registry;
    ArchiveOrchestrator orchestrator(registry_fn(registry));
    const auto tar = ArchiveContainer::write({test::file_entry("p.png", test::make_png())}, ContainerKind::Tar);

    ConversionJob job;
    job.target_format = ImageFormat::Png;
    const auto out = orchestrator.convert(tar, job);
    EXPECT_EQ(ArchiveContainer::detect(out), ContainerKind::Tar);
    EXPECT_EQ(orchestrator.last_output_kind(), ContainerKind::Tar);
}

TEST(ArchiveOrchestratorTest, NonImageEntryAbortsTheRun) {
    const CodecRegistry registry;
    ArchiveOrchestrator orchestrator(registry_fn(registry));
    const auto zip = ArchiveContainer::write({
        test::file_entry("001.png", test::make_png()),
        test::file_entry("notes.txt", test::bytes_of("not an image")),
    }, ContainerKind::Zip);

    ConversionJob job;
    job.target_format = ImageFormat::Png;
    try {
        (void)orchestrator.convert(zip, job);
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.index(), 1U);
    }
}

TEST(ArchiveOrchestratorTest, EmptyArchiveProducesEmptyArchive) {
    ArchiveOrchestrator orchestrator([](std::span<const std::uint8_t>, const ConversionJob&) -> std::vector<std::uint8_t> {
        throw std::logic_error("must not be called");
    });
    const auto out = orchestrator.convert(ArchiveContainer::write({}, ContainerKind::Zip), ConversionJob{});
    EXPECT_TRUE(ArchiveContainer::read(out).entries.empty());
}

TEST(ArchiveOrchestratorTest, DeclaredKindMismatchIsUnsupported) {
    ArchiveOrchestrator orchestrator([](std::span<const std::uint8_t> in, const ConversionJob&) {
        return std::vector<std::uint8_t>(in.begin(), in.end());
    });
    EXPECT_THROW((void)orchestrator.convert(comic_zip(), ConversionJob{}, ContainerKind::SevenZip),
                 UnsupportedContainer);
}

TEST(ArchiveOrchestratorTest, FallbackContainerDefaultsToZip) {
    ArchiveOrchestrator orchestrator([](std::span<const std::uint8_t> in, const ConversionJob&) {
        return std::vector<std::uint8_t>(in.begin(), in.end());
    });
    EXPECT_EQ(orchestrator.fallback_container(), ContainerKind::Zip);
    orchestrator.set_fallback_container(ContainerKind::Tar);
    EXPECT_EQ(orchestrator.fallback_container(), ContainerKind::Tar);
    EXPECT_EQ(orchestrator.last_output_kind(), ContainerKind::Unknown);
}

namespace {

std::vector<ArchiveEntry> read_order() {
    return {
        test::file_entry("001.png", test::bytes_of("a")),
        test::dir_entry("extras/"),
        test::file_entry("extras/002.png", test::bytes_of("b")),
    };
}

TranscodeResult result_for(const std::size_t index, const std::string& bytes) {
    return TranscodeResult{index, test::bytes_of(bytes)};
}

} // namespace

TEST(CorrelateResultsTest, MatchesByIndexRegardlessOfOrder) {
    auto entries = read_order();
    correlate_results(entries, {result_for(2, "B"), result_for(0, "A")}, "webp");

    EXPECT_EQ(entries[0].path, "001.webp");
    EXPECT_EQ(entries[0].content, test::bytes_of("A"));
    EXPECT_EQ(entries[1].path, "extras/");
    EXPECT_EQ(entries[2].path, "extras/002.webp");
    EXPECT_EQ(entries[2].content, test::bytes_of("B"));
}

TEST(CorrelateResultsTest, UnknownIndexIsInconsistent) {
    auto entries = read_order();
    EXPECT_THROW(correlate_results(entries, {result_for(0, "A"), result_for(2, "B"), result_for(7, "?")}, "webp"),
                 ConsistencyError);

    // a directory record never receives a result either
    entries = read_order();
    EXPECT_THROW(correlate_results(entries, {result_for(0, "A"), result_for(1, "?"), result_for(2, "B")}, "webp"),
                 ConsistencyError);
}

TEST(CorrelateResultsTest, DuplicateIndexIsInconsistent) {
    auto entries = read_order();
    EXPECT_THROW(correlate_results(entries, {result_for(0, "A"), result_for(0, "A2"), result_for(2, "B")}, "webp"),
                 ConsistencyError);
}

TEST(CorrelateResultsTest, MissingIndexIsInconsistentAndLeavesEntries) {
    auto entries = read_order();
    EXPECT_THROW(correlate_results(entries, {result_for(2, "B")}, "webp"), ConsistencyError);
    EXPECT_EQ(entries[0].path, "001.png");
    EXPECT_EQ(entries[2].path, "extras/002.png");
    EXPECT_EQ(entries[2].content, test::bytes_of("b"));
}
