#include <gtest/gtest.h>
#include <iterator>
#include "../libcomiconv/include/errors.hpp"
#include "../libcomiconv/include/file_utils.hpp"
#include "test_helpers.hpp"

using namespace comiconv;
namespace fs = std::filesystem;

TEST(ScratchDirectoryTest, UniquePerRunAndRemoved) {
    fs::path first_path;
    {
        const ScratchDirectory a("/books/issue1.cbz", "run");
        const ScratchDirectory b("/books/issue1.cbz", "run");
        EXPECT_NE(a.path(), b.path());
        EXPECT_TRUE(fs::is_directory(a.path()));
        EXPECT_TRUE(fs::is_directory(b.path()));
        EXPECT_NE(a.path().filename().string().find("issue1"), std::string::npos);

        write_file(a.file("staged.cbz"), test::bytes_of("data"));
        EXPECT_TRUE(fs::exists(a.file("staged.cbz")));
        first_path = a.path();
    }
    EXPECT_FALSE(fs::exists(first_path));
}

TEST(ScratchDirectoryTest, RemovedOnException) {
    fs::path dir;
    try {
        const ScratchDirectory s("x.cbz", "run");
        dir = s.path();
        write_file(s.file("partial"), test::bytes_of("partial"));
        throw std::runtime_error("conversion failed");
    } catch (const std::runtime_error&) {
    }
    ASSERT_FALSE(dir.empty());
    EXPECT_FALSE(fs::exists(dir));
}

TEST(FileUtilsTest, ReadWriteAndMove) {
    const ScratchDirectory s("io.cbz", "test");
    const auto data = test::bytes_of("some archive bytes");
    write_file(s.file("a"), data);
    EXPECT_EQ(read_file(s.file("a")), data);

    move_file(s.file("a"), s.file("b"));
    EXPECT_FALSE(fs::exists(s.file("a")));
    EXPECT_EQ(read_file(s.file("b")), data);
}

TEST(FileUtilsTest, SiblingTempPathStaysBesideTarget) {
    const fs::path target = "/books/series/issue1.cbz";
    const auto a = sibling_temp_path(target);
    const auto b = sibling_temp_path(target);
    EXPECT_EQ(a.parent_path(), target.parent_path());
    EXPECT_EQ(a.filename().string().rfind(".issue1.cbz.comiconv-", 0), 0U);
    EXPECT_NE(a, b);
}

TEST(FileUtilsTest, CopyThenRenameReplacesTargetWhole) {
    const ScratchDirectory src("staged.cbz", "test");
    const ScratchDirectory dst("original.cbz", "test");
    write_file(src.file("new.cbz"), test::bytes_of("rebuilt archive"));
    write_file(dst.file("book.cbz"), test::bytes_of("original archive"));

    copy_then_rename(src.file("new.cbz"), dst.file("book.cbz"));

    EXPECT_EQ(read_file(dst.file("book.cbz")), test::bytes_of("rebuilt archive"));
    EXPECT_FALSE(fs::exists(src.file("new.cbz")));
    const auto left = std::distance(fs::directory_iterator(dst.path()), fs::directory_iterator{});
    EXPECT_EQ(left, 1);
}

TEST(FileUtilsTest, FailedCopyLeavesTargetUntouched) {
    const ScratchDirectory dst("original.cbz", "test");
    write_file(dst.file("book.cbz"), test::bytes_of("original archive"));

    EXPECT_THROW(copy_then_rename(dst.file("missing.cbz"), dst.file("book.cbz")), IoError);

    EXPECT_EQ(read_file(dst.file("book.cbz")), test::bytes_of("original archive"));
    const auto left = std::distance(fs::directory_iterator(dst.path()), fs::directory_iterator{});
    EXPECT_EQ(left, 1);
}

TEST(FileUtilsTest, MissingFileIsAnIoError) {
    EXPECT_THROW((void)read_file("/nonexistent/comiconv/none.cbz"), IoError);
}
