/**
 * @file test_file_source.cpp
 * @brief Unit tests for memory and disk file sources
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <filesystem>
#include <vector>

namespace kcenon::file_drop::test {

// =============================================================================
// memory_file_source
// =============================================================================

class MemoryFileSourceTest : public ::testing::Test {};

TEST_F(MemoryFileSourceTest, Metadata) {
    memory_file_source source("notes.txt", make_bytes(100), "text/plain");

    EXPECT_EQ(source.name(), "notes.txt");
    EXPECT_EQ(source.size(), 100u);
    EXPECT_EQ(source.media_type(), "text/plain");
    EXPECT_EQ(file_descriptor::from(source), file_descriptor("notes.txt", 100, "text/plain"));
}

TEST_F(MemoryFileSourceTest, ReadsRange) {
    auto data = make_bytes(100);
    memory_file_source source("a.bin", data);

    auto slice = source.read(10, 20);

    ASSERT_TRUE(slice.has_value());
    EXPECT_EQ(slice.value(), std::vector<std::byte>(data.begin() + 10, data.begin() + 30));
}

TEST_F(MemoryFileSourceTest, ReadsEmptyRangeAtEnd) {
    memory_file_source source("a.bin", make_bytes(10));

    auto slice = source.read(10, 0);

    ASSERT_TRUE(slice.has_value());
    EXPECT_TRUE(slice.value().empty());
}

TEST_F(MemoryFileSourceTest, RejectsRangePastEnd) {
    memory_file_source source("a.bin", make_bytes(10));

    auto slice = source.read(5, 6);

    ASSERT_FALSE(slice.has_value());
    EXPECT_EQ(slice.error().code, error_code::invalid_range);
}

// =============================================================================
// disk_file_source
// =============================================================================

class DiskFileSourceTest : public TempDirectoryFixture {};

TEST_F(DiskFileSourceTest, OpenCapturesMetadata) {
    auto path = create_test_file("photo.JPG", make_bytes(4096));

    auto source = disk_file_source::open(path);

    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source.value()->name(), "photo.JPG");
    EXPECT_EQ(source.value()->size(), 4096u);
    EXPECT_EQ(source.value()->media_type(), "image/jpeg");
    EXPECT_EQ(source.value()->path(), path);
}

TEST_F(DiskFileSourceTest, ExplicitMediaTypeWins) {
    auto path = create_test_file("data.json", make_bytes(16));

    auto source = disk_file_source::open(path, "application/x-custom");

    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source.value()->media_type(), "application/x-custom");
}

TEST_F(DiskFileSourceTest, OpenMissingFile) {
    auto source = disk_file_source::open(test_dir_ / "missing.bin");

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_not_found);
}

TEST_F(DiskFileSourceTest, OpenDirectoryIsNotFound) {
    auto source = disk_file_source::open(test_dir_);

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_not_found);
}

TEST_F(DiskFileSourceTest, ReadsArbitraryRanges) {
    auto data = make_bytes(10000, 7);
    auto source = disk_file_source::open(create_test_file("big.bin", data)).value();

    auto tail = source->read(9000, 1000);
    auto head = source->read(0, 10);

    ASSERT_TRUE(tail.has_value());
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(tail.value(), std::vector<std::byte>(data.begin() + 9000, data.end()));
    EXPECT_EQ(head.value(), std::vector<std::byte>(data.begin(), data.begin() + 10));
}

TEST_F(DiskFileSourceTest, EmptyFile) {
    auto source = disk_file_source::open(create_test_file("empty.txt", {})).value();

    EXPECT_EQ(source->size(), 0u);
    auto slice = source->read(0, 0);
    ASSERT_TRUE(slice.has_value());
    EXPECT_TRUE(slice.value().empty());
}

TEST_F(DiskFileSourceTest, RangePastEndIsInvalid) {
    auto source = disk_file_source::open(create_test_file("a.bin", make_bytes(100))).value();

    auto slice = source->read(90, 11);

    ASSERT_FALSE(slice.has_value());
    EXPECT_EQ(slice.error().code, error_code::invalid_range);
}

TEST_F(DiskFileSourceTest, TruncatedFileIsReadError) {
    auto path = create_test_file("shrinking.bin", make_bytes(1000));
    auto source = disk_file_source::open(path).value();

    std::filesystem::resize_file(path, 100);
    auto slice = source->read(500, 100);

    ASSERT_FALSE(slice.has_value());
    EXPECT_EQ(slice.error().code, error_code::file_read_error);
}

// =============================================================================
// guess_media_type
// =============================================================================

class MediaTypeTest : public ::testing::Test {};

TEST_F(MediaTypeTest, KnownExtensions) {
    EXPECT_EQ(guess_media_type("report.pdf"), "application/pdf");
    EXPECT_EQ(guess_media_type("dir/song.MP3"), "audio/mpeg");
    EXPECT_EQ(guess_media_type("notes.txt"), "text/plain");
}

TEST_F(MediaTypeTest, UnknownIsEmpty) {
    EXPECT_EQ(guess_media_type("archive.xyz"), "");
    EXPECT_EQ(guess_media_type("Makefile"), "");
}

}  // namespace kcenon::file_drop::test
