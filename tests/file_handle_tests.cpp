#include "file_handle.hpp"
#include "file_saver.hpp"
#include "mapped_file.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

auto as_bytes(std::string_view string) -> gsl::span<const std::byte>
{
   return {reinterpret_cast<const std::byte*>(string.data()), string.size()};
}

auto to_string(gsl::span<const std::byte> bytes) -> std::string
{
   return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}
}

TEST(FileHandle, OpenMissingFileReportsNotFound)
{
   Scratch_directory scratch;

   try {
      File_handle::open_read(scratch / "missing");
      FAIL() << "expected std::system_error";
   }
   catch (std::system_error& e) {
      EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
      EXPECT_NE(std::string{e.what()}.find((scratch / "missing").string()),
                std::string::npos);
   }
}

TEST(FileHandle, CreateInMissingDirectoryReportsNotFound)
{
   Scratch_directory scratch;

   try {
      File_handle::create_truncate(scratch / "missing/file");
      FAIL() << "expected std::system_error";
   }
   catch (std::system_error& e) {
      EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
   }
}

TEST(FileHandle, WrittenBytesReadBack)
{
   Scratch_directory scratch;

   auto output = File_handle::create_truncate(scratch / "file");
   output.write_all(as_bytes("hello shards"));
   output.close();

   EXPECT_FALSE(output.is_open());

   auto input = File_handle::open_read(scratch / "file");
   std::array<std::byte, 5> buffer{};

   EXPECT_EQ(input.read_full(buffer), 5u);
   EXPECT_EQ(to_string(buffer), "hello");
   EXPECT_EQ(input.read_full(buffer), 5u);
   EXPECT_EQ(to_string(buffer), " shar");
   EXPECT_EQ(input.read_full(buffer), 2u);
   EXPECT_EQ(to_string(gsl::span{buffer}.first(2)), "ds");
   EXPECT_EQ(input.read_some(buffer), 0u);
}

TEST(FileHandle, CreateTruncatesExistingFile)
{
   Scratch_directory scratch;
   write_text_file(scratch / "file", "old contents");

   auto output = File_handle::create_truncate(scratch / "file");
   output.write_all(as_bytes("new"));
   output.close();

   EXPECT_EQ(read_text_file(scratch / "file"), "new");
}

TEST(FileHandle, MoveTransfersOwnership)
{
   Scratch_directory scratch;
   write_text_file(scratch / "file", "abc");

   auto first = File_handle::open_read(scratch / "file");
   auto second = std::move(first);

   EXPECT_FALSE(first.is_open());
   ASSERT_TRUE(second.is_open());
   EXPECT_EQ(second.path().string(), (scratch / "file").string());

   std::array<std::byte, 3> buffer{};
   EXPECT_EQ(second.read_full(buffer), 3u);
}

TEST(FileHandle, ReadingDirectoryReportsIsADirectory)
{
   Scratch_directory scratch;

   auto input = File_handle::open_read(scratch.path());
   std::array<std::byte, 4> buffer{};

   try {
      input.read_some(buffer);
      FAIL() << "expected std::system_error";
   }
   catch (std::system_error& e) {
      EXPECT_EQ(e.code(), std::errc::is_a_directory);
   }
}

TEST(MappedFile, ExposesFileContents)
{
   Scratch_directory scratch;
   write_text_file(scratch / "file", "mapped contents");

   const Mapped_file file{scratch / "file"};

   EXPECT_EQ(file.bytes().size(), 15u);
   EXPECT_EQ(to_string(file.bytes()), "mapped contents");
}

TEST(MappedFile, EmptyFileHasEmptyView)
{
   Scratch_directory scratch;
   write_text_file(scratch / "file", "");

   const Mapped_file file{scratch / "file"};

   EXPECT_TRUE(file.bytes().empty());
}

TEST(MappedFile, MissingFileReportsNotFound)
{
   Scratch_directory scratch;

   try {
      const Mapped_file file{scratch / "missing"};
      FAIL() << "expected std::filesystem::filesystem_error";
   }
   catch (fs::filesystem_error& e) {
      EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
   }
}

TEST(MappedFile, DirectoryReportsIsADirectory)
{
   Scratch_directory scratch;

   try {
      const Mapped_file file{scratch.path()};
      FAIL() << "expected std::filesystem::filesystem_error";
   }
   catch (fs::filesystem_error& e) {
      EXPECT_EQ(e.code(), std::errc::is_a_directory);
   }
}

TEST(FileSaver, CreatesDirectoryAndSavesFiles)
{
   Scratch_directory scratch;

   File_saver saver{scratch / "nested/dir"};

   EXPECT_TRUE(fs::is_directory(scratch / "nested/dir"));

   const auto path = saver.save_file(as_bytes("payload"), "shard_0000");

   EXPECT_EQ(path.string(), saver.build_file_path("shard_0000").string());
   EXPECT_EQ(read_text_file(scratch / "nested/dir/shard_0000"), "payload");
}

TEST(FileSaver, ExistingDirectoryIsAccepted)
{
   Scratch_directory scratch;

   EXPECT_NO_THROW(File_saver{scratch.path()});
   EXPECT_NO_THROW(File_saver{scratch.path()});
}
