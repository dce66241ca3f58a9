#include "shard_file.hpp"
#include "console.hpp"
#include "file_handle.hpp"
#include "file_saver.hpp"
#include "shard_names.hpp"

#include <gsl/gsl>

#include <algorithm>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

constexpr std::size_t unknown_size_block = 64 * 1024;

// First guess at the block buffer size. The reported file size is only a hint:
// /proc and some network files report 0, and files can grow while being read.
auto initial_buffer_size(const fs::path& source, const std::size_t max_block) -> std::size_t
{
   std::error_code ec;

   if (fs::is_regular_file(source, ec)) {
      const auto file_size = fs::file_size(source, ec);

      if (!ec && file_size >= max_block) return max_block;

      // One byte past the reported size lets the first read see end of file.
      if (!ec && file_size > 0) return static_cast<std::size_t>(file_size) + 1;
   }

   return std::min(unknown_size_block, max_block);
}

// Fills buffer with up to max_block bytes, growing it while reads keep filling it.
// Returns the number of bytes in the block; 0 at end of file.
auto read_block(File_handle& input, std::vector<std::byte>& buffer,
                const std::size_t max_block) -> std::size_t
{
   std::size_t filled = 0;

   for (;;) {
      filled += input.read_full(gsl::span{buffer}.subspan(filled));

      if (filled < buffer.size() || buffer.size() == max_block) return filled;

      buffer.resize(buffer.size() > max_block / 2 ? max_block : buffer.size() * 2);
   }
}

void warn_unordered_names(const std::uint64_t index)
{
   console::warning("Shard index {} does not fit in {} digits. Shards past {} will not "
                    "reassemble in order."sv,
                    index, shard_index_width, make_shard_name(max_ordered_shard_index));
}
}

auto shard_file(const fs::path& source, const fs::path& target_dir,
                const std::uint64_t max_size) -> std::uint64_t
{
   Expects(max_size > 0);

   auto input = File_handle::open_read(source);

   const auto max_block = gsl::narrow<std::size_t>(max_size);
   std::vector<std::byte> buffer(initial_buffer_size(source, max_block));

   File_saver file_saver{target_dir};

   console::info("Reading {} in blocks of {} bytes"sv, source.string(), max_block);

   std::uint64_t index = 0;
   bool warned_unordered = false;

   for (;;) {
      const auto bytes_read = read_block(input, buffer, max_block);

      if (bytes_read == 0) break;

      if (!warned_unordered && shard_name_overflows(index)) {
         warn_unordered_names(index);
         warned_unordered = true;
      }

      const auto path = file_saver.save_file(gsl::span{buffer}.first(bytes_read),
                                             make_shard_name(index));

      console::print("Created shard: {}"sv, path.string());

      ++index;
   }

   return index;
}
