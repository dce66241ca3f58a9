#include "reconstruct_file.hpp"
#include "console.hpp"
#include "file_handle.hpp"
#include "mapped_file.hpp"
#include "shard_names.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

auto open_directory(const fs::path& directory) -> fs::directory_iterator
{
   std::error_code ec;
   fs::directory_iterator iterator{directory, ec};

   if (ec == std::errc::no_such_file_or_directory) {
      console::info("Shard directory {} does not exist"sv, directory.string());

      return {};
   }

   if (ec) throw fs::filesystem_error{"Unable to list shard directory", directory, ec};

   return iterator;
}

void sort_shards(std::vector<Shard_entry>& entries)
{
   std::sort(std::begin(entries), std::end(entries),
             [](const Shard_entry& left, const Shard_entry& right) {
                return shard_name_less(left.name, right.name);
             });
}
}

auto list_shards(const fs::path& directory) -> std::vector<Shard_entry>
{
   std::vector<Shard_entry> entries;

   std::error_code ec;

   // A failed increment leaves the iterator at the end, so the rest of the listing
   // is lost along with the bad entry.
   for (auto iterator = open_directory(directory); iterator != fs::directory_iterator{};
        iterator.increment(ec)) {
      const auto& path = iterator->path();
      auto name = path.filename().string();

      if (!is_shard_name(name)) continue;

      entries.push_back({std::move(name), path});
   }

   if (ec) {
      console::info("Listing of {} stopped at an unreadable entry: {}"sv, directory.string(),
                    ec.message());
   }

   sort_shards(entries);

   return entries;
}

auto reconstruct_file(const fs::path& shard_dir, const fs::path& output) -> std::uint64_t
{
   auto output_file = File_handle::create_truncate(output);

   const auto shards = list_shards(shard_dir);

   console::info("Found {} shards in {}"sv, shards.size(), shard_dir.string());

   for (const auto& shard : shards) {
      const Mapped_file shard_file{shard.path};

      output_file.write_all(shard_file.bytes());

      console::print("Processed shard: {}"sv, shard.path.string());
   }

   output_file.close();

   return shards.size();
}
