#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Shard_entry {
   std::string name;
   std::filesystem::path path;
};

// Entries of directory whose names begin with the shard prefix, in byte-wise name
// order. A missing directory yields no entries; listing stops at the
// first entry that cannot be read.
auto list_shards(const std::filesystem::path& directory) -> std::vector<Shard_entry>;

// Truncates output and appends every shard found in shard_dir to it in name order.
// Returns the number of shards appended. The first I/O error is thrown as is and
// leaves the partial output behind.
auto reconstruct_file(const std::filesystem::path& shard_dir,
                      const std::filesystem::path& output) -> std::uint64_t;
