#pragma once

#include <cstdint>
#include <filesystem>

constexpr std::uint64_t default_max_shard_size = 4ull * 1024ull * 1024ull * 1024ull;

// Splits source into files named shard_0000, shard_0001, ... inside target_dir,
// each holding max_size bytes except possibly the last. The directory is created
// if needed. Returns the number of shards written; an empty source writes none.
//
// The first I/O error is thrown as is. Shards written before it are left on disk.
auto shard_file(const std::filesystem::path& source,
                const std::filesystem::path& target_dir,
                const std::uint64_t max_size = default_max_shard_size) -> std::uint64_t;
