#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

constexpr std::string_view shard_prefix{"shard_"};

// Digits the index is zero padded to. Lexicographic order of shard names only
// matches index order while every index fits in this many digits.
constexpr std::size_t shard_index_width = 4;

constexpr std::uint64_t max_ordered_shard_index = 9999;

auto make_shard_name(const std::uint64_t index) -> std::string;

bool is_shard_name(std::string_view name) noexcept;

bool shard_name_overflows(const std::uint64_t index) noexcept;

bool shard_name_less(std::string_view left, std::string_view right) noexcept;
