#include "shard_names.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

using namespace std::literals;

auto make_shard_name(const std::uint64_t index) -> std::string
{
   return fmt::format("{}{:0{}}"sv, shard_prefix, index, shard_index_width);
}

bool is_shard_name(std::string_view name) noexcept
{
   return begins_with(name, shard_prefix);
}

bool shard_name_overflows(const std::uint64_t index) noexcept
{
   return index > max_ordered_shard_index;
}

bool shard_name_less(std::string_view left, std::string_view right) noexcept
{
   // std::string_view compares through char_traits<char>, which orders bytes as
   // unsigned char.
   return left < right;
}
