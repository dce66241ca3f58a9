#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

template<typename Char_t, typename Char_traits = std::char_traits<Char_t>>
constexpr bool begins_with(
   std::basic_string_view<Char_t, Char_traits> string,
   typename std::common_type<std::basic_string_view<Char_t, Char_traits>>::type
      what) noexcept
{
   if (what.size() > string.size()) return false;

   return (string.substr(0, what.size()) == what);
}

template<typename Char_t, typename Char_traits = std::char_traits<Char_t>>
constexpr bool begins_with(
   const std::basic_string<Char_t, Char_traits>& string,
   typename std::common_type<std::basic_string_view<Char_t, Char_traits>>::type
      what) noexcept
{
   return begins_with(std::basic_string_view<Char_t, Char_traits>{string}, what);
}

// Parses a plain decimal number. Signs, whitespace and trailing characters are
// rejected, as are values that do not fit in 64 bits.
inline auto parse_uint64(std::string_view string) noexcept -> std::optional<std::uint64_t>
{
   if (string.empty()) return std::nullopt;

   std::uint64_t value{};

   const auto [last, ec] =
      std::from_chars(string.data(), string.data() + string.size(), value, 10);

   if (ec != std::errc{} || last != string.data() + string.size()) {
      return std::nullopt;
   }

   return value;
}
