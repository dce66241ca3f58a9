#pragma once

#include <fmt/format.h>

#include <iostream>
#include <ostream>
#include <string_view>
#include <utility>

namespace console {

namespace detail {
inline bool& verbose_flag() noexcept
{
   static bool verbose = false;

   return verbose;
}

template<typename... Args>
inline void write_line(std::ostream& stream, std::string_view prefix,
                       std::string_view format, Args&&... args)
{
   auto line = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
   line.insert(0, prefix);
   line += '\n';

   stream.write(line.data(), static_cast<std::streamsize>(line.size()));
}
}

inline void set_verbose(const bool verbose) noexcept
{
   detail::verbose_flag() = verbose;
}

inline bool verbose() noexcept
{
   return detail::verbose_flag();
}

template<typename... Args>
inline void print(std::string_view format, Args&&... args)
{
   detail::write_line(std::cout, {}, format, std::forward<Args>(args)...);
}

// Only printed when verbose output is enabled.
template<typename... Args>
inline void info(std::string_view format, Args&&... args)
{
   if (!verbose()) return;

   detail::write_line(std::cout, "Info: ", format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void warning(std::string_view format, Args&&... args)
{
   std::cout.flush();

   detail::write_line(std::cerr, "Warning: ", format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(std::string_view format, Args&&... args)
{
   std::cout.flush();

   detail::write_line(std::cerr, "Error: ", format, std::forward<Args>(args)...);
}
}
