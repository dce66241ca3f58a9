#include "mapped_file.hpp"

#include <gsl/gsl>

#include <system_error>

namespace fs = std::filesystem;

Mapped_file::Mapped_file(const fs::path& path)
{
   const auto status = fs::status(path);

   if (!fs::exists(status)) {
      throw fs::filesystem_error{
         "Unable to open shard", path,
         std::make_error_code(std::errc::no_such_file_or_directory)};
   }

   if (fs::is_directory(status)) {
      throw fs::filesystem_error{"Unable to read shard", path,
                                 std::make_error_code(std::errc::is_a_directory)};
   }

   _size = gsl::narrow<std::size_t>(fs::file_size(path));

   if (_size == 0) return;

   boost::iostreams::mapped_file_params parameters;
   parameters.path = path.string();
   parameters.length = _size;
   parameters.offset = 0;
   parameters.flags = boost::iostreams::mapped_file::mapmode::readonly;

   _file.open(parameters);
}

gsl::span<const std::byte> Mapped_file::bytes() const noexcept
{
   if (_size == 0) return {};

   return {reinterpret_cast<const std::byte*>(_file.data()), _size};
}
