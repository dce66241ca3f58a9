#include "file_saver.hpp"
#include "console.hpp"
#include "file_handle.hpp"

namespace fs = std::filesystem;
using namespace std::literals;

File_saver::File_saver(const fs::path& path) : _path{path.lexically_normal()}
{
   if (fs::create_directories(_path)) {
      console::info("Created directory {}"sv, _path.string());
   }
}

auto File_saver::save_file(gsl::span<const std::byte> contents, std::string_view name)
   -> fs::path
{
   auto path = build_file_path(name);

   console::info("Saving {} bytes to {}"sv, contents.size(), path.string());

   auto file = File_handle::create_truncate(path);
   file.write_all(contents);
   file.close();

   return path;
}

auto File_saver::build_file_path(std::string_view name) const -> fs::path
{
   return _path / fs::path{name};
}
