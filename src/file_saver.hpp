#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <filesystem>
#include <string_view>

class File_saver {
public:
   // Creates the directory and any missing parents.
   explicit File_saver(const std::filesystem::path& path);

   auto save_file(gsl::span<const std::byte> contents, std::string_view name)
      -> std::filesystem::path;

   auto build_file_path(std::string_view name) const -> std::filesystem::path;

private:
   const std::filesystem::path _path;
};
