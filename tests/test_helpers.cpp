#include "test_helpers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

std::atomic_int scratch_counter{0};

}

Scratch_directory::Scratch_directory()
   : _path{fs::temp_directory_path() /
           fmt::format("shard_tool_test_{}_{}"sv, ::getpid(), scratch_counter++)}
{
   fs::remove_all(_path);
   fs::create_directories(_path);
}

Scratch_directory::~Scratch_directory()
{
   std::error_code ec;
   fs::remove_all(_path, ec);
}

auto Scratch_directory::path() const noexcept -> const fs::path&
{
   return _path;
}

auto Scratch_directory::operator/(std::string_view name) const -> fs::path
{
   return _path / fs::path{name};
}

void write_text_file(const fs::path& path, std::string_view contents)
{
   std::ofstream file{path, std::ios::binary | std::ios::trunc};

   if (!file) throw std::runtime_error{"Unable to create test file " + path.string()};

   file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

auto read_text_file(const fs::path& path) -> std::string
{
   std::ifstream file{path, std::ios::binary};

   if (!file) throw std::runtime_error{"Unable to open test file " + path.string()};

   return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

auto list_file_names(const fs::path& directory) -> std::vector<std::string>
{
   std::vector<std::string> names;

   for (const auto& entry : fs::directory_iterator{directory}) {
      names.emplace_back(entry.path().filename().string());
   }

   std::sort(std::begin(names), std::end(names));

   return names;
}

auto make_test_bytes(const std::size_t size, const unsigned seed) -> std::string
{
   std::mt19937 engine{seed};
   std::uniform_int_distribution<int> distribution{0, 255};

   std::string bytes;
   bytes.resize(size);

   for (auto& c : bytes) c = static_cast<char>(distribution(engine));

   return bytes;
}
