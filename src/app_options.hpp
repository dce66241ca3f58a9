#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

enum class Tool_mode { none, shard, reconstruct };

constexpr std::string_view tool_name = "shard-tool";

constexpr std::string_view tool_version = "0.1.0";

class App_options {
public:
   App_options(const App_options&) = delete;
   App_options& operator=(const App_options&) = delete;
   App_options(App_options&&) = delete;
   App_options& operator=(App_options&&) = delete;

   // Throws std::invalid_argument for malformed command lines.
   App_options(const int argc, const char* const argv[]);

   Tool_mode tool_mode() const noexcept;

   auto input() const noexcept -> const std::filesystem::path&;

   auto output() const noexcept -> const std::filesystem::path&;

   std::uint64_t max_shard_size() const noexcept;

   bool verbose() const noexcept;

   bool help_requested() const noexcept;

   bool version_requested() const noexcept;

   static void print_usage(std::ostream& ostream);

private:
   App_options();

   using Option_handler = std::function<void(std::istream&)>;

   struct Option {
      std::string name;
      std::string short_name;
      Option_handler handler;
      std::string_view description;
      std::vector<Tool_mode> modes;
   };

   auto find_option(std::string_view name) noexcept -> Option*;

   void apply_option(std::string_view arg, std::istream& arg_stream);

   void validate() const;

   std::vector<Option> _options;

   Tool_mode _tool_mode = Tool_mode::none;
   std::filesystem::path _input;
   std::filesystem::path _output;
   std::uint64_t _max_shard_size;
   bool _size_given = false;
   bool _verbose = false;
   bool _help = false;
   bool _version = false;
};
