#include "app_options.hpp"
#include "shard_file.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace {

std::stringstream create_arg_stream(int argc, const char* const argv[])
{
   std::stringstream arg_stream;

   for (auto i = 1; i < argc; ++i) {
      arg_stream << std::quoted(argv[i]) << ' ';
   }

   return arg_stream;
}

std::string read_option_value(std::istream& istream, std::string_view option)
{
   std::string str;

   if (!(istream >> std::quoted(str))) {
      throw std::invalid_argument{
         fmt::format("Option '{}' requires a value."sv, option)};
   }

   return str;
}

std::filesystem::path read_path(std::istream& istream, std::string_view option)
{
   auto str = read_option_value(istream, option);

   if (str.empty()) {
      throw std::invalid_argument{
         fmt::format("Option '{}' requires a non-empty path."sv, option)};
   }

   return str;
}

std::uint64_t read_byte_size(std::istream& istream, std::string_view option)
{
   const auto str = read_option_value(istream, option);
   const auto size = parse_uint64(str);

   if (!size || *size == 0) {
      throw std::invalid_argument{fmt::format(
         "Invalid value '{}' for '{}'. Expected a positive number of bytes."sv, str,
         option)};
   }

   return *size;
}

Tool_mode parse_tool_mode(std::string_view str)
{
   if (str == "shard"sv) return Tool_mode::shard;
   if (str == "reconstruct"sv) return Tool_mode::reconstruct;

   throw std::invalid_argument{
      fmt::format("Unknown command '{}'. Expected 'shard' or 'reconstruct'."sv, str)};
}

std::string_view mode_name(const Tool_mode mode) noexcept
{
   if (mode == Tool_mode::shard) return "shard"sv;
   if (mode == Tool_mode::reconstruct) return "reconstruct"sv;

   return "none"sv;
}
}

constexpr auto input_opt_description{
   R"(<path> shard: the source file to shard.
   reconstruct: the directory containing the shards.)"sv};

constexpr auto output_opt_description{
   R"(<path> shard: the target directory to save shards to. Created if missing.
   reconstruct: the file to reconstruct. Truncated if it exists.)"sv};

constexpr auto size_opt_description{
   R"(<bytes> shard only: maximum shard size in bytes. Default is 4294967296 (4 GiB).)"sv};

constexpr auto verbose_opt_description{R"(Enable verbose output.)"sv};

constexpr auto help_opt_description{R"(Print this help and exit.)"sv};

constexpr auto version_opt_description{R"(Print the version and exit.)"sv};

constexpr auto commands_description{
   R"(Commands:
 shard        Shard a file into parts named shard_0000, shard_0001, ...
 reconstruct  Reconstruct a file by concatenating its shards in name order
)"sv};

App_options::App_options() : _max_shard_size{default_max_shard_size}
{
   using Istr = std::istream;
   const std::vector<Tool_mode> both{Tool_mode::none, Tool_mode::shard,
                                     Tool_mode::reconstruct};

   _options = {
      {"--input"s, "-i"s, [this](Istr& istr) { _input = read_path(istr, "--input"sv); },
       input_opt_description, both},
      {"--output"s, "-o"s, [this](Istr& istr) { _output = read_path(istr, "--output"sv); },
       output_opt_description, both},
      {"--size"s, "-s"s,
       [this](Istr& istr) {
          _max_shard_size = read_byte_size(istr, "--size"sv);
          _size_given = true;
       },
       size_opt_description,
       {Tool_mode::shard}},
      {"--verbose"s, "-v"s, [this](Istr&) { _verbose = true; }, verbose_opt_description,
       both},
      {"--help"s, "-h"s, [this](Istr&) { _help = true; }, help_opt_description, both},
      {"--version"s, "-V"s, [this](Istr&) { _version = true; }, version_opt_description,
       both}};
}

App_options::App_options(const int argc, const char* const argv[]) : App_options()
{
   auto arg_stream = create_arg_stream(argc, argv);

   for (std::string arg; arg_stream >> std::quoted(arg);) {
      if (begins_with(arg, "-"sv) && arg.size() > 1) {
         apply_option(arg, arg_stream);
      }
      else if (_tool_mode == Tool_mode::none) {
         _tool_mode = parse_tool_mode(arg);
      }
      else {
         throw std::invalid_argument{fmt::format("Unexpected argument '{}'."sv, arg)};
      }
   }

   if (_help || _version) return;

   validate();
}

Tool_mode App_options::tool_mode() const noexcept
{
   return _tool_mode;
}

auto App_options::input() const noexcept -> const std::filesystem::path&
{
   return _input;
}

auto App_options::output() const noexcept -> const std::filesystem::path&
{
   return _output;
}

std::uint64_t App_options::max_shard_size() const noexcept
{
   return _max_shard_size;
}

bool App_options::verbose() const noexcept
{
   return _verbose;
}

bool App_options::help_requested() const noexcept
{
   return _help;
}

bool App_options::version_requested() const noexcept
{
   return _version;
}

void App_options::print_usage(std::ostream& ostream)
{
   const App_options options;

   ostream << "Usage: " << tool_name << " <command> <options>\n\n";
   ostream << commands_description << '\n';
   ostream << "Options:\n";

   for (const auto& option : options._options) {
      ostream << ' ' << option.short_name << ", " << option.name << ' ';
      ostream.write(option.description.data(), option.description.length());
      ostream << '\n';
   }

   ostream << '\n';
}

auto App_options::find_option(std::string_view name) noexcept -> App_options::Option*
{
   const auto result =
      std::find_if(std::begin(_options), std::end(_options), [name](const Option& option) {
         return (option.name == name || option.short_name == name);
      });

   if (result == std::end(_options)) return nullptr;

   return &(*result);
}

void App_options::apply_option(std::string_view arg, std::istream& arg_stream)
{
   // --name=value is accepted for long options.
   const auto equals = begins_with(arg, "--"sv) ? arg.find('=') : arg.npos;
   const auto name = arg.substr(0, equals);

   auto* const option = find_option(name);

   if (!option) {
      throw std::invalid_argument{fmt::format("Unknown option '{}'."sv, name)};
   }

   if (_tool_mode != Tool_mode::none &&
       std::find(std::cbegin(option->modes), std::cend(option->modes), _tool_mode) ==
          std::cend(option->modes)) {
      throw std::invalid_argument{fmt::format("Option '{}' is not valid for '{}'."sv,
                                              option->name, mode_name(_tool_mode))};
   }

   if (equals == arg.npos) return option->handler(arg_stream);

   std::stringstream value_stream;
   value_stream << std::quoted(arg.substr(equals + 1));

   option->handler(value_stream);
}

void App_options::validate() const
{
   if (_tool_mode == Tool_mode::none) {
      throw std::invalid_argument{"No command specified."};
   }

   if (_input.empty()) {
      throw std::invalid_argument{"Missing required option '--input'."};
   }

   if (_output.empty()) {
      throw std::invalid_argument{"Missing required option '--output'."};
   }

   if (_size_given && _tool_mode != Tool_mode::shard) {
      throw std::invalid_argument{fmt::format("Option '--size' is not valid for '{}'."sv,
                                              mode_name(_tool_mode))};
   }
}
