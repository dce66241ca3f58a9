#include "run_tool.hpp"
#include "app_options.hpp"
#include "console.hpp"
#include "reconstruct_file.hpp"
#include "shard_file.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

constexpr int usage_exit_code = 2;

void report_failure(std::string_view activity, const fs::path& path,
                    std::string_view message)
{
   console::error("Exception occured while {}.\n   Path: {}\n   Message: {}"sv, activity,
                  path.string(), message);
}

bool shard_input_file(const App_options& options) noexcept
{
   try {
      console::print("Sharding file {} into directory {} with max shard size {} bytes"sv,
                     options.input().string(), options.output().string(),
                     options.max_shard_size());

      const auto count =
         shard_file(options.input(), options.output(), options.max_shard_size());

      console::info("Wrote {} shards"sv, count);

      return true;
   }
   catch (std::exception& e) {
      report_failure("sharding file"sv, options.input(), e.what());
   }

   return false;
}

bool reconstruct_output_file(const App_options& options) noexcept
{
   try {
      console::print("Reconstructing file from shards in directory {} to {}"sv,
                     options.input().string(), options.output().string());

      const auto count = reconstruct_file(options.input(), options.output());

      console::info("Appended {} shards"sv, count);

      return true;
   }
   catch (std::exception& e) {
      report_failure("reconstructing file"sv, options.output(), e.what());
   }

   return false;
}

auto get_processor(const Tool_mode mode) -> std::function<bool(const App_options&)>
{
   if (mode == Tool_mode::shard) return shard_input_file;
   if (mode == Tool_mode::reconstruct) return reconstruct_output_file;

   throw std::invalid_argument{"No command specified."};
}
}

int run_tool(const int argc, const char* const argv[])
{
   if (argc <= 1) {
      App_options::print_usage(std::cout);

      return usage_exit_code;
   }

   try {
      const App_options app_options{argc, argv};

      if (app_options.help_requested()) {
         App_options::print_usage(std::cout);

         return EXIT_SUCCESS;
      }

      if (app_options.version_requested()) {
         std::cout << tool_name << ' ' << tool_version << '\n';

         return EXIT_SUCCESS;
      }

      console::set_verbose(app_options.verbose());

      const auto processor = get_processor(app_options.tool_mode());

      return processor(app_options) ? EXIT_SUCCESS : EXIT_FAILURE;
   }
   catch (std::invalid_argument& e) {
      console::error("{}"sv, e.what());
      std::cout << '\n';
      App_options::print_usage(std::cout);

      return usage_exit_code;
   }
}
