#include "file_handle.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

[[noreturn]] void throw_errno(const int error, const char* operation, const fs::path& path)
{
   throw std::system_error{error, std::generic_category(),
                           fmt::format("Unable to {} '{}'"sv, operation, path.string())};
}

int open_or_throw(const fs::path& path, const int flags, const char* operation)
{
   int fd = -1;

   do {
      fd = ::open(path.c_str(), flags | O_CLOEXEC, 0666);
   } while (fd == -1 && errno == EINTR);

   if (fd == -1) throw_errno(errno, operation, path);

   return fd;
}
}

auto File_handle::open_read(const fs::path& path) -> File_handle
{
   return {open_or_throw(path, O_RDONLY, "open"), path};
}

auto File_handle::create_truncate(const fs::path& path) -> File_handle
{
   return {open_or_throw(path, O_WRONLY | O_CREAT | O_TRUNC, "create"), path};
}

File_handle::File_handle(int fd, fs::path path) noexcept
   : _fd{fd}, _path{std::move(path)}
{
}

File_handle::File_handle(File_handle&& other) noexcept
   : _fd{std::exchange(other._fd, -1)}, _path{std::move(other._path)}
{
}

File_handle& File_handle::operator=(File_handle&& other) noexcept
{
   if (this != &other) {
      if (_fd != -1) ::close(_fd);

      _fd = std::exchange(other._fd, -1);
      _path = std::move(other._path);
   }

   return *this;
}

File_handle::~File_handle()
{
   if (_fd != -1) ::close(_fd);
}

auto File_handle::read_some(gsl::span<std::byte> buffer) -> std::size_t
{
   Expects(is_open());

   for (;;) {
      const auto result = ::read(_fd, buffer.data(), buffer.size());

      if (result >= 0) return static_cast<std::size_t>(result);
      if (errno != EINTR) throw_last_error("read");
   }
}

auto File_handle::read_full(gsl::span<std::byte> buffer) -> std::size_t
{
   std::size_t total = 0;

   while (total < buffer.size()) {
      const auto count = read_some(buffer.subspan(total));

      if (count == 0) break;

      total += count;
   }

   return total;
}

void File_handle::write_all(gsl::span<const std::byte> bytes)
{
   Expects(is_open());

   while (!bytes.empty()) {
      const auto result = ::write(_fd, bytes.data(), bytes.size());

      if (result < 0) {
         if (errno == EINTR) continue;

         throw_last_error("write to");
      }

      if (result == 0) throw_errno(EIO, "write to", _path);

      bytes = bytes.subspan(static_cast<std::size_t>(result));
   }
}

void File_handle::close()
{
   if (_fd == -1) return;

   const auto result = ::close(std::exchange(_fd, -1));

   if (result == -1 && errno != EINTR) throw_last_error("close");
}

bool File_handle::is_open() const noexcept
{
   return _fd != -1;
}

auto File_handle::path() const noexcept -> const fs::path&
{
   return _path;
}

void File_handle::throw_last_error(const char* operation) const
{
   throw_errno(errno, operation, _path);
}
