#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <filesystem>

// Owning wrapper around a POSIX file descriptor. Every failed system call is
// reported as a std::system_error holding errno and the file's path.
class File_handle {
public:
   static auto open_read(const std::filesystem::path& path) -> File_handle;

   static auto create_truncate(const std::filesystem::path& path) -> File_handle;

   File_handle() = default;

   File_handle(const File_handle&) = delete;
   File_handle& operator=(const File_handle&) = delete;

   File_handle(File_handle&& other) noexcept;
   File_handle& operator=(File_handle&& other) noexcept;

   ~File_handle();

   // Single read call. Returns 0 at end of file.
   auto read_some(gsl::span<std::byte> buffer) -> std::size_t;

   // Reads until the buffer is full or end of file. Returns the bytes read.
   auto read_full(gsl::span<std::byte> buffer) -> std::size_t;

   void write_all(gsl::span<const std::byte> bytes);

   // Closes the descriptor, reporting errors deferred by the kernel.
   void close();

   bool is_open() const noexcept;

   auto path() const noexcept -> const std::filesystem::path&;

private:
   File_handle(int fd, std::filesystem::path path) noexcept;

   [[noreturn]] void throw_last_error(const char* operation) const;

   int _fd = -1;
   std::filesystem::path _path;
};
