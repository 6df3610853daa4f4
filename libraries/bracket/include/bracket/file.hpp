#pragma once

#include <bracket/bracket.hpp>

#include <fcntl.h>
#include <sys/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace bracket
{
   // Owns a POSIX file descriptor. close() is the release action used
   // by the with_* functions below and reports failure by throwing
   // std::system_error.
   class file
   {
     public:
      file() = default;
      file(int fd, std::filesystem::path path) : _fd(fd), _path(std::move(path)) {}
      file(file&& other) noexcept
          : _fd(std::exchange(other._fd, -1)), _path(std::move(other._path))
      {
      }
      file& operator=(file&& other) noexcept;
      ~file();

      static file open(const std::filesystem::path& path, int flags, mode_t mode = 0);

      // Returns 0 at end of file
      std::size_t read(std::span<char> buf);
      std::size_t write(std::span<const char> buf);
      void        write_all(std::string_view data);
      std::string read_all();

      // The descriptor is released even if close fails
      void close();

      int                          native_handle() const { return _fd; }
      bool                         is_open() const { return _fd != -1; }
      const std::filesystem::path& path() const { return _path; }

     private:
      file(const file&) = delete;
      int                   _fd = -1;
      std::filesystem::path _path;
   };

   template <typename Use>
      requires std::invocable<Use&, file&>
   use_result_t<Use, file> with_open_file(const std::filesystem::path& path,
                                          int                          flags,
                                          mode_t                       mode,
                                          Use&&                        use)
   {
      return with_resource([&] { return file::open(path, flags, mode); }, std::forward<Use>(use));
   }

   // Opens for reading
   template <typename Use>
      requires std::invocable<Use&, file&>
   use_result_t<Use, file> with_open(const std::filesystem::path& path, Use&& use)
   {
      return with_open_file(path, O_RDONLY, 0, std::forward<Use>(use));
   }

   // Creates or truncates, opened for reading and writing
   template <typename Use>
      requires std::invocable<Use&, file&>
   use_result_t<Use, file> with_create(const std::filesystem::path& path, Use&& use)
   {
      return with_open_file(path, O_RDWR | O_CREAT | O_TRUNC, 0666, std::forward<Use>(use));
   }
}  // namespace bracket
