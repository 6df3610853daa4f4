#include <bracket/file.hpp>
#include <bracket/log.hpp>

#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace bracket
{
   namespace
   {
      [[noreturn]] void throw_errno(int                          err,
                                    std::string_view             op,
                                    const std::filesystem::path& path)
      {
         throw std::system_error{err, std::generic_category(),
                                 std::string(op) + " " + path.native()};
      }

      // Used where there is no caller to report a failure to
      void close_quietly(int fd, const std::filesystem::path& path)
      {
         if (::close(fd) != 0)
         {
            auto err = errno;
            BRACKET_LOG(loggers::generic::get(), warning)
                << "close " << path.native() << ": " << std::generic_category().message(err);
         }
      }
   }  // namespace

   file& file::operator=(file&& other) noexcept
   {
      if (this != &other)
      {
         if (_fd != -1)
            close_quietly(_fd, _path);
         _fd   = std::exchange(other._fd, -1);
         _path = std::move(other._path);
      }
      return *this;
   }

   file::~file()
   {
      if (_fd != -1)
         close_quietly(_fd, _path);
   }

   file file::open(const std::filesystem::path& path, int flags, mode_t mode)
   {
      int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
      if (fd == -1)
         throw_errno(errno, "open", path);
      BRACKET_LOG(loggers::generic::get(), debug) << "opened " << path.native() << " as " << fd;
      return file{fd, path};
   }

   std::size_t file::read(std::span<char> buf)
   {
      while (true)
      {
         auto n = ::read(_fd, buf.data(), buf.size());
         if (n >= 0)
            return static_cast<std::size_t>(n);
         if (errno != EINTR)
            throw_errno(errno, "read", _path);
      }
   }

   std::size_t file::write(std::span<const char> buf)
   {
      while (true)
      {
         auto n = ::write(_fd, buf.data(), buf.size());
         if (n >= 0)
            return static_cast<std::size_t>(n);
         if (errno != EINTR)
            throw_errno(errno, "write", _path);
      }
   }

   void file::write_all(std::string_view data)
   {
      while (!data.empty())
      {
         auto n = write({data.data(), data.size()});
         data.remove_prefix(n);
      }
   }

   std::string file::read_all()
   {
      std::string result;
      char        buf[65536];
      while (auto n = read(buf))
      {
         result.append(buf, n);
      }
      return result;
   }

   void file::close()
   {
      // Linux releases the descriptor even when close reports an error,
      // so it must not be closed again.
      int fd = std::exchange(_fd, -1);
      if (fd == -1)
         throw_errno(EBADF, "close", _path);
      if (::close(fd) != 0)
         throw_errno(errno, "close", _path);
      BRACKET_LOG(loggers::generic::get(), debug) << "closed " << _path.native();
   }
}  // namespace bracket
