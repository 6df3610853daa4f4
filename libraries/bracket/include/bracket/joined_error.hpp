#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace bracket
{
   // Thrown when both the use of a resource and its release failed.
   // Both original exceptions are kept and can be rethrown with
   // their original types.
   class joined_error : public std::exception
   {
     public:
      joined_error(std::exception_ptr use_error, std::exception_ptr release_error);

      const char* what() const noexcept override;

      const std::exception_ptr& use_error() const noexcept { return _use_error; }
      const std::exception_ptr& release_error() const noexcept { return _release_error; }

      [[noreturn]] void rethrow_use_error() const;
      [[noreturn]] void rethrow_release_error() const;

     private:
      std::exception_ptr _use_error;
      std::exception_ptr _release_error;
      // Copies share the message without allocating
      std::runtime_error _message;
   };

   // The message of the exception held by e, or a placeholder
   // for exceptions that do not derive from std::exception.
   std::string describe(const std::exception_ptr& e);
}  // namespace bracket
