#include <bracket/joined_error.hpp>

#include <utility>

namespace bracket
{
   std::string describe(const std::exception_ptr& e)
   {
      if (!e)
         return "no error";
      try
      {
         std::rethrow_exception(e);
      }
      catch (const std::exception& ex)
      {
         return ex.what();
      }
      catch (...)
      {
         return "unknown exception";
      }
   }

   joined_error::joined_error(std::exception_ptr use_error, std::exception_ptr release_error)
       : _use_error(std::move(use_error)),
         _release_error(std::move(release_error)),
         // Same layout as a list of errors: one message per line
         _message(describe(_use_error) + "\n" + describe(_release_error))
   {
   }

   const char* joined_error::what() const noexcept
   {
      return _message.what();
   }

   void joined_error::rethrow_use_error() const
   {
      std::rethrow_exception(_use_error);
   }

   void joined_error::rethrow_release_error() const
   {
      std::rethrow_exception(_release_error);
   }
}  // namespace bracket
