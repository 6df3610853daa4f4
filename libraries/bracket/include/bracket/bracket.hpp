#pragma once

#include <bracket/joined_error.hpp>
#include <bracket/log.hpp>

#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace bracket
{
   template <typename Acquire>
   using resource_t = std::decay_t<std::invoke_result_t<Acquire&>>;

   template <typename Use, typename R>
   using use_result_t = std::invoke_result_t<Use&, R&>;

   // A release action reports failure by throwing. Anything it returned
   // would be discarded, so it must return void.
   template <typename F, typename R>
   concept release_for = std::invocable<F&, R&> && std::is_void_v<std::invoke_result_t<F&, R&>>;

   template <typename F, typename R>
   concept nothrow_release_for = release_for<F, R> && std::is_nothrow_invocable_v<F&, R&>;

   namespace detail
   {
      template <typename R>
      concept has_close = requires(R& r) {
         { r.close() } -> std::same_as<void>;
      };

      template <typename R>
      concept has_pointee_close = requires(R& r) {
         { r->close() } -> std::same_as<void>;
      };

      template <has_close R>
      void close_resource(R& r) noexcept(noexcept(r.close()))
      {
         r.close();
      }

      template <has_pointee_close R>
         requires(!has_close<R>)
      void close_resource(R& r) noexcept(noexcept(r->close()))
      {
         r->close();
      }

      // Must be called from a handler of the use failure. Never returns:
      // rethrows the use failure, or the joined failure if release also fails.
      //
      // A forced unwind (thread cancellation) is caught by catch (...) but
      // has no exception_ptr. It must leave through a plain rethrow, so a
      // release failure during the unwind is logged and dropped.
      template <typename Release, typename R>
      [[noreturn]] void release_after_failure(Release& release, R& resource)
      {
         auto use_error = std::current_exception();
         try
         {
            std::invoke(release, resource);
         }
         catch (...)
         {
            if (use_error)
            {
               joined_error joined{use_error, std::current_exception()};
               BRACKET_LOG(loggers::generic::get(), debug)
                   << "release failed after use failed: " << joined.what();
               throw joined;
            }
            BRACKET_LOG(loggers::generic::get(), warning)
                << "release failed during unwind: " << describe(std::current_exception());
         }
         throw;
      }
   }  // namespace detail

   // A resource that releases itself with close(), either as a member
   // or through a pointer-like handle.
   template <typename R>
   concept closeable = requires(R& r) { detail::close_resource(r); };

   template <typename R>
   concept nothrow_closeable = closeable<R> && requires(R& r) {
      { detail::close_resource(r) } noexcept;
   };

   /**
    * Acquires a resource, passes it to use, and releases it.
    *
    * release runs exactly once if and only if acquire returns, whether
    * use returns or throws. The outcome:
    *
    * - acquire throws: that exception, use and release never run
    * - use throws, release returns: the use exception
    * - use returns, release throws: the release exception
    * - both throw: joined_error holding both exceptions
    * - otherwise: the value returned by use
    */
   template <typename Acquire, typename Release, typename Use>
      requires std::invocable<Acquire&> && release_for<Release, resource_t<Acquire>> &&
               std::invocable<Use&, resource_t<Acquire>&>
   use_result_t<Use, resource_t<Acquire>> bracket(Acquire&& acquire, Release&& release, Use&& use)
   {
      auto resource = std::invoke(acquire);
      using result_type = use_result_t<Use, resource_t<Acquire>>;
      if constexpr (std::is_void_v<result_type>)
      {
         try
         {
            std::invoke(use, resource);
         }
         catch (...)
         {
            detail::release_after_failure(release, resource);
         }
         std::invoke(release, resource);
      }
      else
      {
         result_type result = [&]() -> result_type
         {
            try
            {
               return std::invoke(use, resource);
            }
            catch (...)
            {
               detail::release_after_failure(release, resource);
            }
         }();
         std::invoke(release, resource);
         return result;
      }
   }

   // Same as bracket for a release that cannot fail. joined_error is never thrown.
   template <typename Acquire, typename Release, typename Use>
      requires std::invocable<Acquire&> && nothrow_release_for<Release, resource_t<Acquire>> &&
               std::invocable<Use&, resource_t<Acquire>&>
   use_result_t<Use, resource_t<Acquire>> bracket_infallible(Acquire&& acquire,
                                                             Release&& release,
                                                             Use&&     use)
   {
      return bracket(
          std::forward<Acquire>(acquire),
          [&release](resource_t<Acquire>& r) noexcept { std::invoke(release, r); },
          std::forward<Use>(use));
   }

   // bracket with the resource's own close() as the release action
   template <typename Acquire, typename Use>
      requires std::invocable<Acquire&> && closeable<resource_t<Acquire>> &&
               std::invocable<Use&, resource_t<Acquire>&>
   use_result_t<Use, resource_t<Acquire>> with_resource(Acquire&& acquire, Use&& use)
   {
      return bracket(
          std::forward<Acquire>(acquire),
          [](resource_t<Acquire>& r) { detail::close_resource(r); }, std::forward<Use>(use));
   }

   template <typename Acquire, typename Use>
      requires std::invocable<Acquire&> && nothrow_closeable<resource_t<Acquire>> &&
               std::invocable<Use&, resource_t<Acquire>&>
   use_result_t<Use, resource_t<Acquire>> with_resource_infallible(Acquire&& acquire, Use&& use)
   {
      return bracket_infallible(
          std::forward<Acquire>(acquire),
          [](resource_t<Acquire>& r) noexcept { detail::close_resource(r); },
          std::forward<Use>(use));
   }
}  // namespace bracket
