#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>

namespace bracket
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
         critical,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      // Replaces the console sink. Records below min_level are dropped.
      void configure(level min_level);
      // Reads the log-level option. Falls back to the default when it is absent.
      void configure(const boost::program_options::variables_map&);
      void configure_default();

      boost::program_options::options_description options();
   }  // namespace loggers

#define BRACKET_LOG(logger, log_level) BOOST_LOG_SEV(logger, ::bracket::loggers::level::log_level)
}  // namespace bracket
