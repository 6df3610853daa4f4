#include <bracket/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/make_shared.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace bracket::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   namespace
   {
      template <typename S, typename T>
      void format_timestamp(S& os, const T& timestamp)
      {
         auto date = std::chrono::floor<std::chrono::days>(timestamp);
         auto ymd  = std::chrono::year_month_day(date);
         auto time = std::chrono::hh_mm_ss(
             std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - date));
         os << std::setfill('0');
         os << std::setw(4) << (int)ymd.year() << '-' << std::setw(2) << (unsigned)ymd.month()
            << '-' << std::setw(2) << (unsigned)ymd.day();
         os << 'T' << std::setw(2) << time.hours().count() << ':' << std::setw(2)
            << time.minutes().count() << ':' << std::setw(2) << time.seconds().count() << '.'
            << std::setw(3) << time.subseconds().count() << 'Z';
         os << std::setfill(' ');
      }

      const char* level_name(level l)
      {
         switch (l)
         {
            case level::debug:
               return "debug";
            case level::info:
               return "info";
            case level::notice:
               return "notice";
            case level::warning:
               return "warning";
            case level::error:
               return "error";
            case level::critical:
               return "critical";
         }
         __builtin_unreachable();
      }

      // [TimeStamp] [Severity]: Message
      auto console_formatter =
          [](const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         if (auto timestamp =
                 boost::log::extract<std::chrono::system_clock::time_point>("TimeStamp", rec))
         {
            os << '[';
            format_timestamp(os, *timestamp);
            os << "] ";
         }
         if (auto l = boost::log::extract<level>("Severity", rec))
         {
            os << '[' << level_name(*l) << "]: ";
         }
         if (auto attr = rec[boost::log::expressions::smessage])
         {
            os << *attr;
         }
      };

      using console_sink =
          boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

      struct log_config
      {
         static log_config& instance()
         {
            static log_config result;
            return result;
         }

         void set(level min_level)
         {
            std::lock_guard lock{mutex};
            auto            core    = boost::log::core::get();
            auto            backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);
            auto next = boost::make_shared<console_sink>(backend);
            next->set_filter(
                [min_level](const boost::log::attribute_value_set& attrs)
                {
                   auto l = boost::log::extract<level>("Severity", attrs);
                   return !l || *l >= min_level;
                });
            next->set_formatter(console_formatter);
            if (sink)
            {
               core->remove_sink(sink);
            }
            core->add_sink(next);
            sink = std::move(next);
         }

        private:
         log_config()
         {
            boost::log::core::get()->add_global_attribute(
                "TimeStamp", boost::log::attributes::function<std::chrono::system_clock::time_point>(
                                 []() { return std::chrono::system_clock::now(); }));
         }

         std::mutex                      mutex;
         boost::shared_ptr<console_sink> sink;
      };
   }  // namespace

   void configure(level min_level)
   {
      log_config::instance().set(min_level);
   }

   void configure(const boost::program_options::variables_map& map)
   {
      auto iter = map.find("log-level");
      if (iter != map.end() && !iter->second.empty())
      {
         configure(iter->second.as<level>());
      }
      else
      {
         configure_default();
      }
   }

   void configure_default()
   {
      configure(level::warning);
   }

   boost::program_options::options_description options()
   {
      namespace po = boost::program_options;
      po::options_description desc("Logging");
      desc.add_options()("log-level",
                         po::value<level>()->default_value(level::warning)->value_name("level"),
                         "Minimum severity of log records: debug, info, notice, warning, error, "
                         "or critical");
      return desc;
   }

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      return os << level_name(l);
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "debug")
         {
            l = level::debug;
         }
         else if (s == "info")
         {
            l = level::info;
         }
         else if (s == "notice")
         {
            l = level::notice;
         }
         else if (s == "warning")
         {
            l = level::warning;
         }
         else if (s == "error")
         {
            l = level::error;
         }
         else if (s == "critical")
         {
            l = level::critical;
         }
         else
         {
            throw std::runtime_error("not a valid log level: \"" + s + "\"");
         }
      }
      return is;
   }
}  // namespace bracket::loggers
