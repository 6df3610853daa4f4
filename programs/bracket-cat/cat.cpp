#include "cat.hpp"

#include <bracket/bracket.hpp>
#include <bracket/joined_error.hpp>
#include <bracket/log.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cerrno>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace bracket::cat
{
   namespace
   {
      const char usage[] = "USAGE: bracket-cat [options] file...";

      std::size_t copy_file(const std::string& input, file& out)
      {
         return with_open(input,
                          [&](file& in)
                          {
                             std::size_t total = 0;
                             char        buf[65536];
                             while (auto n = in.read(buf))
                             {
                                out.write_all({buf, n});
                                total += n;
                             }
                             return total;
                          });
      }

      // Writes to a duplicate of stdout, so that a failure to flush the
      // output when it is closed is reported.
      void copy_to_stdout(const std::vector<std::string>& inputs)
      {
         with_resource(
             []
             {
                int fd = ::dup(STDOUT_FILENO);
                if (fd == -1)
                   throw std::system_error{errno, std::generic_category(), "dup stdout"};
                return file{fd, "<stdout>"};
             },
             [&](file& out) { copy_all(inputs, out); });
      }
   }  // namespace

   void copy_all(const std::vector<std::string>& inputs, file& out)
   {
      for (const auto& input : inputs)
      {
         auto n = copy_file(input, out);
         BRACKET_LOG(loggers::generic::get(), info)
             << "copied " << n << " bytes from " << input << " to " << out.path().native();
      }
   }

   void copy(const options& opts)
   {
      if (opts.inputs.empty())
         throw std::runtime_error("no input files");

      if (opts.output.empty())
      {
         copy_to_stdout(opts.inputs);
      }
      else if (opts.append)
      {
         with_open_file(opts.output, O_WRONLY | O_CREAT | O_APPEND, 0666,
                        [&](file& out) { copy_all(opts.inputs, out); });
      }
      else
      {
         with_create(opts.output, [&](file& out) { copy_all(opts.inputs, out); });
      }
   }

   void print_error(std::ostream& err, const std::exception& e)
   {
      if (auto* joined = dynamic_cast<const joined_error*>(&e))
      {
         err << "bracket-cat: " << describe(joined->use_error()) << "\n";
         err << "bracket-cat: while closing: " << describe(joined->release_error()) << "\n";
      }
      else
      {
         err << "bracket-cat: " << e.what() << "\n";
      }
   }

   int run(int argc, const char* const argv[], std::ostream& err)
   {
      options     opts;
      std::string config;

      namespace po = boost::program_options;

      po::options_description common_opts("Options");
      auto                    opt = common_opts.add_options();
      opt("output,o", po::value(&opts.output)->default_value("")->value_name("path"),
          "Write to this file instead of stdout. The file is created or truncated.");
      opt("append", po::bool_switch(&opts.append), "Append to --output instead of truncating it");
      common_opts.add(loggers::options());

      po::options_description desc("bracket-cat");
      desc.add(common_opts);
      auto add_cmdonly = [&](auto& group)
      {
         group.add_options()("help,h", "Show this message")(
             "config,c", po::value(&config)->value_name("path"), "Read options from this file");
      };
      add_cmdonly(desc);

      po::options_description hidden;
      hidden.add_options()("input", po::value(&opts.inputs)->composing(), "Input files");
      po::options_description cmdline;
      cmdline.add(desc).add(hidden);

      po::positional_options_description positional;
      positional.add("input", -1);

      po::variables_map vm;
      try
      {
         po::store(
             po::command_line_parser(argc, argv).options(cmdline).positional(positional).run(),
             vm);
         if (vm.count("config"))
         {
            auto          path = vm["config"].as<std::string>();
            std::ifstream in(path);
            if (!in)
               throw std::runtime_error("cannot read config file: " + path);
            // Values given on the command line take precedence
            po::store(po::parse_config_file(in, common_opts), vm);
         }
         po::notify(vm);
      }
      catch (std::exception& e)
      {
         if (!vm.count("help"))
         {
            err << e.what() << "\n";
            return 1;
         }
      }

      if (vm.count("help"))
      {
         err << usage << "\n\n";
         err << desc << "\n";
         return 1;
      }

      try
      {
         loggers::configure(vm);
         copy(opts);
      }
      catch (std::exception& e)
      {
         print_error(err, e);
         return 1;
      }
      return 0;
   }
}  // namespace bracket::cat
