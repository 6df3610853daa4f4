#pragma once

#include <bracket/file.hpp>

#include <exception>
#include <iosfwd>
#include <string>
#include <vector>

namespace bracket::cat
{
   struct options
   {
      std::string              output;
      bool                     append = false;
      std::vector<std::string> inputs;
   };

   void copy_all(const std::vector<std::string>& inputs, file& out);

   // Copies the inputs to the output named by opts, or to stdout
   void copy(const options& opts);

   // Both parts of a joined_error are printed, one per line
   void print_error(std::ostream& err, const std::exception& e);

   // Parses the command line and an optional config file, then copies.
   // Returns the exit status. Errors and usage go to err.
   int run(int argc, const char* const argv[], std::ostream& err);
}  // namespace bracket::cat
