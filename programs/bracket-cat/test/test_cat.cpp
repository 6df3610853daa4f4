#include "cat.hpp"

#include <bracket/joined_error.hpp>

#include "test_util.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace
{
   struct cat_result
   {
      int         status;
      std::string err;
   };

   cat_result run_cat(std::initializer_list<std::string> args)
   {
      std::vector<const char*> argv{"bracket-cat"};
      for (const auto& arg : args)
         argv.push_back(arg.c_str());
      std::ostringstream err;
      int status = bracket::cat::run(static_cast<int>(argv.size()), argv.data(), err);
      return {status, err.str()};
   }

   void write_file(const std::filesystem::path& path, std::string_view contents)
   {
      bracket::with_create(path, [&](bracket::file& f) { f.write_all(contents); });
   }

   std::string read_file(const std::filesystem::path& path)
   {
      return bracket::with_open(path, [](bracket::file& f) { return f.read_all(); });
   }
}  // namespace

TEST_CASE("copies inputs in order", "[bracket-cat]")
{
   log_defaults restore;
   tmp_dir      dir;
   write_file(dir / "a", "one\n");
   write_file(dir / "b", "two\n");
   auto result = run_cat({"-o", dir / "out", dir / "a", dir / "b"});
   CHECK(result.status == 0);
   CHECK(result.err.empty());
   CHECK(read_file(dir / "out") == "one\ntwo\n");
}

TEST_CASE("append or truncate the output", "[bracket-cat]")
{
   log_defaults restore;
   tmp_dir      dir;
   write_file(dir / "in", "more\n");
   write_file(dir / "out", "first\n");

   SECTION("append")
   {
      CHECK(run_cat({"--output", dir / "out", "--append", dir / "in"}).status == 0);
      CHECK(read_file(dir / "out") == "first\nmore\n");
   }
   SECTION("truncate")
   {
      CHECK(run_cat({"--output", dir / "out", dir / "in"}).status == 0);
      CHECK(read_file(dir / "out") == "more\n");
   }
}

TEST_CASE("config file options", "[bracket-cat]")
{
   log_defaults restore;
   tmp_dir      dir;
   write_file(dir / "in", "data");
   write_file(dir / "config", "output = " + (dir / "from-config").native() + "\n");

   SECTION("used when the command line is silent")
   {
      CHECK(run_cat({"-c", dir / "config", dir / "in"}).status == 0);
      CHECK(read_file(dir / "from-config") == "data");
   }
   SECTION("command line wins")
   {
      CHECK(run_cat({"-c", dir / "config", "-o", dir / "from-cmdline", dir / "in"}).status == 0);
      CHECK(read_file(dir / "from-cmdline") == "data");
      CHECK(!std::filesystem::exists(dir / "from-config"));
   }
   SECTION("missing config file")
   {
      auto result = run_cat({"-c", dir / "missing", dir / "in"});
      CHECK(result.status == 1);
      CHECK(result.err == "cannot read config file: " + (dir / "missing").native() + "\n");
   }
}

TEST_CASE("command line errors", "[bracket-cat]")
{
   log_defaults restore;
   tmp_dir      dir;

   SECTION("no input files")
   {
      auto result = run_cat({"-o", dir / "out"});
      CHECK(result.status == 1);
      CHECK(result.err == "bracket-cat: no input files\n");
      CHECK(!std::filesystem::exists(dir / "out"));
   }
   SECTION("missing input")
   {
      auto result = run_cat({"-o", dir / "out", dir / "missing"});
      CHECK(result.status == 1);
      CHECK(result.err.find("bracket-cat: open " + (dir / "missing").native()) == 0);
   }
   SECTION("bad log level")
   {
      auto result = run_cat({"--log-level", "loud", dir / "missing"});
      CHECK(result.status == 1);
      CHECK(result.err.find("loud") != std::string::npos);
   }
   SECTION("help")
   {
      auto result = run_cat({"--help"});
      CHECK(result.status == 1);
      CHECK(result.err.find("USAGE: bracket-cat [options] file...") == 0);
   }
}

TEST_CASE("errors are printed with both parts of a joined failure", "[bracket-cat]")
{
   std::ostringstream err;

   SECTION("joined")
   {
      bracket::cat::print_error(
          err, bracket::joined_error{std::make_exception_ptr(std::runtime_error("read in")),
                                     std::make_exception_ptr(std::runtime_error("close out"))});
      CHECK(err.str() == "bracket-cat: read in\nbracket-cat: while closing: close out\n");
   }
   SECTION("single")
   {
      bracket::cat::print_error(err, std::runtime_error("open in"));
      CHECK(err.str() == "bracket-cat: open in\n");
   }
}
