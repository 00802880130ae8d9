#include "artifact/ReproPackage.hpp"
#include "crypto/Sha256Stream.hpp"
#include "training/ReferenceTrainer.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

#include <catch2/catch.hpp>
#include <fstream>

using namespace tessera;
using namespace tessera_test;
using json = nlohmann::json;

static void write_text(const std::string& path, const std::string& text)
{
   std::ofstream f(path, std::ios::binary);
   f << text;
}

static unsigned header_checksum(const std::string& block)
{
   unsigned sum = 0;
   for (size_t i = 0; i < 512; ++i)
   {
      unsigned char c = (i >= 148 && i < 156) ? ' ' : static_cast<unsigned char>(block[i]);
      sum += c;
   }
   return sum;
}

TEST_CASE("archive layout")
{
   ReproPackage pkg;
   pkg.add_file("a.txt", "hello");
   pkg.add_file("dir/b.bin", std::string(600, 'x'));
   CHECK(pkg.entry_count() == 2);

   const std::string bytes = pkg.archive_bytes();
   // header + 1 data block, header + 2 data blocks, 2 end blocks
   REQUIRE(bytes.size() == 512 * 7);
   CHECK(bytes.compare(0, 5, "a.txt") == 0);
   CHECK(bytes.compare(257, 5, "ustar") == 0);
   CHECK(bytes.compare(512, 5, "hello") == 0);
   CHECK(bytes.compare(1024, 9, "dir/b.bin") == 0);
   CHECK(bytes.substr(512 * 5) == std::string(1024, '\0'));

   const std::string header = bytes.substr(0, 512);
   CHECK(std::stoul(header.substr(148, 6), nullptr, 8) == header_checksum(header));
   CHECK(std::stoul(header.substr(124, 11), nullptr, 8) == 5u);
}

TEST_CASE("archive bytes are deterministic")
{
   auto build = [](const std::string& lr) {
      ReproPackage pkg;
      pkg.add_file("hyperparameters.json", R"({"lr": )" + lr + "}\n");
      pkg.add_file("train.py", "print('x')\n");
      return pkg.archive_bytes();
   };
   CHECK(Sha256Stream::hash_bytes(build("0.001")) == Sha256Stream::hash_bytes(build("0.001")));
   CHECK(Sha256Stream::hash_bytes(build("0.001")) != Sha256Stream::hash_bytes(build("0.002")));
}

TEST_CASE("archive entry names are validated")
{
   ReproPackage pkg;
   CHECK_THROWS_AS(pkg.add_file("", "x"), MalformedInput);
   CHECK_THROWS_AS(pkg.add_file("/etc/passwd", "x"), MalformedInput);
   CHECK_THROWS_AS(pkg.add_file("../up", "x"), MalformedInput);
   CHECK_THROWS_AS(pkg.add_file(std::string(100, 'n'), "x"), MalformedInput);
   pkg.add_file("ok", "x");
   CHECK_THROWS_AS(pkg.add_file("ok", "y"), MalformedInput);
   CHECK(pkg.entry_count() == 1);
}

TEST_CASE("repro package on disk")
{
   TempDir           dir;
   const std::string tmpl = dir.file("train.py");
   const std::string out  = dir.file("repro.tar");
   write_text(tmpl, "print('train')\n");

   json hyper = json::parse(R"({"lr":0.001,"epochs":3})");
   const std::string bytes = build_repro_package(hyper, tmpl, out);

   CHECK(bytes.size() % 512 == 0);
   CHECK(Sha256Stream::hash_file(out) == Sha256Stream::hash_bytes(bytes));
   CHECK(read_file_bytes(out) == bytes);
   CHECK(bytes.find("print('train')") != std::string::npos);
   CHECK(bytes.find("\"epochs\": 3") != std::string::npos);

   SECTION("rebuild gives the same digest")
   {
      const std::string again = build_repro_package(hyper, tmpl, dir.file("repro2.tar"));
      CHECK(Sha256Stream::hash_bytes(again) == Sha256Stream::hash_bytes(bytes));
   }

   SECTION("missing template is an I/O error")
   {
      const std::string missing = dir.file("nope.py");
      try
      {
         build_repro_package(hyper, missing, dir.file("x.tar"));
         FAIL("expected IoError");
      }
      catch (const IoError& e)
      {
         CHECK(e.path() == missing);
      }
   }

   SECTION("hyperparameters must be an object")
   {
      CHECK_THROWS_AS(build_repro_package(json::array(), tmpl, dir.file("y.tar")), MalformedInput);
   }
}

TEST_CASE("reference trainer score")
{
   CHECK(ReferenceTrainer::score(json::parse(R"({"lr":0.001})")) == 0.9);
   CHECK(ReferenceTrainer::score(json::parse(R"({"lr":0.002})")) == 0.91);
   CHECK(ReferenceTrainer::score(json::object()) == 0.89);
   CHECK(ReferenceTrainer::score(json::parse(R"({"lr":0.001})")) ==
         ReferenceTrainer::score(json::parse(R"({"lr":0.001,"layers":[1,2]})")));
   CHECK_THROWS_AS(ReferenceTrainer::score(json::parse(R"({"lr":"fast"})")), MalformedInput);
}
