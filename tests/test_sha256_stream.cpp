#include "crypto/Sha256Stream.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

#include <catch2/catch.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace tessera;
using namespace tessera_test;

static std::string pseudo_random_bytes(size_t n) {
    std::string s(n, '\0');
    uint32_t x = 0x12345678u;
    for (size_t i = 0; i < n; ++i) {
        x = x * 1664525u + 1013904223u;
        s[i] = static_cast<char>(x >> 24);
    }
    return s;
}

TEST_CASE("sha256 known digests")
{
   CHECK(Sha256Stream::hash_bytes("hello") == HELLO_SHA256);
   CHECK(Sha256Stream::hash_bytes("") ==
         "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
   CHECK(Sha256Stream::hash_bytes("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("sha256 digest does not depend on chunking")
{
   const std::string data = pseudo_random_bytes(100003);
   const std::string whole = Sha256Stream::hash_bytes(data);

   for (size_t chunk : {size_t(1), size_t(7), size_t(64), size_t(8192), size_t(1 << 20)})
   {
      std::istringstream in(data);
      CHECK(Sha256Stream::hash_stream(in, "mem", chunk) == whole);
   }

   Sha256Stream h;
   h.update(data.substr(0, 10));
   h.update(data.substr(10));
   CHECK(h.hex_digest() == whole);
}

TEST_CASE("sha256 one changed byte changes the digest")
{
   std::string data = pseudo_random_bytes(4096);
   const std::string before = Sha256Stream::hash_bytes(data);
   data[2048] = static_cast<char>(data[2048] ^ 0x01);
   CHECK(Sha256Stream::hash_bytes(data) != before);
}

TEST_CASE("sha256 of a file matches in-memory digest")
{
   TempDir dir;
   const std::string path = dir.file("artifact.bin");
   const std::string data = pseudo_random_bytes(20000);
   {
      std::ofstream f(path, std::ios::binary);
      f.write(data.data(), static_cast<std::streamsize>(data.size()));
   }
   CHECK(Sha256Stream::hash_file(path) == Sha256Stream::hash_bytes(data));
   CHECK(Sha256Stream::hash_file(path, 3) == Sha256Stream::hash_bytes(data));
   CHECK(Sha256Stream::hash_file(path).size() == Sha256Stream::HEX_LEN);
}

TEST_CASE("sha256 missing artifact is an I/O error naming the path")
{
   TempDir dir;
   const std::string path = dir.file("nope.tar");
   try
   {
      Sha256Stream::hash_file(path);
      FAIL("expected IoError");
   }
   catch (const IoError& e)
   {
      CHECK(e.path() == path);
   }
}

TEST_CASE("sha256 stream that fails mid-read yields no digest")
{
   std::istringstream in("partial");
   in.setstate(std::ios::badbit);
   CHECK_THROWS_AS(Sha256Stream::hash_stream(in, "broken"), IoError);
}

TEST_CASE("sha256 digest can only be taken once")
{
   Sha256Stream h;
   h.update("x");
   h.hex_digest();
   CHECK_THROWS_AS(h.hex_digest(), std::logic_error);
   CHECK_THROWS_AS(h.update("y"), std::logic_error);
}
