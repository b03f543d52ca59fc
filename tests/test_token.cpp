/**
 * @file test_token.cpp
 * @brief Tests for token.hpp
 */

#include "ts/token.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <string>

namespace {

std::string TempPath(const char* tag) {
  return std::string("/tmp/ts_token_") + tag + "_" +
         std::to_string(static_cast<long>(::getpid()));
}

void WriteText(const std::string& path, const char* text) {
  FILE* f = std::fopen(path.c_str(), "w");
  REQUIRE(f != nullptr);
  std::fputs(text, f);
  std::fclose(f);
}

std::string ReadText(const std::string& path) {
  FILE* f = std::fopen(path.c_str(), "r");
  REQUIRE(f != nullptr);
  char buf[64] = {0};
  const bool got = std::fgets(buf, sizeof(buf), f) != nullptr;
  std::fclose(f);
  return got ? std::string(buf) : std::string();
}

}  // namespace

TEST_CASE("IsValidToken", "[token]") {
  REQUIRE(ts::IsValidToken("a1b2c3d4e5f6a7b8"));
  REQUIRE_FALSE(ts::IsValidToken("a1b2c3d4e5f6a7b"));
  REQUIRE_FALSE(ts::IsValidToken("A1B2C3D4E5F6A7B8"));
  REQUIRE_FALSE(ts::IsValidToken("g1b2c3d4e5f6a7b8"));
  REQUIRE_FALSE(ts::IsValidToken(""));
}

TEST_CASE("GenerateToken yields distinct valid tokens", "[token]") {
  auto a = ts::GenerateToken();
  auto b = ts::GenerateToken();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(ts::IsValidToken(a.value()));
  REQUIRE(ts::IsValidToken(b.value()));
  REQUIRE(a.value() != b.value());
}

TEST_CASE("LoadOrCreateToken creates then reuses", "[token]") {
  const std::string path = TempPath("create");
  std::remove(path.c_str());

  auto first = ts::LoadOrCreateToken(path.c_str());
  REQUIRE(first.has_value());
  REQUIRE(ts::IsValidToken(first.value()));
  REQUIRE(ReadText(path) == first.value() + "\n");

  struct stat st;
  REQUIRE(::stat(path.c_str(), &st) == 0);
  REQUIRE((st.st_mode & 0777) == 0600);

  auto second = ts::LoadOrCreateToken(path.c_str());
  REQUIRE(second.has_value());
  REQUIRE(second.value() == first.value());
  std::remove(path.c_str());
}

TEST_CASE("LoadOrCreateToken replaces a malformed file", "[token]") {
  const std::string path = TempPath("malformed");
  WriteText(path, "not-a-token\n");
  auto t = ts::LoadOrCreateToken(path.c_str());
  REQUIRE(t.has_value());
  REQUIRE(ts::IsValidToken(t.value()));
  REQUIRE(ReadText(path) == t.value() + "\n");
  std::remove(path.c_str());
}

TEST_CASE("LoadOrCreateToken accepts trailing whitespace", "[token]") {
  const std::string path = TempPath("ws");
  WriteText(path, "0123456789abcdef \r\n");
  auto t = ts::LoadOrCreateToken(path.c_str());
  REQUIRE(t.has_value());
  REQUIRE(t.value() == "0123456789abcdef");
  std::remove(path.c_str());
}

TEST_CASE("RegenerateToken overwrites the stored token", "[token]") {
  const std::string path = TempPath("regen");
  WriteText(path, "0123456789abcdef\n");
  auto t = ts::RegenerateToken(path.c_str());
  REQUIRE(t.has_value());
  REQUIRE(t.value() != "0123456789abcdef");
  REQUIRE(ts::LoadOrCreateToken(path.c_str()).value() == t.value());
  std::remove(path.c_str());
}

TEST_CASE("Token store in a missing directory fails to write", "[token]") {
  auto t = ts::LoadOrCreateToken("/nonexistent/dir/token");
  REQUIRE_FALSE(t.has_value());
  REQUIRE(t.get_error() == ts::TokenError::kWriteFailed);
}
