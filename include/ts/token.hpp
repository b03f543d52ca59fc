/**
 * @file token.hpp
 * @brief Stream path token: generation from the kernel CSPRNG and a small
 *        file-backed store that keeps it stable across runs.
 */

#ifndef TS_TOKEN_HPP_
#define TS_TOKEN_HPP_

#include "ts/log.hpp"
#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#include <fcntl.h>
#include <sys/random.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace ts {

static constexpr uint32_t kTokenBytes = 8U;
static constexpr uint32_t kTokenLength = kTokenBytes * 2U;

enum class TokenError : uint8_t {
  kRandomUnavailable = 0,
  kReadFailed,
  kWriteFailed
};

/// @brief 16 lowercase hex characters.
inline bool IsValidToken(const std::string& token) noexcept {
  if (token.size() != kTokenLength) return false;
  for (char c : token) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

/// @brief Fresh token from getrandom(2).
inline expected<std::string, TokenError> GenerateToken() {
  uint8_t bytes[kTokenBytes];
  size_t filled = 0;
  while (filled < sizeof(bytes)) {
    ssize_t n = ::getrandom(bytes + filled, sizeof(bytes) - filled, 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      TS_LOG_ERROR("Token", "getrandom failed: %s", std::strerror(errno));
      return expected<std::string, TokenError>::error(
          TokenError::kRandomUnavailable);
    }
    filled += static_cast<size_t>(n);
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string token;
  token.reserve(kTokenLength);
  for (uint8_t b : bytes) {
    token.push_back(kHex[b >> 4]);
    token.push_back(kHex[b & 0x0F]);
  }
  return expected<std::string, TokenError>::success(std::move(token));
}

// ============================================================================
// Token file store
// ============================================================================

namespace detail {

inline expected<void, TokenError> WriteTokenFile(const char* path,
                                                 const std::string& token) {
  int fd = ::open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    TS_LOG_ERROR("Token", "cannot write %s: %s", path, std::strerror(errno));
    return expected<void, TokenError>::error(TokenError::kWriteFailed);
  }
  const std::string line = token + "\n";
  ssize_t n = ::write(fd, line.data(), line.size());
  ::close(fd);
  if (n != static_cast<ssize_t>(line.size())) {
    return expected<void, TokenError>::error(TokenError::kWriteFailed);
  }
  return expected<void, TokenError>::success();
}

}  // namespace detail

/**
 * @brief Replace the stored token with a new one.
 * @return The new token.
 */
inline expected<std::string, TokenError> RegenerateToken(const char* path) {
  auto token = GenerateToken();
  if (!token.has_value()) {
    return token;
  }
  auto w = detail::WriteTokenFile(path, token.value());
  if (!w.has_value()) {
    return expected<std::string, TokenError>::error(w.get_error());
  }
  TS_LOG_INFO("Token", "generated new stream token in %s", path);
  return token;
}

/**
 * @brief Stored token, creating and persisting one on first use.
 *
 * A missing, empty or malformed file is treated as "no token yet".
 */
inline expected<std::string, TokenError> LoadOrCreateToken(const char* path) {
  FILE* f = std::fopen(path, "r");
  if (f != nullptr) {
    char buf[64] = {0};
    const bool got = std::fgets(buf, sizeof(buf), f) != nullptr;
    (void)std::fclose(f);
    std::string token = got ? std::string(buf) : std::string();
    while (!token.empty() && (token.back() == '\n' || token.back() == '\r' ||
                              token.back() == ' ')) {
      token.pop_back();
    }
    if (IsValidToken(token)) {
      return expected<std::string, TokenError>::success(std::move(token));
    }
    TS_LOG_WARN("Token", "ignoring malformed token in %s", path);
  } else if (errno != ENOENT) {
    TS_LOG_ERROR("Token", "cannot read %s: %s", path, std::strerror(errno));
    return expected<std::string, TokenError>::error(TokenError::kReadFailed);
  }
  return RegenerateToken(path);
}

}  // namespace ts

#endif  // TS_TOKEN_HPP_
