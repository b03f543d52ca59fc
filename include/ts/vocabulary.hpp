/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, NewType and the shared error
 *        enumerations used across tetherstream.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Errors are returned as values; nothing in this header throws.
 */

#ifndef TS_VOCABULARY_HPP_
#define TS_VOCABULARY_HPP_

#include "ts/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace ts {

// ============================================================================
// Error Enumerations
// ============================================================================

/// @brief Errors reported by the configuration layer.
enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue  ///< Value present but outside its allowed range.
};

/// @brief Errors reported by TimerScheduler.
enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotRunning,
  kAlreadyRunning
};

/**
 * @brief Error kinds surfaced to callers through StatusSnapshot::last_error
 *        and DiscoverCamera().
 */
enum class ErrorKind : uint8_t {
  kNoTetheringInterface = 0,
  kSubnetUndetermined,
  kNoHostsFound,
  kEngineStartFailure,
  kStreamError,
  kReconnectExhausted
};

/// @brief Errors returned by session control calls.
enum class SessionError : uint8_t {
  kAlreadyRunning = 0,
  kNotRunning,
  kInvalidConfig,
  kEngineStartFailure
};

inline const char* ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNoTetheringInterface: return "NoTetheringInterface";
    case ErrorKind::kSubnetUndetermined:   return "SubnetUndetermined";
    case ErrorKind::kNoHostsFound:         return "NoHostsFound";
    case ErrorKind::kEngineStartFailure:   return "EngineStartFailure";
    case ErrorKind::kStreamError:          return "StreamError";
    case ErrorKind::kReconnectExhausted:   return "ReconnectExhausted";
  }
  return "Unknown";
}

inline const char* SessionErrorName(SessionError err) noexcept {
  switch (err) {
    case SessionError::kAlreadyRunning:     return "AlreadyRunning";
    case SessionError::kNotRunning:         return "NotRunning";
    case SessionError::kInvalidConfig:      return "InvalidConfig";
    case SessionError::kEngineStartFailure: return "EngineStartFailure";
  }
  return "Unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Minimal value-or-error holder.
 *
 * Construct through the success() / error() factories. Accessing value()
 * on an error (or get_error() on a value) is a programming error and trips
 * TS_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (&r.storage_) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (&r.storage_) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_),
                                    error_(other.error_) {
    if (has_value_) {
      ::new (&storage_) V(*other.Ptr());
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_), error_(other.error_) {
    if (has_value_) {
      ::new (&storage_) V(std::move(*other.Ptr()));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      error_ = other.error_;
      if (has_value_) {
        ::new (&storage_) V(*other.Ptr());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      error_ = other.error_;
      if (has_value_) {
        ::new (&storage_) V(std::move(*other.Ptr()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    TS_ASSERT(has_value_);
    return *Ptr();
  }
  const V& value() const& noexcept {
    TS_ASSERT(has_value_);
    return *Ptr();
  }
  V&& value() && noexcept {
    TS_ASSERT(has_value_);
    return std::move(*Ptr());
  }

  E get_error() const noexcept {
    TS_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? *Ptr() : fallback;
  }

 private:
  expected() noexcept : has_value_(false), error_() {}

  V* Ptr() noexcept { return std::launder(reinterpret_cast<V*>(&storage_)); }
  const V* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E error_;
};

/// @brief expected<void, E>: success carries no payload.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.has_value_ = false;
    r.error_ = e;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    TS_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept : has_value_(false), error_() {}

  bool has_value_;
  E error_;
};

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Minimal optional value holder (no exceptions on empty access).
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(*other.Ptr());
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(std::move(*other.Ptr()));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    TS_ASSERT(has_value_);
    return *Ptr();
  }
  const T& value() const noexcept {
    TS_ASSERT(has_value_);
    return *Ptr();
  }

  T value_or(const T& fallback) const {
    return has_value_ ? *Ptr() : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

  bool operator==(const optional& other) const {
    if (has_value_ != other.has_value_) {
      return false;
    }
    return !has_value_ || (*Ptr() == *other.Ptr());
  }
  bool operator!=(const optional& other) const { return !(*this == other); }

 private:
  T* Ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  const T* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// NewType - strong typedef
// ============================================================================

/**
 * @brief Wraps a primitive so that ids of different kinds do not mix.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : value_() {}
  constexpr explicit NewType(T v) noexcept : value_(v) {}

  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& o) const noexcept {
    return value_ == o.value_;
  }
  constexpr bool operator!=(const NewType& o) const noexcept {
    return value_ != o.value_;
  }

 private:
  T value_;
};

struct TimerTaskIdTag {};
struct SubscriberIdTag {};

using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;
using SubscriberId = NewType<uint32_t, SubscriberIdTag>;

}  // namespace ts

#endif  // TS_VOCABULARY_HPP_
