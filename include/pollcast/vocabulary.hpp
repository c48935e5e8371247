/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types for pollcast: ErrorCode, expected, FixedVector.
 *
 * Derived from newosp vocabulary (iceoryx inspired).
 * expected keeps its payload inline, FixedVector never allocates.
 */

#ifndef POLLCAST_VOCABULARY_HPP_
#define POLLCAST_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

// Assertion macro (no-op in release)
#ifndef POLLCAST_ASSERT
#define POLLCAST_ASSERT(cond) ((void)(cond))
#endif

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define POLLCAST_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define POLLCAST_THROW(ex)        \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace pollcast {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,

  // Transport (one connection only, never reaches the vote path)
  kBufferFull = 1,
  kBufferEmpty = 2,
  kHandshakeFailed = 3,
  kFrameParseError = 4,
  kConnectionClosed = 5,
  kInvalidState = 6,
  kSocketError = 7,
  kTimeout = 8,
  kMaxConnectionsExceeded = 9,

  // Domain (surfaced to callers as-is)
  kPollNotFound = 20,
  kOptionNotFound = 21,
  kPollClosed = 22,
  kInvalidArgument = 23,
  kAlreadyExists = 24,
  kUnknownSubscriber = 25,

  // Backend
  kBackendUnavailable = 30,

  kInternalError = 255
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kBufferFull: return "buffer full";
    case ErrorCode::kBufferEmpty: return "buffer empty";
    case ErrorCode::kHandshakeFailed: return "handshake failed";
    case ErrorCode::kFrameParseError: return "frame parse error";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kSocketError: return "socket error";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kMaxConnectionsExceeded: return "max connections exceeded";
    case ErrorCode::kPollNotFound: return "poll not found";
    case ErrorCode::kOptionNotFound: return "option not found";
    case ErrorCode::kPollClosed: return "poll closed";
    case ErrorCode::kInvalidArgument: return "invalid argument";
    case ErrorCode::kAlreadyExists: return "already exists";
    case ErrorCode::kUnknownSubscriber: return "unknown subscriber";
    case ErrorCode::kBackendUnavailable: return "backend unavailable";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown error";
}

// A send failure the channel cannot recover from; the subscriber is dropped.
// kBufferFull is not one: the peer is slow, not gone.
inline bool is_connection_failure(ErrorCode code) noexcept {
  return code == ErrorCode::kConnectionClosed || code == ErrorCode::kSocketError ||
         code == ErrorCode::kInvalidState;
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    POLLCAST_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    POLLCAST_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    POLLCAST_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value() : default_val; }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  void destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    POLLCAST_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// FixedVector<T, Capacity> - Stack-allocated fixed-capacity vector
// ============================================================================

/**
 * @brief Fixed-capacity vector with inline storage.
 *
 * @tparam T Element type
 * @tparam Capacity Maximum number of elements
 */
template <typename T, uint32_t Capacity>
class FixedVector final {
  static_assert(Capacity > 0U, "FixedVector capacity must be > 0");

 public:
  using value_type = T;
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept {}  // NOLINT
  ~FixedVector() noexcept { clear(); }

  FixedVector(const FixedVector&) = delete;
  FixedVector& operator=(const FixedVector&) = delete;

  T& operator[](uint32_t index) noexcept { return *reinterpret_cast<T*>(storage_ + index * sizeof(T)); }
  const T& operator[](uint32_t index) const noexcept {
    return *reinterpret_cast<const T*>(storage_ + index * sizeof(T));
  }

  T& back() noexcept { return (*this)[size_ - 1U]; }

  iterator begin() noexcept { return reinterpret_cast<T*>(storage_); }
  iterator end() noexcept { return begin() + size_; }
  const_iterator begin() const noexcept { return reinterpret_cast<const T*>(storage_); }
  const_iterator end() const noexcept { return begin() + size_; }

  [[nodiscard]] bool empty() const noexcept { return size_ == 0U; }
  [[nodiscard]] uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  [[nodiscard]] bool full() const noexcept { return size_ >= Capacity; }

  bool push_back(const T& value) noexcept { return emplace_back(value); }
  bool push_back(T&& value) noexcept { return emplace_back(static_cast<T&&>(value)); }

  template <typename... CtorArgs>
  bool emplace_back(CtorArgs&&... args) noexcept {
    if (size_ >= Capacity) {
      return false;
    }
    ::new (storage_ + size_ * sizeof(T)) T{static_cast<CtorArgs&&>(args)...};
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0U) {
      return false;
    }
    --size_;
    (*this)[size_].~T();
    return true;
  }

  // Swap-and-pop removal; element order is not preserved
  void erase_unordered(uint32_t index) noexcept {
    if (index >= size_) return;
    if (index < size_ - 1U) {
      (*this)[index] = static_cast<T&&>(back());
    }
    (void)pop_back();
  }

  void clear() noexcept {
    while (size_ > 0U) {
      --size_;
      (*this)[size_].~T();
    }
  }

 private:
  alignas(T) uint8_t storage_[sizeof(T) * Capacity];
  uint32_t size_{0U};
};

}  // namespace pollcast

#endif  // POLLCAST_VOCABULARY_HPP_
