/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
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
 * @brief Vocabulary types shared by every ferry module.
 *
 * Header-only, C++17.
 *   - expected<V, E> : value-or-error return type used by all fallible calls.
 *   - ScopeGuard     : run a cleanup callable on scope exit.
 *   - ConfigError    : configuration loading errors (config.hpp, settings.hpp).
 */

#ifndef FERRY_VOCABULARY_HPP_
#define FERRY_VOCABULARY_HPP_

#include "ferry/platform.hpp"

#include <cstdint>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace ferry {

// ============================================================================
// Shared error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kBufferFull,
  kInvalidValue,
  kMissingValue
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the static factories:
 * @code
 *   return expected<int, ConfigError>::success(42);
 *   return expected<int, ConfigError>::error(ConfigError::kParseError);
 * @endcode
 *
 * E is expected to be a small trivially copyable enum.
 */
template <typename V, typename E>
class expected final {
  static_assert(std::is_trivially_copyable<E>::value,
                "expected<V, E>: E must be trivially copyable");

 public:
  static expected success(const V& v) {
    expected r;
    r.ConstructValue(v);
    return r;
  }

  static expected success(V&& v) {
    expected r;
    r.ConstructValue(static_cast<V&&>(v));
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(false), err_(other.err_) {
    if (other.has_value_) ConstructValue(other.Ref());
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(false), err_(other.err_) {
    if (other.has_value_) ConstructValue(static_cast<V&&>(other.Ref()));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) ConstructValue(other.Ref());
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) ConstructValue(static_cast<V&&>(other.Ref()));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    FERRY_ASSERT(has_value_);
    return Ref();
  }

  const V& value() const& noexcept {
    FERRY_ASSERT(has_value_);
    return Ref();
  }

  V&& value() && noexcept {
    FERRY_ASSERT(has_value_);
    return static_cast<V&&>(Ref());
  }

  E get_error() const noexcept {
    FERRY_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? Ref() : fallback;
  }

 private:
  expected() noexcept : has_value_(false), err_() {}

  template <typename U>
  void ConstructValue(U&& v) {
    ::new (static_cast<void*>(&storage_)) V(static_cast<U&&>(v));
    has_value_ = true;
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  V& Ref() noexcept { return *std::launder(reinterpret_cast<V*>(&storage_)); }
  const V& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const V*>(&storage_));
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E err_;
};

/** @brief Specialization for operations that return nothing on success. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E()); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    FERRY_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), err_(e) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a cleanup callable when the guard leaves scope.
 *
 * Call release() to cancel the cleanup (e.g. after a successful commit).
 * Move-only.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> fn) : fn_(std::move(fn)) {}

  ~ScopeGuard() {
    if (fn_) fn_();
  }

  ScopeGuard(ScopeGuard&& other) noexcept : fn_(std::move(other.fn_)) {
    other.fn_ = nullptr;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  void release() noexcept { fn_ = nullptr; }

 private:
  std::function<void()> fn_;
};

#define FERRY_SCOPE_EXIT(...)                                  \
  ::ferry::ScopeGuard FERRY_CONCAT(ferry_scope_exit_, __LINE__)( \
      [&]() { __VA_ARGS__; })

}  // namespace ferry

#endif  // FERRY_VOCABULARY_HPP_
