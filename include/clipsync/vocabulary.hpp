/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected<V,E>, optional<T>, and_then / or_else.
 *
 * Error handling without exceptions. Every fallible clipsync operation
 * returns expected<V, E> with a module-specific error enum.
 */

#ifndef CLIPSYNC_VOCABULARY_HPP_
#define CLIPSYNC_VOCABULARY_HPP_

#include "clipsync/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace clipsync {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct with the static factories success() / error(). Accessing
 * value() on an error (or get_error() on a value) is a programming error
 * and asserts in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.val)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.val)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.storage_.err = e;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.val)) V(other.storage_.val);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.val)) V(std::move(other.storage_.val));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.val)) V(other.storage_.val);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.val))
            V(std::move(other.storage_.val));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    CLIPSYNC_ASSERT(has_value_);
    return storage_.val;
  }
  const V& value() const& noexcept {
    CLIPSYNC_ASSERT(has_value_);
    return storage_.val;
  }
  V&& value() && noexcept {
    CLIPSYNC_ASSERT(has_value_);
    return std::move(storage_.val);
  }

  E get_error() const noexcept {
    CLIPSYNC_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& default_val) const& {
    return has_value_ ? storage_.val : default_val;
  }

 private:
  expected() noexcept : has_value_(false) { storage_.err = E{}; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.val.~V();
      has_value_ = false;
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V val;
    E err;
  } storage_;
  bool has_value_;
};

/** @brief Specialization for operations that return no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    CLIPSYNC_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), err_(e) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// optional<T>
// ============================================================================

/** @brief Nullable value holder. */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&storage_.val)) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&storage_.val)) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.val)) T(other.storage_.val);
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.val)) T(std::move(other.storage_.val));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_.val)) T(other.storage_.val);
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
        ::new (static_cast<void*>(&storage_.val))
            T(std::move(other.storage_.val));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & noexcept {
    CLIPSYNC_ASSERT(has_value_);
    return storage_.val;
  }
  const T& value() const& noexcept {
    CLIPSYNC_ASSERT(has_value_);
    return storage_.val;
  }
  T&& value() && noexcept {
    CLIPSYNC_ASSERT(has_value_);
    return std::move(storage_.val);
  }

  T value_or(const T& default_val) const& {
    return has_value_ ? storage_.val : default_val;
  }

  /** @brief Replace the held value. */
  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (static_cast<void*>(&storage_.val)) T(std::forward<Args>(args)...);
    has_value_ = true;
    return storage_.val;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.val.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    T val;
  } storage_;
  bool has_value_;
};

/** @brief True when @p o holds a value equal to @p v. */
template <typename T>
inline bool operator==(const optional<T>& o, const T& v) {
  return o.has_value() && o.value() == v;
}

template <typename T>
inline bool operator!=(const optional<T>& o, const T& v) {
  return !(o == v);
}

// ============================================================================
// and_then / or_else
// ============================================================================

/**
 * @brief Chain a fallible step on success; propagate the error otherwise.
 * @param r  Input result.
 * @param fn Callable V -> expected<U, E>.
 */
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Ret = decltype(fn(r.value()));
  if (!r.has_value()) {
    return Ret::error(r.get_error());
  }
  return fn(r.value());
}

/** @brief Invoke @p fn with the error when @p r failed. */
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

}  // namespace clipsync

#endif  // CLIPSYNC_VOCABULARY_HPP_
