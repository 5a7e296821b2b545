/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all dflow modules.
 *
 * - expected<V, E>  : value-or-error return type (no exceptions)
 * - optional<T>     : nullable value
 * - FixedString<N>  : bounded inline string
 * - FixedVector<T,N>: bounded inline vector
 * - FixedFunction   : small-buffer callable without heap allocation
 * - NewType<T, Tag> : strong typedef (StageId, SubscriptionTag)
 * - and_then/or_else: expected combinators
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef DFLOW_VOCABULARY_HPP_
#define DFLOW_VOCABULARY_HPP_

#include "dflow/platform.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace dflow {

// ============================================================================
// Common Error Codes
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
  kSectionNotFound,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the named factories success() and error(), so a
 * default-constructed "empty" state never exists.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(&storage_)) V(other.Ref());
      has_value_ = true;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(&storage_)) V(std::move(other.Ref()));
      has_value_ = true;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_)) V(other.Ref());
        has_value_ = true;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_)) V(std::move(other.Ref()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    DFLOW_ASSERT(has_value_);
    return Ref();
  }

  const V& value() const& noexcept {
    DFLOW_ASSERT(has_value_);
    return Ref();
  }

  V&& value() && noexcept {
    DFLOW_ASSERT(has_value_);
    return std::move(Ref());
  }

  E get_error() const noexcept {
    DFLOW_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? Ref() : fallback;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  V& Ref() noexcept { return *std::launder(reinterpret_cast<V*>(&storage_)); }
  const V& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E err_;
  bool has_value_;
};

/** @brief expected<void, E> specialization: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    DFLOW_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// and_then / or_else
// ============================================================================

/**
 * @brief Chain a fallible step onto a successful expected.
 *
 * F must return expected<U, E>. Errors propagate unchanged.
 */
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Result = decltype(fn(r.value()));
  if (!r.has_value()) {
    return Result::error(r.get_error());
  }
  return fn(r.value());
}

/** @brief Invoke fn with the error if r holds one. */
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (static_cast<void*>(&storage_)) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (static_cast<void*>(&storage_)) T(std::move(v));
  }

  optional(const optional& other) : has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(&storage_)) T(other.Ref());
      has_value_ = true;
    }
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(&storage_)) T(std::move(other.Ref()));
      has_value_ = true;
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_)) T(other.Ref());
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
        ::new (static_cast<void*>(&storage_)) T(std::move(other.Ref()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    DFLOW_ASSERT(has_value_);
    return Ref();
  }

  const T& value() const noexcept {
    DFLOW_ASSERT(has_value_);
    return Ref();
  }

  T value_or(const T& fallback) const { return has_value_ ? Ref() : fallback; }

  void reset() noexcept {
    if (has_value_) {
      Ref().~T();
      has_value_ = false;
    }
  }

 private:
  T& Ref() noexcept { return *std::launder(reinterpret_cast<T*>(&storage_)); }
  const T& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting the truncating FixedString constructor.
struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of Capacity chars.
 *
 * Literal construction is checked at compile time; runtime strings must go
 * through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString {
 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept  // NOLINT(runtime/explicit)
      : size_(N - 1U) {
    static_assert(N - 1U <= Capacity, "String literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N - 1U);
    buf_[size_] = '\0';
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0U) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    assign(TruncateToCapacity, str,
           static_cast<uint32_t>(std::strlen(str)));
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    size_ = (len < Capacity) ? len : Capacity;
    std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }

  bool operator!=(const char* other) const noexcept { return !(*this == other); }

  template <uint32_t N>
  bool operator==(const FixedString<N>& other) const noexcept {
    return size_ == other.size() &&
           std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t N>
  bool operator!=(const FixedString<N>& other) const noexcept {
    return !(*this == other);
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

// ============================================================================
// FixedVector<T, Capacity>
// ============================================================================

/**
 * @brief Vector with inline storage for at most Capacity elements.
 *
 * Insertion reports failure via return value instead of reallocating.
 */
template <typename T, uint32_t Capacity>
class FixedVector {
 public:
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept = default;

  FixedVector(const FixedVector& other) : size_(0U) {
    for (uint32_t i = 0U; i < other.size_; ++i) {
      ::new (static_cast<void*>(Slot(i))) T(other[i]);
      ++size_;
    }
  }

  FixedVector(FixedVector&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : size_(0U) {
    for (uint32_t i = 0U; i < other.size_; ++i) {
      ::new (static_cast<void*>(Slot(i))) T(std::move(other[i]));
      ++size_;
    }
    other.clear();
  }

  FixedVector& operator=(const FixedVector& other) {
    if (this != &other) {
      clear();
      for (uint32_t i = 0U; i < other.size_; ++i) {
        ::new (static_cast<void*>(Slot(i))) T(other[i]);
        ++size_;
      }
    }
    return *this;
  }

  FixedVector& operator=(FixedVector&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      clear();
      for (uint32_t i = 0U; i < other.size_; ++i) {
        ::new (static_cast<void*>(Slot(i))) T(std::move(other[i]));
        ++size_;
      }
      other.clear();
    }
    return *this;
  }

  ~FixedVector() { clear(); }

  bool push_back(const T& v) {
    if (full()) return false;
    ::new (static_cast<void*>(Slot(size_))) T(v);
    ++size_;
    return true;
  }

  bool push_back(T&& v) {
    if (full()) return false;
    ::new (static_cast<void*>(Slot(size_))) T(std::move(v));
    ++size_;
    return true;
  }

  template <typename... Args>
  bool emplace_back(Args&&... args) {
    if (full()) return false;
    ::new (static_cast<void*>(Slot(size_))) T(std::forward<Args>(args)...);
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (empty()) return false;
    --size_;
    Slot(size_)->~T();
    return true;
  }

  /** @brief Remove element at index by swapping in the last element. */
  bool erase_unordered(uint32_t index) noexcept {
    if (index >= size_) return false;
    if (index != size_ - 1U) {
      (*this)[index] = std::move((*this)[size_ - 1U]);
    }
    return pop_back();
  }

  void clear() noexcept {
    while (size_ > 0U) {
      --size_;
      Slot(size_)->~T();
    }
  }

  T& operator[](uint32_t i) noexcept {
    DFLOW_ASSERT(i < size_);
    return *Slot(i);
  }

  const T& operator[](uint32_t i) const noexcept {
    DFLOW_ASSERT(i < size_);
    return *Slot(i);
  }

  iterator begin() noexcept { return Slot(0U); }
  iterator end() noexcept { return Slot(0U) + size_; }
  const_iterator begin() const noexcept { return Slot(0U); }
  const_iterator end() const noexcept { return Slot(0U) + size_; }

  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  bool full() const noexcept { return size_ >= Capacity; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

 private:
  T* Slot(uint32_t i) noexcept {
    return std::launder(reinterpret_cast<T*>(&storage_[i]));
  }
  const T* Slot(uint32_t i) const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_[i]));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_[Capacity];
  uint32_t size_{0U};
};

// ============================================================================
// FixedFunction<Signature, BufferSize>
// ============================================================================

template <typename Signature, size_t BufferSize = 2 * sizeof(void*)>
class FixedFunction;

/**
 * @brief Move-only callable wrapper with inline small-buffer storage.
 *
 * Callables larger than BufferSize are rejected at compile time; no heap
 * fallback exists.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> {
 public:
  FixedFunction() noexcept = default;

  FixedFunction(std::nullptr_t) noexcept {}  // NOLINT(runtime/explicit)

  template <typename F,
            typename = typename std::enable_if<!std::is_same<
                typename std::decay<F>::type, FixedFunction>::value>::type>
  FixedFunction(F&& f) noexcept {  // NOLINT(runtime/explicit)
    using Fn = typename std::decay<F>::type;
    static_assert(sizeof(Fn) <= BufferSize,
                  "Callable too large for FixedFunction buffer");
    static_assert(alignof(Fn) <= alignof(std::max_align_t),
                  "Callable alignment too strict for FixedFunction");
    ::new (static_cast<void*>(&storage_)) Fn(std::forward<F>(f));
    invoke_ = [](void* s, Args... args) -> Ret {
      return (*static_cast<Fn*>(s))(std::forward<Args>(args)...);
    };
    ops_ = [](void* dst, void* src) noexcept {
      if (dst != nullptr) {
        ::new (dst) Fn(std::move(*static_cast<Fn*>(src)));
      }
      static_cast<Fn*>(src)->~Fn();
    };
  }

  FixedFunction(FixedFunction&& other) noexcept { MoveFrom(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      Reset();
      MoveFrom(other);
    }
    return *this;
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() { Reset(); }

  Ret operator()(Args... args) const {
    DFLOW_ASSERT(invoke_ != nullptr);
    return invoke_(const_cast<void*>(static_cast<const void*>(&storage_)),
                   std::forward<Args>(args)...);
  }

  explicit operator bool() const noexcept { return invoke_ != nullptr; }

 private:
  using InvokeFn = Ret (*)(void*, Args...);
  using OpsFn = void (*)(void*, void*);

  void MoveFrom(FixedFunction& other) noexcept {
    if (other.invoke_ != nullptr) {
      other.ops_(&storage_, &other.storage_);
      invoke_ = other.invoke_;
      ops_ = other.ops_;
      other.invoke_ = nullptr;
      other.ops_ = nullptr;
    }
  }

  void Reset() noexcept {
    if (invoke_ != nullptr) {
      ops_(nullptr, &storage_);
      invoke_ = nullptr;
      ops_ = nullptr;
    }
  }

  typename std::aligned_storage<BufferSize, alignof(std::max_align_t)>::type storage_;
  InvokeFn invoke_{nullptr};
  OpsFn ops_{nullptr};
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: same representation as T, distinct type per Tag.
 */
template <typename T, typename Tag>
class NewType {
 public:
  constexpr NewType() noexcept : value_{} {}
  constexpr explicit NewType(T v) noexcept : value_(v) {}

  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& o) const noexcept {
    return value_ == o.value_;
  }
  constexpr bool operator!=(const NewType& o) const noexcept {
    return value_ != o.value_;
  }
  constexpr bool operator<(const NewType& o) const noexcept {
    return value_ < o.value_;
  }

 private:
  T value_;
};

struct StageIdTag {};
struct SubscriptionTagTag {};

/// Identity of a stage within its pipeline (0 = invalid).
using StageId = NewType<uint32_t, StageIdTag>;

/// Identity of one subscription link (0 = invalid).
using SubscriptionTag = NewType<uint64_t, SubscriptionTagTag>;

// ============================================================================
// Clocks
// ============================================================================

inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000U; }

}  // namespace dflow

#endif  // DFLOW_VOCABULARY_HPP_
