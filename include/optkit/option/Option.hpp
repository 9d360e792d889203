#pragma once

#include <cstddef>
#include <iterator>
#include <new>

#include "optkit/option/Error.hpp"

namespace optkit {

/**
 * Names the null sentinel of a type. Present() consults it so that a null
 * input never becomes a present value. The primary template says no value of
 * T is null; specialise it for nullable handle types.
 */
template <typename T>
struct NullTraits {
  static bool IsNull(const T&) { return false; }
};

template <typename T>
struct NullTraits<T*> {
  static bool IsNull(const T* value) { return value == NULL; }
};

/**
 * Option<T> - an immutable value that is either Present (holds a T) or Absent
 * (holds nothing, optionally with an Error cause for diagnostics).
 *
 * Both payloads share one raw storage union, selected by m_variant:
 * the Present payload is a T built with placement new, the Absent payload is
 * an owned Error* (NULL when there is no cause). Copies are deep, including
 * the cause.
 *
 * An Option also behaves as a sequence of zero or one elements, see
 * const_iterator.
 */
template <typename T>
class Option {
 public:
  typedef T value_type;

  enum Variant { VT_PRESENT, VT_ABSENT };

  /**
   * Forward iterator over the zero or one values of an Option. Each begin()
   * starts a new traversal; a traversal cannot be stepped past its end.
   */
  class const_iterator {
   public:
    typedef std::forward_iterator_tag iterator_category;
    typedef T value_type;
    typedef std::ptrdiff_t difference_type;
    typedef const T* pointer;
    typedef const T& reference;

    const_iterator() : m_item(NULL) {}

    /**
     * @throws EndOfSequence if the traversal is exhausted
     */
    reference operator*() const {
      if (!m_item) throw EndOfSequence("Option iterator dereferenced at end");
      return *m_item;
    }
    pointer operator->() const { return &**this; }

    /**
     * @throws EndOfSequence if the traversal is exhausted
     */
    const_iterator& operator++() {
      if (!m_item) throw EndOfSequence("Option iterator advanced past end");
      m_item = NULL;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator previous(*this);
      ++*this;
      return previous;
    }

    bool operator==(const const_iterator& other) const {
      return m_item == other.m_item;
    }
    bool operator!=(const const_iterator& other) const {
      return m_item != other.m_item;
    }

   private:
    friend class Option<T>;
    explicit const_iterator(const T* item) : m_item(item) {}

    const T* m_item;
  };

  /**
   * Default constructor - Absent without a cause.
   */
  Option() : m_variant(VT_ABSENT) { m_store.cause = 0; }

  Option(const Option& other) : m_variant(VT_ABSENT) {
    m_store.cause = 0;
    CopyFrom(other);
  }

  Option& operator=(const Option& other) {
    if (this != &other) {
      Destroy();
      CopyFrom(other);
    }
    return *this;
  }

  ~Option() { Destroy(); }

  /**
   * Wraps value. A value that is the null sentinel of T (NULL for pointer
   * types) yields Absent instead, so a Present never holds a null.
   */
  static Option Present(const T& value) {
    if (NullTraits<T>::IsNull(value)) {
      return Option();
    }
    return Option(value);
  }

  /**
   * Wraps a copy of *value, or yields Absent when value is NULL.
   */
  static Option FromNullable(const T* value) {
    if (value == NULL) return Option();
    return Present(*value);
  }

  static Option Absent() { return Option(); }

  /**
   * Absent carrying a copy of cause, reported if Get() is attempted.
   */
  static Option Absent(const Error& cause) {
    Option absent;
    absent.m_store.cause = cause.Clone();
    return absent;
  }

  bool IsPresent() const { return m_variant == VT_PRESENT; }
  bool IsAbsent() const { return !IsPresent(); }

  /**
   * Extract the contained value.
   * @throws BadOptionAccess if absent, chaining the cause when there is one
   */
  const T& Get() const {
    if (IsAbsent()) {
      throw BadOptionAccess("Cannot resolve value on absent", m_store.cause);
    }
    return *ValuePtr();
  }

  /**
   * Extract value or return fallback if absent.
   */
  T GetOr(const T& fallback) const {
    return IsPresent() ? *ValuePtr() : fallback;
  }

  /**
   * The cause attached to an absent value, or NULL (present values and
   * absent values built without a cause). Never throws.
   */
  const Error* Cause() const { return IsPresent() ? 0 : m_store.cause; }

  const_iterator begin() const {
    return const_iterator(IsPresent() ? ValuePtr() : NULL);
  }
  const_iterator end() const { return const_iterator(); }
  std::size_t Size() const { return IsPresent() ? 1 : 0; }

 private:
  explicit Option(const T& value) : m_variant(VT_ABSENT) {
    new (m_store.data) T(value);
    m_variant = VT_PRESENT;
  }

  T* ValuePtr() { return reinterpret_cast<T*>(m_store.data); }
  const T* ValuePtr() const {
    return reinterpret_cast<const T*>(m_store.data);
  }

  // Leaves *this Absent without a cause.
  void Destroy() {
    if (m_variant == VT_PRESENT) {
      ValuePtr()->~T();
    } else {
      delete m_store.cause;
    }
    m_variant = VT_ABSENT;
    m_store.cause = 0;
  }

  // Requires *this to be Absent without a cause. If a copy throws, *this
  // stays that way.
  void CopyFrom(const Option& other) {
    if (other.m_variant == VT_PRESENT) {
      new (m_store.data) T(*other.ValuePtr());
      m_variant = VT_PRESENT;
    } else if (other.m_store.cause) {
      m_store.cause = other.m_store.cause->Clone();
    }
  }

  // Raw storage for either payload; long double forces alignment.
  union Storage {
    char data[sizeof(T)];
    Error* cause;
    long double aligner;
  } m_store;

  Variant m_variant;
};

/**
 * Present values compare with T's operator==. Absent values are equal to each
 * other whatever their causes, and never equal to a Present.
 */
template <typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
  if (lhs.IsAbsent() || rhs.IsAbsent()) {
    return lhs.IsAbsent() && rhs.IsAbsent();
  }
  return lhs.Get() == rhs.Get();
}

template <typename T>
bool operator!=(const Option<T>& lhs, const Option<T>& rhs) {
  return !(lhs == rhs);
}

}  // namespace optkit
