#pragma once

#include <cstddef>
#include <cstring>
#include <string>

#include "optkit/option/Option.hpp"

namespace optkit {

/**
 * Hash<T> - hash functor for values used as keys or compared by equality.
 *
 * Only the specialisations below are defined; specialise Hash for your own
 * types with the same law: values that compare equal hash equally.
 */
template <typename T>
struct Hash;

namespace detail {
// Integral values are their own hash.
template <typename T>
struct IntegralHash {
  std::size_t operator()(T value) const {
    return static_cast<std::size_t>(value);
  }
};
}  // namespace detail

template <> struct Hash<bool> : detail::IntegralHash<bool> {};
template <> struct Hash<char> : detail::IntegralHash<char> {};
template <> struct Hash<signed char> : detail::IntegralHash<signed char> {};
template <> struct Hash<unsigned char> : detail::IntegralHash<unsigned char> {};
template <> struct Hash<wchar_t> : detail::IntegralHash<wchar_t> {};
template <> struct Hash<char16_t> : detail::IntegralHash<char16_t> {};
template <> struct Hash<char32_t> : detail::IntegralHash<char32_t> {};
template <> struct Hash<short> : detail::IntegralHash<short> {};
template <> struct Hash<unsigned short> : detail::IntegralHash<unsigned short> {};
template <> struct Hash<int> : detail::IntegralHash<int> {};
template <> struct Hash<unsigned int> : detail::IntegralHash<unsigned int> {};
template <> struct Hash<long> : detail::IntegralHash<long> {};
template <> struct Hash<unsigned long> : detail::IntegralHash<unsigned long> {};
template <> struct Hash<long long> : detail::IntegralHash<long long> {};
template <>
struct Hash<unsigned long long> : detail::IntegralHash<unsigned long long> {};

namespace detail {
// FNV-1a over raw bytes.
inline std::size_t HashBytes(const unsigned char* bytes, std::size_t len) {
  unsigned long hash = 2166136261UL;
  for (std::size_t i = 0; i < len; ++i) {
    hash ^= bytes[i];
    hash *= 16777619UL;
  }
  return static_cast<std::size_t>(hash);
}
}  // namespace detail

template <>
struct Hash<double> {
  std::size_t operator()(double value) const {
    if (value == 0.0) return 0;  // +0.0 == -0.0
    unsigned char bytes[sizeof(double)];
    std::memcpy(bytes, &value, sizeof(double));
    return detail::HashBytes(bytes, sizeof(double));
  }
};

template <>
struct Hash<float> {
  std::size_t operator()(float value) const {
    return Hash<double>()(static_cast<double>(value));
  }
};

template <>
struct Hash<std::string> {
  std::size_t operator()(const std::string& value) const {
    return detail::HashBytes(
        reinterpret_cast<const unsigned char*>(value.data()), value.size());
  }
};

// Pointers hash by address, matching their operator==.
template <typename T>
struct Hash<T*> {
  std::size_t operator()(const T* value) const {
    return reinterpret_cast<std::size_t>(value);
  }
};

/**
 * Absent values hash to 31 whatever their cause; a Present hashes to
 * 31 + Hash<T>(value).
 */
template <typename T>
struct Hash<Option<T> > {
  std::size_t operator()(const Option<T>& option) const {
    const std::size_t prime = 31;
    if (option.IsAbsent()) return prime;
    return prime + Hash<T>()(option.Get());
  }
};

}  // namespace optkit
