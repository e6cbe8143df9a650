#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace assertkit {

  // How an operand type models an absent value. The primary template covers
  // plain values, which are always present and compare as themselves.
  template <typename T>
  struct nullable_traits {
    static constexpr bool always_absent = false;

    static bool
    is_absent(const T&) {
      return false;
    }

    static const T&
    value(const T& v) {
      return v;
    }
  };

  template <typename T>
  struct nullable_traits<std::optional<T>> {
    static constexpr bool always_absent = false;

    static bool
    is_absent(const std::optional<T>& v) {
      return !v.has_value();
    }

    static const T&
    value(const std::optional<T>& v) {
      return *v;
    }
  };

  // Pointer-like operands use value semantics: a present pointer compares
  // and hashes as its pointee.
  template <typename T>
  struct nullable_traits<T*> {
    static constexpr bool always_absent = false;

    static bool
    is_absent(T* v) {
      return v == nullptr;
    }

    static const T&
    value(T* v) {
      return *v;
    }
  };

  template <typename T>
  struct nullable_traits<std::shared_ptr<T>> {
    static constexpr bool always_absent = false;

    static bool
    is_absent(const std::shared_ptr<T>& v) {
      return v == nullptr;
    }

    static const T&
    value(const std::shared_ptr<T>& v) {
      return *v;
    }
  };

  template <typename T, typename D>
  struct nullable_traits<std::unique_ptr<T, D>> {
    static constexpr bool always_absent = false;

    static bool
    is_absent(const std::unique_ptr<T, D>& v) {
      return v == nullptr;
    }

    static const T&
    value(const std::unique_ptr<T, D>& v) {
      return *v;
    }
  };

  // C strings are text, not pointers to a single char.
  template <>
  struct nullable_traits<const char*> {
    static constexpr bool always_absent = false;

    static bool
    is_absent(const char* v) {
      return v == nullptr;
    }

    static std::string_view
    value(const char* v) {
      return v;
    }
  };

  template <>
  struct nullable_traits<char*> : nullable_traits<const char*> {};

  template <std::size_t N>
  struct nullable_traits<char[N]> {
    static constexpr bool always_absent = false;

    static bool
    is_absent(const char (&)[N]) {
      return false;
    }

    static std::string_view
    value(const char (&v)[N]) {
      return v;
    }
  };

  template <>
  struct nullable_traits<std::nullopt_t> {
    static constexpr bool always_absent = true;

    static bool
    is_absent(std::nullopt_t) {
      return true;
    }
  };

  template <>
  struct nullable_traits<std::nullptr_t> {
    static constexpr bool always_absent = true;

    static bool
    is_absent(std::nullptr_t) {
      return true;
    }
  };

  template <typename T>
  using nullable_traits_for = nullable_traits<std::remove_cvref_t<T>>;

  // True for operand types that can only ever be absent (nullptr, nullopt).
  template <typename T>
  concept always_absent = nullable_traits_for<T>::always_absent;

  template <typename T>
  bool
  is_absent(const T& v) {
    return nullable_traits_for<T>::is_absent(v);
  }

  // The value a present operand stands for. Only valid when !is_absent(v).
  template <typename T>
    requires(!always_absent<T>)
  decltype(auto)
  present_value(const T& v) {
    return nullable_traits_for<T>::value(v);
  }

  template <typename T>
  using present_type_t = std::remove_cvref_t<decltype(
      present_value(std::declval<const std::remove_cvref_t<T>&>()))>;

} // namespace assertkit
