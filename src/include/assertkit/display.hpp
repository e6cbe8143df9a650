#pragma once

#include <assertkit/nullable.hpp>

#include <concepts>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace assertkit {

  template <typename T>
  concept stream_insertable = requires(std::ostream& os, const T& v) {
    { os << v } -> std::convertible_to<std::ostream&>;
  };

  // Render an operand for a failure message. Absent operands render as
  // "null", types without operator<< as "{?}".
  template <typename T>
  std::string
  to_display_string(const T& value) {
    if constexpr (always_absent<T>) {
      return "null";
    } else {
      if (is_absent(value)) return "null";

      using value_type = present_type_t<T>;
      const auto& v = present_value(value);

      if constexpr (!std::is_same_v<value_type, std::remove_cvref_t<T>>) {
        // Unwrap one level (optional, pointer, C string) and render again
        return to_display_string(v);
      } else if constexpr (std::is_same_v<value_type, bool>) {
        return v ? "true" : "false";
      } else if constexpr (std::is_convertible_v<const value_type&,
                                                 std::string_view>) {
        return std::string(std::string_view(v));
      } else if constexpr (std::is_same_v<value_type, signed char> ||
                           std::is_same_v<value_type, unsigned char>) {
        // int8_t and uint8_t are numbers, not characters
        return std::to_string(static_cast<int>(v));
      } else if constexpr (stream_insertable<value_type>) {
        std::ostringstream os;
        if constexpr (std::is_floating_point_v<value_type>) {
          os.precision(std::numeric_limits<value_type>::max_digits10);
        }
        os << v;
        return os.str();
      } else {
        return "{?}";
      }
    }
  }

} // namespace assertkit
