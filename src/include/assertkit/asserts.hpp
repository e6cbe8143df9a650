#pragma once

#include <assertkit/display.hpp>
#include <assertkit/nullable.hpp>
#include <assertkit/test_assertion_failure.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace assertkit {

  inline constexpr std::string_view condition_false_message =
      "Condition expected to be true but was false.";

  inline constexpr std::string_view null_equals_null_message =
      "Your check is dubious...why would you expect null != null?";

  inline constexpr std::string_view object_equals_null_message =
      "Your check is dubious...why would you expect an object to be equal "
      "to null?";

  inline constexpr std::string_view hash_mismatch_message =
      "hash codes for equal objects should match";

  // ---------------------------------------------------------------------------
  // Failure
  // ---------------------------------------------------------------------------

  // Unconditionally raise test_assertion_failure.
  [[noreturn]] void
  fail(std::optional<std::string> message = std::nullopt);

  // Raise with "<user_message> <our_message>", or just our_message when the
  // caller supplied none.
  [[noreturn]] void
  fail_with_message(const std::optional<std::string>& user_message,
                    std::string_view our_message);

  // ---------------------------------------------------------------------------
  // Boolean and equality assertions
  // ---------------------------------------------------------------------------

  void
  assert_true(bool condition,
              std::optional<std::string> message = std::nullopt);

  template <typename E, typename A>
  concept equality_comparable_operands =
      always_absent<E> || always_absent<A> ||
      requires(const present_type_t<E>& e, const present_type_t<A>& a) {
        { e == a } -> std::convertible_to<bool>;
      };

  // Null-safe equality: an absent expected value requires an absent actual
  // value, otherwise expected == actual must hold.
  template <typename E, typename A>
    requires equality_comparable_operands<E, A>
  void
  assert_equals(const E& expected, const A& actual,
                std::optional<std::string> message = std::nullopt) {
    if (!message) {
      message = "Expected '" + to_display_string(expected) + "' but got '" +
                to_display_string(actual) + "'";
    }

    if (is_absent(expected)) {
      assert_true(is_absent(actual), std::move(message));
      return;
    }

    if constexpr (!always_absent<E> && !always_absent<A>) {
      bool equal = !is_absent(actual) &&
                   static_cast<bool>(present_value(expected) ==
                                     present_value(actual));
      assert_true(equal, std::move(message));
    } else {
      // expected is present and actual can only be absent
      fail(std::move(message));
    }
  }

  // ---------------------------------------------------------------------------
  // equals / hash consistency
  // ---------------------------------------------------------------------------

  template <typename T>
  concept hashable = requires(const T& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
  };

  template <typename L, typename R>
  concept hash_checkable_operands =
      always_absent<L> || always_absent<R> ||
      (hashable<present_type_t<L>> && hashable<present_type_t<R>> &&
       requires(const present_type_t<L>& l, const present_type_t<R>& r) {
         { l == r } -> std::convertible_to<bool>;
         { r == l } -> std::convertible_to<bool>;
       });

  namespace detail {

    // Raise "expected:<E> but was:<A>" when the equality outcome of one
    // direction does not match the expectation.
    void
    check_equality_outcome(const std::optional<std::string>& label,
                           bool expected, bool actual);

    std::string
    hash_mismatch_text(const std::optional<std::string>& label);

  } // namespace detail

  // Check operator== in both directions against expected_equal and, when
  // the operands are expected equal, that their std::hash values match.
  // Hashes of unequal operands are not compared since unequal values may
  // share a hash.
  template <typename L, typename R>
    requires hash_checkable_operands<L, R>
  void
  check_equals_and_hash_code(const L& lhs, const R& rhs, bool expected_equal,
                             std::optional<std::string> label = std::nullopt) {
    bool lhs_absent = is_absent(lhs);
    bool rhs_absent = is_absent(rhs);

    if (lhs_absent && rhs_absent) {
      // Asserts rather than fails: absent equals absent.
      assert_true(expected_equal, std::string(null_equals_null_message));
      return;
    }

    if (lhs_absent || rhs_absent) {
      assert_true(!expected_equal, std::string(object_equals_null_message));
      return;
    }

    if constexpr (!always_absent<L> && !always_absent<R>) {
      const auto& l = present_value(lhs);
      const auto& r = present_value(rhs);

      detail::check_equality_outcome(label, expected_equal,
                                     static_cast<bool>(l == r));
      detail::check_equality_outcome(label, expected_equal,
                                     static_cast<bool>(r == l));

      if (expected_equal) {
        std::size_t lhs_hash = std::hash<present_type_t<L>>{}(l);
        std::size_t rhs_hash = std::hash<present_type_t<R>>{}(r);
        if (lhs_hash != rhs_hash) fail(detail::hash_mismatch_text(label));
      }
    }
  }

} // namespace assertkit
