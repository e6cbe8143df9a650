#include <assertkit/asserts.hpp>

#include <utility>

namespace assertkit {

  void
  fail(std::optional<std::string> message) {
    throw test_assertion_failure(std::move(message));
  }

  void
  fail_with_message(const std::optional<std::string>& user_message,
                    std::string_view our_message) {
    if (!user_message) fail(std::string(our_message));
    fail(*user_message + ' ' + std::string(our_message));
  }

  void
  assert_true(bool condition, std::optional<std::string> message) {
    if (condition) return;
    if (message) fail(std::move(message));
    fail(std::string(condition_false_message));
  }

  namespace detail {

    void
    check_equality_outcome(const std::optional<std::string>& label,
                           bool expected, bool actual) {
      if (expected == actual) return;
      fail_with_message(label, std::string("expected:<") +
                                   (expected ? "true" : "false") +
                                   "> but was:<" +
                                   (actual ? "true" : "false") + ">");
    }

    std::string
    hash_mismatch_text(const std::optional<std::string>& label) {
      std::string text(hash_mismatch_message);
      if (label) text += ": " + *label;
      return text;
    }

  } // namespace detail

} // namespace assertkit
