#include <assertkit/display.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

using assertkit::to_display_string;

namespace {

  struct opaque {
    int id = 0;
  };

  struct named {
    std::string name;

    friend std::ostream&
    operator<<(std::ostream& os, const named& n) {
      return os << "named(" << n.name << ')';
    }
  };

} // namespace

TEST_CASE("to_display_string renders numbers", "[display]") {
  CHECK(to_display_string(5) == "5");
  CHECK(to_display_string(-12L) == "-12");
  CHECK(to_display_string(0.5) == "0.5");
}

TEST_CASE("to_display_string renders byte-sized integers as numbers",
          "[display]") {
  CHECK(to_display_string(std::uint8_t{5}) == "5");
  CHECK(to_display_string(std::int8_t{-3}) == "-3");
  CHECK(to_display_string(static_cast<unsigned char>(200)) == "200");
  CHECK(to_display_string(std::optional<std::uint8_t>(7)) == "7");
}

TEST_CASE("to_display_string keeps full floating point precision",
          "[display]") {
  CHECK(to_display_string(0.1 + 0.2) != to_display_string(0.3));
}

TEST_CASE("to_display_string renders booleans as words", "[display]") {
  CHECK(to_display_string(true) == "true");
  CHECK(to_display_string(false) == "false");
}

TEST_CASE("to_display_string renders text verbatim", "[display]") {
  const char* c_string = "c string";
  CHECK(to_display_string("literal") == "literal");
  CHECK(to_display_string(c_string) == "c string");
  CHECK(to_display_string(std::string("owned")) == "owned");
  CHECK(to_display_string('x') == "x");
}

TEST_CASE("to_display_string renders absent operands as null", "[display]") {
  const char* no_text = nullptr;
  CHECK(to_display_string(nullptr) == "null");
  CHECK(to_display_string(std::nullopt) == "null");
  CHECK(to_display_string(std::optional<int>{}) == "null");
  CHECK(to_display_string(std::shared_ptr<int>{}) == "null");
  CHECK(to_display_string(no_text) == "null");
}

TEST_CASE("to_display_string unwraps present operands", "[display]") {
  CHECK(to_display_string(std::optional<int>(42)) == "42");
  CHECK(to_display_string(std::make_shared<std::string>("shared")) ==
        "shared");
  std::optional<std::optional<bool>> nested(std::optional<bool>(true));
  CHECK(to_display_string(nested) == "true");
}

TEST_CASE("to_display_string uses operator<< when available", "[display]") {
  CHECK(to_display_string(named{"widget"}) == "named(widget)");
}

TEST_CASE("to_display_string falls back for unprintable types", "[display]") {
  CHECK(to_display_string(opaque{}) == "{?}");
}
