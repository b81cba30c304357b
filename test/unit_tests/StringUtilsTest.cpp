#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace tv;

TEST_CASE("split breaks on the delimiter", "[StringUtils]") {
  REQUIRE(split("python,zsh,bash", ',') ==
          vector<string>{"python", "zsh", "bash"});
}

TEST_CASE("split keeps empty fields between delimiters", "[StringUtils]") {
  REQUIRE(split("python,,zsh", ',') == vector<string>{"python", "", "zsh"});
}

TEST_CASE("split of an empty string is empty", "[StringUtils]") {
  REQUIRE(split("", ',').empty());
}

TEST_CASE("trim strips surrounding whitespace", "[StringUtils]") {
  REQUIRE(trim("  ctrl+shift+space\t\r\n") == "ctrl+shift+space");
  REQUIRE(trim("alt + n") == "alt + n");
}

TEST_CASE("trim of blank text is empty", "[StringUtils]") {
  REQUIRE(trim(" \t ") == "");
  REQUIRE(trim("") == "");
}

TEST_CASE("Widget ids are unique", "[StringUtils]") {
  set<WidgetId> ids;
  for (int a = 0; a < 100; a++) {
    ids.insert(newWidgetId());
  }
  REQUIRE(ids.size() == 100);
}
