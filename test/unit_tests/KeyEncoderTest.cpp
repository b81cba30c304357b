#include "KeyEncoder.hpp"
#include "TestHeaders.hpp"

using namespace tv;

TEST_CASE("Characters are sent as typed", "[KeyEncoder]") {
  REQUIRE(*KeyEncoder::encode(KeyEvent::character("a")) == "a");
  REQUIRE(*KeyEncoder::encode(KeyEvent::character("\xc3\xa9")) ==
          "\xc3\xa9");
  REQUIRE_FALSE(KeyEncoder::encode(KeyEvent::character("")));
}

TEST_CASE("Control and alt characters", "[KeyEncoder]") {
  REQUIRE(*KeyEncoder::encode(KeyEvent::character("c", MOD_CTRL)) ==
          string(1, '\x03'));
  REQUIRE(*KeyEncoder::encode(KeyEvent::character("C", MOD_CTRL)) ==
          string(1, '\x03'));
  REQUIRE(*KeyEncoder::encode(KeyEvent::character(" ", MOD_CTRL)) ==
          string(1, '\0'));
  REQUIRE(*KeyEncoder::encode(KeyEvent::character("[", MOD_CTRL)) ==
          string(1, '\x1b'));
  REQUIRE(*KeyEncoder::encode(KeyEvent::character("b", MOD_ALT)) == "\x1b" "b");
  REQUIRE(*KeyEncoder::encode(
              KeyEvent::character("a", MOD_CTRL | MOD_ALT)) == "\x1b\x01");

  SECTION("Control with a non-ASCII byte is passed through") {
    REQUIRE(*KeyEncoder::encode(KeyEvent::character("\xe9", MOD_CTRL)) ==
            "\xe9");
  }
}

TEST_CASE("Named keys", "[KeyEncoder]") {
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::ENTER)) == "\r");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::BACKSPACE)) == "\x7f");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::TAB)) == "\t");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::TAB, MOD_SHIFT)) ==
          "\x1b[Z");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::ESCAPE)) == "\x1b");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::UP)) == "\x1b[A");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::LEFT)) == "\x1b[D");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::RIGHT, MOD_CTRL)) ==
          "\x1b[1;5C");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::PAGE_UP)) == "\x1b[5~");
  REQUIRE(*KeyEncoder::encode(KeyEvent::named(Key::DELETE, MOD_SHIFT)) ==
          "\x1b[3;2~");
}

TEST_CASE("Parsing key chords", "[KeyEncoder]") {
  auto chord = KeyChord::parse("ctrl+shift+space");
  REQUIRE(chord);
  REQUIRE(chord->modifiers == (MOD_CTRL | MOD_SHIFT));
  REQUIRE(chord->text == " ");
  REQUIRE(chord->matches(KeyEvent::character(" ", MOD_CTRL | MOD_SHIFT)));
  REQUIRE_FALSE(chord->matches(KeyEvent::character(" ", MOD_CTRL)));
  REQUIRE_FALSE(chord->matches(KeyEvent::character("a", MOD_CTRL | MOD_SHIFT)));

  auto escape = KeyChord::parse(" Alt + Escape ");
  REQUIRE(escape);
  REQUIRE(escape->key == Key::ESCAPE);
  REQUIRE(escape->matches(KeyEvent::named(Key::ESCAPE, MOD_ALT)));

  auto letter = KeyChord::parse("ctrl+K");
  REQUIRE(letter);
  REQUIRE(letter->matches(KeyEvent::character("k", MOD_CTRL)));
  REQUIRE(letter->matches(KeyEvent::character("K", MOD_CTRL)));

  REQUIRE_FALSE(KeyChord::parse("hyper+a"));
  REQUIRE_FALSE(KeyChord::parse("ctrl+nosuchkey"));
}
