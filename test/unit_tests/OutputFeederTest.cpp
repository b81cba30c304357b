#include "OutputFeeder.hpp"
#include "SelectionController.hpp"
#include "TestHeaders.hpp"

using namespace tv;

TEST_CASE("Printable text and newlines", "[OutputFeeder]") {
  TerminalGrid grid(20, 3, 100);
  OutputFeeder feeder;
  feeder.advance(&grid, "hello\r\nworld");
  REQUIRE(grid.lineText(0) == "hello");
  REQUIRE(grid.lineText(1) == "world");
  REQUIRE(grid.cursor() == GridPoint(1, 5));
}

TEST_CASE("Long lines wrap at the right margin", "[OutputFeeder]") {
  TerminalGrid grid(5, 3, 100);
  OutputFeeder feeder;
  feeder.advance(&grid, "abcdefg");
  REQUIRE(grid.lineText(0) == "abcde");
  REQUIRE(grid.lineText(1) == "fg");
  REQUIRE(grid.row(0)[4].hasFlag(CELL_WRAPLINE));
  REQUIRE_FALSE(grid.row(1)[4].hasFlag(CELL_WRAPLINE));
  REQUIRE(grid.cursor() == GridPoint(1, 2));
}

TEST_CASE("Exactly filling a line does not wrap", "[OutputFeeder]") {
  TerminalGrid grid(5, 3, 100);
  OutputFeeder feeder;
  feeder.advance(&grid, "abcde\r\nx");
  REQUIRE_FALSE(grid.row(0)[4].hasFlag(CELL_WRAPLINE));
  REQUIRE(grid.lineText(1) == "x");
}

TEST_CASE("Line feed at the bottom scrolls into history", "[OutputFeeder]") {
  TerminalGrid grid(5, 2, 100);
  OutputFeeder feeder;
  feeder.advance(&grid, "a\r\nb\r\nc");
  REQUIRE(grid.historySize() == 1);
  REQUIRE(grid.lineText(-1) == "a");
  REQUIRE(grid.lineText(0) == "b");
  REQUIRE(grid.lineText(1) == "c");
}

TEST_CASE("Escape sequences are dropped", "[OutputFeeder]") {
  TerminalGrid grid(20, 2, 100);
  OutputFeeder feeder;

  SECTION("CSI") {
    feeder.advance(&grid, "\x1b[31mred\x1b[0m!");
    REQUIRE(grid.lineText(0) == "red!");
  }

  SECTION("OSC terminated by BEL") {
    feeder.advance(&grid, "\x1b]0;title\x07ok");
    REQUIRE(grid.lineText(0) == "ok");
  }

  SECTION("OSC terminated by ST") {
    feeder.advance(&grid, "\x1b]2;x\x1b\\ok");
    REQUIRE(grid.lineText(0) == "ok");
  }

  SECTION("Sequence split across reads") {
    feeder.advance(&grid, "a\x1b[");
    feeder.advance(&grid, "1;32mb");
    REQUIRE(grid.lineText(0) == "ab");
  }
}

TEST_CASE("Wide characters take two cells", "[OutputFeeder]") {
  TerminalGrid grid(5, 2, 100);
  OutputFeeder feeder;
  feeder.advance(&grid, "\xe4\xb8\xad" "a");
  REQUIRE(grid.row(0)[0].c == char32_t(0x4E2D));
  REQUIRE(grid.row(0)[0].hasFlag(CELL_WIDE_CHAR));
  REQUIRE(grid.row(0)[1].hasFlag(CELL_WIDE_CHAR_SPACER));
  REQUIRE(grid.row(0)[2].c == 'a');
  REQUIRE(grid.lineText(0) == "\xe4\xb8\xad" "a");
}

TEST_CASE("UTF-8 split across reads", "[OutputFeeder]") {
  TerminalGrid grid(5, 2, 100);
  OutputFeeder feeder;
  feeder.advance(&grid, "\xe4\xb8");
  REQUIRE(grid.lineText(0) == "");
  feeder.advance(&grid, "\xad");
  REQUIRE(grid.row(0)[0].c == char32_t(0x4E2D));
}

TEST_CASE("Tab and backspace move the cursor", "[OutputFeeder]") {
  TerminalGrid grid(20, 2, 100);
  OutputFeeder feeder;

  SECTION("Tab") {
    feeder.advance(&grid, "a\tb");
    REQUIRE(grid.row(0)[8].c == 'b');
  }

  SECTION("Backspace") {
    feeder.advance(&grid, "ab\bc");
    REQUIRE(grid.lineText(0) == "ac");
  }
}

TEST_CASE("A selection stays on its text while output scrolls",
          "[OutputFeeder]") {
  TerminalState state(10, 3, 100);
  OutputFeeder feeder;
  feeder.advance(&state, "hello\r\nworld\r\nfoo");
  SelectionRange range(SelectionKind::CELL, GridPoint(0, 0), Side::LEFT);
  range.head = GridPoint(0, 4);
  state.selection = range;
  REQUIRE(*SelectionController::extractText(state.grid, *state.selection) ==
          "hello");

  feeder.advance(&state, "\r\nbar\r\nbaz");
  REQUIRE(state.selection);
  REQUIRE(state.selection->anchor == GridPoint(-2, 0));
  REQUIRE(state.selection->head == GridPoint(-2, 4));
  REQUIRE(*SelectionController::extractText(state.grid, *state.selection) ==
          "hello");
}

TEST_CASE("A selection scrolled out of history is cut and then dropped",
          "[OutputFeeder]") {
  TerminalState state(10, 2, 1);
  OutputFeeder feeder;
  feeder.advance(&state, "a\r\nb");
  SelectionRange range(SelectionKind::CELL, GridPoint(1, 0), Side::LEFT);
  range.head = GridPoint(0, 0);
  state.selection = range;

  feeder.advance(&state, "\r\nc");
  REQUIRE(state.selection->head == GridPoint(-1, 0));
  REQUIRE(state.selection->anchor == GridPoint(0, 0));

  feeder.advance(&state, "\r\nd");
  REQUIRE(state.grid.topmostLine() == -1);
  REQUIRE(state.selection->head == GridPoint(-1, 0));
  REQUIRE(state.selection->anchor == GridPoint(-1, 0));

  feeder.advance(&state, "\r\ne");
  REQUIRE_FALSE(state.selection);
}
