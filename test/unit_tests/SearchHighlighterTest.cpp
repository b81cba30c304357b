#include "OutputFeeder.hpp"
#include "SearchHighlighter.hpp"
#include "TestHeaders.hpp"

using namespace tv;

namespace {
void feed(TerminalGrid *grid, const string &bytes) {
  OutputFeeder feeder;
  feeder.advance(grid, bytes);
}
}  // namespace

TEST_CASE("Matches come back in grid order", "[SearchHighlighter]") {
  TerminalGrid grid(4, 2, 100);
  feed(&grid, "xaby\r\nabab");
  auto search = RegexSearch::compile("ab", false);
  REQUIRE(search);

  auto matches = SearchHighlighter::collect(grid, *search);
  REQUIRE(matches.size() == 3);
  REQUIRE(matches[0].start == GridPoint(0, 1));
  REQUIRE(matches[0].end == GridPoint(0, 3));
  REQUIRE(matches[1].start == GridPoint(1, 0));
  REQUIRE(matches[1].end == GridPoint(1, 2));
  REQUIRE(matches[2].start == GridPoint(1, 2));
  REQUIRE(matches[2].end == GridPoint(1, 4));
  for (size_t a = 1; a < matches.size(); a++) {
    REQUIRE(matches[a - 1].start < matches[a].start);
  }
}

TEST_CASE("Literal and regex patterns", "[SearchHighlighter]") {
  TerminalGrid grid(20, 1, 100);
  feed(&grid, "axb a.b");

  SECTION("Literal patterns escape regex syntax") {
    auto search = RegexSearch::compile("a.b", false);
    auto matches = SearchHighlighter::collect(grid, *search);
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].start == GridPoint(0, 4));
  }

  SECTION("Regex patterns") {
    auto search = RegexSearch::compile("a.b", true);
    auto matches = SearchHighlighter::collect(grid, *search);
    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].start == GridPoint(0, 0));
    REQUIRE(matches[1].start == GridPoint(0, 4));
  }
}

TEST_CASE("Unusable patterns do not compile", "[SearchHighlighter]") {
  REQUIRE_FALSE(RegexSearch::compile("", false));
  REQUIRE_FALSE(RegexSearch::compile("", true));
  REQUIRE_FALSE(RegexSearch::compile("(", true));
  REQUIRE(RegexSearch::compile("(", false));
  REQUIRE(RegexSearch::compile("(", false)->getPattern() == "(");
}

TEST_CASE("The visible window and one line below it are searched",
          "[SearchHighlighter]") {
  TerminalGrid grid(5, 2, 100);
  feed(&grid, "ab\r\nab\r\nab");
  REQUIRE(grid.historySize() == 1);
  auto search = RegexSearch::compile("ab", false);

  auto bottom = SearchHighlighter::collect(grid, *search);
  REQUIRE(bottom.size() == 2);
  REQUIRE(bottom[0].start == GridPoint(0, 0));
  REQUIRE(bottom[1].start == GridPoint(1, 0));

  grid.scrollDisplay(Scroll::lines(1));
  auto scrolled = SearchHighlighter::collect(grid, *search);
  REQUIRE(scrolled.size() == 3);
  REQUIRE(scrolled[0].start == GridPoint(-1, 0));
  REQUIRE(scrolled[1].start == GridPoint(0, 0));
  REQUIRE(scrolled[2].start == GridPoint(1, 0));
}

TEST_CASE("Match columns account for wide characters", "[SearchHighlighter]") {
  TerminalGrid grid(10, 1, 100);
  feed(&grid, "\xe4\xb8\xad" "ab");

  auto ascii = SearchHighlighter::collect(
      grid, *RegexSearch::compile("ab", false));
  REQUIRE(ascii.size() == 1);
  REQUIRE(ascii[0].start == GridPoint(0, 2));
  REQUIRE(ascii[0].end == GridPoint(0, 4));

  auto wide = SearchHighlighter::collect(
      grid, *RegexSearch::compile("\xe4\xb8\xad", false));
  REQUIRE(wide.size() == 1);
  REQUIRE(wide[0].start == GridPoint(0, 0));
  REQUIRE(wide[0].end == GridPoint(0, 2));
}

TEST_CASE("Matches follow soft wrapped rows", "[SearchHighlighter]") {
  TerminalGrid grid(5, 2, 100);
  feed(&grid, "abchello");
  REQUIRE(grid.lineText(0) == "abche");
  REQUIRE(grid.lineText(1) == "llo");

  auto matches =
      SearchHighlighter::collect(grid, *RegexSearch::compile("hello", false));
  REQUIRE(matches.size() == 1);
  REQUIRE(matches[0].start == GridPoint(0, 3));
  REQUIRE(matches[0].end == GridPoint(1, 3));

  SECTION("Searching from the continuation row") {
    auto tail = RegexSearch::compile("llo", false)
                    ->searchNext(grid, GridPoint(1, 0), 1);
    REQUIRE(tail);
    REQUIRE(tail->start == GridPoint(1, 0));
    REQUIRE(tail->end == GridPoint(1, 3));
  }

  SECTION("Hard line breaks still separate matches") {
    TerminalGrid broken(10, 2, 100);
    feed(&broken, "foo\r\nbar");
    REQUIRE(SearchHighlighter::collect(broken,
                                       *RegexSearch::compile("obar", false))
                .empty());
  }
}

TEST_CASE("searchNext starts at the origin", "[SearchHighlighter]") {
  TerminalGrid grid(10, 2, 100);
  feed(&grid, "aa aa");
  auto search = RegexSearch::compile("aa", false);

  auto first = search->searchNext(grid, GridPoint(0, 1), 1);
  REQUIRE(first);
  REQUIRE(first->start == GridPoint(0, 3));

  REQUIRE_FALSE(search->searchNext(grid, GridPoint(0, 4), 1));
}
