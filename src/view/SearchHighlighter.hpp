#ifndef __TV_SEARCH_HIGHLIGHTER_HPP__
#define __TV_SEARCH_HIGHLIGHTER_HPP__

#include <regex>

#include "GridTypes.hpp"
#include "Headers.hpp"
#include "TerminalGrid.hpp"

namespace tv {
/**
 * @brief A search hit.  `end` is exclusive, lies on the row holding the last
 * matched character and already includes the second column of a wide
 * character at the end of the match.
 */
struct SearchMatch {
  GridPoint start;
  GridPoint end;

  bool operator==(const SearchMatch &other) const {
    return start == other.start && end == other.end;
  }
};

/**
 * @brief A compiled search pattern that finds matches within grid lines.
 */
class RegexSearch {
 public:
  /**
   * @brief Compiles `pattern`.  Unless `isRegex` is set the pattern is
   * matched literally.
   * @return nullptr when the pattern is empty or does not compile.
   */
  static shared_ptr<RegexSearch> compile(const string &pattern, bool isRegex);

  /**
   * @brief First non-empty match starting at or after `origin` and no
   * further down than `lastLine`.  Rows joined by a soft wrap are searched
   * as one line, so a match may continue onto the following rows.
   */
  optional<SearchMatch> searchNext(const TerminalGrid &grid,
                                   const GridPoint &origin,
                                   int lastLine) const;

  const string &getPattern() const { return pattern; }

 protected:
  string pattern;
  std::wregex regex;

  RegexSearch(const string &_pattern, const std::wregex &_regex)
      : pattern(_pattern), regex(_regex) {}
};

/**
 * @brief Finds the search matches inside the visible window of a grid.
 */
class SearchHighlighter {
 public:
  /**
   * @brief Matches from the top of the visible window (`-displayOffset`)
   * down to `screenLines` lines below it, clamped to the bottom of the grid,
   * in increasing grid order.  Stops early,
   * keeping what was found, if the match stream stops advancing.
   */
  static vector<SearchMatch> collect(const TerminalGrid &grid,
                                     const RegexSearch &search);
};
}  // namespace tv

#endif  // __TV_SEARCH_HIGHLIGHTER_HPP__
