#include "SearchHighlighter.hpp"

#include "Utf8.hpp"

namespace tv {
namespace {
wstring escapeLiteral(const u32string &text) {
  static const u32string SPECIAL = U"\\^$.|?*+()[]{}";
  wstring escaped;
  for (char32_t c : text) {
    if (SPECIAL.find(c) != u32string::npos) {
      escaped.push_back(L'\\');
    }
    escaped.push_back(wchar_t(c));
  }
  return escaped;
}

bool wrapsToNext(const TerminalGrid &grid, int line) {
  return line < grid.bottommostLine() &&
         grid.row(line)[grid.lastColumn()].hasFlag(CELL_WRAPLINE);
}
}  // namespace

shared_ptr<RegexSearch> RegexSearch::compile(const string &pattern,
                                             bool isRegex) {
  if (pattern.empty()) {
    return nullptr;
  }
  u32string decoded = decodeUtf8(pattern);
  wstring source = isRegex ? wstring(decoded.begin(), decoded.end())
                           : escapeLiteral(decoded);
  try {
    std::wregex regex(source, std::regex_constants::ECMAScript);
    return shared_ptr<RegexSearch>(new RegexSearch(pattern, regex));
  } catch (const std::regex_error &re) {
    LOG(WARNING) << "Invalid search pattern '" << pattern
                 << "': " << re.what();
    return nullptr;
  }
}

optional<SearchMatch> RegexSearch::searchNext(const TerminalGrid &grid,
                                              const GridPoint &origin,
                                              int lastLine) const {
  int line = std::max(origin.line, grid.topmostLine());
  lastLine = std::min(lastLine, grid.bottommostLine());
  // Back up to the first row of the wrapped line holding the origin.
  while (line > grid.topmostLine() && wrapsToNext(grid, line - 1)) {
    line--;
  }
  while (line <= lastLine) {
    // One logical line: rows joined across soft wraps.
    wstring text;
    vector<GridPoint> points;
    int rowLine = line;
    while (true) {
      const Row &row = grid.row(rowLine);
      for (int column = 0; column < int(row.size()); column++) {
        if (row[column].hasFlag(CELL_WIDE_CHAR_SPACER)) {
          continue;
        }
        char32_t c = row[column].c;
        text.push_back(wchar_t(c == 0 ? ' ' : c));
        points.push_back(GridPoint(rowLine, column));
      }
      if (!wrapsToNext(grid, rowLine)) {
        break;
      }
      rowLine++;
    }
    line = rowLine + 1;

    size_t from = 0;
    while (from < points.size() && points[from] < origin) {
      from++;
    }
    if (from >= text.length()) {
      continue;
    }

    std::regex_constants::match_flag_type flags =
        std::regex_constants::match_not_null;
    if (from > 0) {
      flags = flags | std::regex_constants::match_prev_avail;
    }
    std::wsmatch match;
    if (!std::regex_search(text.cbegin() + from, text.cend(), match, regex,
                           flags)) {
      continue;
    }
    size_t first = from + size_t(match.position(0));
    size_t last = first + size_t(match.length(0)) - 1;
    if (points[first].line > lastLine) {
      return nullopt;
    }
    const GridPoint &tail = points[last];
    int endColumn =
        tail.column + (grid.cell(tail).hasFlag(CELL_WIDE_CHAR) ? 2 : 1);
    SearchMatch retval;
    retval.start = points[first];
    retval.end = GridPoint(tail.line, endColumn);
    return retval;
  }
  return nullopt;
}

vector<SearchMatch> SearchHighlighter::collect(const TerminalGrid &grid,
                                               const RegexSearch &search) {
  vector<SearchMatch> matches;
  int top = -grid.displayOffset();
  // One line of look-ahead below the window.
  int bottom = std::min(top + grid.screenLines(), grid.bottommostLine());
  GridPoint cursor(top, 0);
  while (cursor.line <= bottom) {
    auto match = search.searchNext(grid, cursor, bottom);
    if (!match) {
      break;
    }
    if (match->start < cursor) {
      VLOG(1) << "Search stream went backwards at " << match->start
              << ", stopping at " << cursor;
      break;
    }
    matches.push_back(*match);

    // Continue one column past the end of the match.
    GridPoint next = match->end;
    if (next.column > grid.lastColumn()) {
      if (next.line >= grid.bottommostLine()) {
        break;
      }
      next = GridPoint(next.line + 1, 0);
    }
    if (!(cursor < next)) {
      break;
    }
    cursor = next;
  }
  return matches;
}
}  // namespace tv
