#include "SelectionController.hpp"

#include "Utf8.hpp"

namespace tv {
SelectionRange SelectionController::beginOrExtend(
    const optional<SelectionRange> &current, const GridPoint &point,
    SelectionKind kind, Side side) {
  if (!current) {
    return SelectionRange(kind, point, side);
  }
  SelectionRange range = *current;
  range.head = point;
  return range;
}

GridPoint SelectionController::pointFromPixel(const PixelPoint &pixel,
                                              const CharMetrics &metrics,
                                              int displayOffset,
                                              int screenLines) {
  if (!metrics.valid() || screenLines <= 0) {
    return GridPoint(-displayOffset, 0);
  }
  int row = int(std::floor(pixel.y / metrics.rowHeight));
  row = std::max(0, std::min(row, screenLines - 1));
  int column = std::max(0, int(std::floor(pixel.x / metrics.colWidth)));
  return GridPoint(row - displayOffset, column);
}

Side SelectionController::sideFromPixel(const PixelPoint &pixel,
                                        const CharMetrics &metrics) {
  if (!metrics.valid()) {
    return Side::LEFT;
  }
  double cellX = pixel.x / metrics.colWidth;
  return (cellX - std::floor(cellX)) < 0.5 ? Side::LEFT : Side::RIGHT;
}

optional<SelectionSpan> SelectionController::resolve(
    const TerminalGrid &grid, const SelectionRange &range) {
  if (range.isEmpty()) {
    return nullopt;
  }
  GridPoint start = range.anchor;
  GridPoint end = range.head;
  if (end < start) {
    std::swap(start, end);
  }
  if (end.line < grid.topmostLine() || start.line > grid.bottommostLine()) {
    return nullopt;
  }

  int lastColumn = grid.lastColumn();
  if (range.kind == SelectionKind::BLOCK) {
    int left = std::min(range.anchor.column, range.head.column);
    int right = std::max(range.anchor.column, range.head.column);
    left = std::min(left, lastColumn);
    right = std::min(right, lastColumn);
    SelectionSpan span;
    span.start = GridPoint(std::max(start.line, grid.topmostLine()), left);
    span.end = GridPoint(std::min(end.line, grid.bottommostLine()), right);
    span.isBlock = true;
    return span;
  }

  if (start.line < grid.topmostLine()) {
    start = GridPoint(grid.topmostLine(), 0);
  }
  if (end.line > grid.bottommostLine()) {
    end = GridPoint(grid.bottommostLine(), lastColumn);
  }
  start.column = std::max(0, std::min(start.column, lastColumn));
  end.column = std::max(0, std::min(end.column, lastColumn));

  switch (range.kind) {
    case SelectionKind::WORD:
      start = wordStart(grid, start);
      end = wordEnd(grid, end);
      break;
    case SelectionKind::LINE:
      start = lineStart(grid, start);
      end = lineEnd(grid, end);
      break;
    case SelectionKind::CELL:
    default:
      if (grid.cell(start).hasFlag(CELL_WIDE_CHAR_SPACER) &&
          start.column > 0) {
        start.column--;
      }
      if (grid.cell(end).hasFlag(CELL_WIDE_CHAR) && end.column < lastColumn) {
        end.column++;
      }
      break;
  }

  SelectionSpan span;
  span.start = start;
  span.end = end;
  span.isBlock = false;
  return span;
}

vector<LineSpan> SelectionController::lineSpans(const SelectionSpan &span,
                                                int columns) {
  vector<LineSpan> spans;
  for (int line = span.start.line; line <= span.end.line; line++) {
    LineSpan ls;
    ls.line = line;
    if (span.isBlock) {
      ls.left = span.start.column;
      ls.right = span.end.column + 1;
    } else {
      ls.left = (line == span.start.line) ? span.start.column : 0;
      ls.right = (line == span.end.line) ? span.end.column + 1 : columns;
    }
    ls.right = std::min(ls.right, columns);
    if (ls.left < ls.right) {
      spans.push_back(ls);
    }
  }
  return spans;
}

optional<string> SelectionController::extractText(const TerminalGrid &grid,
                                                  const SelectionRange &range) {
  auto span = resolve(grid, range);
  if (!span) {
    return nullopt;
  }
  auto spans = lineSpans(*span, grid.columns());
  if (spans.empty()) {
    return nullopt;
  }

  string text;
  for (size_t a = 0; a < spans.size(); a++) {
    const LineSpan &ls = spans[a];
    const Row &row = grid.row(ls.line);
    string lineText;
    for (int column = ls.left; column < ls.right; column++) {
      const Cell &cell = row[column];
      if (cell.hasFlag(CELL_WIDE_CHAR_SPACER)) {
        continue;
      }
      appendUtf8(cell.c == 0 ? char32_t(' ') : cell.c, &lineText);
    }
    bool joinNext = !span->isBlock && ls.right == grid.columns() &&
                    wrapsToNext(grid, ls.line);
    if (!joinNext) {
      auto last = lineText.find_last_not_of(" \t");
      lineText.erase(last == string::npos ? 0 : last + 1);
    }
    text += lineText;
    if (a + 1 < spans.size() && !joinNext) {
      text += "\n";
    }
  }
  return text;
}

int SelectionController::wordCategory(char32_t c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9') || c >= 0x80) {
    return 1;
  }
  switch (c) {
    case '/':
    case '\\':
    case '-':
    case '_':
    case '.':
    case '~':
    case ':':
      return 1;  // Path character.
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\v':
    case '\f':
    case 0:
      return 2;
    case '\'':
      return 3;
    case '"':
      return 4;
    default:
      return 5;
  }
}

GridPoint SelectionController::wordStart(const TerminalGrid &grid,
                                         GridPoint point) {
  int category = wordCategory(charAt(grid, point));
  while (true) {
    GridPoint prev;
    if (point.column > 0) {
      prev = GridPoint(point.line, point.column - 1);
    } else if (grid.hasLine(point.line - 1) &&
               wrapsToNext(grid, point.line - 1)) {
      prev = GridPoint(point.line - 1, grid.lastColumn());
    } else {
      break;
    }
    if (wordCategory(charAt(grid, prev)) != category) {
      break;
    }
    point = prev;
  }
  if (grid.cell(point).hasFlag(CELL_WIDE_CHAR_SPACER) && point.column > 0) {
    point.column--;
  }
  return point;
}

GridPoint SelectionController::wordEnd(const TerminalGrid &grid,
                                       GridPoint point) {
  int category = wordCategory(charAt(grid, point));
  while (true) {
    GridPoint next;
    if (point.column < grid.lastColumn()) {
      next = GridPoint(point.line, point.column + 1);
    } else if (grid.hasLine(point.line + 1) && wrapsToNext(grid, point.line)) {
      next = GridPoint(point.line + 1, 0);
    } else {
      break;
    }
    if (wordCategory(charAt(grid, next)) != category) {
      break;
    }
    point = next;
  }
  if (grid.cell(point).hasFlag(CELL_WIDE_CHAR) &&
      point.column < grid.lastColumn()) {
    point.column++;
  }
  return point;
}

GridPoint SelectionController::lineStart(const TerminalGrid &grid,
                                         GridPoint point) {
  int line = point.line;
  while (grid.hasLine(line - 1) && wrapsToNext(grid, line - 1)) {
    line--;
  }
  return GridPoint(line, 0);
}

GridPoint SelectionController::lineEnd(const TerminalGrid &grid,
                                       GridPoint point) {
  int line = point.line;
  while (grid.hasLine(line + 1) && wrapsToNext(grid, line)) {
    line++;
  }
  return GridPoint(line, grid.lastColumn());
}

bool SelectionController::wrapsToNext(const TerminalGrid &grid, int line) {
  return grid.hasLine(line) &&
         grid.row(line)[grid.lastColumn()].hasFlag(CELL_WRAPLINE);
}

char32_t SelectionController::charAt(const TerminalGrid &grid,
                                     const GridPoint &point) {
  const Cell &cell = grid.cell(point);
  if (cell.hasFlag(CELL_WIDE_CHAR_SPACER) && point.column > 0) {
    return grid.cell(GridPoint(point.line, point.column - 1)).c;
  }
  return cell.c;
}
}  // namespace tv
