#include "TerminalGrid.hpp"

#include "Utf8.hpp"

namespace tv {
namespace {
const Cell BLANK_CELL;
}

TerminalGrid::TerminalGrid(int columns, int screenLines, int _maxScrollback)
    : numColumns(std::max(1, columns)),
      numScreenLines(std::max(1, screenLines)),
      maxScrollback(std::max(0, _maxScrollback)),
      offset(0) {
  rows.resize(numScreenLines, Row(numColumns));
}

const Row &TerminalGrid::row(int line) const {
  if (!hasLine(line)) {
    STFATAL << "Grid line out of range: " << line << " not in ["
            << topmostLine() << "," << bottommostLine() << "]";
  }
  return rows[rowIndex(line)];
}

Row &TerminalGrid::row(int line) {
  if (!hasLine(line)) {
    STFATAL << "Grid line out of range: " << line << " not in ["
            << topmostLine() << "," << bottommostLine() << "]";
  }
  return rows[rowIndex(line)];
}

const Cell &TerminalGrid::cell(const GridPoint &point) const {
  if (!hasLine(point.line) || point.column < 0 ||
      point.column >= numColumns) {
    return BLANK_CELL;
  }
  return rows[rowIndex(point.line)][point.column];
}

void TerminalGrid::setCursor(const GridPoint &point) {
  cursorPoint.line = std::max(0, std::min(point.line, bottommostLine()));
  cursorPoint.column = std::max(0, std::min(point.column, lastColumn()));
}

void TerminalGrid::resize(int columns, int screenLines) {
  columns = std::max(1, columns);
  screenLines = std::max(1, screenLines);
  if (columns == numColumns && screenLines == numScreenLines) {
    return;
  }
  VLOG(1) << "Resizing grid from " << numColumns << "x" << numScreenLines
          << " to " << columns << "x" << screenLines;

  for (auto &it : rows) {
    // The soft wrap marker lives on the last column, wherever that ends up.
    bool wrapped = it.back().hasFlag(CELL_WRAPLINE);
    it.back().flags = uint16_t(it.back().flags & ~CELL_WRAPLINE);
    it.resize(columns);
    // A wide character cut in half by the new width is replaced by a blank.
    if (it.back().hasFlag(CELL_WIDE_CHAR)) {
      it.back() = Cell();
    }
    if (wrapped) {
      it.back().flags |= CELL_WRAPLINE;
    }
  }

  if (screenLines < numScreenLines) {
    // Keep the cursor on screen: blank rows below the cursor are dropped
    // first, the rest moves into history.
    int excess = numScreenLines - screenLines;
    int drop = 0;
    while (drop < excess && cursorPoint.line < numScreenLines - 1 - drop &&
           std::all_of(rows.back().begin(), rows.back().end(),
                       [](const Cell &c) { return c.isBlank(); })) {
      rows.pop_back();
      drop++;
    }
    cursorPoint.line -= (excess - drop);
  } else {
    // Grow at the bottom, pulling nothing back from history.
    int extra = screenLines - numScreenLines;
    for (int a = 0; a < extra; a++) {
      rows.push_back(Row(columns));
    }
  }

  numColumns = columns;
  numScreenLines = screenLines;
  // Rows that left the screen are history now.
  trimHistory();
  cursorPoint.line = std::max(0, std::min(cursorPoint.line, bottommostLine()));
  cursorPoint.column = std::min(cursorPoint.column, lastColumn());
  offset = std::min(offset, historySize());
}

void TerminalGrid::scrollDisplay(const Scroll &scroll) {
  int target = offset;
  switch (scroll.type) {
    case Scroll::DELTA:
      target = offset + scroll.delta;
      break;
    case Scroll::PAGE_UP:
      target = offset + numScreenLines;
      break;
    case Scroll::PAGE_DOWN:
      target = offset - numScreenLines;
      break;
    case Scroll::TOP:
      target = historySize();
      break;
    case Scroll::BOTTOM:
      target = 0;
      break;
  }
  offset = std::max(0, std::min(target, historySize()));
}

void TerminalGrid::scrollUp() {
  rows.push_back(Row(numColumns));
  trimHistory();
  if (offset > 0) {
    // Keep the viewport anchored on the same content while scrolled back.
    offset = std::min(offset + 1, historySize());
  }
}

void TerminalGrid::clear() {
  rows.clear();
  rows.resize(numScreenLines, Row(numColumns));
  cursorPoint = GridPoint();
  offset = 0;
}

string TerminalGrid::lineText(int line) const {
  string retval;
  if (!hasLine(line)) {
    return retval;
  }
  for (const auto &it : row(line)) {
    if (it.hasFlag(CELL_WIDE_CHAR_SPACER)) {
      continue;
    }
    appendUtf8(it.c == 0 ? ' ' : it.c, &retval);
  }
  auto end = retval.find_last_not_of(" \t");
  return end == string::npos ? string() : retval.substr(0, end + 1);
}

void TerminalGrid::trimHistory() {
  while (historySize() > maxScrollback) {
    rows.pop_front();
  }
}
}  // namespace tv
