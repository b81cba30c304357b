#ifndef __TV_TERMINAL_GRID_HPP__
#define __TV_TERMINAL_GRID_HPP__

#include "GridTypes.hpp"
#include "Headers.hpp"

namespace tv {
/** @brief A request to move the visible window through scrollback. */
struct Scroll {
  enum Type { DELTA, PAGE_UP, PAGE_DOWN, TOP, BOTTOM };
  Type type;
  /** @brief Lines to scroll for DELTA; positive scrolls up into history. */
  int delta;

  static Scroll lines(int delta) { return Scroll{DELTA, delta}; }
  static Scroll pageUp() { return Scroll{PAGE_UP, 0}; }
  static Scroll pageDown() { return Scroll{PAGE_DOWN, 0}; }
  static Scroll top() { return Scroll{TOP, 0}; }
  static Scroll bottom() { return Scroll{BOTTOM, 0}; }
};

/**
 * @brief Character grid with scrollback history.
 *
 * Rows are stored oldest first.  The last `screenLines()` rows are the
 * screen, anything before them is history addressed with negative lines.
 */
class TerminalGrid {
 public:
  TerminalGrid(int columns, int screenLines, int maxScrollback);

  int columns() const { return numColumns; }
  int screenLines() const { return numScreenLines; }
  int historySize() const { return int(rows.size()) - numScreenLines; }
  int topmostLine() const { return -historySize(); }
  int bottommostLine() const { return numScreenLines - 1; }
  int lastColumn() const { return numColumns - 1; }
  int displayOffset() const { return offset; }

  /** @brief True if `line` addresses a stored row. */
  bool hasLine(int line) const {
    return line >= topmostLine() && line <= bottommostLine();
  }

  const Row &row(int line) const;
  Row &row(int line);

  /** @brief Cell lookup, columns past the end return a blank cell. */
  const Cell &cell(const GridPoint &point) const;

  GridPoint cursor() const { return cursorPoint; }
  void setCursor(const GridPoint &point);

  /**
   * @brief Changes the grid dimensions.  Rows are truncated or padded to the
   * new width; lines pushed off the top of a shrinking screen go into
   * history.
   */
  void resize(int columns, int screenLines);

  /** @brief Moves the visible window, clamped to the available history. */
  void scrollDisplay(const Scroll &scroll);

  /** @brief Moves the screen up one line, pushing the top row to history. */
  void scrollUp();

  /** @brief Clears the screen and history. */
  void clear();

  /** @brief Text of one row with trailing blanks removed. */
  string lineText(int line) const;

 protected:
  int numColumns;
  int numScreenLines;
  int maxScrollback;
  int offset;
  GridPoint cursorPoint;
  deque<Row> rows;

  int rowIndex(int line) const { return line + historySize(); }
  void trimHistory();
};
}  // namespace tv

#endif  // __TV_TERMINAL_GRID_HPP__
