#include "OutputFeeder.hpp"

namespace tv {
namespace {
const int TAB_WIDTH = 8;
}

int OutputFeeder::advance(TerminalGrid *grid, const string &bytes) {
  linesScrolled = 0;
  u32string decoded;
  decoded.reserve(bytes.length());
  for (char ch : bytes) {
    decoder.feed(uint8_t(ch), &decoded);
  }
  for (char32_t c : decoded) {
    handle(grid, c);
  }
  return linesScrolled;
}

void OutputFeeder::advance(TerminalState *state, const string &bytes) {
  int scrolled = advance(&state->grid, bytes);
  if (scrolled > 0) {
    state->scrollSelection(scrolled);
  }
}

void OutputFeeder::handle(TerminalGrid *grid, char32_t c) {
  switch (escapeState) {
    case ESCAPE:
      if (c == '[') {
        escapeState = CSI;
      } else if (c == ']') {
        escapeState = OSC;
      } else {
        // Two character escape, nothing more to skip.
        escapeState = GROUND;
      }
      return;
    case CSI:
      if (c >= 0x40 && c <= 0x7E) {
        escapeState = GROUND;
      }
      return;
    case OSC:
      if (c == 0x07) {
        escapeState = GROUND;
      } else if (c == 0x1B) {
        escapeState = OSC_ESCAPE;
      }
      return;
    case OSC_ESCAPE:
      escapeState = (c == '\\') ? GROUND : OSC;
      return;
    case GROUND:
      break;
  }

  GridPoint cursor = grid->cursor();
  switch (c) {
    case 0x1B:
      escapeState = ESCAPE;
      break;
    case '\r':
      wrapPending = false;
      grid->setCursor(GridPoint(cursor.line, 0));
      break;
    case '\n':
    case 0x0B:
    case 0x0C:
      wrapPending = false;
      lineFeed(grid);
      break;
    case '\b':
      wrapPending = false;
      grid->setCursor(GridPoint(cursor.line, cursor.column - 1));
      break;
    case '\t': {
      wrapPending = false;
      int next = (cursor.column / TAB_WIDTH + 1) * TAB_WIDTH;
      grid->setCursor(GridPoint(cursor.line, next));
      break;
    }
    default:
      if (c < 0x20 || c == 0x7F) {
        // Other control characters (BEL, SO, SI, ...) have no visible effect.
        break;
      }
      print(grid, c);
      break;
  }
}

void OutputFeeder::print(TerminalGrid *grid, char32_t c) {
  int width = charWidth(c);
  if (width > grid->columns()) {
    return;
  }
  GridPoint cursor = grid->cursor();
  if (wrapPending || cursor.column + width > grid->columns()) {
    grid->row(cursor.line)[grid->lastColumn()].flags |= CELL_WRAPLINE;
    wrapPending = false;
    lineFeed(grid);
    cursor = GridPoint(grid->cursor().line, 0);
  }

  Row &row = grid->row(cursor.line);
  Cell &cell = row[cursor.column];
  cell = Cell(c);
  if (width == 2) {
    cell.flags |= CELL_WIDE_CHAR;
    Cell &spacer = row[cursor.column + 1];
    spacer = Cell(' ');
    spacer.flags |= CELL_WIDE_CHAR_SPACER;
  }

  int next = cursor.column + width;
  if (next > grid->lastColumn()) {
    // Stay on the last column until the next printable character wraps.
    wrapPending = true;
    grid->setCursor(GridPoint(cursor.line, grid->lastColumn()));
  } else {
    grid->setCursor(GridPoint(cursor.line, next));
  }
}

void OutputFeeder::lineFeed(TerminalGrid *grid) {
  GridPoint cursor = grid->cursor();
  if (cursor.line >= grid->bottommostLine()) {
    grid->scrollUp();
    linesScrolled++;
    grid->setCursor(GridPoint(grid->bottommostLine(), cursor.column));
  } else {
    grid->setCursor(GridPoint(cursor.line + 1, cursor.column));
  }
}
}  // namespace tv
