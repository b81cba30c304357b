#include "TerminalSession.hpp"

namespace tv {
RenderableContent RenderableContent::capture(const TerminalState &state) {
  const TerminalGrid &grid = state.grid;
  RenderableContent content;
  content.columns = grid.columns();
  content.screenLines = grid.screenLines();
  content.displayOffset = grid.displayOffset();
  content.cursor = grid.cursor();
  content.colors = state.colors;
  content.rows.reserve(grid.screenLines());
  int top = -grid.displayOffset();
  for (int line = top; line < top + grid.screenLines(); line++) {
    content.rows.push_back(grid.row(line));
  }
  return content;
}

void TerminalState::scrollSelection(int lines) {
  if (!selection || lines <= 0) {
    return;
  }
  selection->anchor.line -= lines;
  selection->head.line -= lines;

  GridPoint *first = &selection->anchor;
  GridPoint *last = &selection->head;
  if (*last < *first) {
    std::swap(first, last);
  }
  int top = grid.topmostLine();
  if (last->line < top) {
    VLOG(1) << "Selection scrolled out of history";
    selection.reset();
    return;
  }
  if (first->line < top) {
    first->line = top;
    if (selection->kind != SelectionKind::BLOCK) {
      first->column = 0;
    }
  }
}

TerminalSession::TerminalSession(int columns, int lines, int scrollback)
    : state(columns, lines, scrollback) {}

GridGuard TerminalSession::lockGrid() { return GridGuard(stateMutex, state); }

RenderableContent TerminalSession::renderableContent() {
  auto guard = lockGrid();
  return RenderableContent::capture(*guard);
}

void TerminalSession::scrollTo(const Scroll &scroll) {
  auto guard = lockGrid();
  guard->grid.scrollDisplay(scroll);
}

void TerminalSession::resize(int columns, int lines) {
  {
    auto guard = lockGrid();
    // Rows pushed into history by a shrinking screen move with the cursor.
    int cursorLine = guard->grid.cursor().line;
    guard->grid.resize(columns, lines);
    guard->scrollSelection(cursorLine - guard->grid.cursor().line);
  }
  resizeProcess(columns, lines);
}

string TerminalSession::title() {
  auto guard = lockGrid();
  return guard->title;
}
}  // namespace tv
