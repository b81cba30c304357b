#include "TerminalPane.hpp"

#include "SelectionController.hpp"

namespace tv {
TerminalPane::TerminalPane(const WidgetId &_splitId,
                           shared_ptr<TerminalSession> _session,
                           const string &_profileName)
    : id(newWidgetId()),
      splitId(_splitId),
      session(_session),
      profileName(_profileName),
      columns(0),
      lines(0),
      mode(PaneMode::INTERACTIVE),
      wheelRemainder(0),
      closed(false) {
  auto guard = session->lockGrid();
  columns = guard->grid.columns();
  lines = guard->grid.screenLines();
}

TerminalPane::~TerminalPane() { close(); }

string TerminalPane::getTitle() {
  string title = session->title();
  if (!title.empty()) {
    return title;
  }
  return profileName.empty() ? string("terminal") : profileName;
}

void TerminalPane::setMode(PaneMode _mode) {
  if (mode != _mode) {
    VLOG(1) << "Pane " << id << " switching to " << paneModeName(_mode);
  }
  mode = _mode;
}

bool TerminalPane::resize(const PixelSize &size, const CharMetrics &_metrics) {
  pixelSize = size;
  metrics = _metrics;
  if (!metrics.valid()) {
    return false;
  }
  int newColumns = std::max(1, int(std::floor(size.width / metrics.colWidth)));
  int newLines = std::max(1, int(std::floor(size.height / metrics.rowHeight)));
  if (newColumns == columns && newLines == lines) {
    return false;
  }
  columns = newColumns;
  lines = newLines;
  session->resize(columns, lines);
  return true;
}

void TerminalPane::write(const string &bytes) {
  session->write(bytes);
  session->scrollTo(Scroll::bottom());
}

void TerminalPane::scroll(const Scroll &scroll) { session->scrollTo(scroll); }

void TerminalPane::wheel(double deltaY, bool lineMode, int linesPerNotch) {
  int rows;
  if (lineMode) {
    rows = int(std::lround(deltaY * linesPerNotch));
  } else {
    if (!metrics.valid()) {
      return;
    }
    wheelRemainder += deltaY;
    rows = int(wheelRemainder / metrics.rowHeight);
    wheelRemainder -= rows * metrics.rowHeight;
  }
  if (rows != 0) {
    // Positive deltas move towards the bottom, which lowers the offset.
    session->scrollTo(Scroll::lines(-rows));
  }
}

optional<SelectionRange> TerminalPane::getSelection() {
  auto guard = session->lockGrid();
  return guard->selection;
}

void TerminalPane::clearSelection() {
  auto guard = session->lockGrid();
  guard->selection.reset();
}

void TerminalPane::selectAt(const PixelPoint &pos, SelectionKind kind) {
  auto guard = session->lockGrid();
  const TerminalGrid &grid = guard->grid;
  GridPoint point = SelectionController::pointFromPixel(
      pos, metrics, grid.displayOffset(), grid.screenLines());
  guard->selection = SelectionController::beginOrExtend(
      nullopt, point, kind, SelectionController::sideFromPixel(pos, metrics));
}

void TerminalPane::extendSelection(const PixelPoint &pos, SelectionKind kind) {
  auto guard = session->lockGrid();
  const TerminalGrid &grid = guard->grid;
  if (!guard->selection) {
    PixelPoint origin = pressOrigin ? *pressOrigin : pos;
    GridPoint anchor = SelectionController::pointFromPixel(
        origin, metrics, grid.displayOffset(), grid.screenLines());
    guard->selection = SelectionController::beginOrExtend(
        nullopt, anchor, kind,
        SelectionController::sideFromPixel(origin, metrics));
  }
  GridPoint head = SelectionController::pointFromPixel(
      pos, metrics, grid.displayOffset(), grid.screenLines());
  guard->selection = SelectionController::beginOrExtend(guard->selection, head,
                                                        kind, Side::LEFT);
}

optional<string> TerminalPane::selectedText() {
  auto guard = session->lockGrid();
  if (!guard->selection) {
    return nullopt;
  }
  return SelectionController::extractText(guard->grid, *guard->selection);
}

bool TerminalPane::copySelection(Clipboard *clipboard) {
  auto text = selectedText();
  if (!text) {
    return false;
  }
  clipboard->putText(*text);
  clearSelection();
  return true;
}

bool TerminalPane::paste(Clipboard *clipboard) {
  auto text = clipboard->getText();
  if (!text || text->empty()) {
    return false;
  }
  write(*text);
  return true;
}

void TerminalPane::handleMouse(const MouseEvent &event, Clipboard *clipboard) {
  switch (event.type) {
    case MouseEvent::DOWN:
      if (event.button == MouseButton::RIGHT) {
        if (!copySelection(clipboard)) {
          paste(clipboard);
        }
      } else if (event.button == MouseButton::LEFT) {
        pressOrigin = event.pos;
        clearSelection();
        if (event.count == 2) {
          selectAt(event.pos, SelectionKind::WORD);
        } else if (event.count == 3) {
          selectAt(event.pos, SelectionKind::LINE);
        }
      }
      break;
    case MouseEvent::MOVE:
      if (event.leftHeld && pressOrigin) {
        extendSelection(event.pos, (event.modifiers & MOD_ALT)
                                       ? SelectionKind::BLOCK
                                       : SelectionKind::CELL);
      }
      break;
    case MouseEvent::UP:
      if (event.button == MouseButton::LEFT) {
        pressOrigin.reset();
      }
      break;
  }
}

bool TerminalPane::handleKey(const KeyEvent &event,
                             const optional<KeyChord> &toggle,
                             Clipboard *clipboard, CommandChannel *channel) {
  if (toggle && toggle->matches(event)) {
    setMode(mode == PaneMode::INTERACTIVE ? PaneMode::NAVIGATION
                                          : PaneMode::INTERACTIVE);
    return true;
  }
  if (mode == PaneMode::NAVIGATION) {
    return handleNavigationKey(event, clipboard, channel);
  }
  auto bytes = KeyEncoder::encode(event);
  if (!bytes) {
    return false;
  }
  write(*bytes);
  return true;
}

bool TerminalPane::handleNavigationKey(const KeyEvent &event,
                                       Clipboard *clipboard,
                                       CommandChannel *channel) {
  bool hasSelection = bool(getSelection());
  bool ctrl = event.hasModifier(MOD_CTRL);
  switch (event.key) {
    case Key::ESCAPE:
      clearSelection();
      return true;
    case Key::UP:
      hasSelection ? moveSelectionHead(-1) : scroll(Scroll::lines(1));
      return true;
    case Key::DOWN:
      hasSelection ? moveSelectionHead(1) : scroll(Scroll::lines(-1));
      return true;
    case Key::PAGE_UP:
      scroll(Scroll::pageUp());
      return true;
    case Key::PAGE_DOWN:
      scroll(Scroll::pageDown());
      return true;
    case Key::CHARACTER:
      break;
    default:
      return false;
  }

  if (event.text.length() != 1) {
    return false;
  }
  char c = event.text[0];
  if (ctrl) {
    if (c == 'd' || c == 'D') {
      scroll(Scroll::lines(-std::max(1, lines / 2)));
      return true;
    }
    if (c == 'u' || c == 'U') {
      scroll(Scroll::lines(std::max(1, lines / 2)));
      return true;
    }
    return false;
  }
  switch (c) {
    case 'i':
    case 'a':
      setMode(PaneMode::INTERACTIVE);
      return true;
    case 'j':
      hasSelection ? moveSelectionHead(1) : scroll(Scroll::lines(-1));
      return true;
    case 'k':
      hasSelection ? moveSelectionHead(-1) : scroll(Scroll::lines(1));
      return true;
    case 'g':
      scroll(Scroll::top());
      return true;
    case 'G':
      scroll(Scroll::bottom());
      return true;
    case 'y':
      copySelection(clipboard);
      return true;
    case 'p':
      paste(clipboard);
      return true;
    case 'v': {
      auto guard = session->lockGrid();
      if (guard->selection) {
        guard->selection.reset();
      } else {
        guard->selection = SelectionRange(
            SelectionKind::LINE, guard->grid.cursor(), Side::LEFT);
      }
      return true;
    }
    case '/':
      channel->post(ShowSearch());
      return true;
    default:
      return false;
  }
}

void TerminalPane::moveSelectionHead(int lineDelta) {
  auto guard = session->lockGrid();
  if (!guard->selection) {
    return;
  }
  const TerminalGrid &grid = guard->grid;
  GridPoint head = guard->selection->head;
  head.line = std::max(grid.topmostLine(),
                       std::min(head.line + lineDelta, grid.bottommostLine()));
  guard->selection->head = head;
}

PaneFrame TerminalPane::frame(const RegexSearch *search, bool focused) {
  PaneFrame frame;
  {
    auto guard = session->lockGrid();
    const TerminalGrid &grid = guard->grid;
    frame.content = RenderableContent::capture(*guard);
    if (guard->selection) {
      frame.content.selection =
          SelectionController::resolve(grid, *guard->selection);
    }
    if (search) {
      frame.matches = SearchHighlighter::collect(grid, *search);
    }
  }
  if (frame.content.columns != columns ||
      frame.content.screenLines != lines) {
    VLOG(1) << "Pane " << id << " painting a " << frame.content.columns << "x"
            << frame.content.screenLines << " grid laid out for " << columns
            << "x" << lines;
  }
  frame.metrics = metrics;
  frame.size = pixelSize;
  frame.focused = focused;
  frame.mode = mode;
  return frame;
}

bool TerminalPane::isRunning() { return !closed && session->isRunning(); }

void TerminalPane::close() {
  if (closed) {
    return;
  }
  closed = true;
  LOG(INFO) << "Closing pane " << id;
  session->close();
}
}  // namespace tv
