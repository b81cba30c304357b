#include "RenderEngine.hpp"

#include "SelectionController.hpp"

namespace tv {
namespace {
bool insideBounds(const PixelRect &rect, const PixelSize &size) {
  return rect.x0 >= 0 && rect.y0 >= 0 && rect.x1 <= size.width &&
         rect.y1 <= size.height;
}

PixelRect clipToBounds(const PixelRect &rect, const PixelSize &size) {
  return PixelRect(std::max(0.0, rect.x0), std::max(0.0, rect.y0),
                   std::min(size.width, rect.x1),
                   std::min(size.height, rect.y1));
}
}  // namespace

RenderEngine::RenderEngine(const ThemeColors &_theme, float _dimAlpha,
                           shared_ptr<ColorResolver> _resolver)
    : theme(_theme), dimAlpha(_dimAlpha), resolver(_resolver) {}

void RenderEngine::paint(const PaneFrame &frame, DrawList *out) const {
  const PixelSize &size = frame.size;
  if (size.width <= 0 || size.height <= 0) {
    return;
  }
  out->fillRect(PixelRect(0, 0, size.width, size.height),
                theme.terminalBackground);
  if (!frame.metrics.valid()) {
    VLOG(1) << "Skipping grid paint without char metrics";
    return;
  }

  const RenderableContent &content = frame.content;
  if (content.selection) {
    paintSelection(frame, out);
  } else if (frame.mode == PaneMode::NAVIGATION) {
    double y = (content.cursor.line + content.displayOffset) *
               frame.metrics.rowHeight;
    PixelRect bar(0, y, size.width, y + frame.metrics.rowHeight);
    if (insideBounds(bar, size)) {
      out->fillRect(bar, theme.editorCurrentLine);
    }
  }
  paintCells(frame, out);
  paintMatches(frame, out);
}

void RenderEngine::paintSelection(const PaneFrame &frame,
                                  DrawList *out) const {
  const RenderableContent &content = frame.content;
  const CharMetrics &metrics = frame.metrics;
  for (const auto &span : SelectionController::lineSpans(*content.selection,
                                                         content.columns)) {
    double y = (span.line + content.displayOffset) * metrics.rowHeight;
    if (y < 0 || y + metrics.rowHeight > frame.size.height) {
      continue;
    }
    PixelRect rect(span.left * metrics.colWidth, y,
                   span.right * metrics.colWidth, y + metrics.rowHeight);
    rect = clipToBounds(rect, frame.size);
    if (rect.width() > 0) {
      out->fillRect(rect, theme.editorSelection);
    }
  }
}

void RenderEngine::paintCells(const PaneFrame &frame, DrawList *out) const {
  const RenderableContent &content = frame.content;
  const CharMetrics &metrics = frame.metrics;
  const GridPoint &cursor = content.cursor;
  Color cursorColor = frame.mode == PaneMode::INTERACTIVE
                          ? theme.terminalCursor
                          : theme.editorCaret;

  for (int a = 0; a < int(content.rows.size()); a++) {
    int line = a - content.displayOffset;
    double y = a * metrics.rowHeight;
    if (y + metrics.rowHeight > frame.size.height) {
      break;
    }
    const Row &row = content.rows[a];
    for (int column = 0; column < int(row.size()); column++) {
      const Cell &cell = row[column];
      if (cell.hasFlag(CELL_WIDE_CHAR_SPACER)) {
        continue;
      }
      int width = cell.hasFlag(CELL_WIDE_CHAR) ? 2 : 1;
      PixelRect rect(column * metrics.colWidth, y,
                     (column + width) * metrics.colWidth,
                     y + metrics.rowHeight);
      if (!insideBounds(rect, frame.size)) {
        break;
      }

      Color fg = resolver->resolve(cell.fg, content.colors);
      Color bg = resolver->resolve(cell.bg, content.colors);
      if (cell.hasFlag(CELL_DIM) || cell.hasFlag(CELL_DIM_BOLD)) {
        fg = fg.withAlpha(fg.a * dimAlpha);
      }
      if (cell.hasFlag(CELL_INVERSE)) {
        std::swap(fg, bg);
      }
      if (bg != theme.terminalBackground) {
        out->fillRect(rect, bg);
      }

      // A cursor on the spacer half of a wide character paints the whole
      // character.
      bool onCursor = line == cursor.line &&
                      (column == cursor.column ||
                       (width == 2 && column + 1 == cursor.column));
      if (onCursor) {
        if (frame.focused) {
          out->fillRect(rect, cursorColor);
          fg = theme.terminalBackground;
        } else {
          out->strokeRect(rect, cursorColor, 1.0);
        }
      }

      if (cell.c != ' ' && cell.c != '\t' && cell.c != 0) {
        bool bold = cell.hasFlag(CELL_BOLD) || cell.hasFlag(CELL_DIM_BOLD);
        out->drawGlyph(rect, cell.c, fg, bold);
      }
    }
  }
}

void RenderEngine::paintMatches(const PaneFrame &frame, DrawList *out) const {
  const CharMetrics &metrics = frame.metrics;
  for (const auto &match : frame.matches) {
    // A match continuing onto soft wrapped rows is outlined row by row.
    for (int line = match.start.line; line <= match.end.line; line++) {
      int left = line == match.start.line ? match.start.column : 0;
      int right = line == match.end.line ? match.end.column
                                         : frame.content.columns;
      double y = (line + frame.content.displayOffset) * metrics.rowHeight;
      PixelRect rect(left * metrics.colWidth, y, right * metrics.colWidth,
                     y + metrics.rowHeight);
      if (right <= left || !insideBounds(rect, frame.size)) {
        continue;
      }
      out->strokeRect(rect, theme.terminalForeground, 1.0);
    }
  }
}
}  // namespace tv
