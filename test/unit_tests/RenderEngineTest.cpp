#include "FakeTerminalSession.hpp"
#include "RenderEngine.hpp"
#include "SelectionController.hpp"
#include "TestHeaders.hpp"

using namespace tv;

namespace {
PaneFrame makeFrame(FakeTerminalSession *session, const PixelSize &size) {
  PaneFrame frame;
  frame.content = session->renderableContent();
  frame.metrics = CharMetrics(10, 20);
  frame.size = size;
  frame.focused = true;
  return frame;
}

bool insideBounds(const DrawList &ops, const PixelSize &size) {
  for (const auto &op : ops.getOps()) {
    if (op.rect.x0 < 0 || op.rect.y0 < 0 || op.rect.x1 > size.width ||
        op.rect.y1 > size.height) {
      return false;
    }
  }
  return true;
}

int firstIndexOf(const DrawList &ops, DrawOp::Type type, const Color &color) {
  for (int a = 0; a < ops.size(); a++) {
    if (ops.getOps()[a].type == type && ops.getOps()[a].color == color) {
      return a;
    }
  }
  return -1;
}
}  // namespace

TEST_CASE("Paint starts with the terminal background", "[RenderEngine]") {
  ThemeColors theme;
  RenderEngine engine(theme, 0.5f,
                      shared_ptr<ColorResolver>(new ThemeColorResolver(theme)));
  FakeTerminalSession session(10, 3);
  session.feed("hi");
  PaneFrame frame = makeFrame(&session, PixelSize(100, 60));

  DrawList out;
  engine.paint(frame, &out);
  REQUIRE(out.size() > 1);
  REQUIRE(out.getOps()[0].type == DrawOp::FILL_RECT);
  REQUIRE(out.getOps()[0].rect == PixelRect(0, 0, 100, 60));
  REQUIRE(out.getOps()[0].color == theme.terminalBackground);
  REQUIRE(out.count(DrawOp::DRAW_GLYPH) == 2);

  SECTION("Without char metrics only the background is drawn") {
    frame.metrics = CharMetrics();
    DrawList bare;
    engine.paint(frame, &bare);
    REQUIRE(bare.size() == 1);
  }

  SECTION("Zero size draws nothing") {
    frame.size = PixelSize(0, 0);
    DrawList none;
    engine.paint(frame, &none);
    REQUIRE(none.empty());
  }
}

TEST_CASE("Nothing is drawn outside the pane bounds", "[RenderEngine]") {
  ThemeColors theme;
  RenderEngine engine(theme, 0.5f,
                      shared_ptr<ColorResolver>(new ThemeColorResolver(theme)));
  FakeTerminalSession session(80, 24);
  string line(80, 'x');
  for (int a = 0; a < 24; a++) {
    session.feed(line);
  }
  {
    auto guard = session.lockGrid();
    SelectionRange range(SelectionKind::CELL, GridPoint(2, 5), Side::LEFT);
    range.head = GridPoint(20, 70);
    guard->selection = range;
  }
  PaneFrame frame = makeFrame(&session, PixelSize(400, 240));
  {
    auto guard = session.lockGrid();
    frame.content.selection =
        SelectionController::resolve(guard->grid, *guard->selection);
  }
  SearchMatch match;
  match.start = GridPoint(20, 70);
  match.end = GridPoint(20, 75);
  frame.matches.push_back(match);

  DrawList out;
  engine.paint(frame, &out);
  REQUIRE(out.count(DrawOp::DRAW_GLYPH) == 40 * 12);
  REQUIRE(out.count(DrawOp::STROKE_RECT) == 0);
  REQUIRE(insideBounds(out, frame.size));
}

TEST_CASE("Paint order", "[RenderEngine]") {
  ThemeColors theme;
  RenderEngine engine(theme, 0.5f,
                      shared_ptr<ColorResolver>(new ThemeColorResolver(theme)));
  FakeTerminalSession session(10, 3);
  session.feed("abc");
  PaneFrame frame = makeFrame(&session, PixelSize(100, 60));
  SelectionRange range(SelectionKind::CELL, GridPoint(0, 0), Side::LEFT);
  range.head = GridPoint(0, 1);
  {
    auto guard = session.lockGrid();
    frame.content.selection = SelectionController::resolve(guard->grid, range);
  }
  SearchMatch match;
  match.start = GridPoint(0, 1);
  match.end = GridPoint(0, 3);
  frame.matches.push_back(match);

  DrawList out;
  engine.paint(frame, &out);
  int selection = firstIndexOf(out, DrawOp::FILL_RECT, theme.editorSelection);
  int glyph = -1;
  for (int a = 0; a < out.size(); a++) {
    if (out.getOps()[a].type == DrawOp::DRAW_GLYPH) {
      glyph = a;
      break;
    }
  }
  REQUIRE(selection > 0);
  REQUIRE(glyph > selection);
  REQUIRE(out.getOps()[selection].rect == PixelRect(0, 0, 20, 20));

  const DrawOp &last = out.getOps().back();
  REQUIRE(last.type == DrawOp::STROKE_RECT);
  REQUIRE(last.color == theme.terminalForeground);
  REQUIRE(last.rect == PixelRect(10, 0, 30, 20));
}

TEST_CASE("Cursor rendering", "[RenderEngine]") {
  ThemeColors theme;
  RenderEngine engine(theme, 0.5f,
                      shared_ptr<ColorResolver>(new ThemeColorResolver(theme)));
  FakeTerminalSession session(10, 3);
  session.feed("ab");
  PaneFrame frame = makeFrame(&session, PixelSize(100, 60));
  PixelRect cursorRect(20, 0, 30, 20);

  SECTION("Focused interactive cursor is a filled block") {
    DrawList out;
    engine.paint(frame, &out);
    int index = firstIndexOf(out, DrawOp::FILL_RECT, theme.terminalCursor);
    REQUIRE(index > 0);
    REQUIRE(out.getOps()[index].rect == cursorRect);
  }

  SECTION("Unfocused cursor is an outline") {
    frame.focused = false;
    DrawList out;
    engine.paint(frame, &out);
    REQUIRE(firstIndexOf(out, DrawOp::FILL_RECT, theme.terminalCursor) == -1);
    int index = firstIndexOf(out, DrawOp::STROKE_RECT, theme.terminalCursor);
    REQUIRE(index > 0);
    REQUIRE(out.getOps()[index].rect == cursorRect);
  }

  SECTION("Navigation mode uses the caret color and a line bar") {
    frame.mode = PaneMode::NAVIGATION;
    DrawList out;
    engine.paint(frame, &out);
    REQUIRE(firstIndexOf(out, DrawOp::FILL_RECT, theme.editorCaret) > 0);
    int bar = firstIndexOf(out, DrawOp::FILL_RECT, theme.editorCurrentLine);
    REQUIRE(bar == 1);
    REQUIRE(out.getOps()[bar].rect == PixelRect(0, 0, 100, 20));
  }

  SECTION("Glyph under a focused cursor uses the background color") {
    session.feed("\b");
    PaneFrame onGlyph = makeFrame(&session, PixelSize(100, 60));
    DrawList out;
    engine.paint(onGlyph, &out);
    const DrawOp &glyph = out.getOps().back();
    REQUIRE(glyph.type == DrawOp::DRAW_GLYPH);
    REQUIRE(glyph.glyph == 'b');
    REQUIRE(glyph.color == theme.terminalBackground);
  }
}

TEST_CASE("Cursor on the second half of a wide character",
          "[RenderEngine]") {
  ThemeColors theme;
  RenderEngine engine(theme, 0.5f,
                      shared_ptr<ColorResolver>(new ThemeColorResolver(theme)));
  FakeTerminalSession session(10, 3);
  session.feed("\xe4\xb8\xad\b");
  PaneFrame frame = makeFrame(&session, PixelSize(100, 60));
  REQUIRE(frame.content.cursor == GridPoint(0, 1));

  DrawList out;
  engine.paint(frame, &out);
  int index = firstIndexOf(out, DrawOp::FILL_RECT, theme.terminalCursor);
  REQUIRE(index > 0);
  REQUIRE(out.getOps()[index].rect == PixelRect(0, 0, 20, 20));
}

TEST_CASE("Matches across a soft wrap are outlined on each row",
          "[RenderEngine]") {
  ThemeColors theme;
  RenderEngine engine(theme, 0.5f,
                      shared_ptr<ColorResolver>(new ThemeColorResolver(theme)));
  FakeTerminalSession session(5, 2);
  session.feed("abchello");
  PaneFrame frame = makeFrame(&session, PixelSize(50, 40));
  SearchMatch match;
  match.start = GridPoint(0, 3);
  match.end = GridPoint(1, 3);
  frame.matches.push_back(match);

  DrawList out;
  engine.paint(frame, &out);
  vector<PixelRect> outlines;
  for (const auto &op : out.getOps()) {
    if (op.type == DrawOp::STROKE_RECT &&
        op.color == theme.terminalForeground) {
      outlines.push_back(op.rect);
    }
  }
  REQUIRE(outlines.size() == 2);
  REQUIRE(outlines[0] == PixelRect(30, 0, 50, 20));
  REQUIRE(outlines[1] == PixelRect(0, 20, 30, 40));
}

TEST_CASE("Cell attributes", "[RenderEngine]") {
  ThemeColors theme;
  RenderEngine engine(theme, 0.5f,
                      shared_ptr<ColorResolver>(new ThemeColorResolver(theme)));
  FakeTerminalSession session(10, 3);
  session.feed("abc");
  PaneFrame frame = makeFrame(&session, PixelSize(100, 60));
  frame.focused = false;
  Row &row = frame.content.rows[0];

  SECTION("Dim text is faded") {
    row[0].flags = CELL_DIM;
    DrawList out;
    engine.paint(frame, &out);
    int index = -1;
    for (int a = 0; a < out.size(); a++) {
      if (out.getOps()[a].glyph == 'a') {
        index = a;
      }
    }
    REQUIRE(index > 0);
    REQUIRE(out.getOps()[index].color.a == Approx(0.5f));
    REQUIRE_FALSE(out.getOps()[index].bold);
  }

  SECTION("Bold text") {
    row[1].flags = CELL_DIM_BOLD;
    DrawList out;
    engine.paint(frame, &out);
    for (const auto &op : out.getOps()) {
      if (op.glyph == 'b') {
        REQUIRE(op.bold);
        REQUIRE(op.color.a == Approx(0.5f));
      }
    }
  }

  SECTION("Inverse swaps foreground and background") {
    row[2].flags = CELL_INVERSE;
    DrawList out;
    engine.paint(frame, &out);
    int fill = firstIndexOf(out, DrawOp::FILL_RECT, theme.terminalForeground);
    REQUIRE(fill > 0);
    REQUIRE(out.getOps()[fill].rect == PixelRect(20, 0, 30, 20));
    for (const auto &op : out.getOps()) {
      if (op.glyph == 'c') {
        REQUIRE(op.color == theme.terminalBackground);
      }
    }
  }

  SECTION("Program colors override the theme") {
    row[0].fg = ColorRef::indexed(1);
    frame.content.colors[1] = Color(1, 2, 3);
    DrawList out;
    engine.paint(frame, &out);
    for (const auto &op : out.getOps()) {
      if (op.glyph == 'a') {
        REQUIRE(op.color == Color(1, 2, 3));
      }
    }
  }
}

TEST_CASE("Palette resolution", "[RenderEngine]") {
  ThemeColors theme;
  ThemeColorResolver resolver(theme);
  map<int, Color> none;

  REQUIRE(resolver.resolve(ColorRef::foreground(), none) ==
          theme.terminalForeground);
  REQUIRE(resolver.resolve(ColorRef::background(), none) ==
          theme.terminalBackground);
  REQUIRE(resolver.resolve(ColorRef::indexed(9), none) == theme.ansi[9]);
  REQUIRE(resolver.indexed(16) == Color(0, 0, 0));
  REQUIRE(resolver.indexed(231) == Color(255, 255, 255));
  REQUIRE(resolver.indexed(196) == Color(255, 0, 0));
  REQUIRE(resolver.indexed(232) == Color(8, 8, 8));
  REQUIRE(resolver.indexed(255) == Color(238, 238, 238));
  REQUIRE(resolver.resolve(ColorRef::direct(Color(4, 5, 6)), none) ==
          Color(4, 5, 6));

  map<int, Color> overrides;
  overrides[PALETTE_BACKGROUND] = Color(9, 9, 9);
  REQUIRE(resolver.resolve(ColorRef::background(), overrides) ==
          Color(9, 9, 9));
}
