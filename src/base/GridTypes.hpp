#ifndef __TV_GRID_TYPES_HPP__
#define __TV_GRID_TYPES_HPP__

#include "Headers.hpp"

namespace tv {
/**
 * @brief A position in the terminal grid.
 *
 * Lines `0..screenLines-1` are the screen, negative lines are scrollback
 * (`-1` is the most recent history line).
 */
struct GridPoint {
  int line;
  int column;

  GridPoint() : line(0), column(0) {}
  GridPoint(int _line, int _column) : line(_line), column(_column) {}

  bool operator==(const GridPoint &other) const {
    return line == other.line && column == other.column;
  }
  bool operator!=(const GridPoint &other) const { return !(*this == other); }
  bool operator<(const GridPoint &other) const {
    return line < other.line || (line == other.line && column < other.column);
  }
  bool operator<=(const GridPoint &other) const { return !(other < *this); }
};

inline std::ostream &operator<<(std::ostream &os, const GridPoint &p) {
  os << "(" << p.line << "," << p.column << ")";
  return os;
}

/** @brief Cell attribute bits. */
enum CellFlags : uint16_t {
  CELL_INVERSE = 1 << 0,
  CELL_BOLD = 1 << 1,
  CELL_ITALIC = 1 << 2,
  CELL_UNDERLINE = 1 << 3,
  CELL_DIM = 1 << 4,
  /** @brief First half of a double width character. */
  CELL_WIDE_CHAR = 1 << 5,
  /** @brief Placeholder occupying the second column of a wide character. */
  CELL_WIDE_CHAR_SPACER = 1 << 6,
  /** @brief The line continues on the next row (soft wrap). */
  CELL_WRAPLINE = 1 << 7,
  CELL_DIM_BOLD = CELL_DIM | CELL_BOLD,
};

/** @brief A concrete RGBA paint color. */
struct Color {
  uint8_t r;
  uint8_t g;
  uint8_t b;
  float a;

  Color() : r(0), g(0), b(0), a(1.0f) {}
  Color(uint8_t _r, uint8_t _g, uint8_t _b, float _a = 1.0f)
      : r(_r), g(_g), b(_b), a(_a) {}

  Color withAlpha(float alpha) const { return Color(r, g, b, alpha); }

  bool operator==(const Color &other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
  bool operator!=(const Color &other) const { return !(*this == other); }

  /** @brief Parses `#rrggbb` or `#rrggbbaa`. */
  static optional<Color> parse(const string &s);
  string toString() const;
};

inline optional<Color> Color::parse(const string &s) {
  if (s.empty() || s[0] != '#' || (s.length() != 7 && s.length() != 9)) {
    return nullopt;
  }
  uint8_t parts[4] = {0, 0, 0, 255};
  for (size_t a = 1; a < s.length(); a += 2) {
    int value = 0;
    for (size_t b = a; b < a + 2; b++) {
      char ch = char(tolower((unsigned char)s[b]));
      value *= 16;
      if (ch >= '0' && ch <= '9') {
        value += ch - '0';
      } else if (ch >= 'a' && ch <= 'f') {
        value += ch - 'a' + 10;
      } else {
        return nullopt;
      }
    }
    parts[(a - 1) / 2] = uint8_t(value);
  }
  return Color(parts[0], parts[1], parts[2], parts[3] / 255.0f);
}

inline string Color::toString() const {
  char buf[16];
  snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", r, g, b,
           int(std::lround(a * 255.0f)));
  return string(buf);
}

/**
 * @brief Abstract color carried by a cell, resolved to a paint color by a
 * ColorResolver.
 */
struct ColorRef {
  enum Kind { FOREGROUND, BACKGROUND, INDEXED, RGB };
  Kind kind;
  uint8_t index;
  Color rgb;

  ColorRef() : kind(FOREGROUND), index(0) {}

  static ColorRef foreground() { return ColorRef(); }
  static ColorRef background() {
    ColorRef ref;
    ref.kind = BACKGROUND;
    return ref;
  }
  static ColorRef indexed(uint8_t index) {
    ColorRef ref;
    ref.kind = INDEXED;
    ref.index = index;
    return ref;
  }
  static ColorRef direct(const Color &color) {
    ColorRef ref;
    ref.kind = RGB;
    ref.rgb = color;
    return ref;
  }

  bool operator==(const ColorRef &other) const {
    return kind == other.kind && index == other.index && rgb == other.rgb;
  }
};

/** @brief One styled character cell. */
struct Cell {
  char32_t c;
  ColorRef fg;
  ColorRef bg;
  uint16_t flags;

  Cell() : c(' '), fg(ColorRef::foreground()), bg(ColorRef::background()),
           flags(0) {}
  explicit Cell(char32_t _c) : Cell() { c = _c; }

  bool hasFlag(uint16_t flag) const { return (flags & flag) == flag; }
  bool isBlank() const {
    return (c == ' ' || c == '\t' || c == 0) &&
           !(flags & CELL_WIDE_CHAR_SPACER);
  }
};

typedef vector<Cell> Row;

/** @brief How a selection snaps when it is rendered or extracted. */
enum class SelectionKind { CELL, WORD, LINE, BLOCK };

/** @brief Side of a cell, used to break ties when anchor == head. */
enum class Side { LEFT, RIGHT };

/**
 * @brief A selection over grid coordinates.  The anchor never moves once
 * set; dragging only moves the head.
 */
struct SelectionRange {
  SelectionKind kind;
  GridPoint anchor;
  GridPoint head;
  Side side;

  SelectionRange() : kind(SelectionKind::CELL), side(Side::LEFT) {}
  SelectionRange(SelectionKind _kind, const GridPoint &point, Side _side)
      : kind(_kind), anchor(point), head(point), side(_side) {}

  /** @brief A Cell selection that never left its starting cell. */
  bool isEmpty() const {
    return kind == SelectionKind::CELL && anchor == head && side == Side::LEFT;
  }
};

/**
 * @brief A selection after snapping: ordered, inclusive endpoints.
 */
struct SelectionSpan {
  GridPoint start;
  GridPoint end;
  bool isBlock;
};

/** @brief Columns `[left, right)` of one line covered by a selection. */
struct LineSpan {
  int line;
  int left;
  int right;
};

/** @brief Pixel position relative to a pane or panel origin. */
struct PixelPoint {
  double x;
  double y;

  PixelPoint() : x(0), y(0) {}
  PixelPoint(double _x, double _y) : x(_x), y(_y) {}
};

/** @brief Pixel dimensions. */
struct PixelSize {
  double width;
  double height;

  PixelSize() : width(0), height(0) {}
  PixelSize(double _width, double _height) : width(_width), height(_height) {}

  bool operator==(const PixelSize &other) const {
    return width == other.width && height == other.height;
  }
  bool operator!=(const PixelSize &other) const { return !(*this == other); }
};

/** @brief Axis aligned pixel rectangle `[x0,x1) x [y0,y1)`. */
struct PixelRect {
  double x0;
  double y0;
  double x1;
  double y1;

  PixelRect() : x0(0), y0(0), x1(0), y1(0) {}
  PixelRect(double _x0, double _y0, double _x1, double _y1)
      : x0(_x0), y0(_y0), x1(_x1), y1(_y1) {}

  static PixelRect fromOrigin(const PixelPoint &origin, const PixelSize &size) {
    return PixelRect(origin.x, origin.y, origin.x + size.width,
                     origin.y + size.height);
  }

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }
  PixelSize size() const { return PixelSize(width(), height()); }
  PixelPoint origin() const { return PixelPoint(x0, y0); }
  bool contains(const PixelPoint &p) const {
    return p.x >= x0 && p.x < x1 && p.y >= y0 && p.y < y1;
  }
  PixelRect translated(double dx, double dy) const {
    return PixelRect(x0 + dx, y0 + dy, x1 + dx, y1 + dy);
  }

  bool operator==(const PixelRect &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
};
}  // namespace tv

#endif  // __TV_GRID_TYPES_HPP__
