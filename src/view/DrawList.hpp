#ifndef __TV_DRAW_LIST_HPP__
#define __TV_DRAW_LIST_HPP__

#include "GridTypes.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tv {
/** @brief One drawing primitive in pixel space. */
struct DrawOp {
  enum Type { FILL_RECT, STROKE_RECT, DRAW_GLYPH, DRAW_TEXT, DRAW_ICON };
  Type type;
  PixelRect rect;
  Color color;
  /** @brief Code point for DRAW_GLYPH. */
  char32_t glyph;
  /** @brief UTF-8 label for DRAW_TEXT, icon name for DRAW_ICON. */
  string text;
  bool bold;
  double strokeWidth;

  DrawOp() : type(FILL_RECT), glyph(0), bold(false), strokeWidth(0) {}
};

/**
 * @brief Ordered list of draw operations produced by one paint pass.  Later
 * operations paint over earlier ones.
 */
class DrawList {
 public:
  void fillRect(const PixelRect &rect, const Color &color);
  void strokeRect(const PixelRect &rect, const Color &color,
                  double strokeWidth = 1.0);
  /** @brief Draws `glyph` inside the cell rectangle `rect`. */
  void drawGlyph(const PixelRect &rect, char32_t glyph, const Color &color,
                 bool bold);
  void drawText(const PixelRect &rect, const string &text, const Color &color);
  /** @brief Draws the named icon ("close", "add", ...) inside `rect`. */
  void drawIcon(const PixelRect &rect, const string &name,
                const Color &color);

  /** @brief Appends `other` shifted by `(dx, dy)`. */
  void append(const DrawList &other, double dx, double dy);

  const vector<DrawOp> &getOps() const { return ops; }
  int size() const { return int(ops.size()); }
  bool empty() const { return ops.empty(); }
  int count(DrawOp::Type type) const;
  void clear() { ops.clear(); }

  /** @brief Operation counts by type, for diagnostics. */
  json summary() const;

 protected:
  vector<DrawOp> ops;
};
}  // namespace tv

#endif  // __TV_DRAW_LIST_HPP__
