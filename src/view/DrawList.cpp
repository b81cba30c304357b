#include "DrawList.hpp"

namespace tv {
void DrawList::fillRect(const PixelRect &rect, const Color &color) {
  DrawOp op;
  op.type = DrawOp::FILL_RECT;
  op.rect = rect;
  op.color = color;
  ops.push_back(op);
}

void DrawList::strokeRect(const PixelRect &rect, const Color &color,
                          double strokeWidth) {
  DrawOp op;
  op.type = DrawOp::STROKE_RECT;
  op.rect = rect;
  op.color = color;
  op.strokeWidth = strokeWidth;
  ops.push_back(op);
}

void DrawList::drawGlyph(const PixelRect &rect, char32_t glyph,
                         const Color &color, bool bold) {
  DrawOp op;
  op.type = DrawOp::DRAW_GLYPH;
  op.rect = rect;
  op.color = color;
  op.glyph = glyph;
  op.bold = bold;
  ops.push_back(op);
}

void DrawList::drawText(const PixelRect &rect, const string &text,
                        const Color &color) {
  DrawOp op;
  op.type = DrawOp::DRAW_TEXT;
  op.rect = rect;
  op.color = color;
  op.text = text;
  ops.push_back(op);
}

void DrawList::drawIcon(const PixelRect &rect, const string &name,
                        const Color &color) {
  DrawOp op;
  op.type = DrawOp::DRAW_ICON;
  op.rect = rect;
  op.color = color;
  op.text = name;
  ops.push_back(op);
}

void DrawList::append(const DrawList &other, double dx, double dy) {
  ops.reserve(ops.size() + other.ops.size());
  for (const auto &op : other.ops) {
    ops.push_back(op);
    ops.back().rect = op.rect.translated(dx, dy);
  }
}

int DrawList::count(DrawOp::Type type) const {
  return int(std::count_if(ops.begin(), ops.end(), [type](const DrawOp &op) {
    return op.type == type;
  }));
}

json DrawList::summary() const {
  json j;
  j["fillRect"] = count(DrawOp::FILL_RECT);
  j["strokeRect"] = count(DrawOp::STROKE_RECT);
  j["glyph"] = count(DrawOp::DRAW_GLYPH);
  j["text"] = count(DrawOp::DRAW_TEXT);
  j["icon"] = count(DrawOp::DRAW_ICON);
  return j;
}
}  // namespace tv
