#ifndef __TV_CHAR_METRICS_HPP__
#define __TV_CHAR_METRICS_HPP__

#include "Headers.hpp"

namespace tv {
/**
 * @brief Measures the advance width of text at a font size.  Supplied by the
 * host's text layout layer.
 */
class TextMeasurer {
 public:
  virtual ~TextMeasurer() {}

  virtual double measure(const string &text, double fontSize) = 0;
};

/**
 * @brief Approximates a monospace font as 0.6 em per character.  Used when
 * no text layout is available (headless runs).
 */
class FixedTextMeasurer : public TextMeasurer {
 public:
  virtual double measure(const string &text, double fontSize);
};

/** @brief Pixel size of one character cell. */
struct CharMetrics {
  double colWidth;
  double rowHeight;

  CharMetrics() : colWidth(0), rowHeight(0) {}
  CharMetrics(double _colWidth, double _rowHeight)
      : colWidth(_colWidth), rowHeight(_rowHeight) {}

  bool valid() const { return colWidth > 0 && rowHeight > 0; }

  bool operator==(const CharMetrics &other) const {
    return colWidth == other.colWidth && rowHeight == other.rowHeight;
  }
  bool operator!=(const CharMetrics &other) const { return !(*this == other); }

  /** @brief Cell size for a font: the width of "W" by the line height. */
  static CharMetrics compute(TextMeasurer *measurer, double fontSize,
                             double lineHeight) {
    return CharMetrics(measurer->measure("W", fontSize), lineHeight);
  }
};
}  // namespace tv

#endif  // __TV_CHAR_METRICS_HPP__
