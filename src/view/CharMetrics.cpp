#include "CharMetrics.hpp"

#include "Utf8.hpp"

namespace tv {
double FixedTextMeasurer::measure(const string &text, double fontSize) {
  double columns = 0;
  for (char32_t c : decodeUtf8(text)) {
    columns += charWidth(c);
  }
  return columns * fontSize * 0.6;
}
}  // namespace tv
