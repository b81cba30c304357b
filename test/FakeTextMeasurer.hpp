#ifndef __TV_FAKE_TEXT_MEASURER_HPP__
#define __TV_FAKE_TEXT_MEASURER_HPP__

#include "CharMetrics.hpp"
#include "Utf8.hpp"

namespace tv {
/** @brief Every character is `charWidth` pixels wide at any font size. */
class FakeTextMeasurer : public TextMeasurer {
 public:
  explicit FakeTextMeasurer(double _charWidth) : charWidth(_charWidth) {}

  virtual double measure(const string &text, double fontSize) {
    return decodeUtf8(text).length() * charWidth;
  }

 protected:
  double charWidth;
};
}  // namespace tv

#endif  // __TV_FAKE_TEXT_MEASURER_HPP__
