#ifndef __TV_UTF8_HPP__
#define __TV_UTF8_HPP__

#include "Headers.hpp"

namespace tv {
/**
 * @brief Incremental UTF-8 decoder that survives sequences split across
 * reads.
 */
class Utf8Decoder {
 public:
  Utf8Decoder() : codePoint(0), remaining(0) {}

  /**
   * @brief Feeds one byte, appending any completed code points to `out`.
   * Malformed input yields U+FFFD.
   */
  void feed(uint8_t byte, u32string *out);

 protected:
  char32_t codePoint;
  int remaining;
};

/** @brief Appends the UTF-8 encoding of `c` to `out`. */
void appendUtf8(char32_t c, string *out);

/** @brief Decodes a whole UTF-8 string. */
u32string decodeUtf8(const string &s);

/** @brief Encodes a whole UTF-32 string as UTF-8. */
string encodeUtf8(const u32string &s);

/**
 * @brief Number of grid columns a code point occupies (1 or 2).
 */
int charWidth(char32_t c);
}  // namespace tv

#endif  // __TV_UTF8_HPP__
