#include "Utf8.hpp"

namespace tv {
namespace {
const char32_t REPLACEMENT_CHARACTER = 0xFFFD;

// East Asian Wide and Fullwidth blocks, plus the emoji planes.
const pair<char32_t, char32_t> WIDE_RANGES[] = {
    {0x1100, 0x115F},   {0x231A, 0x231B},   {0x2329, 0x232A},
    {0x23E9, 0x23EC},   {0x23F0, 0x23F0},   {0x23F3, 0x23F3},
    {0x25FD, 0x25FE},   {0x2614, 0x2615},   {0x2648, 0x2653},
    {0x267F, 0x267F},   {0x2693, 0x2693},   {0x26A1, 0x26A1},
    {0x26AA, 0x26AB},   {0x26BD, 0x26BE},   {0x26C4, 0x26C5},
    {0x26CE, 0x26CE},   {0x26D4, 0x26D4},   {0x26EA, 0x26EA},
    {0x26F2, 0x26F3},   {0x26F5, 0x26F5},   {0x26FA, 0x26FA},
    {0x26FD, 0x26FD},   {0x2705, 0x2705},   {0x270A, 0x270B},
    {0x2728, 0x2728},   {0x274C, 0x274C},   {0x274E, 0x274E},
    {0x2753, 0x2755},   {0x2757, 0x2757},   {0x2795, 0x2797},
    {0x27B0, 0x27B0},   {0x27BF, 0x27BF},   {0x2B1B, 0x2B1C},
    {0x2B50, 0x2B50},   {0x2B55, 0x2B55},   {0x2E80, 0x303E},
    {0x3041, 0x33FF},   {0x3400, 0x4DBF},   {0x4E00, 0x9FFF},
    {0xA000, 0xA4CF},   {0xA960, 0xA97F},   {0xAC00, 0xD7A3},
    {0xF900, 0xFAFF},   {0xFE10, 0xFE19},   {0xFE30, 0xFE6F},
    {0xFF00, 0xFF60},   {0xFFE0, 0xFFE6},   {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};
}  // namespace

void Utf8Decoder::feed(uint8_t byte, u32string *out) {
  if (remaining > 0) {
    if ((byte >> 6) == 0x2) {
      codePoint = (codePoint << 6) | (byte & 0x3F);
      remaining--;
      if (remaining == 0) {
        out->push_back(codePoint);
      }
      return;
    }
    // Truncated sequence, restart decoding on this byte.
    remaining = 0;
    out->push_back(REPLACEMENT_CHARACTER);
  }

  if ((byte >> 7) == 0x0) {
    out->push_back(char32_t(byte));
  } else if ((byte >> 5) == 0x6) {
    codePoint = byte & 0x1F;
    remaining = 1;
  } else if ((byte >> 4) == 0xE) {
    codePoint = byte & 0x0F;
    remaining = 2;
  } else if ((byte >> 3) == 0x1E) {
    codePoint = byte & 0x07;
    remaining = 3;
  } else {
    out->push_back(REPLACEMENT_CHARACTER);
  }
}

void appendUtf8(char32_t c, string *out) {
  if (c < 0x80) {
    out->push_back(char(c));
  } else if (c < 0x800) {
    out->push_back(char(0xC0 | (c >> 6)));
    out->push_back(char(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out->push_back(char(0xE0 | (c >> 12)));
    out->push_back(char(0x80 | ((c >> 6) & 0x3F)));
    out->push_back(char(0x80 | (c & 0x3F)));
  } else if (c < 0x110000) {
    out->push_back(char(0xF0 | (c >> 18)));
    out->push_back(char(0x80 | ((c >> 12) & 0x3F)));
    out->push_back(char(0x80 | ((c >> 6) & 0x3F)));
    out->push_back(char(0x80 | (c & 0x3F)));
  } else {
    appendUtf8(REPLACEMENT_CHARACTER, out);
  }
}

u32string decodeUtf8(const string &s) {
  u32string retval;
  retval.reserve(s.length());
  Utf8Decoder decoder;
  for (char ch : s) {
    decoder.feed(uint8_t(ch), &retval);
  }
  return retval;
}

string encodeUtf8(const u32string &s) {
  string retval;
  retval.reserve(s.length());
  for (char32_t c : s) {
    appendUtf8(c, &retval);
  }
  return retval;
}

int charWidth(char32_t c) {
  if (c < 0x1100) {
    return 1;
  }
  for (const auto &range : WIDE_RANGES) {
    if (c < range.first) {
      return 1;
    }
    if (c <= range.second) {
      return 2;
    }
  }
  return 1;
}
}  // namespace tv
