#ifndef __TV_CLIPBOARD_HPP__
#define __TV_CLIPBOARD_HPP__

#include "Headers.hpp"

namespace tv {
/** @brief System clipboard access. */
class Clipboard {
 public:
  virtual ~Clipboard() {}

  virtual optional<string> getText() = 0;
  virtual void putText(const string &text) = 0;
};

/** @brief Process-local clipboard for headless runs. */
class MemoryClipboard : public Clipboard {
 public:
  virtual optional<string> getText() { return text; }
  virtual void putText(const string &_text) { text = _text; }

 protected:
  optional<string> text;
};
}  // namespace tv

#endif  // __TV_CLIPBOARD_HPP__
