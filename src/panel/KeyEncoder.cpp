#include "KeyEncoder.hpp"

namespace tv {
namespace {
string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return char(tolower(c)); });
  return s;
}

const map<string, Key> NAMED_KEYS = {
    {"enter", Key::ENTER},         {"return", Key::ENTER},
    {"backspace", Key::BACKSPACE}, {"tab", Key::TAB},
    {"escape", Key::ESCAPE},       {"esc", Key::ESCAPE},
    {"up", Key::UP},               {"down", Key::DOWN},
    {"left", Key::LEFT},           {"right", Key::RIGHT},
    {"home", Key::HOME},           {"end", Key::END},
    {"pageup", Key::PAGE_UP},      {"pagedown", Key::PAGE_DOWN},
    {"insert", Key::INSERT},       {"delete", Key::DELETE},
};

// CSI final byte or tilde code for the cursor and editing keys.
string csiKey(Key key, uint8_t modifiers) {
  string finalByte;
  string code;
  switch (key) {
    case Key::UP:
      finalByte = "A";
      break;
    case Key::DOWN:
      finalByte = "B";
      break;
    case Key::RIGHT:
      finalByte = "C";
      break;
    case Key::LEFT:
      finalByte = "D";
      break;
    case Key::HOME:
      finalByte = "H";
      break;
    case Key::END:
      finalByte = "F";
      break;
    case Key::INSERT:
      code = "2";
      break;
    case Key::DELETE:
      code = "3";
      break;
    case Key::PAGE_UP:
      code = "5";
      break;
    case Key::PAGE_DOWN:
      code = "6";
      break;
    default:
      return "";
  }
  int xtermModifier = 1 + ((modifiers & MOD_SHIFT) ? 1 : 0) +
                      ((modifiers & MOD_ALT) ? 2 : 0) +
                      ((modifiers & MOD_CTRL) ? 4 : 0);
  if (!finalByte.empty()) {
    if (xtermModifier == 1) {
      return "\x1b[" + finalByte;
    }
    return "\x1b[1;" + to_string(xtermModifier) + finalByte;
  }
  if (xtermModifier == 1) {
    return "\x1b[" + code + "~";
  }
  return "\x1b[" + code + ";" + to_string(xtermModifier) + "~";
}
}  // namespace

optional<KeyChord> KeyChord::parse(const string &text) {
  auto tokens = split(toLower(trim(text)), '+');
  if (tokens.empty()) {
    return nullopt;
  }
  KeyChord chord;
  for (size_t a = 0; a + 1 < tokens.size(); a++) {
    string token = trim(tokens[a]);
    if (token == "ctrl" || token == "control") {
      chord.modifiers |= MOD_CTRL;
    } else if (token == "shift") {
      chord.modifiers |= MOD_SHIFT;
    } else if (token == "alt" || token == "option") {
      chord.modifiers |= MOD_ALT;
    } else if (token == "meta" || token == "cmd" || token == "super") {
      chord.modifiers |= MOD_META;
    } else {
      LOG(WARNING) << "Unknown modifier in key chord " << text << ": "
                   << token;
      return nullopt;
    }
  }
  string last = trim(tokens.back());
  auto it = NAMED_KEYS.find(last);
  if (it != NAMED_KEYS.end()) {
    chord.key = it->second;
  } else if (last == "space") {
    chord.text = " ";
  } else if (last.length() == 1) {
    chord.text = last;
  } else {
    LOG(WARNING) << "Unknown key in key chord " << text << ": " << last;
    return nullopt;
  }
  return chord;
}

bool KeyChord::matches(const KeyEvent &event) const {
  if (event.key != key || event.modifiers != modifiers) {
    return false;
  }
  return key != Key::CHARACTER || toLower(event.text) == text;
}

optional<string> KeyEncoder::encode(const KeyEvent &event) {
  switch (event.key) {
    case Key::CHARACTER: {
      if (event.text.empty()) {
        return nullopt;
      }
      string bytes = event.text;
      if (event.hasModifier(MOD_CTRL) && bytes.length() == 1) {
        char c = char(tolower((unsigned char)bytes[0]));
        if (c >= 'a' && c <= 'z') {
          bytes = string(1, char(c - 'a' + 1));
        } else if (c == ' ' || c == '@' || c == '2') {
          bytes = string(1, '\0');
        } else if (c >= '[' && c <= '_') {
          bytes = string(1, char(c - '@'));
        }
      }
      if (event.hasModifier(MOD_ALT)) {
        bytes = "\x1b" + bytes;
      }
      return bytes;
    }
    case Key::ENTER:
      return string("\r");
    case Key::BACKSPACE:
      return string(event.hasModifier(MOD_ALT) ? "\x1b\x7f" : "\x7f");
    case Key::TAB:
      return string(event.hasModifier(MOD_SHIFT) ? "\x1b[Z" : "\t");
    case Key::ESCAPE:
      return string("\x1b");
    default: {
      string bytes = csiKey(event.key, event.modifiers);
      if (bytes.empty()) {
        return nullopt;
      }
      return bytes;
    }
  }
}
}  // namespace tv
