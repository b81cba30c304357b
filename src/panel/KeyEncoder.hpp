#ifndef __TV_KEY_ENCODER_HPP__
#define __TV_KEY_ENCODER_HPP__

#include "Headers.hpp"

namespace tv {
enum Modifier : uint8_t {
  MOD_NONE = 0,
  MOD_SHIFT = 1 << 0,
  MOD_ALT = 1 << 1,
  MOD_CTRL = 1 << 2,
  MOD_META = 1 << 3,
};

enum class Key {
  CHARACTER,
  ENTER,
  BACKSPACE,
  TAB,
  ESCAPE,
  UP,
  DOWN,
  LEFT,
  RIGHT,
  HOME,
  END,
  PAGE_UP,
  PAGE_DOWN,
  INSERT,
  DELETE,
};

/** @brief A key press delivered to the panel. */
struct KeyEvent {
  Key key;
  /** @brief UTF-8 text produced by the key, set for CHARACTER. */
  string text;
  uint8_t modifiers;

  KeyEvent() : key(Key::CHARACTER), modifiers(MOD_NONE) {}
  KeyEvent(Key _key, const string &_text, uint8_t _modifiers)
      : key(_key), text(_text), modifiers(_modifiers) {}

  static KeyEvent character(const string &text, uint8_t modifiers = MOD_NONE) {
    return KeyEvent(Key::CHARACTER, text, modifiers);
  }
  static KeyEvent named(Key key, uint8_t modifiers = MOD_NONE) {
    return KeyEvent(key, "", modifiers);
  }

  bool hasModifier(uint8_t m) const { return (modifiers & m) == m; }
};

/**
 * @brief A key combination from the config, e.g. `ctrl+shift+space`.
 */
struct KeyChord {
  Key key;
  /** @brief Lower case text for CHARACTER chords. */
  string text;
  uint8_t modifiers;

  KeyChord() : key(Key::CHARACTER), modifiers(MOD_NONE) {}

  /** @brief Parses `mod+mod+key`; nullopt for an unknown key or modifier. */
  static optional<KeyChord> parse(const string &text);

  bool matches(const KeyEvent &event) const;
};

/**
 * @brief Encodes key presses as the bytes a terminal program expects.
 */
class KeyEncoder {
 public:
  /** @brief Bytes for `event`, or nullopt when the key sends nothing. */
  static optional<string> encode(const KeyEvent &event);
};
}  // namespace tv

#endif  // __TV_KEY_ENCODER_HPP__
