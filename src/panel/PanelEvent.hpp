#ifndef __TV_PANEL_EVENT_HPP__
#define __TV_PANEL_EVENT_HPP__

#include "GridTypes.hpp"
#include "Headers.hpp"
#include "KeyEncoder.hpp"

namespace tv {
enum class MouseButton { NONE, LEFT, RIGHT, MIDDLE };

/** @brief Pointer press, release or move in panel coordinates. */
struct MouseEvent {
  enum Type { DOWN, UP, MOVE };
  Type type;
  MouseButton button;
  PixelPoint pos;
  /** @brief Click count for DOWN (2 double click, 3 triple click). */
  int count;
  uint8_t modifiers;
  /** @brief Left button held, for MOVE. */
  bool leftHeld;

  MouseEvent()
      : type(MOVE),
        button(MouseButton::NONE),
        count(0),
        modifiers(MOD_NONE),
        leftHeld(false) {}

  static MouseEvent down(const PixelPoint &pos, MouseButton button,
                         int count = 1, uint8_t modifiers = MOD_NONE) {
    MouseEvent e;
    e.type = DOWN;
    e.button = button;
    e.pos = pos;
    e.count = count;
    e.modifiers = modifiers;
    e.leftHeld = button == MouseButton::LEFT;
    return e;
  }
  static MouseEvent up(const PixelPoint &pos, MouseButton button) {
    MouseEvent e;
    e.type = UP;
    e.button = button;
    e.pos = pos;
    return e;
  }
  static MouseEvent move(const PixelPoint &pos, bool leftHeld,
                         uint8_t modifiers = MOD_NONE) {
    MouseEvent e;
    e.type = MOVE;
    e.pos = pos;
    e.leftHeld = leftHeld;
    e.modifiers = modifiers;
    return e;
  }
};

/**
 * @brief Scroll wheel motion.  Positive `deltaY` scrolls towards the bottom
 * of the output.  Pixel deltas come from touchpads, line deltas count wheel
 * notches.
 */
struct WheelEvent {
  PixelPoint pos;
  double deltaY;
  bool lineMode;

  WheelEvent() : deltaY(0), lineMode(false) {}
  WheelEvent(const PixelPoint &_pos, double _deltaY, bool _lineMode = false)
      : pos(_pos), deltaY(_deltaY), lineMode(_lineMode) {}
};

/** @brief The panel lost keyboard focus to another part of the application. */
struct FocusLost {
  /** @brief Widget that took focus, if it is a main editor widget. */
  optional<WidgetId> editor;
};

typedef variant<MouseEvent, WheelEvent, KeyEvent, FocusLost> PanelEvent;
}  // namespace tv

#endif  // __TV_PANEL_EVENT_HPP__
