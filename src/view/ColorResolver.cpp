#include "ColorResolver.hpp"

namespace tv {
namespace {
uint8_t cubeLevel(int step) { return step == 0 ? 0 : uint8_t(55 + step * 40); }
}  // namespace

ThemeColorResolver::ThemeColorResolver(const ThemeColors &_theme)
    : theme(_theme) {}

Color ThemeColorResolver::resolve(const ColorRef &ref,
                                  const map<int, Color> &overrides) const {
  int slot;
  switch (ref.kind) {
    case ColorRef::RGB:
      return ref.rgb;
    case ColorRef::FOREGROUND:
      slot = PALETTE_FOREGROUND;
      break;
    case ColorRef::BACKGROUND:
      slot = PALETTE_BACKGROUND;
      break;
    case ColorRef::INDEXED:
    default:
      slot = ref.index;
      break;
  }
  auto it = overrides.find(slot);
  if (it != overrides.end()) {
    return it->second;
  }
  if (slot == PALETTE_FOREGROUND) {
    return theme.terminalForeground;
  }
  if (slot == PALETTE_BACKGROUND) {
    return theme.terminalBackground;
  }
  return indexed(slot);
}

Color ThemeColorResolver::indexed(int index) const {
  if (index < 16) {
    return theme.ansi[std::max(0, index)];
  }
  if (index < 232) {
    // 6x6x6 color cube
    int cube = index - 16;
    return Color(cubeLevel(cube / 36), cubeLevel((cube / 6) % 6),
                 cubeLevel(cube % 6));
  }
  if (index < 256) {
    // 24 step gray ramp
    uint8_t level = uint8_t(8 + (index - 232) * 10);
    return Color(level, level, level);
  }
  return theme.terminalForeground;
}
}  // namespace tv
