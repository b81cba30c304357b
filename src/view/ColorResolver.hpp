#ifndef __TV_COLOR_RESOLVER_HPP__
#define __TV_COLOR_RESOLVER_HPP__

#include "GridTypes.hpp"
#include "Headers.hpp"
#include "ViewConfig.hpp"

namespace tv {
/** @brief Palette slot a program can redefine for the default foreground. */
const int PALETTE_FOREGROUND = 256;
/** @brief Palette slot a program can redefine for the default background. */
const int PALETTE_BACKGROUND = 257;

/**
 * @brief Maps a cell's abstract color to a paint color.
 */
class ColorResolver {
 public:
  virtual ~ColorResolver() {}

  /**
   * @brief Resolves `ref`.  Entries in `overrides` (palette index to color)
   * take precedence over the theme.
   */
  virtual Color resolve(const ColorRef &ref,
                        const map<int, Color> &overrides) const = 0;
};

/**
 * @brief Resolves colors against the configured theme and the xterm 256
 * color palette.
 */
class ThemeColorResolver : public ColorResolver {
 public:
  explicit ThemeColorResolver(const ThemeColors &_theme);

  virtual Color resolve(const ColorRef &ref,
                        const map<int, Color> &overrides) const;

  /** @brief Theme color for palette index 0-255. */
  Color indexed(int index) const;

 protected:
  ThemeColors theme;
};
}  // namespace tv

#endif  // __TV_COLOR_RESOLVER_HPP__
