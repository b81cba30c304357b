#ifndef __TV_VIEW_CONFIG_HPP__
#define __TV_VIEW_CONFIG_HPP__

#include "GridTypes.hpp"
#include "Headers.hpp"

namespace tv {
/** @brief Theme colors used by the panel and the render engine. */
struct ThemeColors {
  Color terminalBackground;
  Color terminalForeground;
  Color terminalCursor;
  Color editorCaret;
  Color editorSelection;
  Color editorCurrentLine;
  Color panelBackground;
  /** @brief The 16 ANSI colors, indices 0-15 of the palette. */
  array<Color, 16> ansi;

  ThemeColors();
};

/**
 * @brief Runtime settings for the terminal panel, read from an INI file.
 */
struct ViewConfig {
  // [Terminal]
  string shell;
  double fontSize;
  double lineHeight;
  int scrollback;
  float dimAlpha;
  int wheelLinesPerNotch;
  bool clearSelectionOnBlur;
  string navigationToggle;

  // [Theme]
  ThemeColors theme;

  // [Panel]
  double headerHeight;
  double paneHeaderHeight;
  double tabTitleWidth;
  double iconSize;
  double panePadding;

  // [Search]
  bool searchRegex;

  // [Profiles]
  map<string, string> profiles;

  // [Debug]
  int verbose;
  bool silent;
  string maxLogSize;

  ViewConfig();

  /** @brief `<config home>/termview/termview.ini`. */
  static string defaultPath();

  /**
   * @brief Loads the file at `path` on top of the defaults.
   * @return false if the file exists but could not be parsed.  A missing file
   * leaves the defaults in place and returns true.
   */
  bool loadFile(const string &path);

  /** @brief Same as `loadFile` but reads INI text from memory. */
  bool loadString(const string &data);

  /** @brief Shell command for a named profile, or the default shell. */
  string commandForProfile(const optional<string> &profile) const;
};
}  // namespace tv

#endif  // __TV_VIEW_CONFIG_HPP__
