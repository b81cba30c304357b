#ifndef __TV_PANE_MODE_HPP__
#define __TV_PANE_MODE_HPP__

#include "Headers.hpp"

namespace tv {
/**
 * @brief Whether keystrokes go to the shell (INTERACTIVE) or are panel
 * commands (NAVIGATION).  Read by both key routing and rendering.
 */
enum class PaneMode { INTERACTIVE, NAVIGATION };

inline const char *paneModeName(PaneMode mode) {
  return mode == PaneMode::INTERACTIVE ? "interactive" : "navigation";
}
}  // namespace tv

#endif  // __TV_PANE_MODE_HPP__
