#ifndef __TV_RENDER_ENGINE_HPP__
#define __TV_RENDER_ENGINE_HPP__

#include "CharMetrics.hpp"
#include "ColorResolver.hpp"
#include "DrawList.hpp"
#include "Headers.hpp"
#include "PaneMode.hpp"
#include "SearchHighlighter.hpp"
#include "TerminalSession.hpp"
#include "ViewConfig.hpp"

namespace tv {
/** @brief Everything one pane paint pass reads. */
struct PaneFrame {
  /** @brief Snapshot of the visible window with the snapped selection. */
  RenderableContent content;
  vector<SearchMatch> matches;
  CharMetrics metrics;
  /** @brief Pane bounds; nothing is drawn outside `[0,w) x [0,h)`. */
  PixelSize size;
  bool focused;
  PaneMode mode;

  PaneFrame() : focused(false), mode(PaneMode::INTERACTIVE) {}
};

/**
 * @brief Turns a pane snapshot into draw operations in pane-local pixels.
 *
 * Output order: background, selection or current line bar, cell
 * backgrounds with the cursor and glyphs, then search match outlines.
 */
class RenderEngine {
 public:
  RenderEngine(const ThemeColors &_theme, float _dimAlpha,
               shared_ptr<ColorResolver> _resolver);

  void paint(const PaneFrame &frame, DrawList *out) const;

  const ThemeColors &getTheme() const { return theme; }

 protected:
  ThemeColors theme;
  float dimAlpha;
  shared_ptr<ColorResolver> resolver;

  void paintSelection(const PaneFrame &frame, DrawList *out) const;
  void paintCells(const PaneFrame &frame, DrawList *out) const;
  void paintMatches(const PaneFrame &frame, DrawList *out) const;
};
}  // namespace tv

#endif  // __TV_RENDER_ENGINE_HPP__
