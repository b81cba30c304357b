#ifndef __TV_PANEL_HEADER_HPP__
#define __TV_PANEL_HEADER_HPP__

#include "CharMetrics.hpp"
#include "DrawList.hpp"
#include "Headers.hpp"
#include "ViewConfig.hpp"

namespace tv {
/** @brief Padding between an icon and its clickable rectangle. */
const double ICON_PADDING = 4.0;

/** @brief One entry of the tab strip. */
struct TabItem {
  WidgetId tabId;
  /** @brief Displayed title, shortened with "..." to fit. */
  string title;
  PixelRect rect;
  PixelRect titleRect;
  PixelRect closeRect;
};

/** @brief What a click in the tab strip landed on. */
struct HeaderHit {
  enum Type { NONE, SELECT_TAB, CLOSE_TAB, NEW_TAB, PROFILES };
  Type type;
  WidgetId tabId;
  /** @brief Position of the tab in tab order. */
  int index;

  HeaderHit() : type(NONE), index(-1) {}
};

/** @brief Clickable icons at the top right of a pane. */
struct PaneIcons {
  PixelRect close;
  /** @brief Splits the pane, new pane to the right. */
  PixelRect splitRight;
  /** @brief Splits the pane, new pane below. */
  PixelRect splitDown;

  enum Hit { NONE, CLOSE, SPLIT_RIGHT, SPLIT_DOWN };
  Hit hitTest(const PixelPoint &pos) const;
};

/**
 * @brief Geometry and painting of the tab strip along the top of the panel.
 *
 * Each tab is `padding + title + padding + close icon + padding` wide.  The
 * add and profile icons sit at the right end of the strip.
 */
class PanelHeader {
 public:
  PanelHeader(const ViewConfig &_config, shared_ptr<TextMeasurer> _measurer);

  /**
   * @brief Lays out the strip for `width` pixels and the given
   * (tab id, title) pairs in tab order.  When the tabs do not all fit and
   * the active tab or the width changed, the strip scrolls just far enough
   * to show the tab at `activeIndex`.
   */
  void layout(double width, const vector<pair<WidgetId, string>> &tabs,
              int activeIndex);

  /**
   * @brief Moves the first shown tab by `delta` tabs, clamped to the tab
   * order.  Takes effect at the next `layout`.
   */
  void scrollTabs(int delta);

  HeaderHit hitTest(const PixelPoint &pos) const;

  void paint(int activeIndex, bool panelFocused, DrawList *out) const;

  double getHeight() const { return config.headerHeight; }
  /** @brief Tabs currently shown, a window over the full tab order. */
  const vector<TabItem> &getItems() const { return items; }
  /** @brief Tab order index of the first shown tab. */
  int getFirstVisible() const { return firstVisible; }
  const PixelRect &getAddRect() const { return addRect; }
  const PixelRect &getProfilesRect() const { return profilesRect; }

  /** @brief Icon rectangles for a pane occupying `paneRect`. */
  static PaneIcons paneIcons(const PixelRect &paneRect,
                             const ViewConfig &config);

 protected:
  ViewConfig config;
  shared_ptr<TextMeasurer> measurer;
  double width;
  int firstVisible;
  int tabCount;
  int visibleCount;
  WidgetId shownActive;
  vector<TabItem> items;
  PixelRect addRect;
  PixelRect profilesRect;

  string fitTitle(const string &title) const;
};
}  // namespace tv

#endif  // __TV_PANEL_HEADER_HPP__
