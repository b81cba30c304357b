#ifndef __TV_TERMINAL_PANEL_HPP__
#define __TV_TERMINAL_PANEL_HPP__

#include "CharMetrics.hpp"
#include "Clipboard.hpp"
#include "ColorResolver.hpp"
#include "DrawList.hpp"
#include "FocusRouter.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PanelCommand.hpp"
#include "PanelEvent.hpp"
#include "PanelHeader.hpp"
#include "ProfilePicker.hpp"
#include "RenderEngine.hpp"
#include "SearchHighlighter.hpp"
#include "TerminalCollection.hpp"
#include "ViewConfig.hpp"

namespace tv {
/**
 * @brief Creates a running session for `command` with an initial grid size.
 * May return nullptr if the session could not be started.
 */
typedef function<shared_ptr<TerminalSession>(const string &command,
                                             int columns, int lines)>
    SessionFactory;

/**
 * @brief The terminal panel: tab strip, the active tab's panes, focus and
 * the profile picker.
 *
 * Input enters through `handleEvent`.  Widgets post commands to the panel's
 * channel; `update()` applies them, removes panes whose program exited and
 * prunes empty tabs.  `paint()` lays out the active tab and produces the
 * frame's draw operations.
 */
class TerminalPanel {
 public:
  TerminalPanel(const ViewConfig &_config, SessionFactory _sessionFactory,
                shared_ptr<Clipboard> _clipboard,
                shared_ptr<TextMeasurer> _measurer, const WidgetId &editorId);

  /**
   * @brief Opens a tab running `profile` (the default shell if unset), makes
   * it active and focuses its pane.
   * @return The new tab id.  The tab is empty if the session failed to start
   * and goes away on the next update.
   */
  WidgetId openTab(const optional<string> &profile);

  /** @brief Splits a pane; the new pane gets focus. */
  bool splitPane(const WidgetId &paneId, bool vertical);
  bool closePane(const WidgetId &paneId);
  bool closeTab(const WidgetId &tabId);
  bool focusPane(const WidgetId &paneId);

  /**
   * @brief Focus request for the panel as a whole.  Opens a tab first when
   * there is no terminal to focus.
   */
  void requestFocus();

  void handleEvent(const PanelEvent &event);

  /**
   * @brief Applies posted commands, removes panes whose session ended and
   * prunes empty tabs, then fixes up focus.
   */
  void update();

  void layout(const PixelSize &_size);
  DrawList paint();

  /** @brief Changes the font, recomputing cell metrics and grid sizes. */
  void setFont(double fontSize, double lineHeight);

  /** @brief Sets the search text.  An empty pattern clears the search. */
  void setSearchPattern(const string &pattern);
  void hideSearch();
  bool isSearchVisible() const { return searchVisible; }

  json dumpState();

  TerminalCollection &getCollection() { return collection; }
  FocusRouter &getFocus() { return focus; }
  CommandChannel &getChannel() { return channel; }
  ProfilePicker &getPicker() { return picker; }
  const PanelHeader &getHeader() const { return header; }
  const CharMetrics &getCharMetrics() const { return metrics; }
  const ViewConfig &getConfig() const { return config; }

  /** @brief Where a pane of the active tab was last laid out. */
  optional<PixelRect> paneRect(const WidgetId &paneId) const;
  /** @brief The rectangle a pane's grid occupies inside `paneRect`. */
  PixelRect gridRect(const PixelRect &paneRect) const;

 protected:
  ViewConfig config;
  SessionFactory sessionFactory;
  shared_ptr<Clipboard> clipboard;
  shared_ptr<TextMeasurer> measurer;
  shared_ptr<ColorResolver> resolver;
  RenderEngine renderEngine;
  CommandChannel channel;
  TerminalCollection collection;
  FocusRouter focus;
  PanelHeader header;
  ProfilePicker picker;
  CharMetrics metrics;
  PixelSize size;
  optional<KeyChord> navigationToggle;
  shared_ptr<RegexSearch> search;
  bool searchVisible;
  map<WidgetId, PixelRect> paneRects;
  /** @brief Pane receiving drag events after a left press. */
  WidgetId capturePane;

  shared_ptr<TerminalPane> createPane(const WidgetId &splitId,
                                      const optional<string> &profile);
  void apply(const PanelCommand &command);
  void removeExitedPanes();
  void focusActivePane();
  void layoutActiveSplit();
  void layoutHeader();
  /** @brief The area below the tab strip shared by the active tab's panes. */
  PixelRect bodyRect() const;
  TerminalPane *paneAt(const PixelPoint &pos, PixelRect *rect);

  void handleMouse(const MouseEvent &event);
  void handleWheel(const WheelEvent &event);
  void handleKey(const KeyEvent &event);
  void handleFocusLost(const FocusLost &event);
};
}  // namespace tv

#endif  // __TV_TERMINAL_PANEL_HPP__
