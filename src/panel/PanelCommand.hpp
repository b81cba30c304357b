#ifndef __TV_PANEL_COMMAND_HPP__
#define __TV_PANEL_COMMAND_HPP__

#include "GridTypes.hpp"
#include "Headers.hpp"

namespace tv {
/** @brief Open a new tab running `profile` (the default shell if unset). */
struct OpenTab {
  optional<string> profile;
};

/** @brief Close a tab and every pane in it. */
struct CloseTab {
  WidgetId tabId;
};

/** @brief Close one pane. */
struct ClosePane {
  WidgetId paneId;
};

/**
 * @brief Split a pane.  `vertical` places the new pane beside the source,
 * otherwise below it.
 */
struct SplitPane {
  WidgetId paneId;
  bool vertical;
};

/** @brief Give keyboard focus to a pane. */
struct Focus {
  WidgetId target;
};

/** @brief Show the search bar over the panel. */
struct ShowSearch {};

/** @brief Pop up the profile picker at `origin`. */
struct ShowProfiles {
  PixelPoint origin;
  vector<string> profiles;
};

/** @brief Dismiss the profile picker. */
struct HideProfiles {};

/**
 * @brief An action requested by a widget, applied by the panel on its next
 * update instead of mutating shared state from inside an event handler.
 */
typedef variant<OpenTab, CloseTab, ClosePane, SplitPane, Focus, ShowSearch,
                ShowProfiles, HideProfiles>
    PanelCommand;

/** @brief Short name for logging. */
string commandName(const PanelCommand &command);

/**
 * @brief FIFO of pending panel commands.
 */
class CommandChannel {
 public:
  void post(const PanelCommand &command);

  /** @brief Removes and returns every pending command in posting order. */
  vector<PanelCommand> drain();

  bool empty() const { return pending.empty(); }
  int size() const { return int(pending.size()); }

 protected:
  deque<PanelCommand> pending;
};
}  // namespace tv

#endif  // __TV_PANEL_COMMAND_HPP__
