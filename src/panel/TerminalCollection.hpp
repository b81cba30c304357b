#ifndef __TV_TERMINAL_COLLECTION_HPP__
#define __TV_TERMINAL_COLLECTION_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SplitGroup.hpp"

namespace tv {
/** @brief Outcome of one `pruneEmpty()` pass. */
struct PruneResult {
  int removed;
  /** @brief The tab that was active before the pass is gone. */
  bool activeRemoved;
  /** @brief The collection has no tabs left. */
  bool emptied;

  PruneResult() : removed(0), activeRemoved(false), emptied(false) {}
};

/**
 * @brief The tab registry: tab order, the split group behind each tab and
 * the active tab.
 *
 * A tab's id is the id of its split group.  Groups that become empty stay
 * registered until the next `pruneEmpty()`, which removes all of them in one
 * linear pass.  Stale ids are tolerated everywhere and reported through the
 * return value.
 */
class TerminalCollection {
 public:
  TerminalCollection();

  /** @brief Appends a new empty tab.  The active tab does not change. */
  WidgetId openTab();

  /**
   * @brief Closes every pane of a tab, leaving it empty for the next prune.
   * @return false for an unknown tab.
   */
  bool closeTab(const WidgetId &tabId);

  /** @brief Removes every empty tab, keeping the order of the others. */
  PruneResult pruneEmpty();

  /** @brief Slot visits made by the last `pruneEmpty()`. */
  int lastPruneCost() const { return pruneCost; }

  /**
   * @brief Activates the tab at `index`, clamped to the valid range.
   * @return false if there are no tabs.
   */
  bool selectTab(int index);
  /** @brief Activates a tab by id.  @return false for an unknown tab. */
  bool selectTabById(const WidgetId &tabId);

  int getActiveIndex() const { return activeIndex; }
  SplitGroup *activeSplit() const;
  TerminalPane *activePane() const;

  SplitGroup *split(const WidgetId &tabId) const;
  /** @brief Looks a pane up in every tab. */
  TerminalPane *findPane(const WidgetId &paneId) const;
  /** @brief The group that holds `paneId`, or NULL. */
  SplitGroup *splitForPane(const WidgetId &paneId) const;

  const vector<WidgetId> &getTabOrder() const { return tabOrder; }
  /** @brief Keys of the tab map, for consistency checks. */
  vector<WidgetId> tabIds() const;
  int size() const { return int(tabOrder.size()); }
  bool empty() const { return tabOrder.empty(); }

  json toJson() const;

 protected:
  vector<WidgetId> tabOrder;
  map<WidgetId, shared_ptr<SplitGroup>> tabs;
  int activeIndex;
  int pruneCost;
};
}  // namespace tv

#endif  // __TV_TERMINAL_COLLECTION_HPP__
