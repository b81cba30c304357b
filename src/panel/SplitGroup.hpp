#ifndef __TV_SPLIT_GROUP_HPP__
#define __TV_SPLIT_GROUP_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "TerminalPane.hpp"

namespace tv {
/** @brief Where one pane sits inside its group. */
struct PaneRect {
  WidgetId paneId;
  PixelRect rect;
};

/**
 * @brief The panes of one tab, laid out side by side (vertical) or stacked.
 *
 * A group is created empty, is a removal candidate as soon as it is empty
 * again and is destroyed when the collection prunes it.
 */
class SplitGroup {
 public:
  explicit SplitGroup(const WidgetId &_splitId);
  /** @brief Closes every remaining pane. */
  ~SplitGroup();

  const WidgetId &getId() const { return splitId; }

  /**
   * @brief Adds a pane after `afterPaneId` (at the end if not found) taking
   * half of that pane's space, and makes it the active pane.
   */
  void addPane(shared_ptr<TerminalPane> pane,
               const WidgetId &afterPaneId = WidgetId());

  /**
   * @brief Closes and removes a pane.  The remaining sizes grow to fill the
   * group.
   * @return false if the pane is not in this group.
   */
  bool removePane(const WidgetId &paneId);

  /** @brief Closes and removes every pane. */
  void clear();

  TerminalPane *activePane() const;
  const WidgetId &getActivePaneId() const { return activePaneId; }
  bool setActivePane(const WidgetId &paneId);
  TerminalPane *pane(const WidgetId &paneId) const;

  bool empty() const { return panes.empty(); }
  int size() const { return int(panes.size()); }

  bool isVertical() const { return vertical; }
  void setVertical(bool _vertical) { vertical = _vertical; }

  /** @brief Panes in display order. */
  const vector<WidgetId> &getOrder() const { return order; }
  /** @brief Share of the group each pane in `getOrder()` takes. */
  const vector<double> &getSizes() const { return sizes; }

  /** @brief Divides `bounds` between the panes in display order. */
  vector<PaneRect> layout(const PixelRect &bounds) const;

  /**
   * @brief The pane under `pos` when the group occupies `bounds`.
   * @return nullopt if `pos` is outside every pane.
   */
  optional<PaneRect> paneAt(const PixelRect &bounds,
                            const PixelPoint &pos) const;

  json toJson() const;

 protected:
  WidgetId splitId;
  map<WidgetId, shared_ptr<TerminalPane>> panes;
  WidgetId activePaneId;
  bool vertical;
  vector<WidgetId> order;
  vector<double> sizes;
};
}  // namespace tv

#endif  // __TV_SPLIT_GROUP_HPP__
