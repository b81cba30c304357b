#ifndef __TV_PROFILE_PICKER_HPP__
#define __TV_PROFILE_PICKER_HPP__

#include "DrawList.hpp"
#include "Headers.hpp"
#include "KeyEncoder.hpp"
#include "PanelCommand.hpp"
#include "ViewConfig.hpp"

namespace tv {
/**
 * @brief Popover listing the configured terminal profiles.  Choosing one
 * opens a tab running it; the popover closes when it loses focus.
 */
class ProfilePicker {
 public:
  explicit ProfilePicker(const ViewConfig &_config);

  const WidgetId &getId() const { return id; }

  void show(const PixelPoint &_origin, const vector<string> &_profiles);
  void hide();
  bool isVisible() const { return visible; }

  const vector<string> &getProfiles() const { return profiles; }
  int getHighlighted() const { return highlighted; }

  /** @brief Bounds of the whole list in panel coordinates. */
  PixelRect bounds() const;
  PixelRect itemRect(int index) const;

  /**
   * @brief Up/Down move the highlight, Enter picks it, Escape closes.
   * @return true if the key was consumed.
   */
  bool handleKey(const KeyEvent &event, CommandChannel *channel);

  /**
   * @brief Picks the item under `pos`.
   * @return false if `pos` is outside the list.
   */
  bool handleClick(const PixelPoint &pos, CommandChannel *channel);

  /** @brief Posts OpenTab for the profile at `index` and closes the list. */
  void select(int index, CommandChannel *channel);

  void paint(DrawList *out) const;

 protected:
  WidgetId id;
  ViewConfig config;
  bool visible;
  PixelPoint origin;
  vector<string> profiles;
  int highlighted;

  double itemHeight() const { return config.paneHeaderHeight; }
  double itemWidth() const {
    return config.tabTitleWidth + config.panePadding * 2;
  }
};
}  // namespace tv

#endif  // __TV_PROFILE_PICKER_HPP__
