#ifndef __TV_FOCUS_ROUTER_HPP__
#define __TV_FOCUS_ROUTER_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tv {
enum class FocusArea { EDITOR, TERMINAL_PANEL, PROFILE_PICKER };

const char *focusAreaName(FocusArea area);

/**
 * @brief The single record of which widget owns keyboard focus, and whether
 * the terminal panel is shown.
 */
class FocusRouter {
 public:
  /** @param _editor Main editor widget that has focus at startup. */
  explicit FocusRouter(const WidgetId &_editor);

  const WidgetId &getOwner() const { return owner; }
  FocusArea getArea() const { return area; }
  bool isPanelVisible() const { return panelVisible; }
  const WidgetId &getLastEditor() const { return lastEditor; }

  /** @brief A main editor widget took focus. */
  void recordEditorFocus(const WidgetId &editor);

  /** @brief A pane was clicked or explicitly focused; shows the panel. */
  void focusPane(const WidgetId &paneId);

  /** @brief True if `paneId` owns focus inside the panel. */
  bool isPaneFocused(const WidgetId &paneId) const;

  /** @brief Opens the profile picker as a modal popover. */
  void focusProfilePicker(const WidgetId &pickerId);

  /** @brief Returns focus from the profile picker to whoever had it. */
  void dismissProfilePicker();

  /**
   * @brief The last tab closed: focus goes back to the last editor widget and
   * the panel is hidden.
   */
  void panelEmptied();

  json toJson() const;

 protected:
  WidgetId owner;
  FocusArea area;
  bool panelVisible;
  WidgetId lastEditor;
  /** @brief Owner and area to restore when the picker closes. */
  WidgetId pickerReturnOwner;
  FocusArea pickerReturnArea;
};
}  // namespace tv

#endif  // __TV_FOCUS_ROUTER_HPP__
