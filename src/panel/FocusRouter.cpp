#include "FocusRouter.hpp"

namespace tv {
const char *focusAreaName(FocusArea area) {
  switch (area) {
    case FocusArea::EDITOR:
      return "editor";
    case FocusArea::TERMINAL_PANEL:
      return "terminal";
    case FocusArea::PROFILE_PICKER:
      return "profiles";
  }
  return "unknown";
}

FocusRouter::FocusRouter(const WidgetId &_editor)
    : owner(_editor),
      area(FocusArea::EDITOR),
      panelVisible(false),
      lastEditor(_editor),
      pickerReturnOwner(_editor),
      pickerReturnArea(FocusArea::EDITOR) {}

void FocusRouter::recordEditorFocus(const WidgetId &editor) {
  lastEditor = editor;
  owner = editor;
  area = FocusArea::EDITOR;
}

void FocusRouter::focusPane(const WidgetId &paneId) {
  VLOG(1) << "Focusing pane " << paneId;
  owner = paneId;
  area = FocusArea::TERMINAL_PANEL;
  panelVisible = true;
}

bool FocusRouter::isPaneFocused(const WidgetId &paneId) const {
  return area == FocusArea::TERMINAL_PANEL && owner == paneId;
}

void FocusRouter::focusProfilePicker(const WidgetId &pickerId) {
  if (area != FocusArea::PROFILE_PICKER) {
    pickerReturnOwner = owner;
    pickerReturnArea = area;
  }
  owner = pickerId;
  area = FocusArea::PROFILE_PICKER;
}

void FocusRouter::dismissProfilePicker() {
  if (area != FocusArea::PROFILE_PICKER) {
    return;
  }
  owner = pickerReturnOwner;
  area = pickerReturnArea;
}

void FocusRouter::panelEmptied() {
  LOG(INFO) << "Terminal panel is empty, returning focus to " << lastEditor;
  owner = lastEditor;
  area = FocusArea::EDITOR;
  panelVisible = false;
}

json FocusRouter::toJson() const {
  json focus;
  focus["owner"] = owner;
  focus["area"] = focusAreaName(area);
  focus["panelVisible"] = panelVisible;
  focus["lastEditor"] = lastEditor;
  return focus;
}
}  // namespace tv
