#include "FocusRouter.hpp"
#include "TestHeaders.hpp"

using namespace tv;

TEST_CASE("The editor starts with focus", "[FocusRouter]") {
  FocusRouter focus("editor");
  REQUIRE(focus.getOwner() == "editor");
  REQUIRE(focus.getArea() == FocusArea::EDITOR);
  REQUIRE_FALSE(focus.isPanelVisible());
  REQUIRE_FALSE(focus.isPaneFocused("pane"));
}

TEST_CASE("Focusing a pane shows the panel", "[FocusRouter]") {
  FocusRouter focus("editor");
  focus.focusPane("pane-1");
  REQUIRE(focus.getOwner() == "pane-1");
  REQUIRE(focus.getArea() == FocusArea::TERMINAL_PANEL);
  REQUIRE(focus.isPanelVisible());
  REQUIRE(focus.isPaneFocused("pane-1"));
  REQUIRE_FALSE(focus.isPaneFocused("pane-2"));

  // An editor taking focus keeps the panel on screen.
  focus.recordEditorFocus("other-editor");
  REQUIRE(focus.getArea() == FocusArea::EDITOR);
  REQUIRE(focus.isPanelVisible());
  REQUIRE(focus.getLastEditor() == "other-editor");
  REQUIRE_FALSE(focus.isPaneFocused("pane-1"));
}

TEST_CASE("The profile picker returns focus when dismissed",
          "[FocusRouter]") {
  FocusRouter focus("editor");
  focus.focusPane("pane-1");

  focus.focusProfilePicker("picker");
  REQUIRE(focus.getOwner() == "picker");
  REQUIRE(focus.getArea() == FocusArea::PROFILE_PICKER);
  REQUIRE_FALSE(focus.isPaneFocused("pane-1"));

  // Showing it again does not lose the return target.
  focus.focusProfilePicker("picker");
  focus.dismissProfilePicker();
  REQUIRE(focus.getOwner() == "pane-1");
  REQUIRE(focus.getArea() == FocusArea::TERMINAL_PANEL);

  // Nothing to dismiss.
  focus.dismissProfilePicker();
  REQUIRE(focus.getOwner() == "pane-1");
}

TEST_CASE("An emptied panel hands focus back to the editor",
          "[FocusRouter]") {
  FocusRouter focus("editor");
  focus.recordEditorFocus("second-editor");
  focus.focusPane("pane-1");
  focus.panelEmptied();
  REQUIRE(focus.getOwner() == "second-editor");
  REQUIRE(focus.getArea() == FocusArea::EDITOR);
  REQUIRE_FALSE(focus.isPanelVisible());

  json state = focus.toJson();
  REQUIRE(state["area"] == "editor");
  REQUIRE(state["panelVisible"] == false);
}
