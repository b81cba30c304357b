#include "FakeTerminalSession.hpp"
#include "TerminalCollection.hpp"
#include "TestHeaders.hpp"

using namespace tv;

namespace {
WidgetId addPane(TerminalCollection &collection, const WidgetId &tabId) {
  shared_ptr<TerminalPane> pane(
      new TerminalPane(tabId, make_shared<FakeTerminalSession>(80, 24), ""));
  collection.split(tabId)->addPane(pane);
  return pane->getId();
}

vector<WidgetId> openTabs(TerminalCollection &collection, int count) {
  vector<WidgetId> tabIds;
  for (int a = 0; a < count; a++) {
    WidgetId tabId = collection.openTab();
    addPane(collection, tabId);
    tabIds.push_back(tabId);
  }
  return tabIds;
}

set<WidgetId> asSet(const vector<WidgetId> &ids) {
  return set<WidgetId>(ids.begin(), ids.end());
}
}  // namespace

TEST_CASE("Opening tabs", "[TerminalCollection]") {
  TerminalCollection collection;
  REQUIRE(collection.empty());
  REQUIRE(collection.activeSplit() == NULL);
  REQUIRE(collection.activePane() == NULL);
  REQUIRE_FALSE(collection.selectTab(0));

  auto tabIds = openTabs(collection, 3);
  REQUIRE(collection.getTabOrder() == tabIds);
  // Opening does not change the active tab.
  REQUIRE(collection.getActiveIndex() == 0);
  REQUIRE(collection.activeSplit()->getId() == tabIds[0]);

  REQUIRE(collection.selectTabById(tabIds[2]));
  REQUIRE(collection.getActiveIndex() == 2);
  REQUIRE_FALSE(collection.selectTabById("missing"));
  REQUIRE(collection.getActiveIndex() == 2);

  REQUIRE(collection.selectTab(10));
  REQUIRE(collection.getActiveIndex() == 2);
  REQUIRE(collection.selectTab(-4));
  REQUIRE(collection.getActiveIndex() == 0);
}

TEST_CASE("Closing a tab leaves it for the next prune",
          "[TerminalCollection]") {
  TerminalCollection collection;
  auto tabIds = openTabs(collection, 2);

  REQUIRE(collection.closeTab(tabIds[0]));
  REQUIRE(collection.size() == 2);
  REQUIRE(collection.split(tabIds[0])->empty());
  REQUIRE_FALSE(collection.closeTab("missing"));

  PruneResult result = collection.pruneEmpty();
  REQUIRE(result.removed == 1);
  REQUIRE(result.activeRemoved);
  REQUIRE_FALSE(result.emptied);
  REQUIRE(collection.getTabOrder() == vector<WidgetId>{tabIds[1]});
  REQUIRE(collection.split(tabIds[0]) == NULL);
}

TEST_CASE("Prune removes many tabs in one pass", "[TerminalCollection]") {
  TerminalCollection collection;
  auto tabIds = openTabs(collection, 6);
  collection.closeTab(tabIds[0]);
  collection.closeTab(tabIds[2]);
  collection.closeTab(tabIds[5]);

  PruneResult result = collection.pruneEmpty();
  REQUIRE(result.removed == 3);
  REQUIRE(collection.getTabOrder() ==
          vector<WidgetId>{tabIds[1], tabIds[3], tabIds[4]});
  REQUIRE(asSet(collection.getTabOrder()) == asSet(collection.tabIds()));
  REQUIRE(collection.lastPruneCost() == 12);

  // Nothing left to remove.
  result = collection.pruneEmpty();
  REQUIRE(result.removed == 0);
  REQUIRE_FALSE(result.activeRemoved);
  REQUIRE(collection.size() == 3);
}

TEST_CASE("Prune cost grows linearly", "[TerminalCollection]") {
  TerminalCollection collection;
  auto tabIds = openTabs(collection, 100);
  for (int a = 0; a < 100; a += 2) {
    collection.closeTab(tabIds[a]);
  }
  PruneResult result = collection.pruneEmpty();
  REQUIRE(result.removed == 50);
  REQUIRE(collection.lastPruneCost() == 200);
  REQUIRE(asSet(collection.getTabOrder()) == asSet(collection.tabIds()));
  for (int a = 0; a < 50; a++) {
    REQUIRE(collection.getTabOrder()[a] == tabIds[a * 2 + 1]);
  }
}

TEST_CASE("Active tab after prune", "[TerminalCollection]") {
  TerminalCollection collection;
  auto tabIds = openTabs(collection, 5);

  SECTION("A surviving active tab stays active") {
    collection.selectTabById(tabIds[3]);
    collection.closeTab(tabIds[0]);
    collection.closeTab(tabIds[1]);
    PruneResult result = collection.pruneEmpty();
    REQUIRE_FALSE(result.activeRemoved);
    REQUIRE(collection.activeSplit()->getId() == tabIds[3]);
    REQUIRE(collection.getActiveIndex() == 1);
  }

  SECTION("The right neighbour replaces a removed active tab") {
    collection.selectTabById(tabIds[2]);
    collection.closeTab(tabIds[1]);
    collection.closeTab(tabIds[2]);
    PruneResult result = collection.pruneEmpty();
    REQUIRE(result.activeRemoved);
    REQUIRE(collection.activeSplit()->getId() == tabIds[3]);
  }

  SECTION("The last tab falls back to its left neighbour") {
    collection.selectTabById(tabIds[4]);
    collection.closeTab(tabIds[4]);
    PruneResult result = collection.pruneEmpty();
    REQUIRE(result.activeRemoved);
    REQUIRE(collection.activeSplit()->getId() == tabIds[3]);
  }

  SECTION("Closing everything empties the collection") {
    for (const auto &tabId : tabIds) {
      collection.closeTab(tabId);
    }
    PruneResult result = collection.pruneEmpty();
    REQUIRE(result.removed == 5);
    REQUIRE(result.emptied);
    REQUIRE(collection.empty());
    REQUIRE(collection.tabIds().empty());
    REQUIRE(collection.activeSplit() == NULL);
  }
}

TEST_CASE("Finding panes across tabs", "[TerminalCollection]") {
  TerminalCollection collection;
  WidgetId first = collection.openTab();
  WidgetId second = collection.openTab();
  WidgetId a = addPane(collection, first);
  WidgetId b = addPane(collection, second);
  WidgetId c = addPane(collection, second);

  REQUIRE(collection.findPane(a)->getId() == a);
  REQUIRE(collection.splitForPane(b)->getId() == second);
  REQUIRE(collection.splitForPane(c)->getId() == second);
  REQUIRE(collection.findPane("missing") == NULL);
  REQUIRE(collection.splitForPane("missing") == NULL);

  collection.selectTabById(second);
  REQUIRE(collection.activePane()->getId() == c);

  json state = collection.toJson();
  REQUIRE(state["tabOrder"].size() == 2);
  REQUIRE(state["tabs"][second]["panes"].size() == 2);
}
