#include "TerminalCollection.hpp"

namespace tv {
TerminalCollection::TerminalCollection() : activeIndex(0), pruneCost(0) {}

WidgetId TerminalCollection::openTab() {
  WidgetId tabId = newWidgetId();
  if (tabs.find(tabId) != tabs.end()) {
    STFATAL << "Tried to open a tab that already exists: " << tabId;
  }
  tabs.insert(make_pair(tabId, shared_ptr<SplitGroup>(new SplitGroup(tabId))));
  tabOrder.push_back(tabId);
  LOG(INFO) << "Opened tab " << tabId;
  return tabId;
}

bool TerminalCollection::closeTab(const WidgetId &tabId) {
  auto it = tabs.find(tabId);
  if (it == tabs.end()) {
    VLOG(1) << "Tried to close a tab that doesn't exist: " << tabId;
    return false;
  }
  LOG(INFO) << "Closing tab " << tabId;
  it->second->clear();
  return true;
}

PruneResult TerminalCollection::pruneEmpty() {
  PruneResult result;
  pruneCost = 0;

  unordered_set<WidgetId> emptyTabs;
  for (const auto &it : tabs) {
    if (it.second->empty()) {
      emptyTabs.insert(it.first);
    }
  }
  if (emptyTabs.empty()) {
    return result;
  }

  WidgetId activeId;
  if (activeIndex >= 0 && activeIndex < int(tabOrder.size())) {
    activeId = tabOrder[activeIndex];
  }
  result.activeRemoved = emptyTabs.find(activeId) != emptyTabs.end();

  // Overwrite every removable slot with one of the removed ids, then filter
  // that id out, so the cost stays linear however many tabs go.
  const WidgetId sentinel = *emptyTabs.begin();
  for (auto &id : tabOrder) {
    pruneCost++;
    if (emptyTabs.find(id) != emptyTabs.end()) {
      id = sentinel;
    }
  }
  for (const auto &id : emptyTabs) {
    tabs.erase(id);
  }

  vector<WidgetId> newOrder;
  newOrder.reserve(tabOrder.size() - emptyTabs.size());
  int newActiveIndex = -1;
  int survivorsBeforeActive = 0;
  for (int a = 0; a < int(tabOrder.size()); a++) {
    pruneCost++;
    if (tabOrder[a] == sentinel) {
      continue;
    }
    if (tabOrder[a] == activeId) {
      newActiveIndex = int(newOrder.size());
    }
    if (a < activeIndex) {
      survivorsBeforeActive++;
    }
    newOrder.push_back(tabOrder[a]);
  }
  tabOrder.swap(newOrder);
  result.removed = int(emptyTabs.size());
  result.emptied = tabOrder.empty();

  if (newActiveIndex >= 0) {
    activeIndex = newActiveIndex;
  } else {
    // The active tab went away: its right neighbour takes its place.
    activeIndex = std::min(survivorsBeforeActive,
                           std::max(0, int(tabOrder.size()) - 1));
  }
  LOG(INFO) << "Pruned " << result.removed << " empty tabs, "
            << tabOrder.size() << " left";
  return result;
}

bool TerminalCollection::selectTab(int index) {
  if (tabOrder.empty()) {
    return false;
  }
  activeIndex = std::max(0, std::min(index, int(tabOrder.size()) - 1));
  return true;
}

bool TerminalCollection::selectTabById(const WidgetId &tabId) {
  auto it = std::find(tabOrder.begin(), tabOrder.end(), tabId);
  if (it == tabOrder.end()) {
    return false;
  }
  activeIndex = int(it - tabOrder.begin());
  return true;
}

SplitGroup *TerminalCollection::activeSplit() const {
  if (tabOrder.empty()) {
    return NULL;
  }
  int index = std::max(0, std::min(activeIndex, int(tabOrder.size()) - 1));
  return split(tabOrder[index]);
}

TerminalPane *TerminalCollection::activePane() const {
  SplitGroup *group = activeSplit();
  return group ? group->activePane() : NULL;
}

SplitGroup *TerminalCollection::split(const WidgetId &tabId) const {
  auto it = tabs.find(tabId);
  if (it == tabs.end()) {
    return NULL;
  }
  return it->second.get();
}

TerminalPane *TerminalCollection::findPane(const WidgetId &paneId) const {
  SplitGroup *group = splitForPane(paneId);
  return group ? group->pane(paneId) : NULL;
}

SplitGroup *TerminalCollection::splitForPane(const WidgetId &paneId) const {
  for (const auto &it : tabs) {
    if (it.second->pane(paneId)) {
      return it.second.get();
    }
  }
  return NULL;
}

vector<WidgetId> TerminalCollection::tabIds() const {
  vector<WidgetId> retval;
  for (const auto &it : tabs) {
    retval.push_back(it.first);
  }
  return retval;
}

json TerminalCollection::toJson() const {
  json state;
  state["tabOrder"] = tabOrder;
  state["activeIndex"] = activeIndex;
  for (const auto &it : tabs) {
    state["tabs"][it.first] = it.second->toJson();
  }
  return state;
}
}  // namespace tv
