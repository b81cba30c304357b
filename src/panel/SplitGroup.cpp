#include "SplitGroup.hpp"

namespace tv {
SplitGroup::SplitGroup(const WidgetId &_splitId)
    : splitId(_splitId), vertical(true) {}

SplitGroup::~SplitGroup() { clear(); }

void SplitGroup::addPane(shared_ptr<TerminalPane> pane,
                         const WidgetId &afterPaneId) {
  if (panes.find(pane->getId()) != panes.end()) {
    STFATAL << "Tried to add a pane twice: " << pane->getId();
  }
  panes.insert(make_pair(pane->getId(), pane));

  auto it = std::find(order.begin(), order.end(), afterPaneId);
  if (it == order.end()) {
    if (order.empty()) {
      order.push_back(pane->getId());
      sizes.push_back(1.0);
    } else {
      // Continuing a split: every pane gives up half its space.
      for (auto &size : sizes) {
        size /= 2.0;
      }
      order.push_back(pane->getId());
      sizes.push_back(0.5);
    }
  } else {
    size_t index = it - order.begin();
    double half = sizes[index] / 2.0;
    sizes[index] = half;
    order.insert(order.begin() + index + 1, pane->getId());
    sizes.insert(sizes.begin() + index + 1, half);
  }
  activePaneId = pane->getId();
}

bool SplitGroup::removePane(const WidgetId &paneId) {
  auto it = panes.find(paneId);
  if (it == panes.end()) {
    VLOG(1) << "Tried to remove a pane that is not in split " << splitId
            << ": " << paneId;
    return false;
  }
  it->second->close();
  panes.erase(it);

  auto orderIt = std::find(order.begin(), order.end(), paneId);
  size_t index = 0;
  if (orderIt != order.end()) {
    index = orderIt - order.begin();
    order.erase(orderIt);
    sizes.erase(sizes.begin() + index);
  }
  double total = 0;
  for (auto size : sizes) {
    total += size;
  }
  if (total > 0) {
    for (auto &size : sizes) {
      size /= total;
    }
  }

  if (activePaneId == paneId) {
    if (order.empty()) {
      activePaneId.clear();
    } else {
      activePaneId = order[std::min(index, order.size() - 1)];
    }
  }
  return true;
}

void SplitGroup::clear() {
  while (!order.empty()) {
    removePane(order.back());
  }
}

TerminalPane *SplitGroup::activePane() const { return pane(activePaneId); }

bool SplitGroup::setActivePane(const WidgetId &paneId) {
  if (panes.find(paneId) == panes.end()) {
    return false;
  }
  activePaneId = paneId;
  return true;
}

TerminalPane *SplitGroup::pane(const WidgetId &paneId) const {
  auto it = panes.find(paneId);
  if (it == panes.end()) {
    return NULL;
  }
  return it->second.get();
}

vector<PaneRect> SplitGroup::layout(const PixelRect &bounds) const {
  vector<PaneRect> rects;
  double extent = vertical ? bounds.width() : bounds.height();
  double position = vertical ? bounds.x0 : bounds.y0;
  double end = vertical ? bounds.x1 : bounds.y1;
  for (size_t a = 0; a < order.size(); a++) {
    double next = (a + 1 == order.size())
                      ? end
                      : std::floor(position + sizes[a] * extent);
    PaneRect pr;
    pr.paneId = order[a];
    if (vertical) {
      pr.rect = PixelRect(position, bounds.y0, next, bounds.y1);
    } else {
      pr.rect = PixelRect(bounds.x0, position, bounds.x1, next);
    }
    rects.push_back(pr);
    position = next;
  }
  return rects;
}

optional<PaneRect> SplitGroup::paneAt(const PixelRect &bounds,
                                      const PixelPoint &pos) const {
  for (const auto &it : layout(bounds)) {
    if (it.rect.contains(pos)) {
      return it;
    }
  }
  return nullopt;
}

json SplitGroup::toJson() const {
  json split;
  split["id"] = splitId;
  split["vertical"] = vertical;
  split["panes"] = order;
  split["sizes"] = sizes;
  split["activePane"] = activePaneId;
  return split;
}
}  // namespace tv
