#include "TerminalPanel.hpp"

namespace tv {
TerminalPanel::TerminalPanel(const ViewConfig &_config,
                             SessionFactory _sessionFactory,
                             shared_ptr<Clipboard> _clipboard,
                             shared_ptr<TextMeasurer> _measurer,
                             const WidgetId &editorId)
    : config(_config),
      sessionFactory(_sessionFactory),
      clipboard(_clipboard),
      measurer(_measurer),
      resolver(new ThemeColorResolver(_config.theme)),
      renderEngine(_config.theme, _config.dimAlpha, resolver),
      focus(editorId),
      header(_config, _measurer),
      picker(_config),
      searchVisible(false) {
  metrics = CharMetrics::compute(measurer.get(), config.fontSize,
                                 config.lineHeight);
  navigationToggle = KeyChord::parse(config.navigationToggle);
  if (!navigationToggle) {
    LOG(WARNING) << "Navigation mode toggle disabled, could not parse "
                 << config.navigationToggle;
  }
}

WidgetId TerminalPanel::openTab(const optional<string> &profile) {
  WidgetId tabId = collection.openTab();
  auto pane = createPane(tabId, profile);
  if (!pane) {
    return tabId;
  }
  collection.split(tabId)->addPane(pane);
  collection.selectTabById(tabId);
  focus.focusPane(pane->getId());
  layoutActiveSplit();
  return tabId;
}

bool TerminalPanel::splitPane(const WidgetId &paneId, bool vertical) {
  SplitGroup *group = collection.splitForPane(paneId);
  if (!group) {
    VLOG(1) << "Tried to split a pane that doesn't exist: " << paneId;
    return false;
  }
  if (group->size() == 1) {
    group->setVertical(vertical);
  } else if (group->isVertical() != vertical) {
    LOG(INFO) << "Split " << group->getId() << " keeps its "
              << (group->isVertical() ? "vertical" : "horizontal")
              << " orientation";
  }
  auto pane = createPane(group->getId(), nullopt);
  if (!pane) {
    return false;
  }
  group->addPane(pane, paneId);
  collection.selectTabById(group->getId());
  focus.focusPane(pane->getId());
  layoutActiveSplit();
  return true;
}

bool TerminalPanel::closePane(const WidgetId &paneId) {
  SplitGroup *group = collection.splitForPane(paneId);
  if (!group) {
    VLOG(1) << "Tried to close a pane that doesn't exist: " << paneId;
    return false;
  }
  group->removePane(paneId);
  if (capturePane == paneId) {
    capturePane.clear();
  }
  // The remaining panes of the active tab grow into the freed space.
  layoutActiveSplit();
  return true;
}

bool TerminalPanel::closeTab(const WidgetId &tabId) {
  if (!collection.closeTab(tabId)) {
    return false;
  }
  if (!capturePane.empty() && !collection.findPane(capturePane)) {
    capturePane.clear();
  }
  return true;
}

bool TerminalPanel::focusPane(const WidgetId &paneId) {
  SplitGroup *group = collection.splitForPane(paneId);
  if (!group) {
    VLOG(1) << "Tried to focus a pane that doesn't exist: " << paneId;
    return false;
  }
  collection.selectTabById(group->getId());
  group->setActivePane(paneId);
  focus.focusPane(paneId);
  layoutActiveSplit();
  return true;
}

void TerminalPanel::requestFocus() {
  if (!collection.activePane()) {
    LOG(INFO) << "No terminal to focus, opening one";
    openTab(nullopt);
    return;
  }
  focusActivePane();
}

void TerminalPanel::handleEvent(const PanelEvent &event) {
  if (auto mouse = get_if<MouseEvent>(&event)) {
    handleMouse(*mouse);
  } else if (auto wheel = get_if<WheelEvent>(&event)) {
    handleWheel(*wheel);
  } else if (auto key = get_if<KeyEvent>(&event)) {
    handleKey(*key);
  } else if (auto focusLost = get_if<FocusLost>(&event)) {
    handleFocusLost(*focusLost);
  }
}

void TerminalPanel::update() {
  for (const auto &command : channel.drain()) {
    apply(command);
  }
  removeExitedPanes();

  PruneResult result = collection.pruneEmpty();
  if (result.emptied) {
    focus.panelEmptied();
    paneRects.clear();
    capturePane.clear();
  } else if (!collection.empty()) {
    bool ownerGone = focus.getArea() == FocusArea::TERMINAL_PANEL &&
                     !collection.findPane(focus.getOwner());
    if (result.activeRemoved || ownerGone) {
      focusActivePane();
    }
    if (result.removed > 0) {
      layoutActiveSplit();
    }
  }

  if (picker.isVisible() && focus.getArea() != FocusArea::PROFILE_PICKER) {
    // The picker is a popover: it only lives while it has focus.
    picker.hide();
  }
}

void TerminalPanel::layout(const PixelSize &_size) {
  size = _size;
  layoutActiveSplit();
  layoutHeader();
}

DrawList TerminalPanel::paint() {
  DrawList out;
  if (size.width <= 0 || size.height <= 0) {
    return out;
  }
  // Pick up font or size changes before reading any grid.
  layoutActiveSplit();
  layoutHeader();

  const ThemeColors &theme = config.theme;
  out.fillRect(PixelRect(0, 0, size.width, size.height),
               theme.terminalBackground);

  SplitGroup *group = collection.activeSplit();
  if (group) {
    const RegexSearch *activeSearch =
        (searchVisible && search) ? search.get() : NULL;
    for (const auto &paneId : group->getOrder()) {
      TerminalPane *pane = group->pane(paneId);
      auto it = paneRects.find(paneId);
      if (!pane || it == paneRects.end()) {
        continue;
      }
      PixelRect grid = gridRect(it->second);
      DrawList paneOps;
      renderEngine.paint(
          pane->frame(activeSearch, focus.isPaneFocused(paneId)), &paneOps);
      out.append(paneOps, grid.x0, grid.y0);

      PaneIcons icons = PanelHeader::paneIcons(it->second, config);
      out.drawIcon(icons.splitDown, "split-down", theme.terminalForeground);
      out.drawIcon(icons.splitRight, "split-right", theme.terminalForeground);
      out.drawIcon(icons.close, "close", theme.terminalForeground);
    }
  }

  int activeItem = -1;
  if (group) {
    const auto &items = header.getItems();
    for (int a = 0; a < int(items.size()); a++) {
      if (items[a].tabId == group->getId()) {
        activeItem = a;
      }
    }
  }
  header.paint(activeItem, focus.getArea() == FocusArea::TERMINAL_PANEL,
               &out);
  picker.paint(&out);
  return out;
}

void TerminalPanel::setFont(double fontSize, double lineHeight) {
  config.fontSize = fontSize;
  config.lineHeight = lineHeight;
  metrics = CharMetrics::compute(measurer.get(), fontSize, lineHeight);
  LOG(INFO) << "Terminal cell size is now " << metrics.colWidth << "x"
            << metrics.rowHeight;
  layoutActiveSplit();
}

void TerminalPanel::setSearchPattern(const string &pattern) {
  if (pattern.empty()) {
    search.reset();
  } else {
    search = RegexSearch::compile(pattern, config.searchRegex);
  }
  searchVisible = true;
}

void TerminalPanel::hideSearch() { searchVisible = false; }

json TerminalPanel::dumpState() {
  json state;
  state["collection"] = collection.toJson();
  state["focus"] = focus.toJson();
  state["panes"] = json::array();
  for (const auto &tabId : collection.getTabOrder()) {
    SplitGroup *group = collection.split(tabId);
    for (const auto &paneId : group->getOrder()) {
      TerminalPane *pane = group->pane(paneId);
      json p;
      p["id"] = paneId;
      p["tab"] = tabId;
      p["title"] = pane->getTitle();
      p["mode"] = paneModeName(pane->getMode());
      p["columns"] = pane->getColumns();
      p["lines"] = pane->getLines();
      p["running"] = pane->isRunning();
      state["panes"].push_back(p);
    }
  }
  state["search"]["visible"] = searchVisible;
  state["search"]["pattern"] = search ? search->getPattern() : string();
  state["profilePicker"]["visible"] = picker.isVisible();
  state["charMetrics"]["colWidth"] = metrics.colWidth;
  state["charMetrics"]["rowHeight"] = metrics.rowHeight;
  return state;
}

optional<PixelRect> TerminalPanel::paneRect(const WidgetId &paneId) const {
  auto it = paneRects.find(paneId);
  if (it == paneRects.end()) {
    return nullopt;
  }
  return it->second;
}

PixelRect TerminalPanel::gridRect(const PixelRect &paneRect) const {
  double padding = config.panePadding;
  double x0 = paneRect.x0 + padding;
  double y0 = paneRect.y0 + padding;
  return PixelRect(x0, y0, std::max(x0, paneRect.x1 - padding),
                   std::max(y0, paneRect.y1 - padding));
}

shared_ptr<TerminalPane> TerminalPanel::createPane(
    const WidgetId &splitId, const optional<string> &profile) {
  string command = config.commandForProfile(profile);
  int columns = 80;
  int lines = 24;
  if (metrics.valid() && size.width > 0 && size.height > header.getHeight()) {
    PixelRect grid = gridRect(bodyRect());
    columns = std::max(1, int(std::floor(grid.width() / metrics.colWidth)));
    lines = std::max(1, int(std::floor(grid.height() / metrics.rowHeight)));
  }
  auto session = sessionFactory(command, columns, lines);
  if (!session) {
    LOG(ERROR) << "Could not start a terminal session for " << command;
    return nullptr;
  }
  return shared_ptr<TerminalPane>(
      new TerminalPane(splitId, session, profile.value_or(string())));
}

void TerminalPanel::apply(const PanelCommand &command) {
  VLOG(1) << "Applying " << commandName(command);
  if (auto c = get_if<OpenTab>(&command)) {
    openTab(c->profile);
  } else if (auto c = get_if<CloseTab>(&command)) {
    closeTab(c->tabId);
  } else if (auto c = get_if<ClosePane>(&command)) {
    closePane(c->paneId);
  } else if (auto c = get_if<SplitPane>(&command)) {
    splitPane(c->paneId, c->vertical);
  } else if (auto c = get_if<Focus>(&command)) {
    focusPane(c->target);
  } else if (get_if<ShowSearch>(&command)) {
    searchVisible = true;
  } else if (auto c = get_if<ShowProfiles>(&command)) {
    if (c->profiles.empty()) {
      VLOG(1) << "No terminal profiles configured";
      return;
    }
    picker.show(c->origin, c->profiles);
    focus.focusProfilePicker(picker.getId());
  } else if (get_if<HideProfiles>(&command)) {
    picker.hide();
    focus.dismissProfilePicker();
  }
}

void TerminalPanel::removeExitedPanes() {
  vector<WidgetId> exited;
  for (const auto &tabId : collection.getTabOrder()) {
    SplitGroup *group = collection.split(tabId);
    for (const auto &paneId : group->getOrder()) {
      TerminalPane *pane = group->pane(paneId);
      if (pane && !pane->isRunning()) {
        exited.push_back(paneId);
      }
    }
  }
  for (const auto &paneId : exited) {
    LOG(INFO) << "Session for pane " << paneId << " ended";
    closePane(paneId);
  }
}

void TerminalPanel::focusActivePane() {
  TerminalPane *pane = collection.activePane();
  if (pane) {
    focus.focusPane(pane->getId());
  }
}

void TerminalPanel::layoutActiveSplit() {
  paneRects.clear();
  SplitGroup *group = collection.activeSplit();
  if (!group || size.width <= 0 || size.height <= 0) {
    return;
  }
  for (const auto &it : group->layout(bodyRect())) {
    TerminalPane *pane = group->pane(it.paneId);
    if (!pane) {
      continue;
    }
    paneRects[it.paneId] = it.rect;
    pane->resize(gridRect(it.rect).size(), metrics);
  }
}

void TerminalPanel::layoutHeader() {
  vector<pair<WidgetId, string>> tabs;
  int activeItem = -1;
  SplitGroup *active = collection.activeSplit();
  for (const auto &tabId : collection.getTabOrder()) {
    TerminalPane *pane = collection.split(tabId)->activePane();
    if (pane) {
      if (active && active->getId() == tabId) {
        activeItem = int(tabs.size());
      }
      tabs.push_back(make_pair(tabId, pane->getTitle()));
    }
  }
  header.layout(size.width, tabs, activeItem);
}

TerminalPane *TerminalPanel::paneAt(const PixelPoint &pos, PixelRect *rect) {
  SplitGroup *group = collection.activeSplit();
  if (!group || size.width <= 0 || size.height <= 0) {
    return NULL;
  }
  auto hit = group->paneAt(bodyRect(), pos);
  if (!hit) {
    return NULL;
  }
  *rect = hit->rect;
  return group->pane(hit->paneId);
}

PixelRect TerminalPanel::bodyRect() const {
  return PixelRect(0, header.getHeight(), size.width,
                   std::max(header.getHeight(), size.height));
}

void TerminalPanel::handleMouse(const MouseEvent &event) {
  if (picker.isVisible() && event.type == MouseEvent::DOWN) {
    if (picker.handleClick(event.pos, &channel)) {
      return;
    }
    // A click anywhere else takes focus away from the picker.
    picker.hide();
    focus.dismissProfilePicker();
  }

  if (event.type == MouseEvent::DOWN && event.pos.y < header.getHeight()) {
    HeaderHit hit = header.hitTest(event.pos);
    switch (hit.type) {
      case HeaderHit::SELECT_TAB:
        collection.selectTabById(hit.tabId);
        layoutActiveSplit();
        focusActivePane();
        break;
      case HeaderHit::CLOSE_TAB:
        channel.post(CloseTab{hit.tabId});
        break;
      case HeaderHit::NEW_TAB:
        channel.post(OpenTab());
        break;
      case HeaderHit::PROFILES: {
        vector<string> names;
        for (const auto &it : config.profiles) {
          names.push_back(it.first);
        }
        const PixelRect &icon = header.getProfilesRect();
        channel.post(ShowProfiles{PixelPoint(icon.x0, icon.y1), names});
        break;
      }
      case HeaderHit::NONE:
        break;
    }
    return;
  }

  TerminalPane *pane = NULL;
  PixelRect rect;
  if (event.type != MouseEvent::DOWN && !capturePane.empty()) {
    pane = collection.findPane(capturePane);
    auto it = paneRects.find(capturePane);
    if (!pane || it == paneRects.end()) {
      capturePane.clear();
      return;
    }
    rect = it->second;
  } else {
    pane = paneAt(event.pos, &rect);
  }
  if (!pane) {
    return;
  }

  WidgetId paneId = pane->getId();
  if (event.type == MouseEvent::DOWN) {
    focusPane(paneId);
    PaneIcons icons = PanelHeader::paneIcons(rect, config);
    switch (icons.hitTest(event.pos)) {
      case PaneIcons::CLOSE:
        channel.post(ClosePane{paneId});
        return;
      case PaneIcons::SPLIT_RIGHT:
        channel.post(SplitPane{paneId, true});
        return;
      case PaneIcons::SPLIT_DOWN:
        channel.post(SplitPane{paneId, false});
        return;
      case PaneIcons::NONE:
        break;
    }
    if (event.button == MouseButton::LEFT) {
      capturePane = paneId;
    }
  }

  PixelRect grid = gridRect(rect);
  MouseEvent local = event;
  local.pos = PixelPoint(event.pos.x - grid.x0, event.pos.y - grid.y0);
  pane->handleMouse(local, clipboard.get());
  if (event.type == MouseEvent::UP && event.button == MouseButton::LEFT) {
    capturePane.clear();
  }
}

void TerminalPanel::handleWheel(const WheelEvent &event) {
  if (event.pos.y < header.getHeight()) {
    // Over the tab strip the wheel scrolls the strip, one tab per notch.
    int tabs = event.deltaY > 0 ? 1 : (event.deltaY < 0 ? -1 : 0);
    if (event.lineMode) {
      tabs = int(std::lround(event.deltaY));
    }
    header.scrollTabs(tabs);
    layoutHeader();
    return;
  }
  PixelRect rect;
  TerminalPane *pane = paneAt(event.pos, &rect);
  if (!pane) {
    return;
  }
  pane->wheel(event.deltaY, event.lineMode, config.wheelLinesPerNotch);
}

void TerminalPanel::handleKey(const KeyEvent &event) {
  if (focus.getArea() == FocusArea::PROFILE_PICKER) {
    picker.handleKey(event, &channel);
    return;
  }
  if (focus.getArea() != FocusArea::TERMINAL_PANEL) {
    return;
  }
  TerminalPane *pane = collection.findPane(focus.getOwner());
  if (!pane) {
    VLOG(1) << "Dropping key for a pane that is gone: " << focus.getOwner();
    return;
  }
  pane->handleKey(event, navigationToggle, clipboard.get(), &channel);
}

void TerminalPanel::handleFocusLost(const FocusLost &event) {
  if (picker.isVisible()) {
    picker.hide();
    focus.dismissProfilePicker();
  }
  if (config.clearSelectionOnBlur &&
      focus.getArea() == FocusArea::TERMINAL_PANEL) {
    TerminalPane *pane = collection.findPane(focus.getOwner());
    if (pane) {
      pane->clearSelection();
    }
  }
  if (event.editor) {
    focus.recordEditorFocus(*event.editor);
  }
}
}  // namespace tv
