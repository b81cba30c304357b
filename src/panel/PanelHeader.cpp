#include "PanelHeader.hpp"

#include "Utf8.hpp"

namespace tv {
PaneIcons::Hit PaneIcons::hitTest(const PixelPoint &pos) const {
  if (close.contains(pos)) {
    return CLOSE;
  }
  if (splitRight.contains(pos)) {
    return SPLIT_RIGHT;
  }
  if (splitDown.contains(pos)) {
    return SPLIT_DOWN;
  }
  return NONE;
}

PanelHeader::PanelHeader(const ViewConfig &_config,
                         shared_ptr<TextMeasurer> _measurer)
    : config(_config),
      measurer(_measurer),
      width(0),
      firstVisible(0),
      tabCount(0),
      visibleCount(0) {}

void PanelHeader::layout(double _width,
                         const vector<pair<WidgetId, string>> &tabs,
                         int activeIndex) {
  bool resized = width != _width;
  width = _width;
  double height = config.headerHeight;
  double padding = config.panePadding;
  double iconSize = config.iconSize;
  double iconBox = iconSize + ICON_PADDING * 2;
  double iconY = (height - iconSize) / 2 - ICON_PADDING;

  // The last two header-height squares hold the profile and add icons.
  addRect = PixelRect::fromOrigin(
      PixelPoint(width - height + ((height - iconSize) / 2 - ICON_PADDING),
                 iconY),
      PixelSize(iconBox, iconBox));
  profilesRect = addRect.translated(-height, 0);
  double contentWidth = std::max(0.0, width - height * 2);

  // The strip scrolls by whole tabs.  It brings the active tab into view
  // when the active tab or the width changes, and otherwise stays where
  // scrollTabs left it.
  double itemWidth = padding + config.tabTitleWidth + iconSize + padding * 2;
  int fit = itemWidth > 0 ? int(contentWidth / itemWidth) : 0;
  int numTabs = int(tabs.size());
  WidgetId activeTab;
  if (activeIndex >= 0 && activeIndex < numTabs) {
    activeTab = tabs[activeIndex].first;
  }
  if (!activeTab.empty() && (resized || activeTab != shownActive)) {
    if (activeIndex < firstVisible) {
      firstVisible = activeIndex;
    } else if (fit > 0 && activeIndex >= firstVisible + fit) {
      firstVisible = activeIndex - fit + 1;
    }
  }
  shownActive = activeTab;
  tabCount = numTabs;
  visibleCount = fit;
  firstVisible = std::max(0, std::min(firstVisible, numTabs - fit));

  items.clear();
  double x = 0;
  for (int a = firstVisible; a < numTabs && a < firstVisible + fit; a++) {
    const auto &it = tabs[a];
    TabItem item;
    item.tabId = it.first;
    item.title = fitTitle(it.second);
    item.rect = PixelRect(x, 0, x + itemWidth, height);
    item.titleRect = PixelRect(x + padding, 0,
                               x + padding + config.tabTitleWidth, height);
    item.closeRect = PixelRect::fromOrigin(
        PixelPoint(x + padding + config.tabTitleWidth + padding - ICON_PADDING,
                   iconY),
        PixelSize(iconBox, iconBox));
    items.push_back(item);
    x += itemWidth;
  }
}

void PanelHeader::scrollTabs(int delta) {
  firstVisible =
      std::max(0, std::min(firstVisible + delta, tabCount - visibleCount));
  VLOG(1) << "Tab strip scrolled to " << firstVisible << " of " << tabCount;
}

HeaderHit PanelHeader::hitTest(const PixelPoint &pos) const {
  HeaderHit hit;
  if (addRect.contains(pos)) {
    hit.type = HeaderHit::NEW_TAB;
    return hit;
  }
  if (profilesRect.contains(pos)) {
    hit.type = HeaderHit::PROFILES;
    return hit;
  }
  for (int a = 0; a < int(items.size()); a++) {
    const TabItem &item = items[a];
    if (!item.rect.contains(pos)) {
      continue;
    }
    hit.type = item.closeRect.contains(pos) ? HeaderHit::CLOSE_TAB
                                            : HeaderHit::SELECT_TAB;
    hit.tabId = item.tabId;
    hit.index = firstVisible + a;
    return hit;
  }
  return hit;
}

void PanelHeader::paint(int activeIndex, bool panelFocused,
                        DrawList *out) const {
  const ThemeColors &theme = config.theme;
  double height = config.headerHeight;
  out->fillRect(PixelRect(0, 0, width, height), theme.panelBackground);
  for (int a = 0; a < int(items.size()); a++) {
    const TabItem &item = items[a];
    out->drawText(item.titleRect, item.title, theme.terminalForeground);
    out->drawIcon(item.closeRect, "close", theme.terminalForeground);
    // Separator on the right edge of the tab.
    out->fillRect(PixelRect(item.rect.x1 - 1, std::round(height * 0.2),
                            item.rect.x1, height - std::round(height * 0.2)),
                  theme.editorCurrentLine);
    if (a == activeIndex) {
      out->fillRect(PixelRect(item.rect.x0 + 2, item.rect.y1 - 2,
                              item.rect.x1 - 2, item.rect.y1),
                    panelFocused ? theme.editorCaret : theme.editorCurrentLine);
    }
  }
  out->drawIcon(profilesRect, "dropdown", theme.terminalForeground);
  out->drawIcon(addRect, "add", theme.terminalForeground);
}

PaneIcons PanelHeader::paneIcons(const PixelRect &paneRect,
                                 const ViewConfig &config) {
  double iconSize = config.iconSize;
  double gap = std::max(0.0, (config.paneHeaderHeight - iconSize) / 2);
  auto iconAt = [&](int slot) {
    return PixelRect::fromOrigin(
        PixelPoint(paneRect.x1 - slot * (gap + iconSize), paneRect.y0 + gap),
        PixelSize(iconSize, iconSize));
  };
  PaneIcons icons;
  icons.close = iconAt(1);
  icons.splitRight = iconAt(2);
  icons.splitDown = iconAt(3);
  return icons;
}

string PanelHeader::fitTitle(const string &title) const {
  double fontSize = config.fontSize;
  if (measurer->measure(title, fontSize) <= config.tabTitleWidth) {
    return title;
  }
  double available = config.tabTitleWidth - measurer->measure("...", fontSize);
  u32string decoded = decodeUtf8(title);
  while (!decoded.empty() &&
         measurer->measure(encodeUtf8(decoded), fontSize) > available) {
    decoded.pop_back();
  }
  return encodeUtf8(decoded) + "...";
}
}  // namespace tv
