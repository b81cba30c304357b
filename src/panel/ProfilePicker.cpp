#include "ProfilePicker.hpp"

namespace tv {
ProfilePicker::ProfilePicker(const ViewConfig &_config)
    : id(newWidgetId()), config(_config), visible(false), highlighted(0) {}

void ProfilePicker::show(const PixelPoint &_origin,
                         const vector<string> &_profiles) {
  origin = _origin;
  profiles = _profiles;
  highlighted = 0;
  visible = !profiles.empty();
}

void ProfilePicker::hide() { visible = false; }

PixelRect ProfilePicker::bounds() const {
  return PixelRect::fromOrigin(
      origin, PixelSize(itemWidth(), itemHeight() * profiles.size()));
}

PixelRect ProfilePicker::itemRect(int index) const {
  return PixelRect::fromOrigin(
      PixelPoint(origin.x, origin.y + index * itemHeight()),
      PixelSize(itemWidth(), itemHeight()));
}

bool ProfilePicker::handleKey(const KeyEvent &event, CommandChannel *channel) {
  if (!visible) {
    return false;
  }
  int count = int(profiles.size());
  switch (event.key) {
    case Key::UP:
      highlighted = (highlighted + count - 1) % count;
      return true;
    case Key::DOWN:
      highlighted = (highlighted + 1) % count;
      return true;
    case Key::ENTER:
      select(highlighted, channel);
      return true;
    case Key::ESCAPE:
      channel->post(HideProfiles());
      return true;
    default:
      return false;
  }
}

bool ProfilePicker::handleClick(const PixelPoint &pos,
                                CommandChannel *channel) {
  if (!visible || !bounds().contains(pos)) {
    return false;
  }
  select(int((pos.y - origin.y) / itemHeight()), channel);
  return true;
}

void ProfilePicker::select(int index, CommandChannel *channel) {
  if (index < 0 || index >= int(profiles.size())) {
    return;
  }
  LOG(INFO) << "Picked terminal profile " << profiles[index];
  channel->post(OpenTab{profiles[index]});
  channel->post(HideProfiles());
}

void ProfilePicker::paint(DrawList *out) const {
  if (!visible) {
    return;
  }
  const ThemeColors &theme = config.theme;
  out->fillRect(bounds(), theme.panelBackground);
  for (int a = 0; a < int(profiles.size()); a++) {
    PixelRect rect = itemRect(a);
    if (a == highlighted) {
      out->fillRect(rect, theme.editorSelection);
    }
    out->drawText(PixelRect(rect.x0 + config.panePadding, rect.y0,
                            rect.x1 - config.panePadding, rect.y1),
                  profiles[a], theme.terminalForeground);
  }
  out->strokeRect(bounds(), theme.editorCurrentLine, 1.0);
}
}  // namespace tv
