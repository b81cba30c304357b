#include "ViewConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace tv {
namespace {
const char *ANSI_DEFAULTS[16] = {
    "#000000", "#cd3131", "#0dbc79", "#e5e510", "#2472c8", "#bc3fbc",
    "#11a8cd", "#e5e5e5", "#666666", "#f14c4c", "#23d18b", "#f5f543",
    "#3b8eea", "#d670d6", "#29b8db", "#e5e5e5",
};

void readColor(const CSimpleIniA &ini, const char *key, Color *color) {
  const char *value = ini.GetValue("Theme", key, NULL);
  if (!value) {
    return;
  }
  auto parsed = Color::parse(trim(value));
  if (!parsed) {
    LOG(WARNING) << "Ignoring invalid color for Theme." << key << ": "
                 << value;
    return;
  }
  *color = *parsed;
}

void readDouble(const CSimpleIniA &ini, const char *section, const char *key,
                double *out) {
  const char *value = ini.GetValue(section, key, NULL);
  if (!value) {
    return;
  }
  try {
    *out = stod(value);
  } catch (const std::logic_error &le) {
    LOG(WARNING) << "Ignoring invalid value for " << section << "." << key
                 << ": " << value;
  }
}

void applyIni(const CSimpleIniA &ini, ViewConfig *config) {
  const char *shell = ini.GetValue("Terminal", "shell", NULL);
  if (shell && strlen(shell)) {
    config->shell = shell;
  }
  readDouble(ini, "Terminal", "font_size", &config->fontSize);
  readDouble(ini, "Terminal", "line_height", &config->lineHeight);
  config->scrollback = int(ini.GetLongValue("Terminal", "scrollback",
                                            config->scrollback));
  double dimAlpha = config->dimAlpha;
  readDouble(ini, "Terminal", "dim_alpha", &dimAlpha);
  config->dimAlpha = float(std::min(1.0, std::max(0.0, dimAlpha)));
  config->wheelLinesPerNotch = int(ini.GetLongValue(
      "Terminal", "wheel_lines_per_notch", config->wheelLinesPerNotch));
  config->clearSelectionOnBlur = ini.GetBoolValue(
      "Terminal", "clear_selection_on_blur", config->clearSelectionOnBlur);
  const char *toggle = ini.GetValue("Terminal", "navigation_toggle", NULL);
  if (toggle && strlen(toggle)) {
    config->navigationToggle = trim(toggle);
  }

  ThemeColors &theme = config->theme;
  readColor(ini, "background", &theme.terminalBackground);
  readColor(ini, "foreground", &theme.terminalForeground);
  readColor(ini, "cursor", &theme.terminalCursor);
  readColor(ini, "caret", &theme.editorCaret);
  readColor(ini, "selection", &theme.editorSelection);
  readColor(ini, "current_line", &theme.editorCurrentLine);
  readColor(ini, "panel_background", &theme.panelBackground);
  for (int a = 0; a < 16; a++) {
    string key = "ansi" + to_string(a);
    readColor(ini, key.c_str(), &theme.ansi[a]);
  }

  readDouble(ini, "Panel", "header_height", &config->headerHeight);
  readDouble(ini, "Panel", "pane_header_height", &config->paneHeaderHeight);
  readDouble(ini, "Panel", "tab_title_width", &config->tabTitleWidth);
  readDouble(ini, "Panel", "icon_size", &config->iconSize);
  readDouble(ini, "Panel", "pane_padding", &config->panePadding);

  config->searchRegex =
      ini.GetBoolValue("Search", "regex", config->searchRegex);

  CSimpleIniA::TNamesDepend keys;
  ini.GetAllKeys("Profiles", keys);
  for (const auto &key : keys) {
    const char *command = ini.GetValue("Profiles", key.pItem, NULL);
    if (command) {
      config->profiles[key.pItem] = command;
    }
  }

  config->verbose = int(ini.GetLongValue("Debug", "verbose", config->verbose));
  config->silent = ini.GetBoolValue("Debug", "silent", config->silent);
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxLogSize is a string of int value
    config->maxLogSize = to_string(atoi(logsize));
  }
}
}  // namespace

ThemeColors::ThemeColors()
    : terminalBackground(0x1e, 0x1e, 0x1e),
      terminalForeground(0xcc, 0xcc, 0xcc),
      terminalCursor(0xae, 0xaf, 0xad),
      editorCaret(0x52, 0x8b, 0xff),
      editorSelection(0x26, 0x4f, 0x78),
      editorCurrentLine(0x2a, 0x2d, 0x2e),
      panelBackground(0x25, 0x25, 0x26) {
  for (int a = 0; a < 16; a++) {
    ansi[a] = *Color::parse(ANSI_DEFAULTS[a]);
  }
}

ViewConfig::ViewConfig()
    : fontSize(13),
      lineHeight(20),
      scrollback(10000),
      dimAlpha(0.66f),
      wheelLinesPerNotch(3),
      clearSelectionOnBlur(false),
      navigationToggle("ctrl+shift+space"),
      headerHeight(35),
      paneHeaderHeight(30),
      tabTitleWidth(120),
      iconSize(16),
      panePadding(10),
      searchRegex(false),
      verbose(0),
      silent(false),
      maxLogSize("20971520") {
  const char *envShell = ::getenv("SHELL");
  shell = (envShell && strlen(envShell)) ? string(envShell) : "/bin/sh";
}

string ViewConfig::defaultPath() {
  return sago::getConfigHome() + "/termview/termview.ini";
}

bool ViewConfig::loadFile(const string &path) {
  if (!fs::exists(path)) {
    VLOG(1) << "No config file at " << path << ", using defaults";
    return true;
  }
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(ERROR) << "Invalid config file: " << path;
    return false;
  }
  applyIni(ini, this);
  return true;
}

bool ViewConfig::loadString(const string &data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data.c_str(), data.length());
  if (rc < 0) {
    LOG(ERROR) << "Invalid config data";
    return false;
  }
  applyIni(ini, this);
  return true;
}

string ViewConfig::commandForProfile(const optional<string> &profile) const {
  if (profile) {
    auto it = profiles.find(*profile);
    if (it != profiles.end()) {
      return it->second;
    }
    LOG(WARNING) << "Unknown terminal profile " << *profile
                 << ", using the default shell";
  }
  return shell;
}
}  // namespace tv
