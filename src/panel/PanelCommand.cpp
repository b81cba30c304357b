#include "PanelCommand.hpp"

namespace tv {
namespace {
struct CommandNamer {
  string operator()(const OpenTab &c) const {
    return "OpenTab(" + c.profile.value_or("") + ")";
  }
  string operator()(const CloseTab &c) const {
    return "CloseTab(" + c.tabId + ")";
  }
  string operator()(const ClosePane &c) const {
    return "ClosePane(" + c.paneId + ")";
  }
  string operator()(const SplitPane &c) const {
    return string("SplitPane(") + c.paneId +
           (c.vertical ? ", vertical)" : ", horizontal)");
  }
  string operator()(const Focus &c) const { return "Focus(" + c.target + ")"; }
  string operator()(const ShowSearch &) const { return "ShowSearch"; }
  string operator()(const ShowProfiles &c) const {
    return "ShowProfiles(" + to_string(c.profiles.size()) + ")";
  }
  string operator()(const HideProfiles &) const { return "HideProfiles"; }
};
}  // namespace

string commandName(const PanelCommand &command) {
  return std::visit(CommandNamer(), command);
}

void CommandChannel::post(const PanelCommand &command) {
  VLOG(1) << "Posting " << commandName(command);
  pending.push_back(command);
}

vector<PanelCommand> CommandChannel::drain() {
  vector<PanelCommand> retval(pending.begin(), pending.end());
  pending.clear();
  return retval;
}
}  // namespace tv
