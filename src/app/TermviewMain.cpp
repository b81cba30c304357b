#include <cxxopts.hpp>

#include "CharMetrics.hpp"
#include "Clipboard.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "LogHandler.hpp"
#include "PtyTerminalSession.hpp"
#include "TerminalPanel.hpp"
#include "ViewConfig.hpp"

using namespace tv;

namespace {
json screenText(TerminalPane *pane) {
  json lines = json::array();
  auto guard = pane->getSession()->lockGrid();
  const TerminalGrid &grid = guard->grid;
  for (int line = 0; line < grid.screenLines(); line++) {
    lines.push_back(grid.lineText(line));
  }
  return lines;
}
}  // namespace

int main(int argc, char **argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tv::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tv::InterruptSignalHandler);

  cxxopts::Options options("termview",
                           "Headless driver for the terminal panel");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("tabs", "Comma separated profiles to open, one tab each",
         cxxopts::value<std::string>()->default_value(""))  //
        ("width", "Panel width in pixels",
         cxxopts::value<int>()->default_value("800"))  //
        ("height", "Panel height in pixels",
         cxxopts::value<int>()->default_value("480"))  //
        ("run", "Command to type into the first pane",
         cxxopts::value<std::string>()->default_value(""))  //
        ("search", "Highlight matches of this pattern",
         cxxopts::value<std::string>()->default_value(""))  //
        ("wait_ms", "How long to let the programs run before painting",
         cxxopts::value<int>()->default_value("500"))  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"));

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "termview version " << TV_VERSION << endl;
      exit(0);
    }

    ViewConfig config;
    string cfgfile = result["cfgfile"].as<string>();
    if (cfgfile.empty()) {
      cfgfile = ViewConfig::defaultPath();
    }
    if (!config.loadFile(cfgfile)) {
      CLOG(INFO, "stdout") << "Could not parse config file: " << cfgfile
                           << endl;
      exit(1);
    }

    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "termview", result.count("logtostdout") > 0,
                              config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Loggers::setVerboseLevel(
        std::max(config.verbose, result["verbose"].as<int>()));
    el::Helpers::setThreadName("termview-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    int scrollback = config.scrollback;
    SessionFactory factory = [scrollback](const string &command, int columns,
                                          int lines) {
      shared_ptr<PtyTerminalSession> session(
          new PtyTerminalSession(columns, lines, scrollback));
      session->start(command);
      return shared_ptr<TerminalSession>(session);
    };
    shared_ptr<Clipboard> clipboard(new MemoryClipboard());
    shared_ptr<TextMeasurer> measurer(new FixedTextMeasurer());
    TerminalPanel panel(config, factory, clipboard, measurer, newWidgetId());
    panel.layout(PixelSize(result["width"].as<int>(),
                           result["height"].as<int>()));

    vector<string> tabs = split(result["tabs"].as<string>(), ',');
    if (tabs.empty()) {
      panel.requestFocus();
    }
    for (const auto &profile : tabs) {
      if (profile.empty()) {
        panel.openTab(nullopt);
      } else {
        panel.openTab(profile);
      }
    }

    string run = result["run"].as<string>();
    if (!run.empty()) {
      TerminalPane *pane = panel.getCollection().activePane();
      if (pane) {
        pane->write(run + "\r");
      }
    }
    if (!result["search"].as<string>().empty()) {
      panel.setSearchPattern(result["search"].as<string>());
    }

    std::this_thread::sleep_for(
        std::chrono::milliseconds(result["wait_ms"].as<int>()));
    panel.update();
    DrawList frame = panel.paint();

    json summary;
    summary["state"] = panel.dumpState();
    summary["frame"] = frame.summary();
    TerminalPane *pane = panel.getCollection().activePane();
    if (pane) {
      summary["screen"] = screenText(pane);
    }
    CLOG(INFO, "stdout") << summary.dump(2) << endl;

    for (const auto &tabId : panel.getCollection().getTabOrder()) {
      panel.closeTab(tabId);
    }
    panel.update();
  } catch (cxxopts::exceptions::exception &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
  return 0;
}
