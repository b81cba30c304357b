#ifndef __TV_TERMINAL_PANE_HPP__
#define __TV_TERMINAL_PANE_HPP__

#include "CharMetrics.hpp"
#include "Clipboard.hpp"
#include "Headers.hpp"
#include "KeyEncoder.hpp"
#include "PaneMode.hpp"
#include "PanelCommand.hpp"
#include "PanelEvent.hpp"
#include "RenderEngine.hpp"
#include "SearchHighlighter.hpp"
#include "TerminalSession.hpp"

namespace tv {
/**
 * @brief One terminal session's view inside a split.
 *
 * The pane translates pane-local pixels to grid coordinates, keeps the grid
 * size in step with its pixel size and closes its session exactly once when
 * it goes away.  Pointer positions passed to the pane are relative to the
 * top left corner of the character grid.
 */
class TerminalPane {
 public:
  TerminalPane(const WidgetId &_splitId, shared_ptr<TerminalSession> _session,
               const string &_profileName);
  /** @brief Closes the session if `close()` was not called yet. */
  ~TerminalPane();

  const WidgetId &getId() const { return id; }
  const WidgetId &getSplitId() const { return splitId; }
  shared_ptr<TerminalSession> getSession() const { return session; }

  /** @brief The session title, falling back to the profile name. */
  string getTitle();

  PaneMode getMode() const { return mode; }
  void setMode(PaneMode _mode);

  const PixelSize &getPixelSize() const { return pixelSize; }
  const CharMetrics &getCharMetrics() const { return metrics; }
  int getColumns() const { return columns; }
  int getLines() const { return lines; }

  /**
   * @brief Recomputes the grid size for a new pixel size or font, resizing
   * the session before returning when it changed.
   * @return true if the grid dimensions changed.
   */
  bool resize(const PixelSize &size, const CharMetrics &_metrics);

  /** @brief Writes bytes to the session and scrolls to the bottom. */
  void write(const string &bytes);
  void scroll(const Scroll &scroll);

  /**
   * @brief Scrolls for wheel motion.  Pixel deltas accumulate until they
   * add up to whole rows; line deltas scroll `linesPerNotch` per notch.
   */
  void wheel(double deltaY, bool lineMode, int linesPerNotch);

  optional<SelectionRange> getSelection();
  void clearSelection();
  /** @brief Starts a new selection of `kind` at a grid-local position. */
  void selectAt(const PixelPoint &pos, SelectionKind kind);
  /** @brief Moves the selection head, starting a selection if needed. */
  void extendSelection(const PixelPoint &pos, SelectionKind kind);
  optional<string> selectedText();

  /**
   * @brief Copies the selection to the clipboard and clears it.
   * @return false if nothing was selected.
   */
  bool copySelection(Clipboard *clipboard);
  /** @brief Writes the clipboard text to the session. */
  bool paste(Clipboard *clipboard);

  /** @brief Pointer input in grid-local coordinates. */
  void handleMouse(const MouseEvent &event, Clipboard *clipboard);

  /**
   * @brief Keyboard input.  `toggle` switches between modes; in navigation
   * mode keys are panel commands.
   * @return true if the key was consumed.
   */
  bool handleKey(const KeyEvent &event, const optional<KeyChord> &toggle,
                 Clipboard *clipboard, CommandChannel *channel);

  /**
   * @brief Copies everything one paint pass needs out of the session under
   * a single short lock.
   */
  PaneFrame frame(const RegexSearch *search, bool focused);

  bool isRunning();

  /** @brief Terminates the session.  Only the first call has an effect. */
  void close();
  bool isClosed() const { return closed; }

 protected:
  WidgetId id;
  WidgetId splitId;
  shared_ptr<TerminalSession> session;
  string profileName;
  PixelSize pixelSize;
  CharMetrics metrics;
  int columns;
  int lines;
  PaneMode mode;
  double wheelRemainder;
  optional<PixelPoint> pressOrigin;
  bool closed;

  bool handleNavigationKey(const KeyEvent &event, Clipboard *clipboard,
                           CommandChannel *channel);
  void moveSelectionHead(int lineDelta);
};
}  // namespace tv

#endif  // __TV_TERMINAL_PANE_HPP__
