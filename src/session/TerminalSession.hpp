#ifndef __TV_TERMINAL_SESSION_HPP__
#define __TV_TERMINAL_SESSION_HPP__

#include "GridTypes.hpp"
#include "Headers.hpp"
#include "TerminalGrid.hpp"

namespace tv {
/**
 * @brief Everything a session shares between its reader thread and the UI
 * thread.
 */
struct TerminalState {
  TerminalGrid grid;
  optional<SelectionRange> selection;
  /** @brief Palette entries redefined by the running program. */
  map<int, Color> colors;
  string title;

  TerminalState(int columns, int lines, int scrollback)
      : grid(columns, lines, scrollback) {}

  /**
   * @brief Moves the selection up after the screen scrolled by `lines`.  A
   * selection that falls entirely past the top of history is dropped, one
   * that falls partly past it is cut at the topmost line.
   */
  void scrollSelection(int lines);
};

/**
 * @brief Scoped exclusive access to a value guarded by a mutex.
 */
template <typename T>
class Locked {
 public:
  Locked(mutex &m, T &v) : lock(m), value(&v) {}

  T *operator->() const { return value; }
  T &operator*() const { return *value; }

 protected:
  unique_lock<mutex> lock;
  T *value;
};

typedef Locked<TerminalState> GridGuard;

/**
 * @brief Copy of the visible part of a session taken once per paint.
 */
struct RenderableContent {
  int columns;
  int screenLines;
  int displayOffset;
  GridPoint cursor;
  /** @brief Visible rows, index `i` is grid line `i - displayOffset`. */
  vector<Row> rows;
  map<int, Color> colors;
  /** @brief Snapped selection, filled in by the pane. */
  optional<SelectionSpan> selection;

  RenderableContent() : columns(0), screenLines(0), displayOffset(0) {}

  /** @brief Copies the visible window out of a locked state. */
  static RenderableContent capture(const TerminalState &state);
};

/**
 * @brief A live terminal session whose grid is shared with a background
 * reader.
 *
 * All grid access goes through `lockGrid()`, which holds the session mutex
 * for the lifetime of the returned guard.  Keep guards short lived.
 */
class TerminalSession {
 public:
  TerminalSession(int columns, int lines, int scrollback);
  virtual ~TerminalSession() {}

  /** @brief Locks the shared state for one read or mutation. */
  GridGuard lockGrid();

  /** @brief Snapshot of the visible window for one paint pass. */
  RenderableContent renderableContent();

  /** @brief Moves the visible window through scrollback. */
  void scrollTo(const Scroll &scroll);

  /**
   * @brief Resizes the grid and tells the running program about the new
   * size.  Takes effect before this call returns.
   */
  void resize(int columns, int lines);

  /** @brief Current title shown in the tab strip. */
  string title();

  /** @brief Sends bytes to the running program. */
  virtual void write(const string &bytes) = 0;

  /**
   * @brief Terminates the running program.  Safe to call any number of
   * times, only the first call has an effect.
   */
  virtual void close() = 0;

  /** @brief False once the program has exited or the session was closed. */
  virtual bool isRunning() = 0;

 protected:
  mutex stateMutex;
  TerminalState state;

  /** @brief Propagates a new size to the program behind the session. */
  virtual void resizeProcess(int columns, int lines) = 0;
};
}  // namespace tv

#endif  // __TV_TERMINAL_SESSION_HPP__
