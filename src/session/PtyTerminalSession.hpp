#ifndef __TV_PTY_TERMINAL_SESSION_HPP__
#define __TV_PTY_TERMINAL_SESSION_HPP__

#include "Headers.hpp"
#include "OutputFeeder.hpp"
#include "TerminalSession.hpp"

namespace tv {
/**
 * @brief Runs a shell on a pseudo-terminal and feeds its output into the
 * session grid from a background reader thread.
 */
class PtyTerminalSession : public TerminalSession {
 public:
  /** @brief Sets up internal buffers/state before launching a PTY. */
  PtyTerminalSession(int columns, int lines, int scrollback);
  /** @brief Closes the session if the owner did not. */
  virtual ~PtyTerminalSession();

  /**
   * @brief Forks `command` connected to a pty and starts the reader thread.
   * A bare executable path is started as a login shell, anything else is run
   * through `/bin/sh -c`.
   */
  void start(const string &command);

  virtual void write(const string &bytes);
  virtual void close();
  virtual bool isRunning() { return running; }

  /** @brief Child process ID for the spawned program. */
  pid_t getChildPid() const { return childPid; }

 protected:
  /** @brief Master fd used to read/write the PTY. */
  int masterFd;
  /** @brief Child process ID for the spawned program. */
  pid_t childPid;
  /** @brief Set while the child is alive and the reader should keep going. */
  atomic<bool> running;
  /** @brief Set by the first `close()`. */
  atomic<bool> closed;
  /** @brief Set once the child has been waited on. */
  atomic<bool> reaped;
  /** @brief Drains the pty while the session runs. */
  unique_ptr<thread> readThread;
  /** @brief Turns program output into grid cells, reader thread only. */
  OutputFeeder feeder;

  virtual void resizeProcess(int columns, int lines);

  /** @brief Reader thread body. */
  void readLoop();
  /** @brief Waits for the child so it does not linger as a zombie. */
  void reapChild(bool block);
};
}  // namespace tv

#endif  // __TV_PTY_TERMINAL_SESSION_HPP__
