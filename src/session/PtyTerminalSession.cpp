#include "PtyTerminalSession.hpp"

#include <pty.h>

namespace tv {
#define BUF_SIZE (16 * 1024)

PtyTerminalSession::PtyTerminalSession(int columns, int lines, int scrollback)
    : TerminalSession(columns, lines, scrollback),
      masterFd(-1),
      childPid(-1),
      running(false),
      closed(false),
      reaped(false) {}

PtyTerminalSession::~PtyTerminalSession() { close(); }

void PtyTerminalSession::start(const string &command) {
  winsize tmpwin;
  {
    auto guard = lockGrid();
    tmpwin.ws_row = guard->grid.screenLines();
    tmpwin.ws_col = guard->grid.columns();
    auto commandTokens = split(command, '/');
    guard->title = commandTokens.empty() ? command : commandTokens.back();
  }
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;

  pid_t pid = forkpty(&masterFd, NULL, NULL, &tmpwin);
  switch (pid) {
    case -1:
      FATAL_FAIL(pid);
      break;
    case 0: {
      passwd *pwd = getpwuid(getuid());
      if (pwd != NULL && pwd->pw_dir != NULL) {
        if (chdir(pwd->pw_dir) == -1) {
          // Stay in the inherited directory.
        }
      }
      setenv("TERM", "xterm-256color", 1);
      setenv("TERMVIEW_VERSION", TV_VERSION, 1);
      if (command.find(' ') == string::npos) {
        execl(command.c_str(), command.c_str(), "-l", NULL);
      } else {
        execl("/bin/sh", "sh", "-c", command.c_str(), NULL);
      }
      _exit(127);
      break;
    }
    default: {
      // parent
      VLOG(1) << "pty opened " << masterFd << " for child " << pid;
      childPid = pid;
      running = true;
      readThread.reset(new thread(&PtyTerminalSession::readLoop, this));
      break;
    }
  }
}

void PtyTerminalSession::readLoop() {
  char b[BUF_SIZE];
  while (running) {
    // Data structures needed for select() and
    // non-blocking I/O.
    fd_set rfd;
    timeval tv;

    FD_ZERO(&rfd);
    FD_SET(masterFd, &rfd);
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int rc = select(masterFd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "select on pty failed: " << strerror(GetErrno());
      running = false;
      break;
    }
    if (rc == 0 || !FD_ISSET(masterFd, &rfd)) {
      continue;
    }

    try {
      ssize_t bytesRead = ::read(masterFd, b, BUF_SIZE);
      if (bytesRead < 0) {
        if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
          continue;
        }
        // EIO is how linux reports that the child side of the pty closed.
        if (GetErrno() != EIO) {
          throw std::runtime_error(string("Terminal failure: ") +
                                   strerror(GetErrno()));
        }
        bytesRead = 0;
      }
      if (bytesRead == 0) {
        LOG(INFO) << "Terminal session ended for child " << childPid;
        running = false;
        reapChild(true);
        break;
      }
      string newChars(b, bytesRead);
      VLOG(2) << "Read " << bytesRead << " bytes from pty " << masterFd;
      auto guard = lockGrid();
      feeder.advance(&*guard, newChars);
    } catch (const std::runtime_error &re) {
      LOG(INFO) << re.what();
      running = false;
    }
  }
}

void PtyTerminalSession::write(const string &bytes) {
  if (!running || masterFd < 0) {
    VLOG(1) << "Dropping " << bytes.length() << " bytes for a closed session";
    return;
  }
  size_t bytesWritten = 0;
  while (bytesWritten < bytes.length()) {
    ssize_t rc = ::write(masterFd, bytes.c_str() + bytesWritten,
                         bytes.length() - bytesWritten);
    if (rc < 0) {
      if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
        continue;
      }
      LOG(WARNING) << "Write to pty failed: " << strerror(GetErrno());
      return;
    }
    bytesWritten += rc;
  }
}

void PtyTerminalSession::resizeProcess(int columns, int lines) {
  if (masterFd < 0 || closed) {
    return;
  }
  winsize tmpwin;
  tmpwin.ws_row = lines;
  tmpwin.ws_col = columns;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    LOG(WARNING) << "TIOCSWINSZ failed: " << strerror(GetErrno());
  }
}

void PtyTerminalSession::close() {
  if (closed.exchange(true)) {
    return;
  }
  LOG(INFO) << "Stopping terminal " << childPid;
  running = false;
  if (readThread) {
    readThread->join();
    readThread.reset();
  }
  // The reader only reaps on end of file, any other exit leaves the child
  // for us.
  if (childPid > 0 && !reaped) {
    if (kill(childPid, SIGKILL) == -1 && GetErrno() != ESRCH) {
      STERROR << "kill failed: " << strerror(GetErrno());
    }
    reapChild(true);
  }
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
  LOG(INFO) << "Terminal stopped";
}

void PtyTerminalSession::reapChild(bool block) {
  if (reaped.exchange(true)) {
    return;
  }
  siginfo_t childInfo;
  int rc = waitid(P_PID, childPid, &childInfo, WEXITED | (block ? 0 : WNOHANG));
  if (rc < 0 && GetErrno() != ECHILD) {
    STERROR << "waitid failed: " << strerror(GetErrno());
  }
}
}  // namespace tv
