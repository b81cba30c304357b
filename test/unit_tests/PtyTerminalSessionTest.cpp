#include "PtyTerminalSession.hpp"
#include "TestHeaders.hpp"

using namespace tv;

namespace {
/** @brief Session whose reader can be stopped without reaping the child. */
class StoppableSession : public PtyTerminalSession {
 public:
  StoppableSession() : PtyTerminalSession(80, 24, 100) {}

  /** @brief Ends the reader the way a select() failure does. */
  void stopReader() {
    running = false;
    readThread->join();
    readThread.reset();
  }

  bool isReaped() const { return reaped; }
};

template <typename Predicate>
bool waitFor(Predicate done) {
  for (int a = 0; a < 500; a++) {
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return done();
}
}  // namespace

TEST_CASE("Program output reaches the grid", "[PtyTerminalSession]") {
  PtyTerminalSession session(80, 24, 100);
  session.start("echo hello");
  REQUIRE(session.getChildPid() > 0);
  REQUIRE(waitFor([&session]() {
    auto guard = session.lockGrid();
    return guard->grid.lineText(0) == "hello";
  }));
  REQUIRE(waitFor([&session]() { return !session.isRunning(); }));
  session.close();
}

TEST_CASE("Closing reaps a child the reader left behind",
          "[PtyTerminalSession]") {
  StoppableSession session;
  session.start("sleep 30");
  pid_t pid = session.getChildPid();
  REQUIRE(pid > 0);

  session.stopReader();
  REQUIRE_FALSE(session.isRunning());
  REQUIRE_FALSE(session.isReaped());

  session.close();
  REQUIRE(session.isReaped());
  REQUIRE(kill(pid, 0) == -1);
  REQUIRE(GetErrno() == ESRCH);
}
