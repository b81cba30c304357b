#ifndef __TV_OUTPUT_FEEDER_HPP__
#define __TV_OUTPUT_FEEDER_HPP__

#include "Headers.hpp"
#include "TerminalGrid.hpp"
#include "TerminalSession.hpp"
#include "Utf8.hpp"

namespace tv {
/**
 * @brief Writes program output into a grid as plain text.
 *
 * Handles printable UTF-8 (including wide characters), CR, LF, BS and TAB
 * and wraps at the right margin.  Escape sequences are consumed and dropped
 * without being interpreted.
 */
class OutputFeeder {
 public:
  OutputFeeder()
      : escapeState(GROUND), wrapPending(false), linesScrolled(0) {}

  /**
   * @brief Appends raw program output to the grid.
   * @return Number of lines the screen scrolled up.
   */
  int advance(TerminalGrid *grid, const string &bytes);

  /**
   * @brief Appends output to a session grid and keeps its selection on the
   * same text.  The caller holds the state lock.
   */
  void advance(TerminalState *state, const string &bytes);

 protected:
  enum EscapeState { GROUND, ESCAPE, CSI, OSC, OSC_ESCAPE };

  Utf8Decoder decoder;
  EscapeState escapeState;
  bool wrapPending;
  int linesScrolled;

  void handle(TerminalGrid *grid, char32_t c);
  void print(TerminalGrid *grid, char32_t c);
  void lineFeed(TerminalGrid *grid);
};
}  // namespace tv

#endif  // __TV_OUTPUT_FEEDER_HPP__
