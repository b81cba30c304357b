#ifndef __TV_SELECTION_CONTROLLER_HPP__
#define __TV_SELECTION_CONTROLLER_HPP__

#include "CharMetrics.hpp"
#include "GridTypes.hpp"
#include "Headers.hpp"
#include "TerminalGrid.hpp"

namespace tv {
/**
 * @brief Selection editing and snapping over grid coordinates.
 *
 * Ranges are stored unsnapped.  The kind of a range decides how it snaps
 * when it is rendered (`resolve`, `lineSpans`) or copied (`extractText`).
 */
class SelectionController {
 public:
  /**
   * @brief Starts a selection at `point`, or moves the head of `current`
   * there.  The anchor and kind of an existing selection never change.
   */
  static SelectionRange beginOrExtend(const optional<SelectionRange> &current,
                                      const GridPoint &point,
                                      SelectionKind kind, Side side);

  /**
   * @brief Grid point under a pane-local pixel position.  The row is clamped
   * to the screen, the column may run past the last column (selecting to the
   * end of the line) but never below zero.
   */
  static GridPoint pointFromPixel(const PixelPoint &pixel,
                                  const CharMetrics &metrics,
                                  int displayOffset, int screenLines);

  /** @brief Which half of its cell a pixel position falls in. */
  static Side sideFromPixel(const PixelPoint &pixel,
                            const CharMetrics &metrics);

  /**
   * @brief Orders and snaps a range against the grid.
   * @return nullopt for a zero width range or one that lies entirely outside
   * the stored lines.
   */
  static optional<SelectionSpan> resolve(const TerminalGrid &grid,
                                         const SelectionRange &range);

  /** @brief Per-line column ranges covered by a snapped selection. */
  static vector<LineSpan> lineSpans(const SelectionSpan &span, int columns);

  /**
   * @brief Text under the selection.  Trailing blanks are dropped from each
   * row and soft wrapped rows are joined without a newline (except in block
   * selections).
   */
  static optional<string> extractText(const TerminalGrid &grid,
                                      const SelectionRange &range);

  /**
   * @brief Character class used for word snapping: 1 path characters, 2
   * whitespace, 3 single quote, 4 double quote, 5 anything else.
   */
  static int wordCategory(char32_t c);

 protected:
  static GridPoint wordStart(const TerminalGrid &grid, GridPoint point);
  static GridPoint wordEnd(const TerminalGrid &grid, GridPoint point);
  static GridPoint lineStart(const TerminalGrid &grid, GridPoint point);
  static GridPoint lineEnd(const TerminalGrid &grid, GridPoint point);
  static bool wrapsToNext(const TerminalGrid &grid, int line);
  static char32_t charAt(const TerminalGrid &grid, const GridPoint &point);
};
}  // namespace tv

#endif  // __TV_SELECTION_CONTROLLER_HPP__
