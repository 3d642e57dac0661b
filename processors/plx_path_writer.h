#ifndef PLX_PATH_WRITER_H
#define PLX_PATH_WRITER_H

#include "../utils/plx_variant.h"
#include <vector>

namespace plx::processors {

struct plx_path_segment {
  plx_string name;
  bool is_array = false;
};

/*
 * Writes values into the output tree along dotted field paths. A segment
 * ending in [] holds a sequence of records:
 *
 *   team.players[].name  = ["A", "B", "C"]   creates three records
 *   team.players[].fouls = [2, 1, 3]         fills the same three records
 *   team.players[].side  = "home"            goes to every record
 *
 * Records are matched by position only. Every op writing into one sequence
 * must produce its rows in the same order, a reordered source silently pairs
 * values of different rows.
 */
class plx_path_writer {
public:
  /**
   * @brief Writes value at field_path, creating maps and sequences on the way.
   * @return false if a list was distributed over a sequence of another length
   *         (the common prefix is written) or a scalar met an empty sequence.
   * @throws plx_path_error for malformed paths, nested [] segments and
   *         segments that run into a value of the wrong shape.
   */
  static bool write(plxv_map& tree, const plx_string& field_path, const plx_variant& value);

  // Throws plx_path_error on empty segments and brackets other than a trailing []
  static std::vector<plx_path_segment> split_path(const plx_string& field_path);

private:
  static bool write_segments(plxv_map& map, const std::vector<plx_path_segment>& segments, size_t index,
                             const plx_variant& value, const plx_string& field_path);
  static bool write_records(plxv_vector& records, const std::vector<plx_path_segment>& segments, size_t index,
                            const plx_variant& value, const plx_string& field_path);
};

} // namespace plx::processors

#endif // PLX_PATH_WRITER_H
