#ifndef PLX_FIELD_EXTRACTOR_H
#define PLX_FIELD_EXTRACTOR_H

#include "plx_region_resolver.h"
#include "plx_source_ref.h"
#include <limits>

namespace plx::processors {

// One inferred table column; x0 in [start, end) selects it
struct plx_column {
  std::vector<plx_string> labels;
  double center = 0;
  double start = 0;
  double end = std::numeric_limits<double>::infinity();

  bool matches_label(const plx_string& label, bool case_sensitive) const;
};

typedef std::vector<plx_text_refs> plx_row_list;

class plx_field_extractor {
public:
  explicit plx_field_extractor(const plx_engine_config& config);

  /**
   * @brief Value of one extraction op.
   * @return A string, a list of strings for array paths, or null when the
   *         source cannot be read (the reason is logged).
   */
  plx_variant extract(const plx_layout_document& layout,
                      const plx_region_map& regions,
                      const plx_anchor_map& anchors,
                      const plx_processor& processor,
                      const plx_extraction_op& op,
                      plx_execution_log& log) const;

  // Rows by center y, each sorted by x0
  plx_row_list group_rows(const plx_text_refs& blocks) const;

  // Columns from header blocks; markers closer than column_tolerance merge
  std::vector<plx_column> infer_columns(const plx_text_refs& headers) const;

  // Column index for field_name, fallback_index unless the mapping names a header
  size_t select_column(const std::vector<plx_column>& columns,
                       const plx_string& field_name,
                       size_t fallback_index,
                       const std::map<plx_string, plx_string>& mapping,
                       plx_execution_log& log) const;

  // Numeric-looking blocks right of the anchor on its row, left to right
  plx_text_refs values_right_of(const plx_layout_document& layout, const plx_layout_text& anchor) const;

  static plx_variant apply_transform(const plx_variant& value, const plx_string& transform, plx_execution_log& log);

  // Last path segment without its [] marker
  static plx_string field_name(const plx_string& field_path);
  static bool is_array_path(const plx_string& field_path);

private:
  plx_variant extract_column(const plx_string& region_name,
                             const plx_text_refs& region_blocks,
                             const plx_anchor_map& anchors,
                             const plx_processor& processor,
                             const plx_string& field_path,
                             size_t column_index,
                             plx_execution_log& log) const;

  plx_text_refs header_blocks(const plx_string& region_name,
                              long long page,
                              const plx_anchor_map& anchors,
                              const plx_processor& processor) const;

  plx_engine_config config;
};

} // namespace plx::processors

#endif // PLX_FIELD_EXTRACTOR_H
