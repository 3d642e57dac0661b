#ifndef PLX_LAYOUT_DOCUMENT_H
#define PLX_LAYOUT_DOCUMENT_H

#include "plx_layout_text.h"
#include <vector>

typedef std::vector<const plx_layout_text*> plx_text_refs;

// Layout IR of a whole document: flat block list plus page metadata.
// Query results point into the block list and stay valid until it changes.
class plx_layout_document : public plx_model
{
public:
  plxp_string(filename);
  plxp_int(page_count);
  plxp_string(layout_hash);
  // [[width, height], ...] per page
  plxp_vector(page_dimensions);
  plxp_int(dpi);
  plxp_string(extraction_method);
  plxp_model_list(blocks, plx_layout_text);

  plx_layout_document();

  plx_text_refs all_blocks() const;
  plx_text_refs blocks_by_page(long long page) const;
  plx_text_refs blocks_by_type(const plx_string& type) const;
  // Blocks overlapping the given box
  plx_text_refs blocks_in_region(const plx_layout_bounds& region) const;
  // Substring search
  plx_text_refs find_text(const plx_string& pattern, bool case_sensitive = false) const;
  plx_text_refs find_text_exact(const plx_string& pattern, bool case_sensitive = true) const;

  // Center distance, same page, reference excluded
  plx_text_refs blocks_near(const plx_layout_text& reference, double max_distance = 0.1) const;
  // Sorted by y0
  plx_text_refs blocks_in_column(const plx_layout_text& reference, double tolerance = 0.02) const;
  // Sorted by x0
  plx_text_refs blocks_in_row(const plx_layout_text& reference, double tolerance = 0.02) const;
};

// Structural fingerprint: hex SHA-256 over position, size and type of the
// first prefix_blocks blocks. Text does not contribute.
plx_string compute_layout_hash(const plx_layout_document& layout, size_t prefix_blocks = 50);

#endif // PLX_LAYOUT_DOCUMENT_H
