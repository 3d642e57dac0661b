#ifndef PLX_LAYOUT_TEXT_H
#define PLX_LAYOUT_TEXT_H

#include "plx_layout_bounds.h"

// One positioned text block of the layout IR
class plx_layout_text : public plx_model
{
public:
  plxp_string(id);
  plxp_string(text);
  plxp_model(bbox, plx_layout_bounds);
  plxp_double(confidence);
  plxp_double(font_size);
  plxp_bool(is_bold);
  // text, header or number
  plxp_string(block_type);

  plx_layout_text();
  plx_layout_text(const plx_string& id_val, const plx_string& text_val,
                  double x0_val, double y0_val, double x1_val, double y1_val,
                  long long page_val = 0, const plx_string& type_val = "text");

  bool is_numeric() const;
  bool is_likely_header() const;
};

#endif // PLX_LAYOUT_TEXT_H
