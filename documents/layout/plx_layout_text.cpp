#include "plx_layout_text.h"

plx_layout_text::plx_layout_text() {}

plx_layout_text::plx_layout_text(const plx_string& id_val, const plx_string& text_val,
                                 double x0_val, double y0_val, double x1_val, double y1_val,
                                 long long page_val, const plx_string& type_val)
{
  id = id_val;
  text = text_val;
  bbox.x0 = x0_val;
  bbox.y0 = y0_val;
  bbox.x1 = x1_val;
  bbox.y1 = y1_val;
  bbox.page = page_val;
  confidence = 100.0;
  is_bold = false;
  block_type = type_val;
}

bool plx_layout_text::is_numeric() const
{
  return text.value_or("").is_numeric();
}

bool plx_layout_text::is_likely_header() const
{
  return font_size.value_or(0.0) > 14.0 && bbox.y0.value() < 0.2;
}
