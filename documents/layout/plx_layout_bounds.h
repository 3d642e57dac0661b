#ifndef PLX_LAYOUT_BOUNDS_H
#define PLX_LAYOUT_BOUNDS_H

#include "../../utils/plx_model.h"

// Page-normalized box, coordinates in [0,1], origin top left
class plx_layout_bounds : public plx_model
{
public:
  plxp_double(x0);
  plxp_double(y0);
  plxp_double(x1);
  plxp_double(y1);
  plxp_int(page);

  plx_layout_bounds();
  explicit plx_layout_bounds(plx_property<plxv_map>* parent_prop);
  plx_layout_bounds(double x0_val, double y0_val, double x1_val, double y1_val, long long page_val = 0);

  double get_width() const;
  double get_height() const;
  double get_center_x() const;
  double get_center_y() const;
  double get_area() const;

  // Page-scoped, touching edges count
  bool overlaps(const plx_layout_bounds& other) const;
  // Inclusive edges
  bool contains_point(double px, double py) const;
  bool contains_point(double px, double py, long long on_page) const;

  // Grow to the union with other; page is kept
  void unite(const plx_layout_bounds& other);
};

#endif // PLX_LAYOUT_BOUNDS_H
