#include "plx_layout_bounds.h"
#include <algorithm>

plx_layout_bounds::plx_layout_bounds() {}

plx_layout_bounds::plx_layout_bounds(plx_property<plxv_map>* parent_prop)
  : plx_model(parent_prop)
{
}

plx_layout_bounds::plx_layout_bounds(double x0_val, double y0_val, double x1_val, double y1_val, long long page_val)
{
  x0 = x0_val;
  y0 = y0_val;
  x1 = x1_val;
  y1 = y1_val;
  page = page_val;
}

double plx_layout_bounds::get_width() const {
  return x1 - x0;
}

double plx_layout_bounds::get_height() const {
  return y1 - y0;
}

double plx_layout_bounds::get_center_x() const {
  return (x0 + x1) / 2.0;
}

double plx_layout_bounds::get_center_y() const {
  return (y0 + y1) / 2.0;
}

double plx_layout_bounds::get_area() const {
  return get_width() * get_height();
}

bool plx_layout_bounds::overlaps(const plx_layout_bounds& other) const {
  if (page.value() != other.page.value()) {
    return false;
  }
  return !(x1 < other.x0 ||
           x0 > other.x1 ||
           y1 < other.y0 ||
           y0 > other.y1);
}

bool plx_layout_bounds::contains_point(double px, double py) const {
  return px >= x0 && px <= x1 &&
         py >= y0 && py <= y1;
}

bool plx_layout_bounds::contains_point(double px, double py, long long on_page) const {
  return page.value() == on_page && contains_point(px, py);
}

void plx_layout_bounds::unite(const plx_layout_bounds& other)
{
  double nx0 = std::min(x0.value(), other.x0.value());
  double ny0 = std::min(y0.value(), other.y0.value());
  double nx1 = std::max(x1.value(), other.x1.value());
  double ny1 = std::max(y1.value(), other.y1.value());
  x0 = nx0;
  y0 = ny0;
  x1 = nx1;
  y1 = ny1;
}
