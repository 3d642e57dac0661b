#ifndef PLX_REGION_RESOLVER_H
#define PLX_REGION_RESOLVER_H

#include "plx_anchor_resolver.h"

namespace plx::processors {

// Region name -> blocks sorted by (y0, x0)
typedef std::map<plx_string, plx_text_refs> plx_region_map;

class plx_region_resolver {
public:
  // Regions whose anchors are missing or on different pages are left out
  static plx_region_map resolve(const plx_layout_document& layout,
                                const plx_anchor_map& anchors,
                                const plx_model_list<plx_region>& regions,
                                plx_execution_log& log);

  // false if the region cannot be bounded
  static bool resolve_region(const plx_layout_document& layout,
                             const plx_anchor_map& anchors,
                             const plx_region& region,
                             plx_text_refs& out,
                             plx_execution_log& log);
};

} // namespace plx::processors

#endif // PLX_REGION_RESOLVER_H
