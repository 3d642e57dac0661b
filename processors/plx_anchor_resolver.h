#ifndef PLX_ANCHOR_RESOLVER_H
#define PLX_ANCHOR_RESOLVER_H

#include "../documents/layout/plx_layout_document.h"
#include "plx_engine_config.h"
#include "plx_execution_log.h"
#include "plx_processor.h"
#include <map>
#include <memory>
#include <vector>

namespace plx::processors {

// Anchor name -> landmark block. Blocks point into the layout, except
// proximity matches which are owned here.
struct plx_anchor_map {
  std::map<plx_string, const plx_layout_text*> blocks;
  std::vector<std::unique_ptr<plx_layout_text>> synthetic;

  const plx_layout_text* find(const plx_string& name) const;
  bool contains(const plx_string& name) const;
  size_t size() const { return blocks.size(); }
};

class plx_anchor_resolver {
public:
  explicit plx_anchor_resolver(const plx_engine_config& config);

  // Optional anchors that are not found are logged and left out
  plx_anchor_map resolve(const plx_layout_document& layout,
                         const plx_model_list<plx_anchor>& anchors,
                         plx_execution_log& log) const;

  // Block for one anchor, nullptr if none survives
  const plx_layout_text* resolve_anchor(const plx_layout_document& layout,
                                        const plx_anchor& anchor,
                                        plx_anchor_map& owner,
                                        plx_execution_log& log) const;

  // Candidates for one pattern in document order
  plx_text_refs match_pattern(const plx_layout_document& layout,
                              const plx_string& pattern,
                              const plx_string& pattern_type,
                              plx_execution_log& log) const;

  // Chains the words of pattern into synthetic blocks, one per complete chain
  std::vector<std::unique_ptr<plx_layout_text>> match_proximity(const plx_layout_document& layout,
                                                                const plx_string& pattern) const;

  static plx_text_refs filter_by_location_hint(const plx_text_refs& candidates, const plx_string& hint);
  static bool is_known_location_hint(const plx_string& hint);

private:
  plx_engine_config config;
};

} // namespace plx::processors

#endif // PLX_ANCHOR_RESOLVER_H
