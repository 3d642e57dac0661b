#include "plx_region_resolver.h"
#include <algorithm>

namespace plx::processors {

plx_region_map plx_region_resolver::resolve(const plx_layout_document& layout,
                                            const plx_anchor_map& anchors,
                                            const plx_model_list<plx_region>& regions,
                                            plx_execution_log& log)
{
  plx_region_map result;
  for (size_t i = 0; i < regions.size(); ++i)
  {
    const plx_region& region = regions.at(i);
    plx_text_refs blocks;
    if (resolve_region(layout, anchors, region, blocks, log))
    {
      plx_string name = region.name.value_or("");
      log.info(plx_string("Region '") + name + "': " + plx_string(blocks.size()) + " blocks");
      result[name] = blocks;
    }
  }
  return result;
}

bool plx_region_resolver::resolve_region(const plx_layout_document& layout,
                                         const plx_anchor_map& anchors,
                                         const plx_region& region,
                                         plx_text_refs& out,
                                         plx_execution_log& log)
{
  plx_string name = region.name.value_or("");
  plx_string start_name = region.start_anchor.value_or("");
  plx_string end_name = region.end_anchor.value_or("");

  const plx_layout_text* start = anchors.find(start_name);
  if (start == nullptr)
  {
    log.warn(plx_string("Region '") + name + "' skipped: start anchor '" + start_name + "' not found");
    return false;
  }

  long long page = start->bbox.page.value();
  double top = start->bbox.y1.value();
  double bottom = 0;
  bool to_page_end = region.ends_at_document_end();

  if (!to_page_end)
  {
    const plx_layout_text* end = anchors.find(end_name);
    if (end == nullptr)
    {
      log.warn(plx_string("Region '") + name + "' skipped: end anchor '" + end_name + "' not found");
      return false;
    }
    if (end->bbox.page.value() != page)
    {
      log.warn(plx_string("Region '") + name + "' skipped: anchors '" + start_name + "' and '" +
               end_name + "' are on different pages");
      return false;
    }
    bottom = end->bbox.y0.value();
  }

  out.clear();
  for (const plx_layout_text* block : layout.blocks_by_page(page))
  {
    double y0 = block->bbox.y0.value();
    if (y0 < top)
    {
      continue;
    }
    if (!to_page_end && y0 > bottom)
    {
      continue;
    }
    out.push_back(block);
  }

  std::stable_sort(out.begin(), out.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
    double ya = a->bbox.y0.value();
    double yb = b->bbox.y0.value();
    if (ya != yb) return ya < yb;
    return a->bbox.x0.value() < b->bbox.x0.value();
  });
  return true;
}

} // namespace plx::processors
