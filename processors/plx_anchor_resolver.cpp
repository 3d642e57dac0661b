#include "plx_anchor_resolver.h"
#include <algorithm>
#include <cmath>
#include <regex>
#include <set>

namespace plx::processors {

const plx_layout_text* plx_anchor_map::find(const plx_string& name) const
{
  auto it = blocks.find(name);
  return it == blocks.end() ? nullptr : it->second;
}

bool plx_anchor_map::contains(const plx_string& name) const
{
  return blocks.count(name) > 0;
}

plx_anchor_resolver::plx_anchor_resolver(const plx_engine_config& config) : config(config)
{
}

plx_anchor_map plx_anchor_resolver::resolve(const plx_layout_document& layout,
                                            const plx_model_list<plx_anchor>& anchors,
                                            plx_execution_log& log) const
{
  plx_anchor_map result;
  for (size_t i = 0; i < anchors.size(); ++i)
  {
    const plx_anchor& anchor = anchors.at(i);
    plx_string name = anchor.name.value_or("");
    const plx_layout_text* block = resolve_anchor(layout, anchor, result, log);
    if (block != nullptr)
    {
      result.blocks[name] = block;
      log.info(plx_string("Found anchor '") + name + "' at (" +
               plx_string(block->bbox.x0.value()) + ", " + plx_string(block->bbox.y0.value()) +
               ") page " + plx_string(block->bbox.page.value()));
    }
    else if (!anchor.is_required())
    {
      log.warn(plx_string("Optional anchor '") + name + "' not found");
    }
  }
  log.info(plx_string("Found ") + plx_string(static_cast<long long>(result.size())) + "/" +
           plx_string(static_cast<long long>(anchors.size())) + " anchors");
  return result;
}

const plx_layout_text* plx_anchor_resolver::resolve_anchor(const plx_layout_document& layout,
                                                           const plx_anchor& anchor,
                                                           plx_anchor_map& owner,
                                                           plx_execution_log& log) const
{
  plx_string type = anchor.type_or_default();
  plx_string hint = anchor.hint_or_default();

  for (const plx_string& pattern : anchor.pattern_list())
  {
    plx_text_refs candidates = match_pattern(layout, pattern, type, log);

    std::vector<std::unique_ptr<plx_layout_text>> chained;
    if (candidates.empty() && type != "regex" && pattern.trim().contains(" "))
    {
      chained = match_proximity(layout, pattern);
      for (const auto& block : chained)
      {
        candidates.push_back(block.get());
      }
    }

    if (candidates.empty())
    {
      continue;
    }

    if (!hint.empty())
    {
      candidates = filter_by_location_hint(candidates, hint);
    }
    if (candidates.empty())
    {
      continue;
    }

    const plx_layout_text* winner = candidates.front();
    // Keep the synthetic block alive if it won
    for (auto& block : chained)
    {
      if (block.get() == winner)
      {
        owner.synthetic.push_back(std::move(block));
        break;
      }
    }
    return winner;
  }
  return nullptr;
}

plx_text_refs plx_anchor_resolver::match_pattern(const plx_layout_document& layout,
                                                 const plx_string& pattern,
                                                 const plx_string& pattern_type,
                                                 plx_execution_log& log) const
{
  if (pattern_type == "exact")
  {
    return layout.find_text_exact(pattern, false);
  }
  if (pattern_type == "regex")
  {
    plx_text_refs result;
    try
    {
      std::regex re(pattern.to_std_const(), std::regex::ECMAScript | std::regex::icase);
      for (const plx_layout_text* block : layout.all_blocks())
      {
        if (std::regex_search(block->text.value_or("").to_std_const(), re))
        {
          result.push_back(block);
        }
      }
    }
    catch (const std::regex_error& e)
    {
      log.warn(plx_string("Invalid regex '") + pattern + "': " + e.what());
      result.clear();
    }
    return result;
  }
  return layout.find_text(pattern, false);
}

std::vector<std::unique_ptr<plx_layout_text>> plx_anchor_resolver::match_proximity(const plx_layout_document& layout,
                                                                                   const plx_string& pattern) const
{
  std::vector<std::unique_ptr<plx_layout_text>> matches;
  std::vector<plx_string> words = pattern.lower().words();
  if (words.size() < 2)
  {
    return matches;
  }

  // Blocks containing each word
  std::vector<plx_text_refs> word_blocks;
  for (const plx_string& word : words)
  {
    plx_text_refs found = layout.find_text(word, false);
    if (found.empty())
    {
      return matches;
    }
    word_blocks.push_back(found);
  }

  for (const plx_layout_text* first : word_blocks[0])
  {
    plx_text_refs chain = {first};
    std::set<const plx_layout_text*> used = {first};
    long long chain_page = first->bbox.page.value();

    for (size_t w = 1; w < words.size(); ++w)
    {
      const plx_layout_text* previous = chain.back();
      const plx_layout_text* closest = nullptr;
      double min_dist = config.proximity_threshold;

      for (const plx_layout_text* candidate : word_blocks[w])
      {
        if (used.count(candidate) > 0 || candidate->bbox.page.value() != chain_page)
        {
          continue;
        }
        // Gap from the end of the previous word to the start of this one
        double dx = candidate->bbox.x0.value() - previous->bbox.x1.value();
        double dy = std::fabs(candidate->bbox.y0.value() - previous->bbox.y0.value());
        double dist = std::sqrt(dx * dx + dy * dy);
        if (dist < min_dist)
        {
          min_dist = dist;
          closest = candidate;
        }
      }

      if (closest == nullptr)
      {
        break;
      }
      chain.push_back(closest);
      used.insert(closest);
    }

    if (chain.size() != words.size())
    {
      continue;
    }

    std::vector<plx_string> texts;
    double confidence = first->confidence.value_or(100.0);
    for (const plx_layout_text* block : chain)
    {
      texts.push_back(block->text.value_or(""));
      confidence = std::min(confidence, block->confidence.value_or(100.0));
    }

    auto synthetic = std::make_unique<plx_layout_text>(
      plx_string("proximity_") + first->id.value_or(""),
      plx_string(" ").join(texts),
      first->bbox.x0.value(), first->bbox.y0.value(),
      first->bbox.x1.value(), first->bbox.y1.value(),
      chain_page,
      first->block_type.value_or("text"));
    for (const plx_layout_text* block : chain)
    {
      synthetic->bbox.unite(block->bbox);
    }
    synthetic->confidence = confidence;
    synthetic->is_bold = first->is_bold.value_or(false);
    if (!first->font_size.is_null())
    {
      synthetic->font_size = first->font_size.value();
    }
    matches.push_back(std::move(synthetic));
  }
  return matches;
}

bool plx_anchor_resolver::is_known_location_hint(const plx_string& hint)
{
  static const char* const known[] = {
    "first_occurrence", "second_occurrence", "last_occurrence",
    "top_third", "top_half", "bottom_half", "left_half", "right_half"
  };
  for (const char* name : known)
  {
    if (hint == name)
    {
      return true;
    }
  }
  return false;
}

plx_text_refs plx_anchor_resolver::filter_by_location_hint(const plx_text_refs& candidates, const plx_string& hint)
{
  if (candidates.empty())
  {
    return candidates;
  }

  if (hint == "first_occurrence" || hint == "second_occurrence" || hint == "last_occurrence")
  {
    plx_text_refs sorted = candidates;
    std::stable_sort(sorted.begin(), sorted.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
      long long pa = a->bbox.page.value();
      long long pb = b->bbox.page.value();
      if (pa != pb) return pa < pb;
      double ya = a->bbox.y0.value();
      double yb = b->bbox.y0.value();
      if (ya != yb) return ya < yb;
      return a->bbox.x0.value() < b->bbox.x0.value();
    });
    if (hint == "first_occurrence")
    {
      return {sorted.front()};
    }
    if (hint == "second_occurrence")
    {
      return sorted.size() > 1 ? plx_text_refs{sorted[1]} : plx_text_refs();
    }
    return {sorted.back()};
  }

  plx_text_refs result;
  for (const plx_layout_text* block : candidates)
  {
    double x0 = block->bbox.x0.value();
    double y0 = block->bbox.y0.value();
    bool keep = true;
    if (hint == "top_third") keep = y0 < 0.33;
    else if (hint == "top_half") keep = y0 < 0.5;
    else if (hint == "bottom_half") keep = y0 >= 0.5;
    else if (hint == "left_half") keep = x0 < 0.5;
    else if (hint == "right_half") keep = x0 >= 0.5;
    if (keep)
    {
      result.push_back(block);
    }
  }
  return result;
}

} // namespace plx::processors
