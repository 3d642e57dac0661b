#include "plx_layout_document.h"
#include <mbedtls/sha256.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

plx_layout_document::plx_layout_document() {}

plx_text_refs plx_layout_document::all_blocks() const
{
  plx_text_refs result;
  size_t count = blocks.size();
  result.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    result.push_back(&blocks.at(i));
  }
  return result;
}

plx_text_refs plx_layout_document::blocks_by_page(long long page) const
{
  plx_text_refs result;
  for (const plx_layout_text* block : all_blocks())
  {
    if (block->bbox.page.value() == page)
    {
      result.push_back(block);
    }
  }
  return result;
}

plx_text_refs plx_layout_document::blocks_by_type(const plx_string& type) const
{
  plx_text_refs result;
  for (const plx_layout_text* block : all_blocks())
  {
    if (block->block_type.value_or("text") == type)
    {
      result.push_back(block);
    }
  }
  return result;
}

plx_text_refs plx_layout_document::blocks_in_region(const plx_layout_bounds& region) const
{
  plx_text_refs result;
  for (const plx_layout_text* block : all_blocks())
  {
    if (block->bbox.overlaps(region))
    {
      result.push_back(block);
    }
  }
  return result;
}

plx_text_refs plx_layout_document::find_text(const plx_string& pattern, bool case_sensitive) const
{
  plx_text_refs result;
  plx_string needle = case_sensitive ? pattern : pattern.lower();
  for (const plx_layout_text* block : all_blocks())
  {
    plx_string hay = block->text.value_or("");
    if (!case_sensitive)
    {
      hay = hay.lower();
    }
    if (hay.contains(needle))
    {
      result.push_back(block);
    }
  }
  return result;
}

plx_text_refs plx_layout_document::find_text_exact(const plx_string& pattern, bool case_sensitive) const
{
  plx_text_refs result;
  plx_string needle = pattern.trim();
  for (const plx_layout_text* block : all_blocks())
  {
    plx_string hay = block->text.value_or("").trim();
    bool match = case_sensitive ? hay == needle : hay.equals_icase(needle);
    if (match)
    {
      result.push_back(block);
    }
  }
  return result;
}

plx_text_refs plx_layout_document::blocks_near(const plx_layout_text& reference, double max_distance) const
{
  plx_text_refs result;
  plx_string ref_id = reference.id.value_or("");
  long long ref_page = reference.bbox.page;
  double ref_center_x = reference.bbox.get_center_x();
  double ref_center_y = reference.bbox.get_center_y();

  for (const plx_layout_text* block : all_blocks())
  {
    if (block->id.value_or("") == ref_id || block->bbox.page.value() != ref_page)
    {
      continue;
    }
    double dx = block->bbox.get_center_x() - ref_center_x;
    double dy = block->bbox.get_center_y() - ref_center_y;
    if (std::sqrt(dx * dx + dy * dy) <= max_distance)
    {
      result.push_back(block);
    }
  }
  return result;
}

plx_text_refs plx_layout_document::blocks_in_column(const plx_layout_text& reference, double tolerance) const
{
  plx_text_refs result;
  plx_string ref_id = reference.id.value_or("");
  long long ref_page = reference.bbox.page;
  double ref_x = reference.bbox.get_center_x();

  for (const plx_layout_text* block : all_blocks())
  {
    if (block->id.value_or("") == ref_id || block->bbox.page.value() != ref_page)
    {
      continue;
    }
    if (std::fabs(block->bbox.get_center_x() - ref_x) <= tolerance)
    {
      result.push_back(block);
    }
  }
  std::stable_sort(result.begin(), result.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
    return a->bbox.y0.value() < b->bbox.y0.value();
  });
  return result;
}

plx_text_refs plx_layout_document::blocks_in_row(const plx_layout_text& reference, double tolerance) const
{
  plx_text_refs result;
  plx_string ref_id = reference.id.value_or("");
  long long ref_page = reference.bbox.page;
  double ref_y = reference.bbox.get_center_y();

  for (const plx_layout_text* block : all_blocks())
  {
    if (block->id.value_or("") == ref_id || block->bbox.page.value() != ref_page)
    {
      continue;
    }
    if (std::fabs(block->bbox.get_center_y() - ref_y) <= tolerance)
    {
      result.push_back(block);
    }
  }
  std::stable_sort(result.begin(), result.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
    return a->bbox.x0.value() < b->bbox.x0.value();
  });
  return result;
}

namespace
{
  plx_string format_2f(double value)
  {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return plx_string(buffer);
  }
}

plx_string compute_layout_hash(const plx_layout_document& layout, size_t prefix_blocks)
{
  std::vector<plx_string> structure;
  size_t count = std::min(layout.blocks.size(), prefix_blocks);
  for (size_t i = 0; i < count; ++i)
  {
    const plx_layout_text& block = layout.blocks.at(i);
    structure.push_back(format_2f(block.bbox.x0) + "," +
                        format_2f(block.bbox.y0) + "," +
                        format_2f(block.bbox.get_width()) + "," +
                        format_2f(block.bbox.get_height()) + "," +
                        block.block_type.value_or("text"));
  }
  plx_string structure_str = plx_string("|").join(structure);

  unsigned char digest[32];
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  mbedtls_sha256_starts(&ctx, 0);  // 0 = SHA-256
  mbedtls_sha256_update(&ctx, (const unsigned char*)structure_str.c_str(), structure_str.size());
  mbedtls_sha256_finish(&ctx, digest);
  mbedtls_sha256_free(&ctx);

  static const char hex[] = "0123456789abcdef";
  plx_string result;
  for (unsigned char byte : digest)
  {
    result += hex[byte >> 4];
    result += hex[byte & 0x0f];
  }
  return result;
}
