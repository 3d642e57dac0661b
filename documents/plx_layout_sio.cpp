#include "plx_layout_sio.h"
#include "../api/json/plx_json.h"
#include <fstream>
#include <iostream>
#include <iterator>

bool plx_layout_sio::read(const plx_string& locator, plx_layout_document& layout)
{
  std::fstream f;
  f.open(locator.c_str(), std::ios::in | std::ios::binary);
  if (!f.is_open())
  {
    std::cerr << "Error: Cannot open layout file " << locator << std::endl;
    return false;
  }
  std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  f.close();

  return parse(plx_string(data), layout);
}

bool plx_layout_sio::write(const plx_string& locator, const plx_layout_document& layout)
{
  plx_string data;
  if (!serialize(layout, data))
  {
    return false;
  }
  std::fstream f;
  f.open(locator.c_str(), std::ios::out | std::ios::binary);
  if (!f.is_open())
  {
    std::cerr << "Error: Cannot write layout file " << locator << std::endl;
    return false;
  }
  f.write(data.c_str(), static_cast<std::streamsize>(data.size()));
  f.close();
  return true;
}

plx_layout_json_sio::plx_layout_json_sio(size_t fingerprint_blocks)
  : fingerprint_blocks(fingerprint_blocks)
{
}

bool plx_layout_json_sio::parse(const plx_string& data, plx_layout_document& layout)
{
  plxv_map root;
  plx_json json(&root);
  if (!json.parse(data))
  {
    return false;
  }

  auto blocks_it = root.find("blocks");
  if (blocks_it == root.end() || !blocks_it->second.is_vector())
  {
    std::cerr << "Error: Layout has no block list" << std::endl;
    return false;
  }

  plxv_vector& blocks = blocks_it->second.to_vector();
  for (size_t i = 0; i < blocks.size(); ++i)
  {
    if (!blocks[i].is_map())
    {
      std::cerr << "Error: Layout block " << i << " is not an object" << std::endl;
      return false;
    }
    plxv_map& block = blocks[i].to_map();
    auto bbox_it = block.find("bbox");
    if (bbox_it == block.end() || !bbox_it->second.is_map())
    {
      std::cerr << "Error: Layout block " << i << " has no bbox" << std::endl;
      return false;
    }
    plxv_map& bbox = bbox_it->second.to_map();
    for (const char* key : {"x0", "y0", "x1", "y1"})
    {
      auto coord = bbox.find(key);
      if (coord == bbox.end() || !coord->second.is_number())
      {
        std::cerr << "Error: Layout block " << i << " has no numeric bbox." << key << std::endl;
        return false;
      }
    }
    // Single page documents may leave the page out
    if (bbox.find("page") == bbox.end() || bbox["page"].is_null())
    {
      bbox["page"] = 0LL;
    }
  }

  layout.load(root);

  if (layout.layout_hash.is_null() || layout.layout_hash.value().empty())
  {
    layout.layout_hash = compute_layout_hash(layout, fingerprint_blocks);
  }
  return true;
}

bool plx_layout_json_sio::serialize(const plx_layout_document& layout, plx_string& data)
{
  plxv_map root = layout.snapshot();
  plx_json json(&root);
  data = json.create(2);
  return !data.empty();
}
