#include "plx_path_writer.h"
#include "plx_errors.h"
#include <algorithm>

namespace plx::processors {

std::vector<plx_path_segment> plx_path_writer::split_path(const plx_string& field_path)
{
  std::vector<plx_path_segment> segments;
  for (const plx_string& part : field_path.trim().split("."))
  {
    plx_path_segment segment;
    segment.name = part.trim();
    if (segment.name.ends_with("[]"))
    {
      segment.is_array = true;
      segment.name = segment.name.substr(0, segment.name.size() - 2).trim();
    }
    if (segment.name.empty())
    {
      throw plx_path_error("Empty path segment", field_path);
    }
    if (segment.name.contains("[") || segment.name.contains("]"))
    {
      throw plx_path_error(plx_string("Invalid segment '") + part + "'", field_path);
    }
    segments.push_back(segment);
  }
  return segments;
}

bool plx_path_writer::write(plxv_map& tree, const plx_string& field_path, const plx_variant& value)
{
  std::vector<plx_path_segment> segments = split_path(field_path);

  size_t arrays = 0;
  for (size_t i = 0; i < segments.size(); ++i)
  {
    arrays += segments[i].is_array ? 1 : 0;
  }
  if (arrays > 1)
  {
    throw plx_path_error("Nested sequences are not supported", field_path);
  }
  return write_segments(tree, segments, 0, value, field_path);
}

bool plx_path_writer::write_segments(plxv_map& map, const std::vector<plx_path_segment>& segments, size_t index,
                                     const plx_variant& value, const plx_string& field_path)
{
  const plx_path_segment& segment = segments[index];
  bool last = index + 1 == segments.size();
  plx_variant& entry = map[segment.name];

  if (!segment.is_array)
  {
    if (last)
    {
      entry = value;
      return true;
    }
    if (!entry.is_null() && !entry.is_map())
    {
      throw plx_path_error(plx_string("'") + segment.name + "' holds a " +
                           (entry.is_vector() ? "sequence" : "value") + ", not a record", field_path);
    }
    return write_segments(entry.to_map(), segments, index + 1, value, field_path);
  }

  if (!entry.is_null() && !entry.is_vector())
  {
    throw plx_path_error(plx_string("'") + segment.name + "' does not hold a sequence", field_path);
  }

  if (last)
  {
    // players[] = [...] sets the sequence itself
    if (value.is_vector())
    {
      entry = value;
    }
    else
    {
      entry = plxv_vector{value};
    }
    return true;
  }

  plxv_vector& records = entry.to_vector();
  if (value.is_vector())
  {
    while (records.size() < value.vector_value().size())
    {
      records.push_back(plx_variant(plxv_map()));
    }
  }
  return write_records(records, segments, index + 1, value, field_path);
}

bool plx_path_writer::write_records(plxv_vector& records, const std::vector<plx_path_segment>& segments,
                                    size_t index, const plx_variant& value, const plx_string& field_path)
{
  for (plx_variant& record : records)
  {
    if (record.is_null())
    {
      record = plxv_map();
    }
    if (!record.is_map())
    {
      throw plx_path_error("Sequence elements are not records", field_path);
    }
  }

  if (!value.is_vector())
  {
    for (plx_variant& record : records)
    {
      write_segments(record.to_map(), segments, index, value, field_path);
    }
    return !records.empty();
  }

  const plxv_vector& items = value.vector_value();
  size_t count = std::min(records.size(), items.size());
  for (size_t i = 0; i < count; ++i)
  {
    write_segments(records[i].to_map(), segments, index, items[i], field_path);
  }
  return records.size() == items.size();
}

} // namespace plx::processors
