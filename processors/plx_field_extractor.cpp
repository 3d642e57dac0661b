#include "plx_field_extractor.h"
#include <algorithm>
#include <cmath>

namespace plx::processors {

namespace {

  plx_string join_texts(const plx_text_refs& blocks)
  {
    std::vector<plx_string> texts;
    for (const plx_layout_text* block : blocks)
    {
      texts.push_back(block->text.value_or(""));
    }
    return plx_string(" ").join(texts);
  }

  plx_variant transform_scalar(const plx_variant& value, const plx_string& transform)
  {
    plx_string text = value.is_string() ? value.string_value() : value.describe();

    if (transform == "to_int")
    {
      if (value.is_int())
      {
        return value;
      }
      if (value.is_double() || value.is_bool())
      {
        return plx_variant(static_cast<long long>(value.number_value()));
      }
      long long parsed = 0;
      return plx_variant(text.trim().parse_int(parsed) ? parsed : 0LL);
    }
    if (transform == "to_float")
    {
      if (value.is_number())
      {
        return plx_variant(value.number_value());
      }
      double parsed = 0;
      return plx_variant(text.trim().parse_double(parsed) ? parsed : 0.0);
    }
    if (transform == "strip")
    {
      return plx_variant(text.trim());
    }
    if (transform == "upper")
    {
      return plx_variant(text.upper());
    }
    if (transform == "lower")
    {
      return plx_variant(text.lower());
    }
    // last_name_only
    std::vector<plx_string> words = text.words();
    return plx_variant(words.empty() ? plx_string("") : words.back());
  }

} // namespace

bool plx_column::matches_label(const plx_string& label, bool case_sensitive) const
{
  plx_string wanted = label.trim();
  for (const plx_string& own : labels)
  {
    if (case_sensitive ? own == wanted : own.equals_icase(wanted))
    {
      return true;
    }
  }
  return false;
}

plx_field_extractor::plx_field_extractor(const plx_engine_config& config) : config(config)
{
}

plx_variant plx_field_extractor::extract(const plx_layout_document& layout,
                                         const plx_region_map& regions,
                                         const plx_anchor_map& anchors,
                                         const plx_processor& processor,
                                         const plx_extraction_op& op,
                                         plx_execution_log& log) const
{
  plx_string field_path = op.field_path.value_or("");
  plx_string source = op.source.value_or("");
  plx_source_ref ref = plx_source_ref::parse(source);
  plx_variant value;

  switch (ref.kind)
  {
    case plx_source_ref::literal:
      value = ref.literal_text;
      break;

    case plx_source_ref::anchor_text:
    case plx_source_ref::anchor_value:
    {
      const plx_layout_text* anchor = anchors.find(ref.name);
      if (anchor == nullptr)
      {
        log.warn(plx_string("Extraction for '") + field_path + "' skipped: anchor '" + ref.name + "' not found");
        return plx_variant();
      }
      if (ref.kind == plx_source_ref::anchor_text)
      {
        value = anchor->text.value_or("");
        break;
      }
      plx_text_refs numbers = values_right_of(layout, *anchor);
      if (ref.index < 0 || static_cast<size_t>(ref.index) >= numbers.size())
      {
        log.warn(plx_string("Extraction for '") + field_path + "': no value #" + plx_string(ref.index) +
                 " right of anchor '" + ref.name + "'");
        return plx_variant();
      }
      value = numbers[static_cast<size_t>(ref.index)]->text.value_or("").trim();
      break;
    }

    case plx_source_ref::region_text:
    case plx_source_ref::region_column:
    {
      auto region = regions.find(ref.name);
      if (region == regions.end())
      {
        log.warn(plx_string("Extraction for '") + field_path + "' skipped: region '" + ref.name + "' not resolved");
        return plx_variant();
      }
      if (ref.kind == plx_source_ref::region_text)
      {
        value = join_texts(region->second);
        break;
      }
      value = extract_column(ref.name, region->second, anchors, processor, field_path,
                             static_cast<size_t>(ref.index), log);
      break;
    }

    case plx_source_ref::invalid:
    default:
      log.warn(plx_string("Extraction for '") + field_path + "' skipped: " + ref.error);
      return plx_variant();
  }

  plx_string transform = op.transform.value_or("");
  if (!transform.empty())
  {
    value = apply_transform(value, transform, log);
  }
  return value;
}

plx_row_list plx_field_extractor::group_rows(const plx_text_refs& blocks) const
{
  plx_text_refs sorted = blocks;
  std::stable_sort(sorted.begin(), sorted.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
    return a->bbox.get_center_y() < b->bbox.get_center_y();
  });

  plx_row_list rows;
  double row_y = 0;
  for (const plx_layout_text* block : sorted)
  {
    double y = block->bbox.get_center_y();
    if (rows.empty() || std::fabs(y - row_y) > config.row_tolerance)
    {
      rows.emplace_back();
      row_y = y;
    }
    rows.back().push_back(block);
  }

  for (plx_text_refs& row : rows)
  {
    std::stable_sort(row.begin(), row.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
      return a->bbox.x0.value() < b->bbox.x0.value();
    });
  }
  return rows;
}

std::vector<plx_column> plx_field_extractor::infer_columns(const plx_text_refs& headers) const
{
  plx_text_refs sorted = headers;
  std::stable_sort(sorted.begin(), sorted.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
    return a->bbox.get_center_x() < b->bbox.get_center_x();
  });

  std::vector<plx_column> columns;
  std::vector<size_t> members;
  for (const plx_layout_text* header : sorted)
  {
    double x = header->bbox.get_center_x();
    plx_string label = header->text.value_or("").trim();
    if (!columns.empty() && std::fabs(x - columns.back().center) <= config.column_tolerance)
    {
      plx_column& merged = columns.back();
      size_t n = ++members.back();
      merged.center += (x - merged.center) / static_cast<double>(n);
      merged.labels.push_back(label);
      continue;
    }
    plx_column column;
    column.center = x;
    column.labels.push_back(label);
    columns.push_back(column);
    members.push_back(1);
  }

  for (size_t i = 0; i < columns.size(); ++i)
  {
    columns[i].start = i == 0 ? 0.0 : (columns[i - 1].center + columns[i].center) / 2.0;
    columns[i].end = i + 1 == columns.size()
                       ? std::numeric_limits<double>::infinity()
                       : (columns[i].center + columns[i + 1].center) / 2.0;
  }
  return columns;
}

size_t plx_field_extractor::select_column(const std::vector<plx_column>& columns,
                                          const plx_string& field_name,
                                          size_t fallback_index,
                                          const std::map<plx_string, plx_string>& mapping,
                                          plx_execution_log& log) const
{
  auto mapped = mapping.find(field_name);
  if (mapped == mapping.end())
  {
    return fallback_index;
  }

  for (bool case_sensitive : {true, false})
  {
    for (size_t i = 0; i < columns.size(); ++i)
    {
      if (columns[i].matches_label(mapped->second, case_sensitive))
      {
        if (i != fallback_index)
        {
          log.info(plx_string("Column for '") + field_name + "' corrected from " + plx_string(fallback_index) +
                   " to " + plx_string(i) + " ('" + mapped->second + "')");
        }
        return i;
      }
    }
  }

  log.warn(plx_string("Column header '") + mapped->second + "' for field '" + field_name +
           "' not found, using column " + plx_string(fallback_index));
  return fallback_index;
}

plx_text_refs plx_field_extractor::header_blocks(const plx_string& region_name,
                                                 long long page,
                                                 const plx_anchor_map& anchors,
                                                 const plx_processor& processor) const
{
  std::vector<plx_string> names;
  for (size_t i = 0; i < processor.regions.size(); ++i)
  {
    const plx_region& region = processor.regions.at(i);
    if (region.name.value_or("") == region_name)
    {
      names = region.header_anchor_list();
      break;
    }
  }
  if (names.empty())
  {
    for (size_t i = 0; i < processor.anchors.size(); ++i)
    {
      const plx_anchor& anchor = processor.anchors.at(i);
      if (anchor.is_column_marker())
      {
        names.push_back(anchor.name.value_or(""));
      }
    }
  }

  plx_text_refs headers;
  for (const plx_string& name : names)
  {
    const plx_layout_text* block = anchors.find(name);
    if (block != nullptr && block->bbox.page.value() == page &&
        std::find(headers.begin(), headers.end(), block) == headers.end())
    {
      headers.push_back(block);
    }
  }
  return headers;
}

plx_variant plx_field_extractor::extract_column(const plx_string& region_name,
                                                const plx_text_refs& region_blocks,
                                                const plx_anchor_map& anchors,
                                                const plx_processor& processor,
                                                const plx_string& field_path,
                                                size_t column_index,
                                                plx_execution_log& log) const
{
  bool as_list = is_array_path(field_path);
  if (region_blocks.empty())
  {
    log.warn(plx_string("Region '") + region_name + "' is empty, nothing for '" + field_path + "'");
    return as_list ? plx_variant(plxv_vector()) : plx_variant();
  }

  long long page = region_blocks.front()->bbox.page.value();
  plx_row_list rows = group_rows(region_blocks);
  plx_text_refs headers = header_blocks(region_name, page, anchors, processor);

  if (headers.empty())
  {
    headers = rows.front();
    rows.erase(rows.begin());
  }
  else
  {
    // Drop the header row itself
    rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const plx_text_refs& row) {
      double y = row.front()->bbox.get_center_y();
      for (const plx_layout_text* header : headers)
      {
        if (std::fabs(header->bbox.get_center_y() - y) <= config.row_tolerance)
        {
          return true;
        }
      }
      return false;
    }), rows.end());
  }

  // The end anchor bounds the table, its row is not data
  for (size_t i = 0; i < processor.regions.size(); ++i)
  {
    const plx_region& region = processor.regions.at(i);
    if (region.name.value_or("") != region_name || region.ends_at_document_end())
    {
      continue;
    }
    const plx_layout_text* end = anchors.find(region.end_anchor.value_or(""));
    if (end == nullptr)
    {
      break;
    }
    // Matched by row position, proximity anchors are not blocks of the region
    double end_y = end->bbox.get_center_y();
    rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const plx_text_refs& row) {
      return std::find(row.begin(), row.end(), end) != row.end() ||
             std::fabs(row.front()->bbox.get_center_y() - end_y) <= config.row_tolerance;
    }), rows.end());
    break;
  }

  std::vector<plx_column> columns = infer_columns(headers);
  plx_string field = field_name(field_path);
  size_t index = select_column(columns, field, column_index, processor.column_mapping(), log);
  if (index >= columns.size())
  {
    log.warn(plx_string("Column ") + plx_string(index) + " of region '" + region_name + "' does not exist (" +
             plx_string(columns.size()) + " columns), nothing for '" + field_path + "'");
    return plx_variant();
  }

  const plx_column& column = columns[index];
  plxv_vector values;
  for (const plx_text_refs& row : rows)
  {
    plx_text_refs cells;
    for (const plx_layout_text* block : row)
    {
      double x0 = block->bbox.x0.value();
      if (x0 >= column.start && x0 < column.end)
      {
        cells.push_back(block);
      }
    }
    values.push_back(plx_variant(join_texts(cells)));
  }

  if (as_list)
  {
    return plx_variant(values);
  }
  if (values.empty())
  {
    log.warn(plx_string("Region '") + region_name + "' has no data rows for '" + field_path + "'");
    return plx_variant();
  }
  return values.front();
}

plx_text_refs plx_field_extractor::values_right_of(const plx_layout_document& layout,
                                                   const plx_layout_text& anchor) const
{
  long long page = anchor.bbox.page.value();
  double right = anchor.bbox.x1.value();
  double row_y = anchor.bbox.get_center_y();
  plx_string anchor_id = anchor.id.value_or("");

  plx_text_refs candidates;
  for (const plx_layout_text* block : layout.blocks_by_page(page))
  {
    if (block == &anchor || block->id.value_or("") == anchor_id)
    {
      continue;
    }
    double x0 = block->bbox.x0.value();
    if (std::fabs(block->bbox.get_center_y() - row_y) > config.row_tolerance)
    {
      continue;
    }
    if (x0 < right || x0 - right > config.value_max_distance)
    {
      continue;
    }
    if (block->is_numeric())
    {
      candidates.push_back(block);
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const plx_layout_text* a, const plx_layout_text* b) {
    return a->bbox.x0.value() < b->bbox.x0.value();
  });
  return candidates;
}

plx_variant plx_field_extractor::apply_transform(const plx_variant& value, const plx_string& transform,
                                                 plx_execution_log& log)
{
  if (value.is_null())
  {
    return value;
  }
  static const char* const known[] = {"to_int", "to_float", "strip", "upper", "lower", "last_name_only"};
  bool is_known = false;
  for (const char* name : known)
  {
    is_known = is_known || transform == name;
  }
  if (!is_known)
  {
    log.warn(plx_string("Unknown transform '") + transform + "', value left unchanged");
    return value;
  }

  if (value.is_vector())
  {
    plxv_vector result;
    for (const plx_variant& item : value.vector_value())
    {
      result.push_back(item.is_null() ? item : transform_scalar(item, transform));
    }
    return plx_variant(result);
  }
  return transform_scalar(value, transform);
}

plx_string plx_field_extractor::field_name(const plx_string& field_path)
{
  std::vector<plx_string> segments = field_path.split(".");
  plx_string last = segments.empty() ? field_path : segments.back();
  return last.remove("[]").trim();
}

bool plx_field_extractor::is_array_path(const plx_string& field_path)
{
  return field_path.contains("[]");
}

} // namespace plx::processors
