#include "plx_processor.h"

namespace plx::processors {

namespace {

  std::vector<plx_string> string_list(const plx_property<plxv_vector>& prop)
  {
    std::vector<plx_string> result;
    if (prop.is_null())
    {
      return result;
    }
    for (const auto& item : prop.value())
    {
      if (item.is_string())
      {
        result.push_back(item.string_value());
      }
      else if (!item.is_null())
      {
        result.push_back(item.describe());
      }
    }
    return result;
  }

} // namespace

plx_anchor::plx_anchor() {}

std::vector<plx_string> plx_anchor::pattern_list() const
{
  return string_list(patterns);
}

void plx_anchor::add_pattern(const plx_string& pattern)
{
  patterns.value().push_back(plx_variant(pattern));
}

plx_string plx_anchor::type_or_default() const
{
  return pattern_type.value_or("contains");
}

plx_string plx_anchor::hint_or_default() const
{
  return location_hint.value_or("");
}

bool plx_anchor::is_required() const
{
  return required.value_or(true);
}

plx_string plx_anchor::role_or_default() const
{
  return role.value_or("landmark");
}

bool plx_anchor::is_column_marker() const
{
  plx_string r = role_or_default();
  return r == "column" || r == "name_column";
}

plx_region::plx_region() {}

std::vector<plx_string> plx_region::header_anchor_list() const
{
  return string_list(header_anchors);
}

bool plx_region::ends_at_document_end() const
{
  return end_anchor.value_or("") == end_of_document;
}

plx_extraction_op::plx_extraction_op() {}

plx_calculation::plx_calculation() {}

plx_validation_rule::plx_validation_rule() {}

bool plx_validation_rule::is_error() const
{
  return severity.value_or("error") == "error";
}

plx_processor::plx_processor() {}

const plx_anchor* plx_processor::find_anchor(const plx_string& anchor_name) const
{
  for (size_t i = 0; i < anchors.size(); ++i)
  {
    const plx_anchor& anchor = anchors.at(i);
    if (anchor.name.value_or("") == anchor_name)
    {
      return &anchor;
    }
  }
  return nullptr;
}

std::map<plx_string, plx_string> plx_processor::column_mapping() const
{
  std::map<plx_string, plx_string> result;
  if (field_column_mapping.is_null())
  {
    return result;
  }
  for (const auto& pair : field_column_mapping.value())
  {
    if (pair.second.is_string())
    {
      result[pair.first] = pair.second.string_value();
    }
  }
  return result;
}

plx_string plx_processor::display_name() const
{
  return name.value_or(id.value_or("unnamed"));
}

plx_anchor& plx_processor::add_anchor(const plx_string& anchor_name, const plx_string& pattern,
                                      const plx_string& type, bool is_required)
{
  anchors.add_element();
  plx_anchor& anchor = anchors.back();
  anchor.name = anchor_name;
  anchor.add_pattern(pattern);
  anchor.pattern_type = type;
  anchor.required = is_required;
  return anchor;
}

plx_region& plx_processor::add_region(const plx_string& region_name, const plx_string& start, const plx_string& end)
{
  regions.add_element();
  plx_region& region = regions.back();
  region.name = region_name;
  region.start_anchor = start;
  region.end_anchor = end;
  region.region_type = "table";
  return region;
}

plx_extraction_op& plx_processor::add_extraction_op(const plx_string& path, const plx_string& source_ref,
                                                    const plx_string& transform_name)
{
  extraction_ops.add_element();
  plx_extraction_op& op = extraction_ops.back();
  op.field_path = path;
  op.source = source_ref;
  if (!transform_name.empty())
  {
    op.transform = transform_name;
  }
  return op;
}

plx_calculation& plx_processor::add_calculation(const plx_string& target, const plx_string& formula_text)
{
  calculations.add_element();
  plx_calculation& calc = calculations.back();
  calc.field = target;
  calc.formula = formula_text;
  return calc;
}

plx_validation_rule& plx_processor::add_validation(const plx_string& rule_name, const plx_string& check_text,
                                                   const plx_string& severity_name)
{
  validations.add_element();
  plx_validation_rule& rule = validations.back();
  rule.name = rule_name;
  rule.check = check_text;
  rule.severity = severity_name;
  return rule;
}

} // namespace plx::processors
