#ifndef PLX_PROCESSOR_H
#define PLX_PROCESSOR_H

#include "../utils/plx_model.h"
#include <vector>

namespace plx::processors {

// Region end marker that extends a region to the bottom of its page
static const char* const end_of_document = "end_of_document";

// Named landmark found by text pattern
class plx_anchor : public plx_model
{
public:
  plxp_string(name);
  plxp_vector(patterns);
  // exact, contains or regex
  plxp_string(pattern_type);
  // first_occurrence, second_occurrence, last_occurrence,
  // top_third, top_half, bottom_half, left_half, right_half
  plxp_string(location_hint);
  plxp_bool(required);
  // landmark, column or name_column
  plxp_string(role);

  plx_anchor();

  std::vector<plx_string> pattern_list() const;
  void add_pattern(const plx_string& pattern);

  plx_string type_or_default() const;
  plx_string hint_or_default() const;
  bool is_required() const;
  plx_string role_or_default() const;
  bool is_column_marker() const;
};

// Block range between two anchors of one page
class plx_region : public plx_model
{
public:
  plxp_string(name);
  plxp_string(start_anchor);
  plxp_string(end_anchor);
  // table, list, key_value or text
  plxp_string(region_type);
  // Optional explicit column headers for this region
  plxp_vector(header_anchors);

  plx_region();

  std::vector<plx_string> header_anchor_list() const;
  bool ends_at_document_end() const;
};

class plx_extraction_op : public plx_model
{
public:
  plxp_string(field_path);
  plxp_string(source);
  plxp_string(transform);

  plx_extraction_op();
};

class plx_calculation : public plx_model
{
public:
  plxp_string(field);
  plxp_string(formula);
  plxp_string(description);

  plx_calculation();
};

class plx_validation_rule : public plx_model
{
public:
  plxp_string(name);
  plxp_string(check);
  // error or warning
  plxp_string(severity);

  plx_validation_rule();

  bool is_error() const;
};

// Declarative extraction rules for one layout family
class plx_processor : public plx_model
{
public:
  // Identity
  plxp_string(id);
  plxp_string(name);
  plxp_string(document_type);

  // Routing
  plxp_string(layout_hash);
  plxp_vector(text_patterns);

  // Extraction rules
  plxp_model_list(anchors, plx_anchor);
  plxp_model_list(regions, plx_region);
  plxp_model_list(extraction_ops, plx_extraction_op);
  plxp_model_list(calculations, plx_calculation);
  plxp_model_list(validations, plx_validation_rule);
  // semantic field name -> exact column header text
  plxp_map(field_column_mapping);

  // Rendering, carried through unchanged
  plxp_string(template_id);
  plxp_string(template_text, {{"fieldname", "template"}});

  // Metadata
  plxp_string(created_at);
  plxp_string(updated_at);
  plxp_int(version);

  plx_processor();

  const plx_anchor* find_anchor(const plx_string& anchor_name) const;
  std::map<plx_string, plx_string> column_mapping() const;
  plx_string display_name() const;

  plx_anchor& add_anchor(const plx_string& anchor_name, const plx_string& pattern,
                         const plx_string& type = "contains", bool is_required = true);
  plx_region& add_region(const plx_string& region_name, const plx_string& start, const plx_string& end);
  plx_extraction_op& add_extraction_op(const plx_string& path, const plx_string& source_ref,
                                       const plx_string& transform_name = "");
  plx_calculation& add_calculation(const plx_string& target, const plx_string& formula_text);
  plx_validation_rule& add_validation(const plx_string& rule_name, const plx_string& check_text,
                                      const plx_string& severity_name = "error");
};

} // namespace plx::processors

#endif // PLX_PROCESSOR_H
