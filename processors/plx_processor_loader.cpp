#include "plx_processor_loader.h"
#include "../api/json/plx_json.h"
#include "expr/plx_expr_parser.h"
#include "plx_anchor_resolver.h"
#include "plx_errors.h"
#include "plx_source_ref.h"
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace plx::processors {

void plx_processor_loader::load_json(const plx_string& json_text, plx_processor& processor)
{
  plxv_map root;
  plx_json json(&root);
  if (!json.parse(json_text))
  {
    throw plx_processor_error("Processor definition is not a valid JSON object");
  }
  processor.load(root);

  for (const plx_string& finding : check(processor))
  {
    std::cerr << "Warning: " << processor.display_name().c_str() << ": " << finding.c_str() << std::endl;
  }
}

void plx_processor_loader::load_file(const plx_string& path, plx_processor& processor)
{
  std::ifstream file(path.c_str());
  if (!file.is_open())
  {
    throw plx_processor_error(plx_string("Cannot open processor file: ") + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  load_json(buffer.str(), processor);
}

plx_string plx_processor_loader::to_json(const plx_processor& processor, int indent)
{
  return plx_json::dump(plx_variant(processor.snapshot()), indent);
}

std::vector<plx_string> plx_processor_loader::check(const plx_processor& processor)
{
  std::vector<plx_string> problems;
  std::vector<plx_string> findings;

  std::set<plx_string> declared;
  for (size_t i = 0; i < processor.anchors.size(); ++i)
  {
    const plx_anchor& anchor = processor.anchors.at(i);
    plx_string name = anchor.name.value_or("");
    if (name.empty())
    {
      findings.push_back(plx_string("Anchor #") + plx_string(i) + " has no name");
      continue;
    }
    if (!declared.insert(name).second)
    {
      findings.push_back(plx_string("Anchor '") + name + "' is declared twice, the first one wins");
    }

    plx_string type = anchor.type_or_default();
    if (type != "exact" && type != "contains" && type != "regex")
    {
      findings.push_back(plx_string("Anchor '") + name + "' has unknown pattern_type '" + type + "'");
    }
    plx_string hint = anchor.hint_or_default();
    if (!hint.empty() && !plx_anchor_resolver::is_known_location_hint(hint))
    {
      findings.push_back(plx_string("Anchor '") + name + "' has unknown location_hint '" + hint + "'");
    }
    if (anchor.pattern_list().empty())
    {
      findings.push_back(plx_string("Anchor '") + name + "' has no patterns");
    }
  }

  for (size_t i = 0; i < processor.regions.size(); ++i)
  {
    const plx_region& region = processor.regions.at(i);
    plx_string name = region.name.value_or("");
    plx_string start = region.start_anchor.value_or("");
    plx_string end = region.end_anchor.value_or("");

    if (declared.count(start) == 0)
    {
      problems.push_back(plx_string("Region '") + name + "' references undeclared start_anchor '" + start + "'");
    }
    if (end != end_of_document && declared.count(end) == 0)
    {
      problems.push_back(plx_string("Region '") + name + "' references undeclared end_anchor '" + end + "'");
    }
    for (const plx_string& header : region.header_anchor_list())
    {
      if (declared.count(header) == 0)
      {
        problems.push_back(plx_string("Region '") + name + "' references undeclared header anchor '" + header + "'");
      }
    }
  }

  if (!problems.empty())
  {
    throw plx_processor_error(processor.display_name(), problems);
  }

  for (size_t i = 0; i < processor.extraction_ops.size(); ++i)
  {
    const plx_extraction_op& op = processor.extraction_ops.at(i);
    plx_source_ref ref = plx_source_ref::parse(op.source.value_or(""));
    if (!ref.is_valid())
    {
      findings.push_back(plx_string("Extraction for '") + op.field_path.value_or("") + "': " + ref.error);
    }
  }

  for (size_t i = 0; i < processor.calculations.size(); ++i)
  {
    const plx_calculation& calc = processor.calculations.at(i);
    try
    {
      expr::plx_expr_parser::parse_formula(calc.formula.value_or(""));
    }
    catch (const plx_expression_error& e)
    {
      findings.push_back(plx_string("Calculation for '") + calc.field.value_or("") + "': " + e.get_message());
    }
  }

  for (size_t i = 0; i < processor.validations.size(); ++i)
  {
    const plx_validation_rule& rule = processor.validations.at(i);
    plx_string severity = rule.severity.value_or("error");
    if (severity != "error" && severity != "warning")
    {
      findings.push_back(plx_string("Validation '") + rule.name.value_or("") + "' has unknown severity '" +
                         severity + "', treated as warning");
    }
    try
    {
      expr::plx_expr_parser::parse_predicate(rule.check.value_or(""));
    }
    catch (const plx_expression_error& e)
    {
      findings.push_back(plx_string("Validation '") + rule.name.value_or("") + "': " + e.get_message());
    }
  }

  return findings;
}

} // namespace plx::processors
