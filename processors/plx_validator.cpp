#include "plx_validator.h"
#include "expr/plx_expr_evaluator.h"
#include "expr/plx_expr_parser.h"
#include "plx_errors.h"
#include <iostream>

namespace plx::processors {

namespace {

  plxv_vector to_vector(const std::vector<plx_string>& messages)
  {
    plxv_vector result;
    for (const plx_string& message : messages)
    {
      result.push_back(plx_variant(message));
    }
    return result;
  }

  const char* const both_teams = "'home_team' in data and 'away_team' in data";
  const char* const final_scores =
    "'final_score' in data.get('home_team', {}) and 'final_score' in data.get('away_team', {})";

} // namespace

plxv_map plx_validation_result::to_map() const
{
  plxv_map result;
  result["success"] = success;
  result["errors"] = to_vector(errors);
  result["warnings"] = to_vector(warnings);
  return result;
}

plx_validator::plx_validator(bool verbose) : verbose_(verbose)
{
}

plx_validation_result plx_validator::validate(const plxv_map& data,
                                              const plx_model_list<plx_validation_rule>& rules) const
{
  plx_validation_result result;
  for (size_t i = 0; i < rules.size(); ++i)
  {
    validate_rule(data, rules.at(i), result);
  }
  result.success = result.errors.empty();

  if (verbose_)
  {
    std::cout << "Validation " << (result.success ? "passed" : "failed") << " with "
              << result.errors.size() << " errors, " << result.warnings.size() << " warnings" << std::endl;
  }
  return result;
}

void plx_validator::validate_rule(const plxv_map& data, const plx_validation_rule& rule,
                                  plx_validation_result& result) const
{
  plx_string name = rule.name.value_or("");
  plx_string check = rule.check.value_or("");
  std::vector<plx_string>& severity_list = rule.is_error() ? result.errors : result.warnings;

  try
  {
    expr::node_ptr predicate = expr::plx_expr_parser::parse_predicate(check);
    expr::plx_expr_evaluator evaluator(data);
    if (!expr::plx_expr_evaluator::truthy(evaluator.evaluate(predicate)))
    {
      severity_list.push_back(plx_string("Validation failed: ") + name);
    }
  }
  catch (const plx_missing_field_error& e)
  {
    severity_list.push_back(plx_string("Validation '") + name + "' failed: Missing field '" + e.get_field() + "'");
  }
  catch (const plx_expression_error& e)
  {
    plx_string message = plx_string("Validation '") + name + "' error: " + e.get_message();
    std::cerr << "Error: " << message.c_str() << std::endl;
    result.errors.push_back(message);
  }
  result.success = result.errors.empty();
}

plx_validation_result plx_validator::validate_required_fields(const plxv_map& data,
                                                              const std::vector<plx_string>& paths) const
{
  plx_validation_result result;
  for (const plx_string& path : paths)
  {
    if (!has_field(data, path))
    {
      result.errors.push_back(plx_string("Missing required field: ") + path);
    }
  }
  result.success = result.errors.empty();
  return result;
}

bool plx_validator::has_field(const plxv_map& data, const plx_string& field_path)
{
  const plx_variant* current = nullptr;
  const plxv_map* map = &data;

  for (const plx_string& raw : field_path.split("."))
  {
    plx_string part = raw.trim().remove("[]");
    if (current != nullptr)
    {
      if (current->is_vector())
      {
        if (current->vector_value().empty())
        {
          return false;
        }
        current = &current->vector_value().front();
      }
      if (!current->is_map())
      {
        return false;
      }
      map = &current->map_value();
    }
    auto it = map->find(part);
    if (it == map->end())
    {
      return false;
    }
    current = &it->second;
  }
  return current != nullptr && !current->is_null();
}

void plx_validator::add_basketball_validations(plx_processor& processor)
{
  processor.add_validation("Both teams present", both_teams);
  processor.add_validation("Team names not empty",
                           "data.get('home_team', {}).get('name') and data.get('away_team', {}).get('name')");
  processor.add_validation("Final scores present", final_scores);
  processor.add_validation("Period scores sum to final (home)",
                           "sum(data.get('home_team', {}).get('period_scores', [])) == "
                           "data.get('home_team', {}).get('final_score', 0)",
                           "warning");
  processor.add_validation("Period scores sum to final (away)",
                           "sum(data.get('away_team', {}).get('period_scores', [])) == "
                           "data.get('away_team', {}).get('final_score', 0)",
                           "warning");
}

void plx_validator::add_hockey_validations(plx_processor& processor)
{
  processor.add_validation("Both teams present", both_teams);
  processor.add_validation("Final scores present", final_scores);
}

} // namespace plx::processors
