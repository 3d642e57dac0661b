#include "plx_calculation_engine.h"
#include "expr/plx_expr_evaluator.h"
#include "expr/plx_expr_parser.h"
#include "plx_errors.h"
#include "plx_path_writer.h"
#include <cmath>

namespace plx::processors {

bool plx_calculation_engine::evaluate(const plx_string& formula, const plxv_map& tree, plx_variant& result,
                                      plx_execution_log& log)
{
  plx_variant value;
  try
  {
    expr::node_ptr ast = expr::plx_expr_parser::parse_formula(formula);
    expr::plx_expr_evaluator evaluator(tree, &log);
    value = evaluator.evaluate(ast);
  }
  catch (const plx_expression_error& e)
  {
    log.warn(plx_string("Formula '") + formula + "' rejected: " + e.get_message());
    return false;
  }

  double number = value.number_value();
  if (!value.is_number() || !std::isfinite(number))
  {
    log.warn(plx_string("Formula '") + formula + "' has no finite result");
    return false;
  }

  if (number == std::floor(number) && std::fabs(number) < 9.0e15)
  {
    result = static_cast<long long>(number);
  }
  else
  {
    result = number;
  }
  return true;
}

bool plx_calculation_engine::apply(plxv_map& tree, const plx_calculation& calc, plx_execution_log& log)
{
  plx_string field = calc.field.value_or("");
  plx_string formula = calc.formula.value_or("");
  plx_variant result;
  if (!evaluate(formula, tree, result, log))
  {
    return false;
  }

  try
  {
    if (!plx_path_writer::write(tree, field, result))
    {
      log.warn(plx_string("Calculation '") + field + "' found no records to write to");
    }
  }
  catch (const plx_path_error& e)
  {
    log.warn(plx_string("Calculation '") + field + "' not written: " + e.get_message());
    return false;
  }
  log.info(plx_string("Calculated ") + field + " = " + result.describe());
  return true;
}

} // namespace plx::processors
