#ifndef PLX_EXPR_EVALUATOR_H
#define PLX_EXPR_EVALUATOR_H

#include "plx_expr_ast.h"
#include "../plx_execution_log.h"

namespace plx::processors::expr {

// Evaluates a parsed formula or predicate against one data tree.
// Values follow the usual scripting semantics: and/or return an operand,
// bool counts as a number, / always yields a double.
// Missing keys throw plx_missing_field_error, type errors plx_expression_error.
class plx_expr_evaluator {
public:
  // sink receives the coercion warnings of sum(path) atoms, may be nullptr
  explicit plx_expr_evaluator(const plxv_map& root, plx_execution_log* sink = nullptr);

  plx_variant evaluate(const node_ptr& expression);

  static bool truthy(const plx_variant& value);
  static bool values_equal(const plx_variant& a, const plx_variant& b);
  // -1, 0 or 1; throws for values without an ordering
  static int compare_values(const plx_variant& a, const plx_variant& b, const plx_string& op);
  static plx_string type_name(const plx_variant& value);

private:
  plx_variant eval(const node& n);
  plx_variant eval_member(const node& n);
  plx_variant eval_index(const node& n);
  plx_variant eval_projection(const node& n);
  plx_variant eval_get(const node& n);
  plx_variant eval_call(const node& n);
  plx_variant eval_compare(const node& n);
  plx_variant eval_sum_path(const node& n);

  static plx_variant arithmetic(const plx_string& op, const plx_variant& a, const plx_variant& b);
  static bool contains(const plx_variant& container, const plx_variant& item);

  plx_variant root_value;
  plx_execution_log* sink;
  std::vector<const plx_variant*> elements;
};

} // namespace plx::processors::expr

#endif // PLX_EXPR_EVALUATOR_H
