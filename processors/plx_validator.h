#ifndef PLX_VALIDATOR_H
#define PLX_VALIDATOR_H

#include "plx_execution_log.h"
#include "plx_processor.h"
#include <vector>

namespace plx::processors {

struct plx_validation_result {
  bool success = true;
  std::vector<plx_string> errors;
  std::vector<plx_string> warnings;

  // {"success": bool, "errors": [...], "warnings": [...]}
  plxv_map to_map() const;
};

// Runs predicates over the extracted tree. Failures are collected, never thrown.
class plx_validator {
public:
  explicit plx_validator(bool verbose = false);

  plx_validation_result validate(const plxv_map& data, const plx_model_list<plx_validation_rule>& rules) const;

  // Single rule; appends to result
  void validate_rule(const plxv_map& data, const plx_validation_rule& rule, plx_validation_result& result) const;

  // Every dotted path must exist and be non-null, sequences are checked at their first record
  plx_validation_result validate_required_fields(const plxv_map& data, const std::vector<plx_string>& paths) const;

  static bool has_field(const plxv_map& data, const plx_string& field_path);

  // Common rules for box score processors
  static void add_basketball_validations(plx_processor& processor);
  static void add_hockey_validations(plx_processor& processor);

private:
  bool verbose_;
};

} // namespace plx::processors

#endif // PLX_VALIDATOR_H
