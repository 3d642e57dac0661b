#ifndef PLX_CALCULATION_ENGINE_H
#define PLX_CALCULATION_ENGINE_H

#include "plx_execution_log.h"
#include "plx_processor.h"

namespace plx::processors {

// Derived fields: arithmetic over sum(path) atoms of the extracted tree
class plx_calculation_engine {
public:
  /**
   * @brief Evaluates one formula.
   * @param result Integer when the value is integral, double otherwise.
   * @return false if the formula does not parse or has no finite value;
   *         the reason is logged and result is left untouched.
   */
  static bool evaluate(const plx_string& formula, const plxv_map& tree, plx_variant& result,
                       plx_execution_log& log);

  // Evaluates calc.formula and writes the result at calc.field
  static bool apply(plxv_map& tree, const plx_calculation& calc, plx_execution_log& log);
};

} // namespace plx::processors

#endif // PLX_CALCULATION_ENGINE_H
