#ifndef PLX_EXECUTOR_H
#define PLX_EXECUTOR_H

#include "../documents/plx_layout_sio.h"
#include "plx_engine_config.h"
#include "plx_processor.h"
#include "plx_validator.h"
#include <memory>

namespace plx::processors {

struct plx_execution_result {
  plxv_map data;
  plx_validation_result validation;

  // {"data": ..., "validation": {...}}
  plxv_map to_map() const;
};

/*
 * Runs one processor over one layout:
 *
 *   anchors -> regions -> extraction ops -> calculations -> validations
 *
 * The layout and the processor are only read. Each call builds a fresh
 * output tree, so executions on the same inputs give identical results.
 */
class plx_executor {
public:
  explicit plx_executor(std::shared_ptr<plx_layout_sio> provider,
                        const plx_engine_config& config = plx_engine_config());

  // Throws plx_missing_anchor_error when a required anchor is not found
  plx_execution_result execute(const plx_layout_document& layout, const plx_processor& processor) const;

  // Reads the layout through the provider first; throws plx_layout_error if that fails
  plx_execution_result execute_source(const plx_string& locator, const plx_processor& processor) const;

  const plx_engine_config& get_config() const { return config; }

private:
  std::shared_ptr<plx_layout_sio> provider;
  plx_engine_config config;
};

} // namespace plx::processors

#endif // PLX_EXECUTOR_H
