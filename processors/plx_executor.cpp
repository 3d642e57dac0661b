#include "plx_executor.h"
#include "plx_anchor_resolver.h"
#include "plx_calculation_engine.h"
#include "plx_errors.h"
#include "plx_field_extractor.h"
#include "plx_path_writer.h"
#include "plx_region_resolver.h"

namespace plx::processors {

plxv_map plx_execution_result::to_map() const
{
  plxv_map result;
  result["data"] = data;
  result["validation"] = validation.to_map();
  return result;
}

plx_executor::plx_executor(std::shared_ptr<plx_layout_sio> provider, const plx_engine_config& config)
  : provider(std::move(provider)), config(config)
{
}

plx_execution_result plx_executor::execute(const plx_layout_document& layout, const plx_processor& processor) const
{
  plx_execution_log log(config.verbose);
  log.info(plx_string("Executing processor ") + processor.display_name() + " on " +
           plx_string(layout.blocks.size()) + " blocks");

  // 1. Anchors
  plx_anchor_resolver anchor_resolver(config);
  plx_anchor_map anchors = anchor_resolver.resolve(layout, processor.anchors, log);
  for (size_t i = 0; i < processor.anchors.size(); ++i)
  {
    const plx_anchor& anchor = processor.anchors.at(i);
    plx_string name = anchor.name.value_or("");
    if (anchor.is_required() && !anchors.contains(name))
    {
      throw plx_missing_anchor_error(name);
    }
  }

  // 2. Regions
  plx_region_map regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);

  // 3. Extraction ops, in declared order
  plx_execution_result result;
  plx_field_extractor extractor(config);
  for (size_t i = 0; i < processor.extraction_ops.size(); ++i)
  {
    const plx_extraction_op& op = processor.extraction_ops.at(i);
    plx_string field_path = op.field_path.value_or("");
    plx_variant value = extractor.extract(layout, regions, anchors, processor, op, log);
    if (value.is_null())
    {
      continue;
    }

    try
    {
      if (!plx_path_writer::write(result.data, field_path, value))
      {
        log.warn(plx_string("Extraction for '") + field_path + "' does not line up with the existing records");
      }
    }
    catch (const plx_path_error& e)
    {
      log.warn(plx_string("Extraction for '") + field_path + "' not written: " + e.get_message());
    }
  }

  // 4. Calculations, later ones see earlier results
  for (size_t i = 0; i < processor.calculations.size(); ++i)
  {
    plx_calculation_engine::apply(result.data, processor.calculations.at(i), log);
  }

  // 5. Validations
  plx_validator validator(config.verbose);
  result.validation = validator.validate(result.data, processor.validations);
  for (const plx_string& warning : log.get_warnings())
  {
    result.validation.warnings.push_back(warning);
  }
  return result;
}

plx_execution_result plx_executor::execute_source(const plx_string& locator, const plx_processor& processor) const
{
  if (!provider)
  {
    throw plx_layout_error("No layout provider configured", locator);
  }
  plx_layout_document layout;
  if (!provider->read(locator, layout))
  {
    throw plx_layout_error(plx_string("Cannot read layout from ") + locator, locator);
  }
  return execute(layout, processor);
}

} // namespace plx::processors
