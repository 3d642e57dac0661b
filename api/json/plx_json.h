#ifndef PLX_JSON_H
#define PLX_JSON_H

#include "../../utils/plx_variant.h"

// nlohmann::json stays out of the header; conversion happens in plx_json.cpp.

class plx_json {
public:
  /**
   * @brief Binds the converter to an externally owned map.
   * @param map_ptr Map read by create() and filled by parse(). Must outlive this object.
   */
  explicit plx_json(plxv_map* map_ptr);

  /**
   * @brief Parses a JSON object into the bound map.
   * @param json_string JSON text; the top level must be an object.
   * @return true on success, false on a parse error (details go to std::cerr).
   * @note The bound map is cleared first.
   */
  bool parse(const plx_string& json_string);

  /**
   * @brief Serializes the bound map.
   * @param indent -1 for compact output, otherwise spaces per level.
   */
  plx_string create(int indent = -1) const;

  // Serializes any variant (null, scalars and containers)
  static plx_string dump(const plx_variant& value, int indent = -1);

private:
  plxv_map* data_map;
};

#endif // PLX_JSON_H
