#ifndef PLX_SOURCE_REF_H
#define PLX_SOURCE_REF_H

#include "../utils/plx_string.h"

namespace plx::processors {

// Parsed ExtractionOp source:
//   anchor.NAME / anchor.NAME.text     anchor text
//   anchor.NAME.value[N]               Nth number right of the anchor
//   region.NAME                        region text
//   region.NAME.column[N]              column N of the region
//   literal:TEXT                       TEXT
struct plx_source_ref {
  enum kind_t {
    invalid,
    anchor_text,
    anchor_value,
    region_text,
    region_column,
    literal
  };

  kind_t kind = invalid;
  plx_string name;
  long long index = 0;
  plx_string literal_text;
  plx_string error;

  static plx_source_ref parse(const plx_string& source);

  bool is_valid() const { return kind != invalid; }
};

} // namespace plx::processors

#endif // PLX_SOURCE_REF_H
