#ifndef PLX_LAYOUT_SIO_H
#define PLX_LAYOUT_SIO_H

#include "../utils/plx_string.h"
#include "layout/plx_layout_document.h"

// Source of layout IR documents. The engine only sees this interface;
// OCR and PDF text positioning live behind it.
class plx_layout_sio
{
public:
  virtual ~plx_layout_sio() = default;

  // Reads the document at locator (a file path for file based formats)
  virtual bool read(const plx_string& locator, plx_layout_document& layout);
  virtual bool write(const plx_string& locator, const plx_layout_document& layout);

  virtual bool parse(const plx_string& data, plx_layout_document& layout) = 0;
  virtual bool serialize(const plx_layout_document& layout, plx_string& data) = 0;
};

// Layout IR stored as JSON
class plx_layout_json_sio : public plx_layout_sio
{
  size_t fingerprint_blocks;
public:
  explicit plx_layout_json_sio(size_t fingerprint_blocks = 50);

  // Fills layout_hash when the document carries none
  bool parse(const plx_string& data, plx_layout_document& layout) override;
  bool serialize(const plx_layout_document& layout, plx_string& data) override;
};

#endif // PLX_LAYOUT_SIO_H
