#include "plx_source_ref.h"
#include <regex>

namespace plx::processors {

plx_source_ref plx_source_ref::parse(const plx_string& source)
{
  static const std::regex anchor_re(R"(^anchor\.([^.\s]+)(?:\.(text|value)(?:\[(\d+)\])?)?$)");
  static const std::regex region_re(R"(^region\.([^.\s]+)(?:\.column\[(\d+)\])?$)");

  plx_source_ref ref;
  plx_string trimmed = source.trim();

  if (trimmed.starts_with("literal:"))
  {
    ref.kind = literal;
    ref.literal_text = trimmed.substr(8);
    return ref;
  }

  std::smatch match;
  const std::string& text = trimmed.to_std_const();

  if (std::regex_match(text, match, anchor_re))
  {
    ref.name = plx_string(match[1].str());
    plx_string accessor = match[2].matched ? plx_string(match[2].str()) : plx_string("text");
    if (accessor == "text")
    {
      if (match[3].matched)
      {
        ref.error = "anchor text takes no index";
        return ref;
      }
      ref.kind = anchor_text;
      return ref;
    }
    ref.kind = anchor_value;
    ref.index = match[3].matched ? plx_string(match[3].str()).to_int(0) : 0;
    return ref;
  }

  if (std::regex_match(text, match, region_re))
  {
    ref.name = plx_string(match[1].str());
    if (match[2].matched)
    {
      ref.kind = region_column;
      ref.index = plx_string(match[2].str()).to_int(0);
    }
    else
    {
      ref.kind = region_text;
    }
    return ref;
  }

  if (trimmed.starts_with("table."))
  {
    ref.error = "table sources are not supported";
    return ref;
  }

  ref.error = plx_string("unknown source '") + source + "'";
  return ref;
}

} // namespace plx::processors
