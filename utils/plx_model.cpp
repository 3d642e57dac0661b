#include "plx_model.h"

plx_property_i::plx_property_i(plx_model* parent, const plx_string& name, const plxv_map& meta)
  : parent(parent), name(name), metadata(meta)
{
  auto fieldname = metadata.find("fieldname");
  if (fieldname != metadata.end() && fieldname->second.is_string())
  {
    this->name = fieldname->second.string_value();
  }
  if (parent != nullptr)
  {
    parent->add_prop(this, this->name);
  }
}

plx_variant& plx_property_i::access()
{
  plxv_map* current = &(**parent);
  if (!name.contains("/"))
  {
    return (*current)[name];
  }
  std::vector<plx_string> parts = name.split("/");
  for (size_t i = 0; i + 1 < parts.size(); ++i)
  {
    current = &(*current)[parts[i]].to_map();
  }
  return (*current)[parts.back()];
}

const plx_variant& plx_property_i::const_access() const
{
  const plx_model& model = *parent;
  const plxv_map* current = nullptr;
  try
  {
    current = &(*model);
  }
  catch (const plx_null_access_exception&)
  {
    // Model never written
    throw plx_null_field_exception(name);
  }
  std::vector<plx_string> parts;
  if (name.contains("/"))
  {
    parts = name.split("/");
  }
  else
  {
    parts.push_back(name);
  }
  for (size_t i = 0; i < parts.size(); ++i)
  {
    auto it = current->find(parts[i]);
    if (it == current->end())
    {
      throw plx_null_field_exception(name);
    }
    if (i + 1 == parts.size())
    {
      return it->second;
    }
    if (!it->second.is_map())
    {
      throw plx_null_field_exception(name);
    }
    current = &it->second.map_value();
  }
  throw plx_null_field_exception(name);
}

bool plx_property_i::is_null() const
{
  try
  {
    return const_access().is_null();
  }
  catch (const plx_null_access_exception&)
  {
    return true;
  }
  catch (const plx_null_field_exception&)
  {
    return true;
  }
}

plx_model::plx_model() : parent_property(nullptr)
{
}

plx_model::plx_model(plx_property<plxv_map>* parent_prop) : parent_property(parent_prop)
{
}

void plx_model::add_prop(plx_property_i* prop, const plx_string& name)
{
  props[name] = prop;
}

void plx_model::add_model_list(const plx_string& name, plx_list* list)
{
  model_lists[name] = list;
}

plxv_map& plx_model::operator*()
{
  if (parent_property != nullptr)
  {
    set(&parent_property->value());
  }
  return plx_lazy_ptr<plxv_map>::operator*();
}

const plxv_map& plx_model::operator*() const
{
  if (parent_property != nullptr)
  {
    const plx_variant& data = parent_property->const_access();
    if (!data.is_map())
    {
      throw plx_null_field_exception(parent_property->prop_name());
    }
    return data.map_value();
  }
  return plx_lazy_ptr<plxv_map>::operator*();
}

void plx_model::load(const plxv_map& data)
{
  // data may be part of our own tree
  plxv_map copy = data;
  **this = std::move(copy);
}

void plx_model::assign(const plx_model& other)
{
  load(other.snapshot());
}

plxv_map plx_model::snapshot() const
{
  try
  {
    return **this;
  }
  catch (const plx_null_access_exception&)
  {
    return plxv_map();
  }
  catch (const plx_null_field_exception&)
  {
    return plxv_map();
  }
}

bool plx_model::same_data(const plx_model& other) const
{
  return snapshot() == other.snapshot();
}
