#ifndef PLX_MODEL_H
#define PLX_MODEL_H

#include "plx_lazy_ptr.h"
#include "plx_variant.h"
#include <type_traits>

// Exception for null field access in properties
class plx_null_field_exception : public std::exception {
    plx_string field_name;
    plx_string message;
public:
    explicit plx_null_field_exception(const plx_string& name)
      : field_name(name), message(plx_string("Access to null field: ") + name) {}
    const char* what() const noexcept override {
        return message.c_str();
    }
    const plx_string& get_field_name() const { return field_name; }
};

class plx_model;

// Typed view on one entry of a model's map. The entry key is the C++ name
// unless the "fieldname" metadata renames it; a "/" in the key addresses a
// nested map.
class plx_property_i
{
protected:
  plx_model* parent;
  plx_string name;
  plxv_map metadata;
public:
  plx_property_i(plx_model* parent, const plx_string& name, const plxv_map& meta = plxv_map());
  virtual ~plx_property_i() = default;

  // Properties are bound to the model that declares them
  plx_property_i(const plx_property_i&) = delete;
  plx_property_i& operator=(const plx_property_i&) = delete;

  plx_string prop_name() const { return name; }

  const plxv_map& get_meta() const { return metadata; }

  virtual plx_variant::state get_variant_type() const = 0;

  // Non-const access - creates the entry (and intermediate maps)
  plx_variant& access();

  // Const access - throws plx_null_field_exception if the entry is missing
  const plx_variant& const_access() const;

  bool is_null() const;
};

template <typename type>
class plx_property : public plx_property_i
{
  plx_variant::state variant_type;
public:
  explicit plx_property(plx_model* parent, const plx_string& name, const plxv_map& meta = plxv_map())
    : plx_property_i(parent, name, meta)
    , variant_type(plxv_detect_state(type()))
  {
  }

  plx_variant::state get_variant_type() const override
  {
    return variant_type;
  }

  // Creates a default value if null, converts in place if the stored type differs
  type& value()
  {
    plx_variant& data = this->access();
    if (data.in_state() != variant_type)
    {
      data = data.convert(variant_type);
    }
    return data.template to<type>();
  }

  // Converted copy; throws plx_null_field_exception if null
  type value() const
  {
    const plx_variant& data = this->const_access();
    if (data.is_null())
    {
      throw plx_null_field_exception(prop_name());
    }
    if (data.in_state() == variant_type)
    {
      return *data.template cast_content<type>();
    }
    plx_variant converted = data.convert(variant_type);
    return *converted.template cast_content<type>();
  }

  type value_or(const type& fallback) const
  {
    return is_null() ? fallback : value();
  }

  type& operator*() { return value(); }
  type operator*() const { return value(); }
  type* operator->() { return &value(); }

  plx_property& operator=(const type& new_value)
  {
    value() = new_value;
    return *this;
  }

  bool operator==(const type& other) const
  {
    if (is_null()) return false;
    return value() == other;
  }

  bool operator!=(const type& other) const
  {
    return !(*this == other);
  }

  operator type&() { return value(); }
  operator type() const { return value(); }
};

// Base interface for model lists
class plx_list {
public:
  virtual ~plx_list() = default;
  virtual size_t list_size() const = 0;
  virtual void add_element() = 0;
  virtual void clear() = 0;
};

// A model is a set of typed properties over one plxv_map. The map is owned
// by the model, or lives inside a parent model (nested models, list elements).
// Models are pinned: they are never copied or moved, data is copied instead.
class plx_model : public plx_lazy_ptr<plxv_map>
{
  std::map<plx_string, plx_property_i*> props;
  std::map<plx_string, plx_list*> model_lists;
  plx_property<plxv_map>* parent_property;
public:
  plx_model();
  explicit plx_model(plx_property<plxv_map>* parent_prop);
  ~plx_model() override = default;

  plx_model(const plx_model&) = delete;
  plx_model& operator=(const plx_model&) = delete;

  void add_prop(plx_property_i* prop, const plx_string& name);
  void add_model_list(const plx_string& name, plx_list* list);

  const std::map<plx_string, plx_property_i*>& get_properties() const { return props; }
  const std::map<plx_string, plx_list*>& get_model_lists() const { return model_lists; }

  // Nested models resolve through the parent on every access
  plxv_map& operator*() override;
  const plxv_map& operator*() const override;

  plx_variant& operator[](const plx_string& key)
  {
    return (**this)[key];
  }

  // Replace this model's data
  void load(const plxv_map& data);
  // Deep copy of another model's data
  void assign(const plx_model& other);
  // Copy of the data, empty if never set
  plxv_map snapshot() const;
  bool same_data(const plx_model& other) const;

  void clear()
  {
    (**this).clear();
  }
};

template <typename model>
class plx_model_list : public plx_lazy_ptr<plxv_vector>, public plx_list
{
  mutable std::map<size_t, model> cache;
  plx_property<plxv_vector>* parent_property;
  const plxv_vector* bound_vector;

  // Re-point cached element views after the vector moved or grew
  void rebind_cache(plxv_vector& vec)
  {
    for (auto it = cache.begin(); it != cache.end();)
    {
      if (it->first >= vec.size())
      {
        it = cache.erase(it);
        continue;
      }
      it->second.set(&vec[it->first].to_map());
      ++it;
    }
    bound_vector = &vec;
  }

  const plxv_vector* const_data() const
  {
    if (parent_property != nullptr)
    {
      if (parent_property->is_null())
      {
        return nullptr;
      }
      const plx_variant& data = parent_property->const_access();
      return data.is_vector() ? &data.vector_value() : nullptr;
    }
    return getptr();
  }

public:
  plx_model_list() : parent_property(nullptr), bound_vector(nullptr)
  {
  }

  plx_model_list(plx_property<plxv_vector>* parent_prop, plx_model* parent, const plx_string& name)
    : parent_property(parent_prop), bound_vector(nullptr)
  {
    if (parent != nullptr)
    {
      parent->add_model_list(name, this);
    }
  }

  plx_model_list(const plx_model_list&) = delete;
  plx_model_list& operator=(const plx_model_list&) = delete;

  plxv_vector& operator*() override
  {
    if (parent_property != nullptr)
    {
      this->set(&parent_property->value());
    }
    plxv_vector& vec = plx_lazy_ptr<plxv_vector>::operator*();
    if (bound_vector != &vec)
    {
      rebind_cache(vec);
    }
    return vec;
  }

  const plxv_vector& operator*() const override
  {
    const plxv_vector* vec = const_data();
    if (vec == nullptr)
    {
      throw plx_null_access_exception();
    }
    return *vec;
  }

  void add_element() override
  {
    plxv_vector& vec = **this;
    vec.push_back(plxv_map());
    rebind_cache(vec);
  }

  model& back()
  {
    return at(size() - 1);
  }

  model& at(size_t index)
  {
    plxv_vector& vec = **this;
    if (index >= vec.size())
    {
      throw std::out_of_range("Index out of range");
    }
    cache[index].set(&vec[index].to_map());
    return cache[index];
  }

  const model& at(size_t index) const
  {
    const plxv_vector* vec = const_data();
    if (vec == nullptr || index >= vec->size())
    {
      throw std::out_of_range("Index out of range");
    }
    const plx_variant& element = (*vec)[index];
    if (!element.is_map())
    {
      throw plx_null_field_exception(plx_string("[") + plx_string(static_cast<long long>(index)) + "]");
    }
    cache[index].set(const_cast<plxv_map*>(&element.map_value()));
    return cache[index];
  }

  model& operator[](size_t index) { return at(index); }
  const model& operator[](size_t index) const { return at(index); }

  size_t size() const
  {
    const plxv_vector* vec = const_data();
    return vec == nullptr ? 0 : vec->size();
  }

  bool empty() const { return size() == 0; }

  size_t list_size() const override
  {
    return size();
  }

  void clear() override
  {
    (**this).clear();
    cache.clear();
  }
};

// Property macros with optional metadata
#define plxp_int(name, ...) plx_property<plxv_int> name = plx_property<plxv_int>(this, #name, ##__VA_ARGS__)
#define plxp_string(name, ...) plx_property<plxv_string> name = plx_property<plxv_string>(this, #name, ##__VA_ARGS__)
#define plxp_bool(name, ...) plx_property<plxv_bool> name = plx_property<plxv_bool>(this, #name, ##__VA_ARGS__)
#define plxp_double(name, ...) plx_property<plxv_double> name = plx_property<plxv_double>(this, #name, ##__VA_ARGS__)
#define plxp_vector(name, ...) plx_property<plxv_vector> name = plx_property<plxv_vector>(this, #name, ##__VA_ARGS__)
#define plxp_map(name, ...) plx_property<plxv_map> name = plx_property<plxv_map>(this, #name, ##__VA_ARGS__)
#define plxp_model(name, model_type, ...) \
  plx_property<plxv_map> name##_map = plx_property<plxv_map>(this, #name, ##__VA_ARGS__); \
  model_type name = model_type(&name##_map)
#define plxp_model_list(name, model_type, ...) \
  plx_property<plxv_vector> name##_vec = plx_property<plxv_vector>(this, #name, ##__VA_ARGS__); \
  plx_model_list<model_type> name = plx_model_list<model_type>(&name##_vec, this, name##_vec.prop_name())

#endif // PLX_MODEL_H
