#ifndef PLX_VARIANT_H
#define PLX_VARIANT_H

#include "plx_string.h"
#include <map>
#include <vector>

class plx_variant;

typedef std::vector<plx_variant> plxv_vector;
typedef std::map<plx_string, plx_variant> plxv_map;

#define plxv_string plx_string
#define plxv_int long long
#define plxv_bool bool
#define plxv_double double

#define plxv_detect_state(value) plx_variant(value).in_state()

// Tagged value: null, scalar (string, int, bool, double), sequence or map.
// Extracted data, processor specs and layouts are all trees of these.
class plx_variant
{
public:
  enum state
  {
    none,
    string_state,
    int_state,
    bool_state,
    double_state,
    vector_state,
    map_state
  };

private:
  void* content;
  state is;

  void copy_from(const plx_variant& other);

public:
  template<typename to>
  to* cast_content() const
  {
    return static_cast<to*>(content);
  }
  void clear();
  void reset(state to);
  ~plx_variant();
  plx_variant();
  plx_variant(const char* from_string);
  plx_variant(const plx_string& from_string);
  plx_variant(int from_int);
  plx_variant(bool from_bool);
  plx_variant(long long from_int);
  plx_variant(double from_double);
  plx_variant(const plxv_vector& from_vector);
  plx_variant(const plxv_map& from_map);
  plx_variant(const plx_variant& other);
  plx_variant(plx_variant&& other) noexcept;

  state in_state() const;
  bool is_null() const;
  bool is_string() const;
  bool is_int() const;
  bool is_bool() const;
  bool is_double() const;
  bool is_vector() const;
  bool is_map() const;

  // int, double and bool all count as numbers
  bool is_number() const;
  double number_value() const;

  // These convert in place when the state differs
  plx_string& to_string();
  long long& to_int();
  bool& to_bool();
  double& to_double();
  plxv_vector& to_vector();
  plxv_map& to_map();

  template<typename type>
  type& to()
  {
    state tstate = plxv_detect_state(type());
    if (is != tstate)
    {
      *this = convert(tstate);
    }
    return *cast_content<type>();
  }

  // These should only be used after a type check
  const plx_string& string_value() const;
  const long long& int_value() const;
  const bool& bool_value() const;
  const double& double_value() const;
  const plxv_vector& vector_value() const;
  const plxv_map& map_value() const;

  bool converts_to(state s) const;
  plx_variant convert(state to) const;

  // Compact text form used in messages and for string coercion of containers
  plx_string describe() const;

  plx_variant& operator=(const plx_variant& other);
  plx_variant& operator=(plx_variant&& other) noexcept;
  plx_variant& operator=(const char* s);
  plx_variant& operator=(const plx_string& s);
  plx_variant& operator=(long long i);
  plx_variant& operator=(int i);
  plx_variant& operator=(bool b);
  plx_variant& operator=(double d);
  plx_variant& operator=(const plxv_vector& v);
  plx_variant& operator=(const plxv_map& m);

  bool operator==(const plx_variant& other) const;
  bool operator!=(const plx_variant& other) const
  {
    return !(*this == other);
  }
};

#endif // PLX_VARIANT_H
