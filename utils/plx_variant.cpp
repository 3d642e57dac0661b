#include "plx_variant.h"
#include <cmath>

void plx_variant::copy_from(const plx_variant& other)
{
  if (this == &other)
  {
    return;
  }
  reset(other.is);
  if (other.is == string_state)
  {
    *cast_content<plx_string>() = other.string_value();
  }
  if (other.is == int_state)
  {
    *cast_content<long long>() = other.int_value();
  }
  if (other.is == double_state)
  {
    *cast_content<double>() = other.double_value();
  }
  if (other.is == bool_state)
  {
    *cast_content<bool>() = other.bool_value();
  }
  if (other.is == vector_state)
  {
    *cast_content<plxv_vector>() = other.vector_value();
  }
  if (other.is == map_state)
  {
    *cast_content<plxv_map>() = other.map_value();
  }
}

void plx_variant::clear()
{
  if (is == string_state)
  {
    delete cast_content<plx_string>();
  }
  if (is == int_state)
  {
    delete cast_content<long long>();
  }
  if (is == double_state)
  {
    delete cast_content<double>();
  }
  if (is == bool_state)
  {
    delete cast_content<bool>();
  }
  if (is == vector_state)
  {
    delete cast_content<plxv_vector>();
  }
  if (is == map_state)
  {
    delete cast_content<plxv_map>();
  }
  content = nullptr;
  is = none;
}

void plx_variant::reset(plx_variant::state to)
{
  clear();
  is = to;
  if (is == string_state)
  {
    content = new plx_string;
  }
  if (is == int_state)
  {
    content = new long long(0);
  }
  if (is == double_state)
  {
    content = new double(0.0);
  }
  if (is == bool_state)
  {
    content = new bool(false);
  }
  if (is == vector_state)
  {
    content = new plxv_vector;
  }
  if (is == map_state)
  {
    content = new plxv_map;
  }
}

plx_variant::~plx_variant()
{
  clear();
}

plx_variant::plx_variant() : content(nullptr), is(none)
{
}

plx_variant::plx_variant(const char* from_string) : content(new plx_string(from_string)), is(string_state)
{
}

plx_variant::plx_variant(const plx_string& from_string) : content(new plx_string(from_string)), is(string_state)
{
}

plx_variant::plx_variant(int from_int) : content(new long long(from_int)), is(int_state)
{
}

plx_variant::plx_variant(bool from_bool) : content(new bool(from_bool)), is(bool_state)
{
}

plx_variant::plx_variant(long long from_int) : content(new long long(from_int)), is(int_state)
{
}

plx_variant::plx_variant(double from_double) : content(new double(from_double)), is(double_state)
{
}

plx_variant::plx_variant(const plxv_vector& from_vector) : content(new plxv_vector(from_vector)), is(vector_state)
{
}

plx_variant::plx_variant(const plxv_map& from_map) : content(new plxv_map(from_map)), is(map_state)
{
}

plx_variant::plx_variant(const plx_variant& other) : content(nullptr), is(none)
{
  copy_from(other);
}

plx_variant::plx_variant(plx_variant&& other) noexcept : content(other.content), is(other.is)
{
  other.content = nullptr;
  other.is = none;
}

plx_variant::state plx_variant::in_state() const
{
  return is;
}

bool plx_variant::is_null() const
{
  return is == none;
}

bool plx_variant::is_string() const
{
  return is == string_state;
}

bool plx_variant::is_int() const
{
  return is == int_state;
}

bool plx_variant::is_bool() const
{
  return is == bool_state;
}

bool plx_variant::is_double() const
{
  return is == double_state;
}

bool plx_variant::is_vector() const
{
  return is == vector_state;
}

bool plx_variant::is_map() const
{
  return is == map_state;
}

bool plx_variant::is_number() const
{
  return is == int_state || is == double_state || is == bool_state;
}

double plx_variant::number_value() const
{
  if (is == int_state)
  {
    return static_cast<double>(int_value());
  }
  if (is == double_state)
  {
    return double_value();
  }
  if (is == bool_state)
  {
    return bool_value() ? 1.0 : 0.0;
  }
  return 0.0;
}

plx_string& plx_variant::to_string()
{
  if (is != string_state)
  {
    *this = convert(string_state);
  }
  return *cast_content<plx_string>();
}

long long& plx_variant::to_int()
{
  if (is != int_state)
  {
    *this = convert(int_state);
  }
  return *cast_content<long long>();
}

bool& plx_variant::to_bool()
{
  if (is != bool_state)
  {
    *this = convert(bool_state);
  }
  return *cast_content<bool>();
}

double& plx_variant::to_double()
{
  if (is != double_state)
  {
    *this = convert(double_state);
  }
  return *cast_content<double>();
}

plxv_vector& plx_variant::to_vector()
{
  if (is != vector_state)
  {
    *this = convert(vector_state);
  }
  return *cast_content<plxv_vector>();
}

plxv_map& plx_variant::to_map()
{
  if (is != map_state)
  {
    *this = convert(map_state);
  }
  return *cast_content<plxv_map>();
}

const plx_string& plx_variant::string_value() const
{
  return *cast_content<plx_string>();
}

const long long& plx_variant::int_value() const
{
  return *cast_content<long long>();
}

const bool& plx_variant::bool_value() const
{
  return *cast_content<bool>();
}

const double& plx_variant::double_value() const
{
  return *cast_content<double>();
}

const plxv_vector& plx_variant::vector_value() const
{
  return *cast_content<plxv_vector>();
}

const plxv_map& plx_variant::map_value() const
{
  return *cast_content<plxv_map>();
}

bool plx_variant::converts_to(plx_variant::state s) const
{
  if (is == s)
  {
    return true;
  }
  if (is == string_state)
  {
    return (s == bool_state && (string_value().lower() == "true" ||
                                string_value().lower() == "false" ||
                                string_value().is_integer())) ||
           (s == int_state && string_value().is_integer()) ||
           (s == double_state && string_value().is_double());
  }
  if (is == bool_state)
  {
    return s == int_state || s == double_state || s == string_state;
  }
  if (is == int_state || is == double_state)
  {
    return s == int_state || s == double_state || s == bool_state || s == string_state;
  }
  return false;
}

plx_variant plx_variant::convert(plx_variant::state to) const
{
  plx_variant res;
  res.reset(to);

  if (is == to)
  {
    res = *this;
  }
  else if (is == string_state)
  {
    if (to == int_state)
    {
      res = string_value().to_int(0);
    }
    else if (to == bool_state)
    {
      plx_string lower = string_value().lower();
      res = lower == "true" || lower == "t" || string_value().to_int(0) != 0;
    }
    else if (to == double_state)
    {
      res = string_value().to_double(0);
    }
  }
  else if (is == bool_state)
  {
    if (to == int_state)
    {
      res = bool_value() ? 1LL : 0LL;
    }
    else if (to == double_state)
    {
      res = bool_value() ? 1.0 : 0.0;
    }
    else if (to == string_state)
    {
      res = bool_value() ? "true" : "false";
    }
  }
  else if (is == int_state)
  {
    if (to == double_state)
    {
      res = static_cast<double>(int_value());
    }
    else if (to == bool_state)
    {
      res = int_value() != 0;
    }
    else if (to == string_state)
    {
      res = plx_string(int_value());
    }
  }
  else if (is == double_state)
  {
    if (to == int_state)
    {
      res = static_cast<long long>(double_value());
    }
    else if (to == bool_state)
    {
      res = double_value() != 0.0;
    }
    else if (to == string_state)
    {
      res = plx_string(double_value());
    }
  }
  else if (to == string_state && (is == vector_state || is == map_state))
  {
    res = describe();
  }
  return res;
}

plx_string plx_variant::describe() const
{
  switch (is)
  {
    case string_state:
      return string_value();
    case int_state:
      return plx_string(int_value());
    case double_state:
      return plx_string(double_value());
    case bool_state:
      return bool_value() ? "true" : "false";
    case vector_state:
    {
      std::vector<plx_string> parts;
      for (const auto& el : vector_value())
      {
        parts.push_back(el.describe());
      }
      return "[" + plx_string(", ").join(parts) + "]";
    }
    case map_state:
    {
      std::vector<plx_string> parts;
      for (const auto& pair : map_value())
      {
        parts.push_back(pair.first + ": " + pair.second.describe());
      }
      return "{" + plx_string(", ").join(parts) + "}";
    }
    case none:
    default:
      return "null";
  }
}

plx_variant& plx_variant::operator=(const plx_variant& other)
{
  if (this != &other)
  {
    // other may live inside our own content (e.g. v = v.to_vector()[0])
    plx_variant copy(other);
    *this = std::move(copy);
  }
  return *this;
}

plx_variant& plx_variant::operator=(plx_variant&& other) noexcept
{
  if (this != &other)
  {
    void* old_content = content;
    state old_state = is;
    content = other.content;
    is = other.is;
    other.content = old_content;
    other.is = old_state;
  }
  return *this;
}

plx_variant& plx_variant::operator=(const plxv_vector& v)
{
  return *this = plx_variant(v);
}

plx_variant& plx_variant::operator=(const plxv_map& m)
{
  return *this = plx_variant(m);
}

plx_variant& plx_variant::operator=(double d)
{
  return *this = plx_variant(d);
}

plx_variant& plx_variant::operator=(long long i)
{
  return *this = plx_variant(i);
}

plx_variant& plx_variant::operator=(int i)
{
  return *this = plx_variant(i);
}

plx_variant& plx_variant::operator=(bool b)
{
  return *this = plx_variant(b);
}

plx_variant& plx_variant::operator=(const char* s)
{
  return *this = plx_variant(s);
}

plx_variant& plx_variant::operator=(const plx_string& s)
{
  return *this = plx_variant(s);
}

bool plx_variant::operator==(const plx_variant& other) const
{
  if ((is == int_state || is == double_state) &&
      (other.is == int_state || other.is == double_state))
  {
    if (is == int_state && other.is == int_state)
    {
      return int_value() == other.int_value();
    }
    return number_value() == other.number_value();
  }
  if (is != other.is)
  {
    return false;
  }
  switch (is)
  {
    case string_state:
      return string_value() == other.string_value();
    case bool_state:
      return bool_value() == other.bool_value();
    case vector_state:
      return vector_value() == other.vector_value();
    case map_state:
      return map_value() == other.map_value();
    case none:
      return true;
    default:
      return false;
  }
}
