#ifndef PLX_STRING_H
#define PLX_STRING_H

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Wrapper around std::string with the text helpers layout matching needs
class plx_string
{
  std::string str;

  static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

public:
  static const size_t npos = std::string::npos;

  plx_string() : str() {}
  plx_string(const char* s) : str(s ? s : "") {}
  plx_string(const char* s, size_t len) : str(s, len) {}
  plx_string(const std::string& s) : str(s) {}
  plx_string(long i) : str(std::to_string(i)) {}
  plx_string(long long i) : str(std::to_string(i)) {}
  plx_string(int i) : str(std::to_string(i)) {}
  plx_string(size_t i) : str(std::to_string(i)) {}
  plx_string(double d)
  {
    std::ostringstream out;
    out.precision(15);
    out << d;
    str = out.str();
  }
  plx_string(char c) : str(1, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  plx_string operator+(const plx_string& s) const { return str + s.str; }
  plx_string operator+(const char* s) const { return str + s; }
  plx_string& operator+=(const plx_string& s) { str += s.str; return *this; }
  plx_string& operator+=(char c) { str += c; return *this; }
  bool operator==(const plx_string& s) const { return str == s.str; }
  bool operator!=(const plx_string& s) const { return str != s.str; }
  bool operator<(const plx_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  size_t length() const { return str.length(); }
  void clear() { str.clear(); }

  char& operator[](size_t i) { return str[i]; }
  char operator[](size_t i) const { return str[i]; }

  plx_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  long long to_int(long long def = 0) const
  {
    try
    {
      return std::stoll(str);
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  double to_double(double def = 0) const
  {
    try
    {
      return std::stod(str);
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  // Strict parses: surrounding whitespace is allowed, trailing garbage is not
  bool parse_int(long long& out) const
  {
    plx_string t = trim();
    if (t.empty()) return false;
    size_t used = 0;
    try
    {
      out = std::stoll(t.str, &used);
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
    return used == t.size();
  }

  bool parse_double(double& out) const
  {
    plx_string t = trim();
    if (t.empty()) return false;
    size_t used = 0;
    try
    {
      out = std::stod(t.str, &used);
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
    return used == t.size();
  }

  bool is_integer() const
  {
    long long ignored = 0;
    return parse_int(ignored);
  }

  bool is_double() const
  {
    double ignored = 0;
    return parse_double(ignored);
  }

  size_t find(const plx_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  size_t rfind(const plx_string& s) const { return str.rfind(s.str); }
  bool contains(const plx_string& s) const { return str.find(s.str) != std::string::npos; }

  bool contains_icase(const plx_string& s) const { return lower().contains(s.lower()); }
  bool equals_icase(const plx_string& s) const { return lower() == s.lower(); }

  plx_string lower() const
  {
    plx_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res.str[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(res.str[i])));
    }
    return res;
  }

  plx_string upper() const
  {
    plx_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res.str[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(res.str[i])));
    }
    return res;
  }

  plx_string& replace(const plx_string& from, const plx_string& to)
  {
    if (from.empty()) return *this;
    for (size_t pos = 0; (pos = str.find(from.str, pos)) != std::string::npos; pos += to.size())
    {
      str.replace(pos, from.size(), to.str);
    }
    return *this;
  }

  plx_string remove(const plx_string& substring) const
  {
    plx_string result = *this;
    result.replace(substring, "");
    return result;
  }

  size_t split(const plx_string& delim, std::vector<plx_string>& out) const
  {
    size_t pos = 0;
    size_t last_pos = 0;
    while ((pos = str.find(delim.str, last_pos)) != std::string::npos)
    {
      out.push_back(str.substr(last_pos, pos - last_pos));
      last_pos = pos + delim.size();
    }
    out.push_back(str.substr(last_pos));
    return out.size();
  }

  std::vector<plx_string> split(const plx_string& delim) const
  {
    std::vector<plx_string> out;
    split(delim, out);
    return out;
  }

  // Whitespace-delimited tokens, empty tokens dropped
  std::vector<plx_string> words() const
  {
    std::vector<plx_string> out;
    std::string current;
    for (char c : str)
    {
      if (is_space(c))
      {
        if (!current.empty())
        {
          out.push_back(current);
          current.clear();
        }
      }
      else
      {
        current += c;
      }
    }
    if (!current.empty())
    {
      out.push_back(current);
    }
    return out;
  }

  plx_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return plx_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const plx_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const plx_string& suffix) const
  {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  plx_string join(const std::vector<plx_string>& parts) const
  {
    if (parts.empty()) return plx_string();
    plx_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i)
    {
      result += *this + parts[i];
    }
    return result;
  }

  // Digits only once '.' and '-' are removed ("10-15", "3.5" qualify)
  bool is_numeric() const
  {
    plx_string digits = trim().remove(".").remove("-");
    if (digits.empty()) return false;
    return std::all_of(digits.str.begin(), digits.str.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
  }
};

inline plx_string operator+(const char* lhs, const plx_string& rhs)
{
  return plx_string(lhs) + rhs;
}

inline std::ostream& operator<<(std::ostream& out, const plx_string& s)
{
  return out << s.to_std_const();
}

#endif // PLX_STRING_H
