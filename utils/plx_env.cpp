#include "plx_env.h"
#include <cstdlib>
#include <fstream>
#include <iostream>

bool load_env_file(const plx_string& filepath) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    plx_string plx_line(line);
    plx_line = plx_line.trim();

    if (plx_line.empty() || plx_line.starts_with("#")) {
      continue;
    }

    size_t pos = plx_line.find("=");
    if (pos == plx_string::npos) {
      continue;
    }

    plx_string key = plx_line.substr(0, pos).trim();
    plx_string value = plx_line.substr(pos + 1).trim();

    // Strip optional surrounding quotes
    if (value.size() >= 2 &&
        ((value.starts_with("\"") && value.ends_with("\"")) ||
         (value.starts_with("'") && value.ends_with("'")))) {
      value = value.substr(1, value.size() - 2);
    }

    setenv(key.c_str(), value.c_str(), 1);
  }
  return true;
}

plx_string env_string(const plx_string& key, const plx_string& fallback) {
  const char* raw = std::getenv(key.c_str());
  if (raw == nullptr) {
    return fallback;
  }
  return plx_string(raw);
}

double env_double(const plx_string& key, double fallback) {
  const char* raw = std::getenv(key.c_str());
  if (raw == nullptr) {
    return fallback;
  }
  double value = fallback;
  if (!plx_string(raw).parse_double(value)) {
    std::cerr << "Warning: " << key << "='" << raw << "' is not a number, using " << fallback << std::endl;
    return fallback;
  }
  return value;
}

long long env_int(const plx_string& key, long long fallback) {
  const char* raw = std::getenv(key.c_str());
  if (raw == nullptr) {
    return fallback;
  }
  long long value = fallback;
  if (!plx_string(raw).parse_int(value)) {
    std::cerr << "Warning: " << key << "='" << raw << "' is not an integer, using " << fallback << std::endl;
    return fallback;
  }
  return value;
}

bool env_bool(const plx_string& key, bool fallback) {
  const char* raw = std::getenv(key.c_str());
  if (raw == nullptr) {
    return fallback;
  }
  plx_string value = plx_string(raw).trim().lower();
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off" || value.empty()) {
    return false;
  }
  std::cerr << "Warning: " << key << "='" << raw << "' is not a boolean, using "
            << (fallback ? "true" : "false") << std::endl;
  return fallback;
}
