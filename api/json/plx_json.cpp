#include "plx_json.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>

namespace {

  plx_variant nlohmann_to_plx(const nlohmann::json& j_val) {
    if (j_val.is_null()) {
      return plx_variant();
    }
    if (j_val.is_boolean()) {
      return plx_variant(j_val.get<bool>());
    }
    if (j_val.is_number_unsigned()) {
      unsigned long long u_val = j_val.get<unsigned long long>();
      if (u_val > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        std::cerr << "Warning: Unsigned JSON number " << u_val << " too large for int, converting to double." << std::endl;
        return plx_variant(static_cast<double>(u_val));
      }
      return plx_variant(static_cast<long long>(u_val));
    }
    if (j_val.is_number_integer()) {
      return plx_variant(j_val.get<long long>());
    }
    if (j_val.is_number_float()) {
      return plx_variant(j_val.get<double>());
    }
    if (j_val.is_string()) {
      return plx_variant(plx_string(j_val.get<std::string>()));
    }
    if (j_val.is_array()) {
      plxv_vector vec;
      vec.reserve(j_val.size());
      for (const auto& el : j_val) {
        vec.push_back(nlohmann_to_plx(el));
      }
      return plx_variant(vec);
    }
    if (j_val.is_object()) {
      plxv_map map_val;
      for (auto it = j_val.begin(); it != j_val.end(); ++it) {
        map_val[plx_string(it.key())] = nlohmann_to_plx(it.value());
      }
      return plx_variant(map_val);
    }
    std::cerr << "Warning: Unknown nlohmann::json type encountered during conversion." << std::endl;
    return plx_variant();
  }

  nlohmann::json plx_to_nlohmann(const plx_variant& var) {
    switch (var.in_state()) {
      case plx_variant::string_state:
        return var.string_value().to_std_const();
      case plx_variant::int_state:
        return var.int_value();
      case plx_variant::bool_state:
        return var.bool_value();
      case plx_variant::double_state:
        return var.double_value();
      case plx_variant::vector_state: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& el : var.vector_value()) {
          arr.push_back(plx_to_nlohmann(el));
        }
        return arr;
      }
      case plx_variant::map_state: {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& pair : var.map_value()) {
          obj[pair.first.to_std_const()] = plx_to_nlohmann(pair.second);
        }
        return obj;
      }
      case plx_variant::none:
      default:
        return nullptr;
    }
  }

  plx_string dump_json(const nlohmann::json& j_obj, int indent) {
    try {
      // Invalid UTF-8 in extracted text is replaced instead of failing the dump
      return plx_string(j_obj.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const nlohmann::json::type_error& e) {
      std::cerr << "JSON dump type error: " << e.what() << std::endl;
      return plx_string("");
    }
  }

} // namespace

plx_json::plx_json(plxv_map* map_ptr) : data_map(map_ptr) {
  if (!data_map) {
    throw std::invalid_argument("plx_json constructor received a nullptr for data_map");
  }
}

bool plx_json::parse(const plx_string& json_string) {
  data_map->clear();

  try {
    nlohmann::json parsed_json = nlohmann::json::parse(json_string.to_std_const());

    if (parsed_json.is_object()) {
      for (auto it = parsed_json.begin(); it != parsed_json.end(); ++it) {
        (*data_map)[plx_string(it.key())] = nlohmann_to_plx(it.value());
      }
      return true;
    }

    std::cerr << "Error: JSON string does not represent an object at the top level." << std::endl;
    return false;

  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "JSON parse error: " << e.what()
              << " at byte " << e.byte << std::endl;
    return false;
  }
}

plx_string plx_json::create(int indent) const {
  nlohmann::json j_obj = nlohmann::json::object();
  for (const auto& pair : *data_map) {
    j_obj[pair.first.to_std_const()] = plx_to_nlohmann(pair.second);
  }
  return dump_json(j_obj, indent);
}

plx_string plx_json::dump(const plx_variant& value, int indent) {
  return dump_json(plx_to_nlohmann(value), indent);
}
