#include "plx_expr_evaluator.h"
#include "../plx_errors.h"
#include <cmath>

namespace plx::processors::expr {

namespace {

  long long int_of(const plx_variant& value) {
    if (value.is_bool()) {
      return value.bool_value() ? 1 : 0;
    }
    return value.int_value();
  }

  bool is_integral(const plx_variant& value) {
    return value.is_int() || value.is_bool();
  }

  // Integer + - * that leave the long long range continue as floats
  plx_variant int_arithmetic(const plx_string& op, long long x, long long y) {
    long long r = 0;
    bool overflow = false;
    if (op == "+") {
      overflow = __builtin_add_overflow(x, y, &r);
      if (overflow) return plx_variant(static_cast<double>(x) + static_cast<double>(y));
    } else if (op == "-") {
      overflow = __builtin_sub_overflow(x, y, &r);
      if (overflow) return plx_variant(static_cast<double>(x) - static_cast<double>(y));
    } else {
      overflow = __builtin_mul_overflow(x, y, &r);
      if (overflow) return plx_variant(static_cast<double>(x) * static_cast<double>(y));
    }
    return plx_variant(r);
  }

  // Doubles too large for an exact long long stay floats
  plx_variant rounded_int(double value) {
    double r = std::nearbyint(value);
    if (!std::isfinite(r) || std::fabs(r) >= 9.0e15) {
      return plx_variant(r);
    }
    return plx_variant(static_cast<long long>(r));
  }

  // Keeps the projection stack balanced when evaluation throws
  class element_scope {
    std::vector<const plx_variant*>& stack;
  public:
    element_scope(std::vector<const plx_variant*>& stack, const plx_variant* element) : stack(stack) {
      stack.push_back(element);
    }
    ~element_scope() {
      stack.pop_back();
    }
    element_scope(const element_scope&) = delete;
    element_scope& operator=(const element_scope&) = delete;
  };

} // namespace

plx_expr_evaluator::plx_expr_evaluator(const plxv_map& root, plx_execution_log* sink)
  : root_value(root), sink(sink) {}

plx_variant plx_expr_evaluator::evaluate(const node_ptr& expression) {
  if (!expression) {
    throw plx_expression_error("Empty expression");
  }
  return eval(*expression);
}

plx_string plx_expr_evaluator::type_name(const plx_variant& value) {
  switch (value.in_state()) {
    case plx_variant::string_state: return "str";
    case plx_variant::int_state: return "int";
    case plx_variant::bool_state: return "bool";
    case plx_variant::double_state: return "float";
    case plx_variant::vector_state: return "list";
    case plx_variant::map_state: return "map";
    case plx_variant::none:
    default:
      return "none";
  }
}

bool plx_expr_evaluator::truthy(const plx_variant& value) {
  switch (value.in_state()) {
    case plx_variant::string_state: return !value.string_value().empty();
    case plx_variant::int_state: return value.int_value() != 0;
    case plx_variant::bool_state: return value.bool_value();
    case plx_variant::double_state: return value.double_value() != 0.0;
    case plx_variant::vector_state: return !value.vector_value().empty();
    case plx_variant::map_state: return !value.map_value().empty();
    case plx_variant::none:
    default:
      return false;
  }
}

bool plx_expr_evaluator::values_equal(const plx_variant& a, const plx_variant& b) {
  if (a.is_number() && b.is_number()) {
    if (is_integral(a) && is_integral(b)) {
      return int_of(a) == int_of(b);
    }
    return a.number_value() == b.number_value();
  }
  if (a.is_vector() && b.is_vector()) {
    const plxv_vector& left = a.vector_value();
    const plxv_vector& right = b.vector_value();
    if (left.size() != right.size()) {
      return false;
    }
    for (size_t i = 0; i < left.size(); ++i) {
      if (!values_equal(left[i], right[i])) {
        return false;
      }
    }
    return true;
  }
  if (a.is_map() && b.is_map()) {
    const plxv_map& left = a.map_value();
    const plxv_map& right = b.map_value();
    if (left.size() != right.size()) {
      return false;
    }
    for (const auto& pair : left) {
      auto it = right.find(pair.first);
      if (it == right.end() || !values_equal(pair.second, it->second)) {
        return false;
      }
    }
    return true;
  }
  return a == b;
}

int plx_expr_evaluator::compare_values(const plx_variant& a, const plx_variant& b, const plx_string& op) {
  if (a.is_number() && b.is_number()) {
    if (is_integral(a) && is_integral(b)) {
      long long x = int_of(a);
      long long y = int_of(b);
      return x < y ? -1 : (x > y ? 1 : 0);
    }
    double x = a.number_value();
    double y = b.number_value();
    return x < y ? -1 : (x > y ? 1 : 0);
  }
  if (a.is_string() && b.is_string()) {
    int c = a.string_value().to_std_const().compare(b.string_value().to_std_const());
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  if (a.is_vector() && b.is_vector()) {
    const plxv_vector& left = a.vector_value();
    const plxv_vector& right = b.vector_value();
    for (size_t i = 0; i < left.size() && i < right.size(); ++i) {
      if (!values_equal(left[i], right[i])) {
        return compare_values(left[i], right[i], op);
      }
    }
    return left.size() < right.size() ? -1 : (left.size() > right.size() ? 1 : 0);
  }
  throw plx_expression_error(plx_string("'") + op + "' not supported between '" +
                             type_name(a) + "' and '" + type_name(b) + "'");
}

plx_variant plx_expr_evaluator::arithmetic(const plx_string& op, const plx_variant& a, const plx_variant& b) {
  if (a.is_number() && b.is_number()) {
    bool ints = is_integral(a) && is_integral(b);
    if (op == "/") {
      if (b.number_value() == 0.0) {
        throw plx_expression_error("division by zero");
      }
      return plx_variant(a.number_value() / b.number_value());
    }
    if (op == "%") {
      if (b.number_value() == 0.0) {
        throw plx_expression_error("modulo by zero");
      }
      if (ints) {
        long long x = int_of(a);
        long long y = int_of(b);
        if (y == -1) {
          return plx_variant(0LL);
        }
        long long r = x % y;
        if (r != 0 && ((r < 0) != (y < 0))) {
          r += y;
        }
        return plx_variant(r);
      }
      double y = b.number_value();
      double r = std::fmod(a.number_value(), y);
      if (r != 0.0 && ((r < 0.0) != (y < 0.0))) {
        r += y;
      }
      return plx_variant(r);
    }
    if (ints) {
      if (op == "+" || op == "-" || op == "*") {
        return int_arithmetic(op, int_of(a), int_of(b));
      }
    } else {
      double x = a.number_value();
      double y = b.number_value();
      if (op == "+") return plx_variant(x + y);
      if (op == "-") return plx_variant(x - y);
      if (op == "*") return plx_variant(x * y);
    }
  }
  if (op == "+" && a.is_string() && b.is_string()) {
    return plx_variant(a.string_value() + b.string_value());
  }
  if (op == "+" && a.is_vector() && b.is_vector()) {
    plxv_vector joined = a.vector_value();
    joined.insert(joined.end(), b.vector_value().begin(), b.vector_value().end());
    return plx_variant(joined);
  }
  throw plx_expression_error(plx_string("unsupported operand types for ") + op + ": '" +
                             type_name(a) + "' and '" + type_name(b) + "'");
}

bool plx_expr_evaluator::contains(const plx_variant& container, const plx_variant& item) {
  if (container.is_string()) {
    if (!item.is_string()) {
      throw plx_expression_error(plx_string("'in <str>' requires str as left operand, not ") + type_name(item));
    }
    return container.string_value().contains(item.string_value());
  }
  if (container.is_vector()) {
    for (const auto& element : container.vector_value()) {
      if (values_equal(element, item)) {
        return true;
      }
    }
    return false;
  }
  if (container.is_map()) {
    if (!item.is_string()) {
      return false;
    }
    return container.map_value().count(item.string_value()) > 0;
  }
  throw plx_expression_error(plx_string("argument of type '") + type_name(container) + "' is not iterable");
}

plx_variant plx_expr_evaluator::eval(const node& n) {
  switch (n.type) {
    case node::kind::literal:
      return n.value;

    case node::kind::list: {
      plxv_vector items;
      for (const auto& child : n.children) {
        items.push_back(eval(*child));
      }
      return plx_variant(items);
    }

    case node::kind::empty_map:
      return plx_variant(plxv_map());

    case node::kind::root:
      return root_value;

    case node::kind::name: {
      const plxv_map& root = root_value.map_value();
      auto it = root.find(n.text);
      if (it == root.end()) {
        throw plx_missing_field_error(n.text);
      }
      return it->second;
    }

    case node::kind::element:
      if (elements.empty()) {
        throw plx_expression_error("Projection element used outside a projection");
      }
      return *elements.back();

    case node::kind::member:
      return eval_member(n);

    case node::kind::index:
      return eval_index(n);

    case node::kind::projection:
      return eval_projection(n);

    case node::kind::method_get:
      return eval_get(n);

    case node::kind::call:
      return eval_call(n);

    case node::kind::negate: {
      plx_variant operand = eval(*n.children[0]);
      if (is_integral(operand)) {
        return int_arithmetic("-", 0, int_of(operand));
      }
      if (operand.is_double()) {
        return plx_variant(-operand.double_value());
      }
      throw plx_expression_error(plx_string("bad operand type for unary -: '") + type_name(operand) + "'");
    }

    case node::kind::logical_not:
      return plx_variant(!truthy(eval(*n.children[0])));

    case node::kind::binary: {
      plx_variant left = eval(*n.children[0]);
      plx_variant right = eval(*n.children[1]);
      return arithmetic(n.text, left, right);
    }

    case node::kind::logical: {
      plx_variant left = eval(*n.children[0]);
      if (n.text == "and") {
        return truthy(left) ? eval(*n.children[1]) : left;
      }
      return truthy(left) ? left : eval(*n.children[1]);
    }

    case node::kind::compare:
      return eval_compare(n);

    case node::kind::sum_path:
      return eval_sum_path(n);
  }
  throw plx_expression_error("Unknown expression node");
}

plx_variant plx_expr_evaluator::eval_member(const node& n) {
  plx_variant base = eval(*n.children[0]);
  if (!base.is_map()) {
    throw plx_expression_error(plx_string("'") + type_name(base) + "' object has no attribute '" + n.text + "'");
  }
  const plxv_map& map = base.map_value();
  auto it = map.find(n.text);
  if (it == map.end()) {
    throw plx_missing_field_error(n.text);
  }
  return it->second;
}

plx_variant plx_expr_evaluator::eval_index(const node& n) {
  plx_variant base = eval(*n.children[0]);
  plx_variant key = eval(*n.children[1]);

  if (base.is_map()) {
    plx_string name = key.is_string() ? key.string_value() : key.describe();
    const plxv_map& map = base.map_value();
    auto it = map.find(name);
    if (it == map.end()) {
      throw plx_missing_field_error(name);
    }
    return it->second;
  }

  if (base.is_vector() || base.is_string()) {
    if (!is_integral(key)) {
      throw plx_expression_error(plx_string("indices must be integers, not ") + type_name(key));
    }
    long long size = base.is_vector() ? static_cast<long long>(base.vector_value().size())
                                      : static_cast<long long>(base.string_value().size());
    long long index = int_of(key);
    if (index < 0) {
      index += size;
    }
    if (index < 0 || index >= size) {
      throw plx_expression_error(base.is_vector() ? "list index out of range" : "string index out of range");
    }
    if (base.is_vector()) {
      return base.vector_value()[static_cast<size_t>(index)];
    }
    return plx_variant(plx_string(base.string_value()[static_cast<size_t>(index)]));
  }

  throw plx_expression_error(plx_string("'") + type_name(base) + "' object is not subscriptable");
}

plx_variant plx_expr_evaluator::eval_projection(const node& n) {
  plx_variant base = eval(*n.children[0]);
  if (!base.is_vector()) {
    throw plx_expression_error(plx_string("[] needs a list, got '") + type_name(base) + "'");
  }
  plxv_vector result;
  for (const auto& element : base.vector_value()) {
    element_scope scope(elements, &element);
    result.push_back(eval(*n.children[1]));
  }
  return plx_variant(result);
}

plx_variant plx_expr_evaluator::eval_get(const node& n) {
  plx_variant base = eval(*n.children[0]);
  if (!base.is_map()) {
    throw plx_expression_error(plx_string("'") + type_name(base) + "' object has no attribute 'get'");
  }
  plx_variant key = eval(*n.children[1]);
  plx_variant fallback = n.children.size() > 2 ? eval(*n.children[2]) : plx_variant();
  if (!key.is_string()) {
    return fallback;
  }
  const plxv_map& map = base.map_value();
  auto it = map.find(key.string_value());
  return it == map.end() ? fallback : it->second;
}

plx_variant plx_expr_evaluator::eval_call(const node& n) {
  std::vector<plx_variant> args;
  for (const auto& child : n.children) {
    args.push_back(eval(*child));
  }
  const plx_string& fn = n.text;

  auto expect_args = [&](size_t min_count, size_t max_count) {
    if (args.size() < min_count || args.size() > max_count) {
      throw plx_expression_error(fn + "() takes " + plx_string(static_cast<long long>(min_count)) +
                                 (max_count != min_count ? plx_string(" or more") : plx_string("")) +
                                 " arguments, " + plx_string(static_cast<long long>(args.size())) + " given");
    }
  };
  auto iterable = [&](const plx_variant& value) -> plxv_vector {
    if (value.is_vector()) {
      return value.vector_value();
    }
    if (value.is_map()) {
      plxv_vector keys;
      for (const auto& pair : value.map_value()) {
        keys.push_back(plx_variant(pair.first));
      }
      return keys;
    }
    throw plx_expression_error(plx_string("'") + type_name(value) + "' object is not iterable");
  };

  if (fn == "len") {
    expect_args(1, 1);
    const plx_variant& value = args[0];
    if (value.is_string()) return plx_variant(static_cast<long long>(value.string_value().size()));
    if (value.is_vector()) return plx_variant(static_cast<long long>(value.vector_value().size()));
    if (value.is_map()) return plx_variant(static_cast<long long>(value.map_value().size()));
    throw plx_expression_error(plx_string("object of type '") + type_name(value) + "' has no len()");
  }

  if (fn == "sum") {
    expect_args(1, 2);
    plx_variant total = args.size() > 1 ? args[1] : plx_variant(0LL);
    for (const auto& item : iterable(args[0])) {
      if (!item.is_number() || !total.is_number()) {
        throw plx_expression_error(plx_string("unsupported operand types for +: '") +
                                   type_name(total) + "' and '" + type_name(item) + "'");
      }
      total = arithmetic("+", total, item);
    }
    return total;
  }

  if (fn == "min" || fn == "max") {
    expect_args(1, static_cast<size_t>(-1));
    plxv_vector candidates = args.size() == 1 ? iterable(args[0]) : args;
    if (candidates.empty()) {
      throw plx_expression_error(fn + "() arg is an empty sequence");
    }
    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
      int c = compare_values(candidates[i], candidates[best], fn == "min" ? "<" : ">");
      if ((fn == "min" && c < 0) || (fn == "max" && c > 0)) {
        best = i;
      }
    }
    return candidates[best];
  }

  if (fn == "all" || fn == "any") {
    expect_args(1, 1);
    bool want_all = fn == "all";
    for (const auto& item : iterable(args[0])) {
      bool t = truthy(item);
      if (want_all && !t) return plx_variant(false);
      if (!want_all && t) return plx_variant(true);
    }
    return plx_variant(want_all);
  }

  if (fn == "abs") {
    expect_args(1, 1);
    const plx_variant& value = args[0];
    if (is_integral(value)) {
      long long x = int_of(value);
      return x < 0 ? int_arithmetic("-", 0, x) : plx_variant(x);
    }
    if (value.is_double()) return plx_variant(std::fabs(value.double_value()));
    throw plx_expression_error(plx_string("bad operand type for abs(): '") + type_name(value) + "'");
  }

  if (fn == "round") {
    expect_args(1, 2);
    const plx_variant& value = args[0];
    if (!value.is_number()) {
      throw plx_expression_error(plx_string("type ") + type_name(value) + " doesn't define round()");
    }
    if (args.size() == 1 || args[1].is_null()) {
      if (is_integral(value)) return plx_variant(int_of(value));
      // nearbyint rounds half to even in the default rounding mode
      return rounded_int(value.double_value());
    }
    if (!is_integral(args[1])) {
      throw plx_expression_error("round() digits must be an integer");
    }
    if (is_integral(value)) return plx_variant(int_of(value));
    double scale = std::pow(10.0, static_cast<double>(int_of(args[1])));
    return plx_variant(std::nearbyint(value.double_value() * scale) / scale);
  }

  throw plx_expression_error(plx_string("Unknown function '") + fn + "'");
}

plx_variant plx_expr_evaluator::eval_compare(const node& n) {
  plx_variant left = eval(*n.children[0]);
  for (size_t i = 0; i < n.ops.size(); ++i) {
    plx_variant right = eval(*n.children[i + 1]);
    const plx_string& op = n.ops[i];
    bool result = false;
    if (op == "==") {
      result = values_equal(left, right);
    } else if (op == "!=") {
      result = !values_equal(left, right);
    } else if (op == "in") {
      result = contains(right, left);
    } else if (op == "not in") {
      result = !contains(right, left);
    } else {
      int c = compare_values(left, right, op);
      if (op == "<") result = c < 0;
      else if (op == "<=") result = c <= 0;
      else if (op == ">") result = c > 0;
      else if (op == ">=") result = c >= 0;
    }
    if (!result) {
      return plx_variant(false);
    }
    left = right;
  }
  return plx_variant(true);
}

plx_variant plx_expr_evaluator::eval_sum_path(const node& n) {
  plx_string path = path_to_string(n.path);
  std::vector<const plx_variant*> current = {&root_value};

  for (size_t i = 0; i + 1 < n.path.size(); ++i) {
    const path_segment& segment = n.path[i];
    std::vector<const plx_variant*> next;
    for (const plx_variant* value : current) {
      if (!value->is_map()) {
        if (sink) sink->warn(plx_string("Cannot navigate path ") + path + ": expected a map at " + segment.name);
        continue;
      }
      auto it = value->map_value().find(segment.name);
      if (it == value->map_value().end() || it->second.is_null()) {
        if (sink) sink->warn(plx_string("Path ") + path + " not found in data");
        continue;
      }
      if (!segment.is_array) {
        next.push_back(&it->second);
        continue;
      }
      if (!it->second.is_vector()) {
        if (sink) sink->warn(plx_string("Expected array at ") + segment.name + " in " + path +
                           ", got " + type_name(it->second));
        continue;
      }
      // Nested arrays flatten
      for (const auto& element : it->second.vector_value()) {
        next.push_back(&element);
      }
    }
    current = next;
  }

  const path_segment& last = n.path.back();
  double total = 0.0;
  auto add = [&](const plx_variant& value) {
    if (value.is_null()) {
      return;
    }
    if (value.is_number()) {
      total += value.number_value();
      return;
    }
    double parsed = 0.0;
    if (value.is_string() && value.string_value().parse_double(parsed)) {
      total += parsed;
      return;
    }
    if (sink) sink->warn(plx_string("Cannot convert ") + value.describe() + " to number in sum");
  };

  for (const plx_variant* value : current) {
    if (!value->is_map()) {
      if (sink) sink->warn(plx_string("Expected map in array, got ") + type_name(*value));
      continue;
    }
    auto it = value->map_value().find(last.name);
    if (it == value->map_value().end()) {
      if (sink) sink->warn(plx_string("Missing field ") + last.name + " in sum, counted as 0");
      continue;
    }
    if (last.is_array && it->second.is_vector()) {
      for (const auto& element : it->second.vector_value()) {
        add(element);
      }
      continue;
    }
    add(it->second);
  }
  return plx_variant(total);
}

} // namespace plx::processors::expr
