#ifndef PLX_EXPR_AST_H
#define PLX_EXPR_AST_H

#include "../../utils/plx_variant.h"
#include <memory>
#include <vector>

namespace plx::processors::expr {

// Grammar a parser accepts: arithmetic formulas over sum(path) atoms, or
// boolean predicates over the extracted tree.
enum class grammar_mode {
  formula,
  predicate
};

// One segment of a dotted data path, "players[]" is an array segment
struct path_segment {
  plx_string name;
  bool is_array = false;
};

struct node;
typedef std::shared_ptr<node> node_ptr;

struct node {
  enum class kind {
    literal,      // value
    list,         // children are the items
    empty_map,
    root,         // the whole tree ("data")
    name,         // text is a top-level key of the tree
    element,      // current element inside a projection
    member,       // children[0].text
    index,        // children[0][children[1]]
    projection,   // children[1] evaluated per element of children[0]
    method_get,   // children[0].get(children[1] [, children[2]])
    call,         // helper text(children...)
    negate,
    logical_not,
    binary,       // text is + - * / %
    logical,      // text is and / or
    compare,      // children chained by ops (== != < <= > >= in, not in)
    sum_path      // formula atom sum(path)
  };

  kind type = kind::literal;
  plx_variant value;
  plx_string text;
  std::vector<node_ptr> children;
  std::vector<plx_string> ops;
  std::vector<path_segment> path;
  size_t position = 0;
};

// Dotted path as written, e.g. "team.players[].fouls"
plx_string path_to_string(const std::vector<path_segment>& path);

} // namespace plx::processors::expr

#endif // PLX_EXPR_AST_H
