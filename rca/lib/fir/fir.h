#ifndef RCA_LIB_FIR_FIR_H_
#define RCA_LIB_FIR_FIR_H_
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <cstddef>
#include <util/util.h>
#include <util/index_map.h>
#include <fir/ty.h>

// Flattened, fully type-checked program representation consumed by the analysis. Read-only input.
namespace rca::fir {

typedef size_t package_id;
typedef size_t local_item_id;
typedef size_t block_id;
typedef size_t stmt_id;
typedef size_t expr_id;
typedef size_t pat_id;
typedef size_t node_id;

struct item_id {
  std::optional<package_id> package; //none: same package as the referencing expression
  local_item_id item;
  bool operator==(const item_id &o) const { return package == o.package && item == o.item; }
};

struct local {
  node_id id;
  bool operator==(const local &o) const { return id == o.id; }
};
typedef std::variant<item_id, local> res;

enum class binary_operator {
  add, and_b, and_l, div, eq, exp, gt, gte, lt, lte, mod, mul, neq, or_b, or_l, shl, shr, sub, xor_b
};
enum class unary_operator { functor_adj, functor_ctl, neg, not_b, not_l, pos, unwrap };
inline bool is_functor(unary_operator op) {
  return op == unary_operator::functor_adj || op == unary_operator::functor_ctl;
}
enum class mutability { immutable, mut };

namespace pat_kind {
struct bind {
  node_id id;
  std::string name;
};
struct discard {};
struct tuple { std::vector<pat_id> items; };
typedef std::variant<bind, discard, tuple> t;
}

struct pat {
  pat_id id;
  ty::t ty;
  pat_kind::t kind;
};

namespace expr_kind {
struct array { std::vector<expr_id> items; };
struct array_repeat { expr_id item, size; };
struct assign { expr_id lhs, rhs; };
struct assign_op {
  binary_operator op;
  expr_id lhs, rhs;
};
struct assign_field {
  expr_id record;
  std::string field;
  expr_id replace;
};
struct assign_index { expr_id array, index, replace; };
struct bin_op {
  binary_operator op;
  expr_id lhs, rhs;
};
struct block { block_id id; };
struct call { expr_id callee, args; };
struct closure {
  std::vector<node_id> captures;
  local_item_id item;
};
struct fail { expr_id msg; };
struct field {
  expr_id record;
  std::string field;
};
struct hole {};
struct if_ {
  expr_id cond, body;
  std::optional<expr_id> otherwise;
};
struct index { expr_id array, index; };
struct lit { std::string text; };
struct range { std::optional<expr_id> start, step, end; };
struct return_ { expr_id value; };
struct string { std::vector<std::variant<std::string, expr_id>> components; };
struct tuple { std::vector<expr_id> items; };
struct un_op {
  unary_operator op;
  expr_id operand;
};
struct update_field {
  expr_id record;
  std::string field;
  expr_id replace;
};
struct update_index { expr_id array, index, replace; };
struct var { res target; };
struct while_ {
  expr_id cond;
  block_id body;
};
typedef std::variant<array, array_repeat, assign, assign_op, assign_field, assign_index, bin_op, block, call,
                     closure, fail, field, hole, if_, index, lit, range, return_, string, tuple, un_op,
                     update_field, update_index, var, while_> t;
}

struct expr {
  expr_id id;
  ty::t ty;
  expr_kind::t kind;
};

namespace stmt_kind {
struct expr { expr_id id; };
struct semi { expr_id id; };
struct local {
  mutability mut;
  pat_id pat;
  expr_id value;
};
struct item { local_item_id id; };
typedef std::variant<expr, semi, local, item> t;
}

struct stmt {
  stmt_id id;
  stmt_kind::t kind;
};

struct block {
  block_id id;
  ty::t ty;
  std::vector<stmt_id> stmts;
};

struct spec_decl {
  node_id id;
  block_id block;
  std::optional<pat_id> input; //control register of controlled specializations
};

struct spec_impl {
  spec_decl body;
  std::optional<spec_decl> adj, ctl, ctl_adj;
};

struct intrinsic {};

struct callable_decl {
  std::string name;
  callable_kind kind;
  pat_id input;
  ty::t output;
  std::variant<intrinsic, spec_impl> implementation;
  bool is_intrinsic() const { return std::holds_alternative<intrinsic>(implementation); }
};

namespace item_kind {
struct callable { callable_decl decl; };
struct namespace_ {
  std::string name;
  std::vector<local_item_id> items;
};
struct ty {
  std::string name;
  fir::ty::t underlying;
};
typedef std::variant<callable, namespace_, ty> t;
}

struct item {
  local_item_id id;
  std::optional<local_item_id> parent;
  item_kind::t kind;
  // nullptr for non-callable items
  const callable_decl *as_callable() const;
  std::string_view name() const;
};

struct package {
  util::index_map<local_item_id, item> items;
  util::index_map<block_id, block> blocks;
  util::index_map<stmt_id, stmt> stmts;
  util::index_map<expr_id, expr> exprs;
  util::index_map<pat_id, pat> pats;

  // all getters throw error::missing_node when the id is absent
  const item &get_item(local_item_id id) const;
  const block &get_block(block_id id) const;
  const stmt &get_stmt(stmt_id id) const;
  const expr &get_expr(expr_id id) const;
  const pat &get_pat(pat_id id) const;
  const callable_decl &get_callable(local_item_id id) const;

  // first callable item with the given name
  std::optional<local_item_id> find_callable(std::string_view name) const;
};

struct package_store {
  util::index_map<package_id, package> packages;
  const package &get(package_id id) const;
  package_id insert(package &&p);
};

}

#endif //RCA_LIB_FIR_FIR_H_
