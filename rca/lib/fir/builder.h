#ifndef RCA_LIB_FIR_BUILDER_H_
#define RCA_LIB_FIR_BUILDER_H_
#include <fir/fir.h>

namespace rca::fir {

// Incrementally assembles a well-typed package. Ids are allocated densely in creation order.
// Types of derived expressions (calls, operators, blocks) are computed from their operands.
class package_builder {
 public:
  //patterns
  pat_id bind(std::string_view name, ty::t type);
  pat_id discard(ty::t type);
  pat_id tuple_pat(std::vector<pat_id> items);
  node_id node_of(pat_id bind_pat) const;

  //expressions
  expr_id add_expr(ty::t type, expr_kind::t kind);
  expr_id lit(std::string_view text, ty::t type);
  expr_id bool_lit(bool value);
  expr_id int_lit(int64_t value);
  expr_id double_lit(double value);
  expr_id unit_lit();
  expr_id local_var(pat_id bind_pat);
  expr_id item_ref(item_id target, ty::t type);
  expr_id callable_ref(local_item_id callable);
  // reference to a callable declared in another package
  expr_id callable_ref(package_id other, const package &p, local_item_id callable);
  expr_id call(expr_id callee, expr_id args);
  expr_id tuple(std::vector<expr_id> items);
  expr_id array(std::vector<expr_id> items, ty::t item_type);
  expr_id index(expr_id array, expr_id index);
  expr_id bin_op(binary_operator op, expr_id lhs, expr_id rhs);
  expr_id un_op(unary_operator op, expr_id operand);
  expr_id adjoint(expr_id operand) { return un_op(unary_operator::functor_adj, operand); }
  expr_id controlled(expr_id operand) { return un_op(unary_operator::functor_ctl, operand); }
  expr_id if_(expr_id cond, expr_id body, std::optional<expr_id> otherwise = std::nullopt);
  expr_id while_(expr_id cond, block_id body);
  expr_id block_expr(block_id b);
  expr_id assign(expr_id lhs, expr_id rhs);
  expr_id assign_op(binary_operator op, expr_id lhs, expr_id rhs);
  expr_id return_(expr_id value);
  expr_id closure(std::vector<node_id> captures, local_item_id target);
  expr_id fail(expr_id msg, ty::t type);
  expr_id string(std::vector<std::variant<std::string, expr_id>> components);

  //statements
  stmt_id expr_stmt(expr_id e);
  stmt_id semi(expr_id e);
  stmt_id local(pat_id p, expr_id value, mutability mut = mutability::immutable);
  stmt_id item_stmt(local_item_id i);

  block_id block(std::vector<stmt_id> stmts);

  //items
  local_item_id namespace_(std::string_view name, std::vector<local_item_id> items = {});
  local_item_id type_decl(std::string_view name, ty::t underlying);
  local_item_id intrinsic(callable_kind kind, std::string_view name, pat_id input, ty::t output);
  // binds one parameter per type: none gives a unit pattern, one a single binding, more a tuple
  local_item_id intrinsic(callable_kind kind, std::string_view name, const std::vector<ty::t> &params, ty::t output);
  local_item_id callable(callable_kind kind, std::string_view name, pat_id input, ty::t output, block_id body);
  // declares a callable whose body is supplied later with set_body, so that bodies may refer to it
  local_item_id declare(callable_kind kind, std::string_view name, pat_id input, ty::t output);
  void set_body(local_item_id callable, block_id body);
  void set_adj(local_item_id callable, block_id body);
  void set_ctl(local_item_id callable, pat_id ctls, block_id body);
  void set_ctl_adj(local_item_id callable, pat_id ctls, block_id body);
  void add_to_namespace(local_item_id ns, local_item_id i);

  const package &peek() const { return pkg; }
  package finish() { return std::move(pkg); }

 private:
  const ty::t &type_of(expr_id e) const;
  local_item_id add_item(item_kind::t kind);
  spec_impl &impl_of(local_item_id callable);
  spec_decl make_spec(block_id body, std::optional<pat_id> ctls);
  package pkg;
  node_id next_node = 0;
};

}

#endif //RCA_LIB_FIR_BUILDER_H_
