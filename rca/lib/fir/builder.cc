#include <fir/builder.h>
#include <error/error.h>
#include <limits>

namespace rca::fir {

namespace {
// body block of a callable declared but not yet defined
constexpr block_id undefined_block = std::numeric_limits<block_id>::max();

ty::t arrow_type(const callable_decl &decl, const package &p) {
  return ty::arrow_of(decl.kind, p.get_pat(decl.input).ty, decl.output);
}
}

pat_id package_builder::bind(std::string_view name, ty::t type) {
  const pat_id id = pkg.pats.next_key();
  pkg.pats.insert(id, pat{.id=id, .ty=std::move(type), .kind=pat_kind::bind{.id=next_node++, .name=std::string(name)}});
  return id;
}

pat_id package_builder::discard(ty::t type) {
  const pat_id id = pkg.pats.next_key();
  pkg.pats.insert(id, pat{.id=id, .ty=std::move(type), .kind=pat_kind::discard{}});
  return id;
}

pat_id package_builder::tuple_pat(std::vector<pat_id> items) {
  std::vector<ty::t> types;
  for (pat_id p : items)types.push_back(pkg.get_pat(p).ty);
  const pat_id id = pkg.pats.next_key();
  pkg.pats.insert(id, pat{.id=id, .ty=ty::tuple_of(std::move(types)), .kind=pat_kind::tuple{std::move(items)}});
  return id;
}

node_id package_builder::node_of(pat_id bind_pat) const {
  const pat &p = pkg.get_pat(bind_pat);
  if (auto b = std::get_if<pat_kind::bind>(&p.kind))return b->id;
  throw error::malformed_fir("pattern " + std::to_string(bind_pat) + " is not a binding");
}

const ty::t &package_builder::type_of(expr_id e) const { return pkg.get_expr(e).ty; }

expr_id package_builder::add_expr(ty::t type, expr_kind::t kind) {
  const expr_id id = pkg.exprs.next_key();
  pkg.exprs.insert(id, expr{.id=id, .ty=std::move(type), .kind=std::move(kind)});
  return id;
}

expr_id package_builder::lit(std::string_view text, ty::t type) {
  return add_expr(std::move(type), expr_kind::lit{std::string(text)});
}
expr_id package_builder::bool_lit(bool value) { return lit(value ? "true" : "false", ty::make(ty::prim::boolean)); }
expr_id package_builder::int_lit(int64_t value) { return lit(std::to_string(value), ty::make(ty::prim::integer)); }
expr_id package_builder::double_lit(double value) { return lit(util::to_string(value), ty::make(ty::prim::dbl)); }
expr_id package_builder::unit_lit() { return add_expr(ty::unit(), expr_kind::tuple{}); }

expr_id package_builder::local_var(pat_id bind_pat) {
  return add_expr(pkg.get_pat(bind_pat).ty, expr_kind::var{fir::local{node_of(bind_pat)}});
}

expr_id package_builder::item_ref(item_id target, ty::t type) {
  return add_expr(std::move(type), expr_kind::var{target});
}

expr_id package_builder::callable_ref(local_item_id callable) {
  return item_ref(item_id{.package=std::nullopt, .item=callable}, arrow_type(pkg.get_callable(callable), pkg));
}

expr_id package_builder::callable_ref(package_id other, const package &p, local_item_id callable) {
  return item_ref(item_id{.package=other, .item=callable}, arrow_type(p.get_callable(callable), p));
}

expr_id package_builder::call(expr_id callee, expr_id args) {
  const ty::t &ct = type_of(callee);
  auto arrow = std::get_if<ty::arrow>(&ct);
  if (arrow == nullptr)throw error::malformed_fir("call to expression " + std::to_string(callee) + " of non-callable type");
  return add_expr(*arrow->output, expr_kind::call{.callee=callee, .args=args});
}

expr_id package_builder::tuple(std::vector<expr_id> items) {
  std::vector<ty::t> types;
  for (expr_id e : items)types.push_back(type_of(e));
  return add_expr(ty::tuple_of(std::move(types)), expr_kind::tuple{std::move(items)});
}

expr_id package_builder::array(std::vector<expr_id> items, ty::t item_type) {
  return add_expr(ty::array_of(std::move(item_type)), expr_kind::array{std::move(items)});
}

expr_id package_builder::index(expr_id array, expr_id index) {
  auto at = std::get_if<ty::array>(&type_of(array));
  if (at == nullptr)throw error::malformed_fir("indexing expression " + std::to_string(array) + " of non-array type");
  return add_expr(*at->item, expr_kind::index{.array=array, .index=index});
}

expr_id package_builder::bin_op(binary_operator op, expr_id lhs, expr_id rhs) {
  typedef binary_operator o;
  const bool to_bool = util::is_in(op, {o::eq, o::neq, o::gt, o::gte, o::lt, o::lte, o::and_l, o::or_l});
  ty::t type = to_bool ? ty::make(ty::prim::boolean) : type_of(lhs);
  return add_expr(std::move(type), expr_kind::bin_op{.op=op, .lhs=lhs, .rhs=rhs});
}

expr_id package_builder::un_op(unary_operator op, expr_id operand) {
  ty::t type = type_of(operand);
  if (op == unary_operator::functor_ctl) {
    auto arrow = std::get_if<ty::arrow>(&type);
    if (arrow == nullptr)throw error::malformed_fir("Controlled applied to a non-callable expression");
    type = ty::arrow_of(arrow->kind, ty::tuple_of({ty::array_of(ty::make(ty::prim::qubit)), *arrow->input}),
                        *arrow->output);
  }
  return add_expr(std::move(type), expr_kind::un_op{.op=op, .operand=operand});
}

expr_id package_builder::if_(expr_id cond, expr_id body, std::optional<expr_id> otherwise) {
  ty::t type = otherwise.has_value() ? type_of(body) : ty::unit();
  return add_expr(std::move(type), expr_kind::if_{.cond=cond, .body=body, .otherwise=otherwise});
}

expr_id package_builder::while_(expr_id cond, block_id body) {
  return add_expr(ty::unit(), expr_kind::while_{.cond=cond, .body=body});
}

expr_id package_builder::block_expr(block_id b) {
  return add_expr(pkg.get_block(b).ty, expr_kind::block{b});
}

expr_id package_builder::assign(expr_id lhs, expr_id rhs) {
  return add_expr(ty::unit(), expr_kind::assign{.lhs=lhs, .rhs=rhs});
}

expr_id package_builder::assign_op(binary_operator op, expr_id lhs, expr_id rhs) {
  return add_expr(ty::unit(), expr_kind::assign_op{.op=op, .lhs=lhs, .rhs=rhs});
}

expr_id package_builder::return_(expr_id value) {
  return add_expr(ty::unit(), expr_kind::return_{value});
}

expr_id package_builder::closure(std::vector<node_id> captures, local_item_id target) {
  return add_expr(arrow_type(pkg.get_callable(target), pkg),
                  expr_kind::closure{.captures=std::move(captures), .item=target});
}

expr_id package_builder::fail(expr_id msg, ty::t type) {
  return add_expr(std::move(type), expr_kind::fail{msg});
}

expr_id package_builder::string(std::vector<std::variant<std::string, expr_id>> components) {
  return add_expr(ty::make(ty::prim::string), expr_kind::string{std::move(components)});
}

stmt_id package_builder::expr_stmt(expr_id e) {
  const stmt_id id = pkg.stmts.next_key();
  pkg.stmts.insert(id, stmt{.id=id, .kind=stmt_kind::expr{e}});
  return id;
}

stmt_id package_builder::semi(expr_id e) {
  const stmt_id id = pkg.stmts.next_key();
  pkg.stmts.insert(id, stmt{.id=id, .kind=stmt_kind::semi{e}});
  return id;
}

stmt_id package_builder::local(pat_id p, expr_id value, mutability mut) {
  const stmt_id id = pkg.stmts.next_key();
  pkg.stmts.insert(id, stmt{.id=id, .kind=stmt_kind::local{.mut=mut, .pat=p, .value=value}});
  return id;
}

stmt_id package_builder::item_stmt(local_item_id i) {
  const stmt_id id = pkg.stmts.next_key();
  pkg.stmts.insert(id, stmt{.id=id, .kind=stmt_kind::item{i}});
  return id;
}

block_id package_builder::block(std::vector<stmt_id> stmts) {
  ty::t type = ty::unit();
  if (!stmts.empty()) {
    if (auto e = std::get_if<stmt_kind::expr>(&pkg.get_stmt(stmts.back()).kind))type = type_of(e->id);
  }
  const block_id id = pkg.blocks.next_key();
  pkg.blocks.insert(id, fir::block{.id=id, .ty=std::move(type), .stmts=std::move(stmts)});
  return id;
}

local_item_id package_builder::add_item(item_kind::t kind) {
  const local_item_id id = pkg.items.next_key();
  pkg.items.insert(id, item{.id=id, .parent=std::nullopt, .kind=std::move(kind)});
  return id;
}

local_item_id package_builder::namespace_(std::string_view name, std::vector<local_item_id> items) {
  const local_item_id id = add_item(item_kind::namespace_{.name=std::string(name), .items={}});
  for (local_item_id i : items)add_to_namespace(id, i);
  return id;
}

void package_builder::add_to_namespace(local_item_id ns, local_item_id i) {
  pkg.get_item(i);
  auto n = std::get_if<item_kind::namespace_>(&pkg.get_item(ns).kind);
  if (n == nullptr)throw error::malformed_fir("item " + std::to_string(ns) + " is not a namespace");
  std::get<item_kind::namespace_>(pkg.items.get(ns)->kind).items.push_back(i);
  pkg.items.get(i)->parent = ns;
}

local_item_id package_builder::type_decl(std::string_view name, ty::t underlying) {
  return add_item(item_kind::ty{.name=std::string(name), .underlying=std::move(underlying)});
}

local_item_id package_builder::intrinsic(callable_kind kind, std::string_view name, pat_id input, ty::t output) {
  return add_item(item_kind::callable{callable_decl{
      .name=std::string(name), .kind=kind, .input=input, .output=std::move(output), .implementation=fir::intrinsic{}}});
}

local_item_id package_builder::intrinsic(callable_kind kind, std::string_view name, const std::vector<ty::t> &params,
                                         ty::t output) {
  pat_id input;
  if (params.size() == 1) {
    input = bind("p0", params[0]);
  } else {
    std::vector<pat_id> binds;
    for (size_t i = 0; i < params.size(); ++i)binds.push_back(bind("p" + std::to_string(i), params[i]));
    input = tuple_pat(std::move(binds));
  }
  return intrinsic(kind, name, input, std::move(output));
}

spec_decl package_builder::make_spec(block_id body, std::optional<pat_id> ctls) {
  return spec_decl{.id=next_node++, .block=body, .input=ctls};
}

local_item_id package_builder::callable(callable_kind kind, std::string_view name, pat_id input, ty::t output,
                                        block_id body) {
  const local_item_id id = declare(kind, name, input, std::move(output));
  set_body(id, body);
  return id;
}

local_item_id package_builder::declare(callable_kind kind, std::string_view name, pat_id input, ty::t output) {
  return add_item(item_kind::callable{callable_decl{
      .name=std::string(name), .kind=kind, .input=input, .output=std::move(output),
      .implementation=spec_impl{.body=make_spec(undefined_block, std::nullopt)}}});
}

spec_impl &package_builder::impl_of(local_item_id callable) {
  pkg.get_callable(callable);
  auto &decl = std::get<item_kind::callable>(pkg.items.get(callable)->kind).decl;
  auto impl = std::get_if<spec_impl>(&decl.implementation);
  if (impl == nullptr)throw error::malformed_fir("callable " + decl.name + " is intrinsic and has no specializations");
  return *impl;
}

void package_builder::set_body(local_item_id callable, block_id body) {
  impl_of(callable).body.block = body;
}

void package_builder::set_adj(local_item_id callable, block_id body) {
  impl_of(callable).adj = make_spec(body, std::nullopt);
}

void package_builder::set_ctl(local_item_id callable, pat_id ctls, block_id body) {
  impl_of(callable).ctl = make_spec(body, ctls);
}

void package_builder::set_ctl_adj(local_item_id callable, pat_id ctls, block_id body) {
  impl_of(callable).ctl_adj = make_spec(body, ctls);
}

}
