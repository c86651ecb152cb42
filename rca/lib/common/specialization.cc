#include <common/specialization.h>
#include <error/error.h>

namespace rca {

std::string_view to_string(specialization_kind k) {
  switch (k) {
    case specialization_kind::body:return "body";
    case specialization_kind::adj:return "adj";
    case specialization_kind::ctl:return "ctl";
    case specialization_kind::ctl_adj:return "ctl-adj";
  }
  THROW_INTERNAL_ERROR
}

specialization_selector specialization_selector::apply(fir::unary_operator functor) const {
  switch (functor) {
    case fir::unary_operator::functor_adj:return {.adjoint=!adjoint, .controlled=controlled};
    case fir::unary_operator::functor_ctl:return {.adjoint=adjoint, .controlled=true};
    default:THROW_INTERNAL_ERROR
  }
}

specialization_kind specialization_selector::kind() const {
  if (controlled)return adjoint ? specialization_kind::ctl_adj : specialization_kind::ctl;
  return adjoint ? specialization_kind::adj : specialization_kind::body;
}

specialization_selector specialization_selector::of(specialization_kind k) {
  return {.adjoint=k == specialization_kind::adj || k == specialization_kind::ctl_adj,
      .controlled=k == specialization_kind::ctl || k == specialization_kind::ctl_adj};
}

namespace {

void collect_binds(const fir::package &p, fir::pat_id id, std::vector<fir::node_id> &out) {
  std::visit(util::overloaded{
      [&out](const fir::pat_kind::bind &b) { out.push_back(b.id); },
      [](const fir::pat_kind::discard &) {},
      [&](const fir::pat_kind::tuple &t) { for (fir::pat_id x : t.items)collect_binds(p, x, out); }
  }, p.get_pat(id).kind);
}

const std::optional<fir::spec_decl> &optional_spec(const fir::spec_impl &impl, specialization_kind k) {
  switch (k) {
    case specialization_kind::adj:return impl.adj;
    case specialization_kind::ctl:return impl.ctl;
    case specialization_kind::ctl_adj:return impl.ctl_adj;
    default:THROW_INTERNAL_ERROR
  }
}

}

std::vector<input_param> derive_input_params(const fir::package &p, const fir::callable_decl &decl) {
  const fir::pat &input = p.get_pat(decl.input);
  std::vector<input_param> params;
  std::visit(util::overloaded{
      [&](const fir::pat_kind::bind &b) {
        params.push_back(input_param{.index=0, .pat=input.id, .ty=input.ty, .nodes={b.id}});
      },
      [&](const fir::pat_kind::discard &) {
        throw error::malformed_fir("callable " + decl.name + " has a discarded input pattern");
      },
      [&](const fir::pat_kind::tuple &t) {
        auto tt = std::get_if<fir::ty::tuple>(&input.ty);
        if (tt == nullptr || tt->items.size() != t.items.size()) {
          throw error::malformed_fir("input pattern of " + decl.name + " doesn't match its type " + util::to_string(input.ty));
        }
        for (size_t i = 0; i < t.items.size(); ++i) {
          input_param ip{.index=i, .pat=t.items[i], .ty=tt->items[i], .nodes={}};
          collect_binds(p, t.items[i], ip.nodes);
          params.push_back(std::move(ip));
        }
      }
  }, input.kind);
  return params;
}

std::vector<input_param> derive_input_params(const fir::package &p, const fir::callable_decl &decl,
                                             specialization_selector s) {
  std::vector<input_param> params = derive_input_params(p, decl);
  if (!s.controlled || decl.is_intrinsic())return params;
  const fir::spec_decl &spec = select_spec_decl(decl, s);
  if (spec.input.has_value()) {
    const fir::pat &ctls = p.get_pat(*spec.input);
    input_param ip{.index=params.size(), .pat=ctls.id, .ty=ctls.ty, .nodes={}};
    collect_binds(p, ctls.id, ip.nodes);
    params.push_back(std::move(ip));
  }
  return params;
}

node_map make_node_map(const std::vector<input_param> &params) {
  node_map nodes;
  for (const input_param &ip : params) {
    for (fir::node_id n : ip.nodes)nodes.insert_or_assign(n, callable_variable::input_param{ip.index});
  }
  return nodes;
}

bool has_spec_decl(const fir::callable_decl &decl, specialization_selector s) {
  auto impl = std::get_if<fir::spec_impl>(&decl.implementation);
  if (impl == nullptr)return false;
  if (s.kind() == specialization_kind::body)return true;
  return optional_spec(*impl, s.kind()).has_value();
}

const fir::spec_decl &select_spec_decl(const fir::callable_decl &decl, specialization_selector s) {
  auto impl = std::get_if<fir::spec_impl>(&decl.implementation);
  if (impl == nullptr)throw error::malformed_fir("callable " + decl.name + " is intrinsic and has no specializations");
  if (s.kind() == specialization_kind::body)return impl->body;
  const std::optional<fir::spec_decl> &spec = optional_spec(*impl, s.kind());
  if (!spec.has_value()) {
    throw error::malformed_fir("callable " + decl.name + " has no " + std::string(to_string(s.kind())) + " specialization");
  }
  return *spec;
}

void bind_pattern(const fir::package &p, fir::pat_id pat, fir::expr_id value, node_map &nodes) {
  std::visit(util::overloaded{
      [&](const fir::pat_kind::bind &b) { nodes.insert_or_assign(b.id, callable_variable::bound_to_expr{value}); },
      [](const fir::pat_kind::discard &) {},
      [&](const fir::pat_kind::tuple &t) {
        auto tuple = std::get_if<fir::expr_kind::tuple>(&p.get_expr(value).kind);
        if (tuple == nullptr || tuple->items.size() != t.items.size())return;
        for (size_t i = 0; i < t.items.size(); ++i)bind_pattern(p, t.items[i], tuple->items[i], nodes);
      }
  }, p.get_pat(pat).kind);
}

std::optional<resolved_callee> resolve_callee(const resolution_context &ctx, fir::expr_id callee) {
  const fir::expr &e = ctx.package.get_expr(callee);
  return std::visit(util::overloaded{
      [&](const fir::expr_kind::block &b) -> std::optional<resolved_callee> {
        const fir::block &blk = ctx.package.get_block(b.id);
        if (blk.stmts.empty())return std::nullopt;
        auto tail = std::get_if<fir::stmt_kind::expr>(&ctx.package.get_stmt(blk.stmts.back()).kind);
        if (tail == nullptr)return std::nullopt;
        return resolve_callee(ctx, tail->id);
      },
      [&](const fir::expr_kind::closure &c) -> std::optional<resolved_callee> {
        return resolved_callee{.package=ctx.package_id, .item=c.item, .specialization={}};
      },
      [&](const fir::expr_kind::un_op &u) -> std::optional<resolved_callee> {
        if (!fir::is_functor(u.op))return std::nullopt;
        std::optional<resolved_callee> r = resolve_callee(ctx, u.operand);
        if (!r.has_value())return std::nullopt;
        r->specialization = r->specialization.apply(u.op);
        if (u.op == fir::unary_operator::functor_ctl)++r->controlled_depth;
        return r;
      },
      [&](const fir::expr_kind::var &v) -> std::optional<resolved_callee> {
        if (auto id = std::get_if<fir::item_id>(&v.target)) {
          if (!id->package.has_value() || *id->package == ctx.package_id) {
            return resolved_callee{.package=ctx.package_id, .item=id->item, .specialization={}};
          }
          if (!ctx.cross_package)return std::nullopt;
          return resolved_callee{.package=*id->package, .item=id->item, .specialization={}};
        }
        auto it = ctx.nodes.find(std::get<fir::local>(v.target).id);
        if (it == ctx.nodes.end())return std::nullopt;
        if (auto bound = std::get_if<callable_variable::bound_to_expr>(&it->second))return resolve_callee(ctx, bound->expr);
        return std::nullopt;
      },
      [](const auto &) -> std::optional<resolved_callee> { return std::nullopt; }
  }, e.kind);
}

const fir::callable_decl *callee_decl(const fir::item &it) {
  return std::visit(util::overloaded{
      [](const fir::item_kind::callable &c) -> const fir::callable_decl * { return &c.decl; },
      [](const fir::item_kind::ty &) -> const fir::callable_decl * { return nullptr; },
      [&it](const fir::item_kind::namespace_ &) -> const fir::callable_decl * {
        throw error::malformed_fir("call to namespace " + std::string(it.name()));
      }
  }, it.kind);
}

}
