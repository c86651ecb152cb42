#include <cycle/cycle_detection.h>
#include <error/error.h>
#include <util/message.h>
#include <map>
#include <set>

namespace rca::cycle {

cycled_callable_info cycled_callable_info::make(fir::local_item_id id, const fir::spec_impl &impl) {
  cycled_callable_info info;
  info.id = id;
  info.flags[static_cast<size_t>(specialization_kind::body)].present = true;
  info.flags[static_cast<size_t>(specialization_kind::adj)].present = impl.adj.has_value();
  info.flags[static_cast<size_t>(specialization_kind::ctl)].present = impl.ctl.has_value();
  info.flags[static_cast<size_t>(specialization_kind::ctl_adj)].present = impl.ctl_adj.has_value();
  return info;
}

std::optional<bool> cycled_callable_info::is_cycled(specialization_kind k) const {
  const flag &f = flags[static_cast<size_t>(k)];
  if (!f.present)return std::nullopt;
  return f.cycled;
}

void cycled_callable_info::mark(specialization_kind k) {
  flag &f = flags[static_cast<size_t>(k)];
  if (!f.present)THROW_INTERNAL_ERROR
  f.cycled = true;
}

util::sexp::t cycled_callable_info::to_sexp() const {
  util::sexp::t s = {"cycled_callable", util::sexp::make_sexp(id)};
  for (specialization_kind k : all_specialization_kinds) {
    s.push_back({to_string(k), util::sexp::make_sexp(is_cycled(k))});
  }
  return s;
}

namespace {

class call_stack {
 public:
  bool contains(const callable_specialization_selector &s) const { return set.contains(s); }
  const callable_specialization_selector &top() const {
    if (stack.empty())THROW_INTERNAL_ERROR
    return stack.back();
  }
  void push(const callable_specialization_selector &s) {
    set.insert(s);
    stack.push_back(s);
  }
  void pop() {
    set.erase(top());
    stack.pop_back();
  }
 private:
  std::set<callable_specialization_selector> set;
  std::vector<callable_specialization_selector> stack;
};

class cycle_detector {
 public:
  cycle_detector(fir::package_id package_id, const fir::package &package, std::ostream *trace)
      : package_id(package_id), package(package), trace(trace) {}

  void detect() {
    for (const auto &[id, it] : package.items) {
      const fir::callable_decl *decl = it.as_callable();
      if (decl == nullptr || decl->is_intrinsic())continue;
      for (specialization_kind k : all_specialization_kinds) {
        const specialization_selector s = specialization_selector::of(k);
        if (!has_spec_decl(*decl, s))continue;
        walk_spec_decl({.callable=id, .specialization=s}, select_spec_decl(*decl, s));
      }
    }
  }

  const std::set<callable_specialization_selector> &specializations_with_cycles() const { return cycled; }

 private:
  node_map &current_nodes() {
    auto it = node_maps.find(stack.top());
    if (it == node_maps.end())THROW_INTERNAL_ERROR
    return it->second;
  }

  void walk_spec_decl(const callable_specialization_selector &s, const fir::spec_decl &spec) {
    if (stack.contains(s)) {
      if (cycled.insert(s).second && trace) {
        util::message::note_string(
            "specialization " + std::string(to_string(s.specialization.kind())) + " of "
                + std::string(package.get_item(s.callable).name()) + " is part of a call cycle").print(*trace);
      }
      return;
    }
    if (!node_maps.contains(s)) {
      const fir::callable_decl &decl = package.get_callable(s.callable);
      node_maps.emplace(s, make_node_map(derive_input_params(package, decl, s.specialization)));
    }
    stack.push(s);
    visit_block(spec.block);
    stack.pop();
  }

  void walk_call(fir::expr_id callee, fir::expr_id args) {
    // callee and arguments are evaluated inside the caller, before the call
    visit_expr(callee);
    visit_expr(args);
    const resolution_context ctx{.package_id=package_id, .package=package, .nodes=current_nodes()};
    std::optional<resolved_callee> r = resolve_callee(ctx, callee);
    if (!r.has_value())return;
    const fir::callable_decl *decl = callee_decl(package.get_item(r->item));
    if (decl == nullptr || decl->is_intrinsic())return;
    walk_spec_decl({.callable=r->item, .specialization=r->specialization}, select_spec_decl(*decl, r->specialization));
  }

  void visit_block(fir::block_id id) {
    for (fir::stmt_id s : package.get_block(id).stmts)visit_stmt(s);
  }

  void visit_stmt(fir::stmt_id id) {
    std::visit(util::overloaded{
        [this](const fir::stmt_kind::expr &e) { visit_expr(e.id); },
        [this](const fir::stmt_kind::semi &e) { visit_expr(e.id); },
        [this](const fir::stmt_kind::local &l) {
          bind_pattern(package, l.pat, l.value, current_nodes());
          visit_expr(l.value);
        },
        [](const fir::stmt_kind::item &) {}
    }, package.get_stmt(id).kind);
  }

  void visit_exprs(const std::vector<fir::expr_id> &v) {
    for (fir::expr_id e : v)visit_expr(e);
  }

  void visit_expr(fir::expr_id id) {
    namespace ek = fir::expr_kind;
    std::visit(util::overloaded{
        [this](const ek::array &a) { visit_exprs(a.items); },
        [this](const ek::array_repeat &a) { visit_exprs({a.item, a.size}); },
        [this](const ek::assign &a) { visit_exprs({a.lhs, a.rhs}); },
        [this](const ek::assign_op &a) { visit_exprs({a.lhs, a.rhs}); },
        [this](const ek::assign_field &a) { visit_exprs({a.record, a.replace}); },
        [this](const ek::assign_index &a) { visit_exprs({a.array, a.index, a.replace}); },
        [this](const ek::bin_op &b) { visit_exprs({b.lhs, b.rhs}); },
        [this](const ek::block &b) { visit_block(b.id); },
        [this](const ek::call &c) { walk_call(c.callee, c.args); },
        [this](const ek::fail &f) { visit_expr(f.msg); },
        [this](const ek::field &f) { visit_expr(f.record); },
        [this](const ek::if_ &i) {
          visit_exprs({i.cond, i.body});
          if (i.otherwise.has_value())visit_expr(*i.otherwise);
        },
        [this](const ek::index &i) { visit_exprs({i.array, i.index}); },
        [this](const ek::range &r) {
          for (const auto &e : {r.start, r.step, r.end})if (e.has_value())visit_expr(*e);
        },
        [this](const ek::return_ &r) { visit_expr(r.value); },
        [this](const ek::string &s) {
          for (const auto &c : s.components) {
            if (auto e = std::get_if<fir::expr_id>(&c))visit_expr(*e);
          }
        },
        [this](const ek::tuple &t) { visit_exprs(t.items); },
        [this](const ek::un_op &u) { visit_expr(u.operand); },
        [this](const ek::update_field &u) { visit_exprs({u.record, u.replace}); },
        [this](const ek::update_index &u) { visit_exprs({u.array, u.index, u.replace}); },
        [this](const ek::while_ &w) {
          visit_expr(w.cond);
          visit_block(w.body);
        },
        [](const ek::closure &) {},
        [](const ek::hole &) {},
        [](const ek::lit &) {},
        [](const ek::var &) {}
    }, package.get_expr(id).kind);
  }

  fir::package_id package_id;
  const fir::package &package;
  std::ostream *trace;
  call_stack stack;
  std::map<callable_specialization_selector, node_map> node_maps;
  std::set<callable_specialization_selector> cycled;
};

}

std::vector<cycled_callable_info> detect_callables_with_cycles(fir::package_id package_id, const fir::package &package,
                                                               std::ostream *trace) {
  cycle_detector detector(package_id, package, trace);
  detector.detect();

  std::map<fir::local_item_id, cycled_callable_info> by_callable;
  for (const callable_specialization_selector &s : detector.specializations_with_cycles()) {
    auto it = by_callable.find(s.callable);
    if (it == by_callable.end()) {
      const auto &impl = std::get<fir::spec_impl>(package.get_callable(s.callable).implementation);
      it = by_callable.emplace(s.callable, cycled_callable_info::make(s.callable, impl)).first;
    }
    it->second.mark(s.specialization.kind());
  }
  std::vector<cycled_callable_info> infos;
  for (auto &[id, info] : by_callable)infos.push_back(std::move(info));
  return infos;
}

}
