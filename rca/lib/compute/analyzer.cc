#include <compute/analyzer.h>
#include <common/specialization.h>
#include <cycle/cycle_detection.h>
#include <error/error.h>
#include <util/message.h>
#include <algorithm>
#include <map>
#include <set>

namespace rca::compute {

applications_table analyze_intrinsic(const fir::package &package, const fir::callable_decl &decl,
                                     const capability_mapping &mapping, const options &opts) {
  const std::vector<input_param> params = derive_input_params(package, decl);
  if (params.size() > opts.max_input_param_count) {
    throw error::too_many_parameters(decl.name, params.size(), opts.max_input_param_count);
  }
  const bool is_operation = decl.kind == fir::callable_kind::operation;
  const bool output_carries_data = decl.output.carries_classical_data();
  // a function reading qubits observes quantum state even when every argument is static
  const bool observes_qubits = !is_operation && std::any_of(params.begin(), params.end(), [](const input_param &ip) {
    return ip.ty.contains_qubit();
  });

  applications_table table(params.size());
  for (app_idx app = 0; app < table.size(); ++app) {
    compute_props &props = table.at(app);
    for (const input_param &ip : params) {
      if (!is_param_dynamic(app, ip.index))continue;
      props.runtime_capabilities.merge(mapping(ip.ty));
      if (ip.ty.contains_qubit())props.uses_dynamic_qubit = true;
    }
    const bool source = output_carries_data && (is_operation || app != 0 || observes_qubits);
    if (app != 0 || source)props.runtime_capabilities.merge(mapping(decl.output));
    if (source)props.add_source(quantum_source::intrinsic);
  }
  return table;
}

namespace {

// What is known about a value under one application: whether it may differ between runs.
struct abstract_value {
  bool dynamic = false;
  std::vector<abstract_value> items; //per element, for tuple literals

  static abstract_value of(bool dynamic) { return abstract_value{.dynamic=dynamic, .items={}}; }
  bool is_dynamic() const {
    return dynamic || std::any_of(items.begin(), items.end(), [](const abstract_value &v) { return v.is_dynamic(); });
  }
  void join(const abstract_value &o) {
    if (items.size() == o.items.size()) {
      dynamic = dynamic || o.dynamic;
      for (size_t i = 0; i < items.size(); ++i)items[i].join(o.items[i]);
    } else {
      dynamic = is_dynamic() || o.is_dynamic();
      items.clear();
    }
  }
  bool operator==(const abstract_value &o) const { return dynamic == o.dynamic && items == o.items; }
};

typedef std::map<fir::node_id, abstract_value> local_values;

void join_locals(local_values &into, const local_values &other) {
  for (const auto &[node, v] : other) {
    auto [it, inserted] = into.try_emplace(node, v);
    if (!inserted)it->second.join(v);
  }
}

// Per-element tables of one specialization, merged over its applications.
struct element_tables {
  size_t param_count;
  std::map<fir::block_id, applications_table> blocks;
  std::map<fir::stmt_id, applications_table> stmts;
  std::map<fir::expr_id, applications_table> exprs;
  std::map<fir::pat_id, pat_compute_props::t> pats;

  explicit element_tables(size_t param_count) : param_count(param_count) {}

  void record(std::map<size_t, applications_table> &m, size_t id, app_idx app, const compute_props &props) {
    m.try_emplace(id, param_count).first->second.at(app).merge(props);
  }

  package_compute_props to_package() && {
    package_compute_props p;
    for (auto &[id, table] : blocks)p.blocks.insert(id, inner_elmt_compute_props::t::from_table(std::move(table)));
    for (auto &[id, table] : stmts)p.stmts.insert(id, inner_elmt_compute_props::t::from_table(std::move(table)));
    for (auto &[id, table] : exprs)p.exprs.insert(id, inner_elmt_compute_props::t::from_table(std::move(table)));
    for (auto &[id, pat] : pats)p.pats.insert(id, pat);
    return p;
  }
};

struct callee_tables {
  virtual applications_table table_of(const global_specialization &s) = 0;
  virtual ~callee_tables() = default;
}; // virtual class

// Evaluates one application of a specialization block.
class app_evaluator {
 public:
  app_evaluator(callee_tables &callees, const fir::package_store &store, const capability_mapping &mapping,
                fir::package_id package_id, const fir::callable_decl &decl, const std::vector<input_param> &params,
                app_idx app, element_tables &elements)
      : callees(callees), store(store), mapping(mapping), package_id(package_id), package(store.get(package_id)),
        decl(decl), app(app), elements(elements), nodes(make_node_map(params)) {
    for (const input_param &ip : params) {
      for (fir::node_id n : ip.nodes)locals[n] = abstract_value::of(is_param_dynamic(app, ip.index));
    }
  }

  compute_props evaluate(fir::block_id body) {
    scopes.assign(1, compute_props{});
    const abstract_value v = eval_block(body);
    if (v.is_dynamic() || output_dynamic) {
      charge(mapping(decl.output));
      if (decl.output.carries_classical_data())scopes.back().add_source(quantum_source::intrinsic);
    }
    return scopes.back();
  }

 private:
  void charge(const capability_set &caps) { scopes.back().runtime_capabilities.merge(caps); }
  void charge_if_dynamic(fir::expr_id e, const abstract_value &v) {
    if (v.is_dynamic())charge(mapping(package.get_expr(e).ty));
  }

  void open_scope() { scopes.emplace_back(); }
  void close_scope(std::map<size_t, applications_table> &m, size_t id) {
    compute_props mine = std::move(scopes.back());
    scopes.pop_back();
    elements.record(m, id, app, mine);
    scopes.back().merge(mine);
  }

  abstract_value eval_block(fir::block_id id) {
    open_scope();
    abstract_value v;
    for (fir::stmt_id s : package.get_block(id).stmts)v = eval_stmt(s);
    close_scope(elements.blocks, id);
    return v;
  }

  abstract_value eval_stmt(fir::stmt_id id) {
    open_scope();
    abstract_value v;
    std::visit(util::overloaded{
        [&](const fir::stmt_kind::expr &e) { v = eval_expr(e.id); },
        [&](const fir::stmt_kind::semi &e) { eval_expr(e.id); },
        [&](const fir::stmt_kind::local &l) {
          const abstract_value value = eval_expr(l.value);
          bind_pattern(package, l.pat, l.value, nodes);
          bind_value(l.pat, value);
        },
        [](const fir::stmt_kind::item &) {}
    }, package.get_stmt(id).kind);
    close_scope(elements.stmts, id);
    return v;
  }

  void bind_value(fir::pat_id id, const abstract_value &value) {
    elements.pats.try_emplace(id, pat_compute_props::local{});
    std::visit(util::overloaded{
        [&](const fir::pat_kind::bind &b) { locals[b.id] = value; },
        [](const fir::pat_kind::discard &) {},
        [&](const fir::pat_kind::tuple &t) {
          for (size_t i = 0; i < t.items.size(); ++i) {
            bind_value(t.items[i], value.items.size() == t.items.size() ? value.items[i]
                                                                       : abstract_value::of(value.is_dynamic()));
          }
        }
    }, package.get_pat(id).kind);
  }

  // stores `value` into the place denoted by `lhs`
  void assign_to(fir::expr_id lhs, abstract_value value) {
    if (dynamic_depth > 0)value = abstract_value::of(true);
    elements.record(elements.exprs, lhs, app, {});
    const fir::expr &e = package.get_expr(lhs);
    if (auto var = std::get_if<fir::expr_kind::var>(&e.kind)) {
      if (auto l = std::get_if<fir::local>(&var->target))locals[l->id] = std::move(value);
    } else if (auto tuple = std::get_if<fir::expr_kind::tuple>(&e.kind)) {
      for (size_t i = 0; i < tuple->items.size(); ++i) {
        assign_to(tuple->items[i], value.items.size() == tuple->items.size() ? value.items[i]
                                                                             : abstract_value::of(value.is_dynamic()));
      }
    }
  }

  // evaluates operands, charges the dynamic ones and returns whether any is dynamic
  bool eval_operands(const std::vector<fir::expr_id> &operands) {
    bool dynamic = false;
    for (fir::expr_id e : operands) {
      const abstract_value v = eval_expr(e);
      charge_if_dynamic(e, v);
      dynamic = dynamic || v.is_dynamic();
    }
    return dynamic;
  }

  abstract_value eval_expr(fir::expr_id id) {
    namespace ek = fir::expr_kind;
    open_scope();
    const abstract_value v = std::visit(util::overloaded{
        [&](const ek::array &a) { return abstract_value::of(eval_operands(a.items)); },
        [&](const ek::array_repeat &a) { return abstract_value::of(eval_operands({a.item, a.size})); },
        [&](const ek::assign &a) {
          assign_to(a.lhs, eval_expr(a.rhs));
          return abstract_value{};
        },
        [&](const ek::assign_op &a) {
          assign_to(a.lhs, abstract_value::of(eval_operands({a.lhs, a.rhs})));
          return abstract_value{};
        },
        [&](const ek::assign_field &a) {
          const bool record = eval_expr(a.record).is_dynamic();
          const bool replace = eval_operands({a.replace});
          assign_to(a.record, abstract_value::of(record || replace));
          return abstract_value{};
        },
        [&](const ek::assign_index &a) {
          const bool array = eval_expr(a.array).is_dynamic();
          const bool rest = eval_operands({a.index, a.replace});
          assign_to(a.array, abstract_value::of(array || rest));
          return abstract_value{};
        },
        [&](const ek::bin_op &b) { return abstract_value::of(eval_operands({b.lhs, b.rhs})); },
        [&](const ek::block &b) { return eval_block(b.id); },
        [&](const ek::call &c) { return eval_call(c); },
        [&](const ek::closure &c) {
          bool dynamic = false;
          for (fir::node_id n : c.captures) {
            auto it = locals.find(n);
            dynamic = dynamic || (it != locals.end() && it->second.is_dynamic());
          }
          return abstract_value::of(dynamic);
        },
        [&](const ek::fail &f) {
          eval_operands({f.msg});
          return abstract_value{};
        },
        [&](const ek::field &f) { return abstract_value::of(eval_operands({f.record})); },
        [](const ek::hole &) { return abstract_value{}; },
        [&](const ek::if_ &i) { return eval_if(i); },
        [&](const ek::index &i) { return abstract_value::of(eval_operands({i.array, i.index})); },
        [](const ek::lit &) { return abstract_value{}; },
        [&](const ek::range &r) {
          std::vector<fir::expr_id> parts;
          for (const auto &e : {r.start, r.step, r.end})if (e.has_value())parts.push_back(*e);
          return abstract_value::of(eval_operands(parts));
        },
        [&](const ek::return_ &r) {
          const abstract_value value = eval_expr(r.value);
          if (value.is_dynamic() || dynamic_depth > 0)output_dynamic = true;
          return abstract_value{};
        },
        [&](const ek::string &s) {
          std::vector<fir::expr_id> parts;
          for (const auto &c : s.components) {
            if (auto e = std::get_if<fir::expr_id>(&c))parts.push_back(*e);
          }
          return abstract_value::of(eval_operands(parts));
        },
        [&](const ek::tuple &t) {
          abstract_value tuple;
          for (fir::expr_id e : t.items)tuple.items.push_back(eval_expr(e));
          return tuple;
        },
        [&](const ek::un_op &u) {
          if (fir::is_functor(u.op))return eval_expr(u.operand);
          return abstract_value::of(eval_operands({u.operand}));
        },
        [&](const ek::update_field &u) {
          const bool record = eval_expr(u.record).is_dynamic();
          return abstract_value::of(eval_operands({u.replace}) || record);
        },
        [&](const ek::update_index &u) {
          const bool array = eval_expr(u.array).is_dynamic();
          return abstract_value::of(eval_operands({u.index, u.replace}) || array);
        },
        [&](const ek::var &v) {
          auto l = std::get_if<fir::local>(&v.target);
          if (l == nullptr)return abstract_value{};
          auto it = locals.find(l->id);
          return it == locals.end() ? abstract_value{} : it->second;
        },
        [&](const ek::while_ &w) {
          eval_while(w);
          return abstract_value{};
        }
    }, package.get_expr(id).kind);
    close_scope(elements.exprs, id);
    return v;
  }

  abstract_value eval_if(const fir::expr_kind::if_ &i) {
    const abstract_value cond = eval_expr(i.cond);
    const bool dynamic = cond.is_dynamic();
    if (dynamic) {
      charge_if_dynamic(i.cond, cond);
      ++dynamic_depth;
    }
    const local_values before = locals;
    abstract_value v = eval_expr(i.body);
    local_values after_body = std::move(locals);
    locals = before;
    if (i.otherwise.has_value())v.join(eval_expr(*i.otherwise));
    join_locals(locals, after_body);
    if (dynamic) {
      --dynamic_depth;
      v = abstract_value::of(true);
    }
    return v;
  }

  void eval_while(const fir::expr_kind::while_ &w) {
    for (;;) {
      const local_values before = locals;
      const abstract_value cond = eval_expr(w.cond);
      const bool dynamic = cond.is_dynamic();
      if (dynamic) {
        charge_if_dynamic(w.cond, cond);
        ++dynamic_depth;
      }
      eval_block(w.body);
      if (dynamic)--dynamic_depth;
      join_locals(locals, before);
      if (locals == before)return;
    }
  }

  abstract_value eval_call(const fir::expr_kind::call &c) {
    const abstract_value callee = eval_expr(c.callee);
    const abstract_value args = eval_expr(c.args);
    const resolution_context ctx{.package_id=package_id, .package=package, .nodes=nodes, .cross_package=true};
    const std::optional<resolved_callee> r = resolve_callee(ctx, c.callee);
    if (!r.has_value())return abstract_value::of(callee.is_dynamic() || args.is_dynamic());
    const fir::package &callee_package = store.get(r->package);
    const fir::callable_decl *target = callee_decl(callee_package.get_item(r->item));
    if (target == nullptr)return abstract_value::of(args.is_dynamic());

    // Controlled calls take (controls, args), once per application of the functor
    abstract_value inner = args;
    bool controls_dynamic = false;
    for (size_t i = 0; i < r->controlled_depth; ++i) {
      if (inner.items.size() == 2) {
        controls_dynamic = controls_dynamic || inner.items[0].is_dynamic();
        abstract_value unwrapped = inner.items[1];
        inner = std::move(unwrapped);
      } else {
        controls_dynamic = controls_dynamic || inner.is_dynamic();
      }
    }

    const size_t n = derive_input_params(callee_package, *target).size();
    app_idx callee_app = 0;
    if (n == 1) {
      callee_app = inner.is_dynamic() ? 1 : 0;
    } else if (inner.items.size() == n) {
      for (size_t i = 0; i < n; ++i)if (inner.items[i].is_dynamic())callee_app |= app_idx(1) << i;
    } else if (inner.is_dynamic()) {
      callee_app = (app_idx(1) << n) - 1;
    }

    specialization_selector selector = r->specialization;
    if (target->is_intrinsic()) {
      selector = {};
    } else if (selector.controlled && controls_dynamic && select_spec_decl(*target, selector).input.has_value()) {
      callee_app |= app_idx(1) << n;
    }

    compute_props props = callees.table_of({.package=r->package, .callable=r->item, .specialization=selector}).at(callee_app);
    if (target->is_intrinsic() && r->specialization.controlled && controls_dynamic) {
      props.runtime_capabilities.merge(mapping(fir::ty::array_of(fir::ty::make(fir::ty::prim::qubit))));
      props.uses_dynamic_qubit = true;
    }
    scopes.back().merge(props);
    return abstract_value::of(props.is_quantum_source());
  }

  callee_tables &callees;
  const fir::package_store &store;
  const capability_mapping &mapping;
  fir::package_id package_id;
  const fir::package &package;
  const fir::callable_decl &decl;
  app_idx app;
  element_tables &elements;
  node_map nodes;
  local_values locals;
  std::vector<compute_props> scopes; //props charged by each element being evaluated, innermost last
  size_t dynamic_depth = 0; //nesting of code that runs depending on a dynamic condition
  bool output_dynamic = false;
};

// A specialization under evaluation.
struct frame {
  size_t depth;
  size_t lowest_dependency; //depth of the outermost unfinished specialization the result relied on
  bool self_referenced;
  applications_table provisional; //result assumed for recursive calls
};

class analyzer : public callee_tables {
 public:
  analyzer(const fir::package_store &store, const capability_mapping &mapping, const options &opts)
      : store(store), mapping(mapping), opts(opts) {}

  store_compute_props run() {
    for (const auto &[package_id, package] : store.packages) {
      for (const cycle::cycled_callable_info &info : cycle::detect_callables_with_cycles(package_id, package, opts.trace)) {
        for (specialization_kind k : all_specialization_kinds) {
          if (info.is_cycled(k).value_or(false)) {
            cycled.insert(global_specialization{.package=package_id, .callable=info.id,
                                                 .specialization=specialization_selector::of(k)});
          }
        }
      }
    }
    for (const auto &[package_id, package] : store.packages) {
      result.get_or_insert_package(package_id);
      for (const auto &[item_id, it] : package.items) {
        if (!result.has_item(package_id, item_id))analyze_item(package_id, item_id);
      }
    }
    return std::move(result);
  }

  applications_table table_of(const global_specialization &s) override {
    if (auto it = finished.find(s); it != finished.end())return it->second;
    if (auto it = in_progress.find(s); it != in_progress.end()) {
      if (!cycled.contains(s))THROW_INTERNAL_ERROR
      frame &target = frames[it->second];
      target.self_referenced = true;
      frames.back().lowest_dependency = std::min(frames.back().lowest_dependency, target.depth);
      return target.provisional;
    }

    const fir::package &package = store.get(s.package);
    const fir::callable_decl &decl = package.get_callable(s.callable);
    if (decl.is_intrinsic()) {
      applications_table table = analyze_intrinsic(package, decl, mapping, opts);
      finished.emplace(s, table);
      return table;
    }
    return evaluate_specialization(s, package, decl);
  }

 private:
  void note(const std::string &what) const {
    if (opts.trace)util::message::note_string(what).print(*opts.trace);
  }

  static std::string describe(const global_specialization &s, const fir::callable_decl &decl) {
    return std::string(to_string(s.specialization.kind())) + " of " + decl.name;
  }

  void analyze_item(fir::package_id package_id, fir::local_item_id item_id) {
    const fir::item &it = store.get(package_id).get_item(item_id);
    package_compute_props partial;
    const fir::callable_decl *decl = it.as_callable();
    if (decl == nullptr) {
      partial.items.insert(item_id, non_callable{});
    } else {
      callable_compute_props props(table_of({.package=package_id, .callable=item_id, .specialization={}}));
      for (specialization_kind k : {specialization_kind::adj, specialization_kind::ctl, specialization_kind::ctl_adj}) {
        const specialization_selector s = specialization_selector::of(k);
        if (!has_spec_decl(*decl, s))continue;
        applications_table table = table_of({.package=package_id, .callable=item_id, .specialization=s});
        if (k == specialization_kind::adj)props.adj = std::move(table);
        else if (k == specialization_kind::ctl)props.ctl = std::move(table);
        else props.ctl_adj = std::move(table);
      }
      partial.items.insert(item_id, std::move(props));
    }
    result.incorporate(package_id, std::move(partial));
  }

  void record_param_pats(const fir::package &package, fir::pat_id pat, const global_specialization &s, size_t index,
                         element_tables &elements) {
    elements.pats.try_emplace(pat, pat_compute_props::callable_param{
        .item={.package=s.package, .item=s.callable}, .index=index});
    if (auto t = std::get_if<fir::pat_kind::tuple>(&package.get_pat(pat).kind)) {
      for (fir::pat_id p : t->items)record_param_pats(package, p, s, index, elements);
    }
  }

  applications_table evaluate_specialization(const global_specialization &s, const fir::package &package,
                                             const fir::callable_decl &decl) {
    const std::vector<input_param> params = derive_input_params(package, decl, s.specialization);
    if (params.size() > opts.max_input_param_count) {
      throw error::too_many_parameters(decl.name, params.size(), opts.max_input_param_count);
    }
    const fir::spec_decl &spec = select_spec_decl(decl, s.specialization);
    const size_t depth = frames.size();
    frames.push_back(frame{.depth=depth, .lowest_dependency=depth, .self_referenced=false,
                           .provisional=applications_table(params.size())});
    in_progress.emplace(s, depth);
    note("analyzing " + describe(s, decl));

    element_tables elements(params.size());
    applications_table table(params.size());
    for (;;) {
      frames[depth].self_referenced = false;
      elements = element_tables(params.size());
      for (const input_param &ip : params)record_param_pats(package, ip.pat, s, ip.index, elements);
      for (app_idx app = 0; app < table.size(); ++app) {
        app_evaluator evaluator(*this, store, mapping, s.package, decl, params, app, elements);
        table.at(app) = evaluator.evaluate(spec.block);
      }
      frame &f = frames[depth];
      if (!f.self_referenced || !f.provisional.merge(table))break;
      note("recursive " + describe(s, decl) + " changed, evaluating it again");
    }

    const size_t lowest = frames[depth].lowest_dependency;
    frames.pop_back();
    in_progress.erase(s);
    if (lowest < depth) {
      // relies on an outer specialization that hasn't converged yet, recomputed once it has
      frames.back().lowest_dependency = std::min(frames.back().lowest_dependency, lowest);
      return table;
    }
    finished.emplace(s, table);
    result.incorporate(s.package, std::move(elements).to_package());
    return table;
  }

  const fir::package_store &store;
  const capability_mapping &mapping;
  const options &opts;
  std::set<global_specialization> cycled;
  std::map<global_specialization, applications_table> finished;
  std::vector<frame> frames;
  std::map<global_specialization, size_t> in_progress; //index into frames
  store_compute_props result;
};

}

store_compute_props analyze(const fir::package_store &store, const capability_mapping &mapping, const options &opts) {
  return analyzer(store, mapping, opts).run();
}

}
