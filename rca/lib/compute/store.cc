#include <compute/store.h>
#include <error/error.h>
#include <fstream>

namespace rca::compute {

const applications_table *callable_compute_props::get(specialization_kind k) const {
  switch (k) {
    case specialization_kind::body:return &apps;
    case specialization_kind::adj:return adj ? &*adj : nullptr;
    case specialization_kind::ctl:return ctl ? &*ctl : nullptr;
    case specialization_kind::ctl_adj:return ctl_adj ? &*ctl_adj : nullptr;
  }
  THROW_INTERNAL_ERROR
}

bool callable_compute_props::operator==(const callable_compute_props &o) const {
  return apps == o.apps && adj == o.adj && ctl == o.ctl && ctl_adj == o.ctl_adj;
}

void callable_compute_props::print(std::ostream &os, size_t level) const {
  os << "Callable Compute Properties:";
  for (specialization_kind k : all_specialization_kinds) {
    os << "\n";
    util::indent(os, level + 1);
    os << to_string(k) << ": ";
    if (const applications_table *table = get(k))table->print(os, level + 1);
    else os << "<none>";
  }
}

util::sexp::t callable_compute_props::to_sexp() const {
  util::sexp::t s = {"callable_compute_props"};
  for (specialization_kind k : all_specialization_kinds) {
    const applications_table *table = get(k);
    s.push_back({to_string(k), table ? table->to_sexp() : util::sexp::t("none")});
  }
  return s;
}

void item_compute_props::print(std::ostream &os, size_t level) const {
  std::visit(util::overloaded{
      [&os](const non_callable &) { os << "Non-Callable"; },
      [&os, level](const callable_compute_props &c) { c.print(os, level); }
  }, static_cast<const base &>(*this));
}

namespace inner_elmt_compute_props {

t t::from_table(applications_table apps) {
  if (apps.is_app_independent())return app_independent{apps.at(0)};
  return app_dependent{std::move(apps)};
}

const compute_props &t::at(app_idx app) const {
  return std::visit(util::overloaded{
      [app](const app_dependent &d) -> const compute_props & { return d.apps.at(app); },
      [](const app_independent &i) -> const compute_props & { return i.props; }
  }, static_cast<const base &>(*this));
}

bool t::operator==(const t &o) const {
  if (index() != o.index())return false;
  if (auto d = std::get_if<app_dependent>(this))return d->apps == std::get<app_dependent>(o).apps;
  return std::get<app_independent>(*this).props == std::get<app_independent>(o).props;
}

void t::print(std::ostream &os, size_t level) const {
  std::visit(util::overloaded{
      [&](const app_dependent &d) {
        os << "Application Dependent: ";
        d.apps.print(os, level);
      },
      [&](const app_independent &i) {
        os << "Application Independent: ";
        i.props.print(os, level);
      }
  }, static_cast<const base &>(*this));
}

}

namespace pat_compute_props {
void print(const t &p, std::ostream &os, size_t level) {
  std::visit(util::overloaded{
      [&os](const local &) { os << "Local"; },
      [&os, level](const callable_param &c) {
        os << "Callable Parameter:\n";
        util::indent(os, level + 1);
        os << "Item ID: ";
        if (c.item.package.has_value())os << "Package " << *c.item.package << ", ";
        os << "Item " << c.item.item << "\n";
        util::indent(os, level + 1);
        os << "Parameter Index: " << c.index;
      }
  }, p);
}
}

namespace {
template<typename K, typename V>
void incorporate_map(util::index_map<K, V> &into, util::index_map<K, V> &&from) {
  for (auto &&[id, v] : from)into.insert(id, std::move(v));
}

template<typename K, typename V, typename F>
void print_section(std::ostream &os, std::string_view title, std::string_view label,
                   const util::index_map<K, V> &m, F &&print_value) {
  os << title << ":";
  for (const auto &[id, v] : m) {
    os << "\n";
    util::indent(os, 1);
    os << label << " " << id << ": \n";
    util::indent(os, 2);
    print_value(v);
  }
}
}

void package_compute_props::incorporate(package_compute_props &&partial) {
  incorporate_map(items, std::move(partial.items));
  incorporate_map(blocks, std::move(partial.blocks));
  incorporate_map(stmts, std::move(partial.stmts));
  incorporate_map(exprs, std::move(partial.exprs));
  incorporate_map(pats, std::move(partial.pats));
}

bool package_compute_props::operator==(const package_compute_props &o) const {
  return items == o.items && blocks == o.blocks && stmts == o.stmts && exprs == o.exprs && pats == o.pats;
}

void package_compute_props::print(std::ostream &os) const {
  print_section(os, "Items", "Local Item ID", items, [&os](const item_compute_props &i) { i.print(os, 2); });
  os << "\n";
  print_section(os, "Blocks", "Block ID", blocks, [&os](const inner_elmt_compute_props::t &b) { b.print(os, 2); });
  os << "\n";
  print_section(os, "Statements", "Statement ID", stmts, [&os](const inner_elmt_compute_props::t &s) { s.print(os, 2); });
  os << "\n";
  print_section(os, "Expressions", "Expression ID", exprs, [&os](const inner_elmt_compute_props::t &e) { e.print(os, 2); });
  os << "\n";
  print_section(os, "Patterns", "Pattern ID", pats, [&os](const pat_compute_props::t &p) { pat_compute_props::print(p, os, 2); });
}

bool store_compute_props::has_item(fir::package_id package, fir::local_item_id item) const {
  const package_compute_props *p = packages.get(package);
  return p != nullptr && p->items.contains(item);
}

const item_compute_props &store_compute_props::get_item(fir::package_id package, fir::local_item_id item) const {
  const package_compute_props *p = packages.get(package);
  const item_compute_props *i = p ? p->items.get(item) : nullptr;
  if (i == nullptr)throw error::missing_compute_props(package, item);
  return *i;
}

const callable_compute_props &store_compute_props::get_callable(fir::package_id package, fir::local_item_id item) const {
  const callable_compute_props *c = get_item(package, item).as_callable();
  if (c == nullptr)throw error::missing_compute_props(package, item);
  return *c;
}

const inner_elmt_compute_props::t *store_compute_props::find_block(fir::package_id package, fir::block_id id) const {
  const package_compute_props *p = packages.get(package);
  return p ? p->blocks.get(id) : nullptr;
}

const inner_elmt_compute_props::t *store_compute_props::find_stmt(fir::package_id package, fir::stmt_id id) const {
  const package_compute_props *p = packages.get(package);
  return p ? p->stmts.get(id) : nullptr;
}

const inner_elmt_compute_props::t *store_compute_props::find_expr(fir::package_id package, fir::expr_id id) const {
  const package_compute_props *p = packages.get(package);
  return p ? p->exprs.get(id) : nullptr;
}

const pat_compute_props::t *store_compute_props::find_pat(fir::package_id package, fir::pat_id id) const {
  const package_compute_props *p = packages.get(package);
  return p ? p->pats.get(id) : nullptr;
}

void store_compute_props::incorporate(fir::package_id package, package_compute_props &&partial) {
  packages.get_or_insert_default(package).incorporate(std::move(partial));
}

void store_compute_props::print(std::ostream &os) const {
  for (const auto &[id, p] : packages) {
    os << "Package " << id << ":\n";
    p.print(os);
    os << "\n";
  }
}

void store_compute_props::persist(std::string_view directory) const {
  for (const auto &[id, p] : packages) {
    const std::string path = std::string(directory) + "/rca.package" + std::to_string(id) + ".txt";
    std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
    if (!file)throw error::base("couldn't open " + path + " for writing");
    p.print(file);
    file << std::endl;
  }
}

}
