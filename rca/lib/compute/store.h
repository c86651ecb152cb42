#ifndef RCA_LIB_COMPUTE_STORE_H_
#define RCA_LIB_COMPUTE_STORE_H_
#include <optional>
#include <variant>
#include <string_view>
#include <util/index_map.h>
#include <util/sexp.h>
#include <fir/fir.h>
#include <common/specialization.h>
#include <compute/compute_props.h>

namespace rca::compute {

struct callable_compute_props : public util::sexp::sexp_of_t {
  applications_table apps; //body
  std::optional<applications_table> adj, ctl, ctl_adj;

  explicit callable_compute_props(applications_table body) : apps(std::move(body)) {}
  // nullptr when the callable lacks the specialization
  const applications_table *get(specialization_kind k) const;
  bool operator==(const callable_compute_props &o) const;
  void print(std::ostream &os, size_t level) const;
  util::sexp::t to_sexp() const final;
};

struct non_callable {
  bool operator==(const non_callable &) const { return true; }
};

struct item_compute_props : public std::variant<non_callable, callable_compute_props> {
  typedef std::variant<non_callable, callable_compute_props> base;
  using base::base;
  // nullptr for non-callable items
  const callable_compute_props *as_callable() const { return std::get_if<callable_compute_props>(this); }
  bool operator==(const item_compute_props &o) const {
    return static_cast<const base &>(*this) == static_cast<const base &>(o);
  }
  void print(std::ostream &os, size_t level) const;
};

// Properties of a block, statement or expression inside a specialization.
namespace inner_elmt_compute_props {
struct app_dependent { applications_table apps; };
struct app_independent { compute_props props; };
struct t : public std::variant<app_dependent, app_independent> {
  typedef std::variant<app_dependent, app_independent> base;
  using base::base;
  // app_independent when every application agrees
  static t from_table(applications_table apps);
  const compute_props &at(app_idx app) const;
  bool operator==(const t &o) const;
  void print(std::ostream &os, size_t level) const;
};
}

namespace pat_compute_props {
struct local {
  bool operator==(const local &) const { return true; }
};
struct callable_param {
  fir::item_id item;
  size_t index;
  bool operator==(const callable_param &o) const { return item == o.item && index == o.index; }
};
typedef std::variant<local, callable_param> t;
void print(const t &p, std::ostream &os, size_t level);
}

struct package_compute_props {
  util::index_map<fir::local_item_id, item_compute_props> items;
  util::index_map<fir::block_id, inner_elmt_compute_props::t> blocks;
  util::index_map<fir::stmt_id, inner_elmt_compute_props::t> stmts;
  util::index_map<fir::expr_id, inner_elmt_compute_props::t> exprs;
  util::index_map<fir::pat_id, pat_compute_props::t> pats;

  // entries already present are kept
  void incorporate(package_compute_props &&partial);
  bool operator==(const package_compute_props &o) const;
  void print(std::ostream &os) const;
};

// Result of one analysis run, indexed by package and item.
class store_compute_props {
 public:
  bool has_item(fir::package_id package, fir::local_item_id item) const;
  // throw error::missing_compute_props
  const item_compute_props &get_item(fir::package_id package, fir::local_item_id item) const;
  const callable_compute_props &get_callable(fir::package_id package, fir::local_item_id item) const;

  const package_compute_props *find_package(fir::package_id package) const { return packages.get(package); }
  const inner_elmt_compute_props::t *find_block(fir::package_id package, fir::block_id id) const;
  const inner_elmt_compute_props::t *find_stmt(fir::package_id package, fir::stmt_id id) const;
  const inner_elmt_compute_props::t *find_expr(fir::package_id package, fir::expr_id id) const;
  const pat_compute_props::t *find_pat(fir::package_id package, fir::pat_id id) const;

  package_compute_props &get_or_insert_package(fir::package_id package) { return packages.get_or_insert_default(package); }
  void incorporate(fir::package_id package, package_compute_props &&partial);

  bool operator==(const store_compute_props &o) const { return packages == o.packages; }
  bool operator!=(const store_compute_props &o) const { return !(*this == o); }
  void print(std::ostream &os) const;
  // writes one rca.package<N>.txt per package into `directory`
  void persist(std::string_view directory) const;

 private:
  util::index_map<fir::package_id, package_compute_props> packages;
};

}

#endif //RCA_LIB_COMPUTE_STORE_H_
