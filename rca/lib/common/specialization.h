#ifndef RCA_LIB_COMMON_SPECIALIZATION_H_
#define RCA_LIB_COMMON_SPECIALIZATION_H_
#include <array>
#include <map>
#include <vector>
#include <optional>
#include <functional>
#include <variant>
#include <fir/fir.h>

namespace rca {

enum class specialization_kind { body, adj, ctl, ctl_adj };
std::string_view to_string(specialization_kind k);
static constexpr std::array<specialization_kind, 4> all_specialization_kinds = {
    specialization_kind::body, specialization_kind::adj, specialization_kind::ctl, specialization_kind::ctl_adj};

struct specialization_selector {
  bool adjoint = false;
  bool controlled = false;

  // Adjoint flips adjoint, Controlled sets controlled and never clears it.
  specialization_selector apply(fir::unary_operator functor) const;
  specialization_kind kind() const;
  static specialization_selector of(specialization_kind k);

  bool operator==(const specialization_selector &o) const { return adjoint == o.adjoint && controlled == o.controlled; }
  bool operator!=(const specialization_selector &o) const { return !(*this == o); }
  bool operator<(const specialization_selector &o) const { return kind() < o.kind(); }
};

struct callable_specialization_selector {
  fir::local_item_id callable;
  specialization_selector specialization;
  bool operator==(const callable_specialization_selector &o) const {
    return callable == o.callable && specialization == o.specialization;
  }
  bool operator<(const callable_specialization_selector &o) const {
    if (callable != o.callable)return callable < o.callable;
    return specialization < o.specialization;
  }
};

// a specialization anywhere in a package store
struct global_specialization {
  fir::package_id package;
  fir::local_item_id callable;
  specialization_selector specialization;
  bool operator==(const global_specialization &o) const {
    return package == o.package && callable == o.callable && specialization == o.specialization;
  }
  bool operator<(const global_specialization &o) const {
    if (package != o.package)return package < o.package;
    if (callable != o.callable)return callable < o.callable;
    return specialization < o.specialization;
  }
};

namespace callable_variable {
struct bound_to_expr { fir::expr_id expr; };
struct input_param { size_t index; };
typedef std::variant<bound_to_expr, input_param> t;
}
// local binding -> what it holds, for one specialization traversal
typedef std::map<fir::node_id, callable_variable::t> node_map;

struct input_param {
  size_t index;
  fir::pat_id pat;
  fir::ty::t ty;
  std::vector<fir::node_id> nodes; //bindings of this parameter, several if it is a nested tuple
};

// One parameter for a single binding, one per element for a tuple. Throws error::malformed_fir otherwise.
std::vector<input_param> derive_input_params(const fir::package &p, const fir::callable_decl &decl);
// The callable's parameters followed, for controlled specializations, by the control register.
std::vector<input_param> derive_input_params(const fir::package &p, const fir::callable_decl &decl,
                                             specialization_selector s);
node_map make_node_map(const std::vector<input_param> &params);

// Throws error::malformed_fir if the callable is intrinsic or lacks the requested specialization.
const fir::spec_decl &select_spec_decl(const fir::callable_decl &decl, specialization_selector s);
bool has_spec_decl(const fir::callable_decl &decl, specialization_selector s);

// Binds the names of `pat` against `value` in `nodes`; tuple patterns destructure tuple literals.
void bind_pattern(const fir::package &p, fir::pat_id pat, fir::expr_id value, node_map &nodes);

struct resolved_callee {
  fir::package_id package;
  fir::local_item_id item;
  specialization_selector specialization;
  size_t controlled_depth = 0; //Controlled applications on the way to the item
};

struct resolution_context {
  fir::package_id package_id;
  const fir::package &package;
  const node_map &nodes;
  bool cross_package = false; //follow references into other packages
};

// Statically resolves a callee expression. nullopt when it can't be determined.
std::optional<resolved_callee> resolve_callee(const resolution_context &ctx, fir::expr_id callee);

// nullptr for type declarations (constructor calls). Throws error::malformed_fir for namespaces.
const fir::callable_decl *callee_decl(const fir::item &it);

}

template<>
struct std::hash<rca::callable_specialization_selector> {
  size_t operator()(const rca::callable_specialization_selector &s) const {
    return std::hash<size_t>()(s.callable) * 4 + static_cast<size_t>(s.specialization.kind());
  }
};

#endif //RCA_LIB_COMMON_SPECIALIZATION_H_
