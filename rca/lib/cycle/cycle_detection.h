#ifndef RCA_LIB_CYCLE_CYCLE_DETECTION_H_
#define RCA_LIB_CYCLE_CYCLE_DETECTION_H_
#include <array>
#include <optional>
#include <vector>
#include <iostream>
#include <util/sexp.h>
#include <fir/fir.h>
#include <common/specialization.h>

namespace rca::cycle {

// A callable with at least one specialization that takes part in a call cycle. Cycles never cross packages.
struct cycled_callable_info : public util::sexp::sexp_of_t {
  struct flag {
    bool present = false; //the callable declares this specialization
    bool cycled = false;
    bool operator==(const flag &o) const { return present == o.present && cycled == o.cycled; }
  };
  fir::local_item_id id;
  std::array<flag, 4> flags; //indexed by specialization_kind, body always present

  static cycled_callable_info make(fir::local_item_id id, const fir::spec_impl &impl);
  // none when the specialization doesn't exist
  std::optional<bool> is_cycled(specialization_kind k) const;
  bool is_body_cycled() const { return flags[0].cycled; }
  std::optional<bool> is_adj_cycled() const { return is_cycled(specialization_kind::adj); }
  std::optional<bool> is_ctl_cycled() const { return is_cycled(specialization_kind::ctl); }
  std::optional<bool> is_ctl_adj_cycled() const { return is_cycled(specialization_kind::ctl_adj); }
  void mark(specialization_kind k);

  bool operator==(const cycled_callable_info &o) const { return id == o.id && flags == o.flags; }
  util::sexp::t to_sexp() const final;
};

// One entry per callable with a cycled specialization, ordered by callable id.
// Throws error::malformed_fir on dangling ids or calls to missing specializations.
std::vector<cycled_callable_info> detect_callables_with_cycles(fir::package_id package_id, const fir::package &package,
                                                               std::ostream *trace = nullptr);

}

#endif //RCA_LIB_CYCLE_CYCLE_DETECTION_H_
