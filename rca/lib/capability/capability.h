#ifndef RCA_LIB_CAPABILITY_CAPABILITY_H_
#define RCA_LIB_CAPABILITY_CAPABILITY_H_
#include <array>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string_view>
#include <util/sexp.h>
#include <fir/ty.h>

namespace rca {

enum class runtime_capability : uint8_t {
  conditional_forward_branching,
  integer_computations,
  floating_point_computation,
  higher_level_constructs,
};
std::string_view to_string(runtime_capability c);

static constexpr std::array<runtime_capability, 4> all_runtime_capabilities = {
    runtime_capability::conditional_forward_branching,
    runtime_capability::integer_computations,
    runtime_capability::floating_point_computation,
    runtime_capability::higher_level_constructs,
};

// Set of capabilities as a bit mask. Iteration follows the declaration order of runtime_capability.
class capability_set : public util::sexp::sexp_of_t {
 public:
  capability_set() = default;
  capability_set(std::initializer_list<runtime_capability> caps);

  bool contains(runtime_capability c) const { return bits & bit(c); }
  bool empty() const { return bits == 0; }
  size_t size() const;
  void insert(runtime_capability c) { bits |= bit(c); }
  // returns true if this set grew
  bool merge(const capability_set &o);
  bool includes(const capability_set &o) const { return (bits & o.bits) == o.bits; }

  bool operator==(const capability_set &o) const { return bits == o.bits; }
  bool operator!=(const capability_set &o) const { return bits != o.bits; }
  capability_set operator|(const capability_set &o) const;

  template<typename F>
  void for_each(F &&f) const {
    for (runtime_capability c : all_runtime_capabilities)if (contains(c))f(c);
  }
  // "<empty>" or the capability names separated by " | "
  void print(std::ostream &os) const;
  util::sexp::t to_sexp() const final;

 private:
  static uint8_t bit(runtime_capability c) { return uint8_t(1) << static_cast<uint8_t>(c); }
  uint8_t bits = 0;
};

// Maps a type to the capabilities needed to handle a dynamic value of that type.
typedef std::function<capability_set(const fir::ty::t &)> capability_mapping;

namespace foundational {
// The default mapping. Throws error::unsupported_type on type parameters.
capability_set capabilities_of(const fir::ty::t &type);
capability_mapping mapping();
}

std::ostream &operator<<(std::ostream &os, runtime_capability c);
std::ostream &operator<<(std::ostream &os, const capability_set &s);

}

#endif //RCA_LIB_CAPABILITY_CAPABILITY_H_
