#include <capability/capability.h>
#include <error/error.h>

namespace rca {

std::string_view to_string(runtime_capability c) {
  switch (c) {
    case runtime_capability::conditional_forward_branching:return "ConditionalForwardBranching";
    case runtime_capability::integer_computations:return "IntegerComputations";
    case runtime_capability::floating_point_computation:return "FloatingPointComputation";
    case runtime_capability::higher_level_constructs:return "HigherLevelConstructs";
  }
  THROW_INTERNAL_ERROR
}

capability_set::capability_set(std::initializer_list<runtime_capability> caps) {
  for (runtime_capability c : caps)insert(c);
}

size_t capability_set::size() const {
  size_t n = 0;
  for_each([&n](runtime_capability) { ++n; });
  return n;
}

bool capability_set::merge(const capability_set &o) {
  const uint8_t before = bits;
  bits |= o.bits;
  return bits != before;
}

capability_set capability_set::operator|(const capability_set &o) const {
  capability_set s = *this;
  s.merge(o);
  return s;
}

void capability_set::print(std::ostream &os) const {
  if (empty()) {
    os << "<empty>";
    return;
  }
  bool sep = false;
  for_each([&](runtime_capability c) {
    if (sep)os << " | ";
    sep = true;
    os << to_string(c);
  });
}

util::sexp::t capability_set::to_sexp() const {
  util::sexp::t s = {};
  for_each([&s](runtime_capability c) { s.push_back(to_string(c)); });
  return s;
}

namespace foundational {

capability_set capabilities_of(const fir::ty::t &type) {
  using namespace fir::ty;
  return std::visit(util::overloaded{
      [](const primitive &p) -> capability_set {
        switch (p.kind) {
          case prim::qubit:return {};
          case prim::boolean:
          case prim::result:return {runtime_capability::conditional_forward_branching};
          case prim::integer:
          case prim::pauli:
          case prim::range:
          case prim::range_from:
          case prim::range_to:
          case prim::range_full:return {runtime_capability::integer_computations};
          case prim::dbl:return {runtime_capability::floating_point_computation};
          case prim::big_int:
          case prim::string:return {runtime_capability::higher_level_constructs};
        }
        THROW_INTERNAL_ERROR
      },
      [](const array &) -> capability_set { return {runtime_capability::higher_level_constructs}; },
      [](const arrow &) -> capability_set { return {runtime_capability::higher_level_constructs}; },
      [](const udt &) -> capability_set { return {runtime_capability::higher_level_constructs}; },
      [](const tuple &tp) {
        capability_set s;
        for (const t &x : tp.items)s.merge(capabilities_of(x));
        return s;
      },
      [&type](const param &) -> capability_set { throw error::unsupported_type(util::to_string(type)); }
  }, static_cast<const t::base &>(type));
}

capability_mapping mapping() { return capabilities_of; }

}

std::ostream &operator<<(std::ostream &os, runtime_capability c) { return os << to_string(c); }

std::ostream &operator<<(std::ostream &os, const capability_set &s) {
  s.print(os);
  return os;
}

}
