#ifndef RCA_LIB_FIR_TY_H_
#define RCA_LIB_FIR_TY_H_
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <memory>
#include <iostream>
#include <util/util.h>

namespace rca::fir {

enum class callable_kind { function, operation };
std::string_view to_string(callable_kind k);

namespace ty {

enum class prim {
  big_int, boolean, dbl, integer, pauli, qubit, range, range_from, range_to, range_full, result, string
};
std::string_view to_string(prim p);

struct t;
typedef std::shared_ptr<const t> ptr;

struct primitive {
  prim kind;
  bool operator==(const primitive &o) const { return kind == o.kind; }
};
struct array {
  ptr item;
  bool operator==(const array &o) const;
};
struct arrow {
  callable_kind kind;
  ptr input, output;
  bool operator==(const arrow &o) const;
};
struct tuple {
  std::vector<t> items; //empty for unit
  bool operator==(const tuple &o) const;
};
struct udt {
  std::string name;
  bool operator==(const udt &o) const { return name == o.name; }
};
// generic type parameter, only legal where the analysis never needs a capability for it
struct param {
  size_t id;
  bool operator==(const param &o) const { return id == o.id; }
};

struct t : public std::variant<primitive, array, arrow, tuple, udt, param> {
  typedef std::variant<primitive, array, arrow, tuple, udt, param> base;
  using base::base;
  bool is_unit() const;
  bool is_prim(prim p) const;
  // true if a value of this type holds a qubit somewhere inside it
  bool contains_qubit() const;
  // false for unit, qubits and tuples made only of those: values that hold no classical data
  bool carries_classical_data() const;
  void print(std::ostream &os) const;
  bool operator==(const t &o) const { return static_cast<const base &>(*this) == static_cast<const base &>(o); }
  bool operator!=(const t &o) const { return !(*this == o); }
};

t unit();
t make(prim p);
t array_of(t item);
t arrow_of(callable_kind kind, t input, t output);
t tuple_of(std::vector<t> items);
t udt_of(std::string_view name);
t param_of(size_t id);

std::ostream &operator<<(std::ostream &os, const t &type);

}
}

#endif //RCA_LIB_FIR_TY_H_
