#include <fir/ty.h>

namespace rca::fir {

std::string_view to_string(callable_kind k) {
  switch (k) {
    case callable_kind::function:return "function";
    case callable_kind::operation:return "operation";
  }
  THROW_INTERNAL_ERROR
}

namespace ty {

std::string_view to_string(prim p) {
  switch (p) {
    case prim::big_int:return "BigInt";
    case prim::boolean:return "Bool";
    case prim::dbl:return "Double";
    case prim::integer:return "Int";
    case prim::pauli:return "Pauli";
    case prim::qubit:return "Qubit";
    case prim::range:return "Range";
    case prim::range_from:return "RangeFrom";
    case prim::range_to:return "RangeTo";
    case prim::range_full:return "RangeFull";
    case prim::result:return "Result";
    case prim::string:return "String";
  }
  THROW_INTERNAL_ERROR
}

bool array::operator==(const array &o) const { return *item == *o.item; }
bool arrow::operator==(const arrow &o) const {
  return kind == o.kind && *input == *o.input && *output == *o.output;
}
bool tuple::operator==(const tuple &o) const { return items == o.items; }

bool t::is_unit() const {
  return std::holds_alternative<tuple>(*this) && std::get<tuple>(*this).items.empty();
}

bool t::is_prim(prim p) const {
  return std::holds_alternative<primitive>(*this) && std::get<primitive>(*this).kind == p;
}

bool t::contains_qubit() const {
  return std::visit(util::overloaded{
      [](const primitive &p) { return p.kind == prim::qubit; },
      [](const array &a) { return a.item->contains_qubit(); },
      [](const tuple &tp) {
        return std::any_of(tp.items.begin(), tp.items.end(), [](const t &x) { return x.contains_qubit(); });
      },
      [](const arrow &) { return false; },
      [](const udt &) { return false; },
      [](const param &) { return false; }
  }, static_cast<const base &>(*this));
}

bool t::carries_classical_data() const {
  return std::visit(util::overloaded{
      [](const primitive &p) { return p.kind != prim::qubit; },
      [](const tuple &tp) {
        return std::any_of(tp.items.begin(), tp.items.end(), [](const t &x) { return x.carries_classical_data(); });
      },
      [](const auto &) { return true; }
  }, static_cast<const base &>(*this));
}

void t::print(std::ostream &os) const {
  std::visit(util::overloaded{
      [&os](const primitive &p) { os << to_string(p.kind); },
      [&os](const array &a) {
        const bool sq = std::holds_alternative<arrow>(*a.item);
        if (sq)os << "(";
        a.item->print(os);
        if (sq)os << ")";
        os << "[]";
      },
      [&os](const arrow &a) {
        os << "(";
        a.input->print(os);
        os << (a.kind == callable_kind::function ? " -> " : " => ");
        a.output->print(os);
        os << ")";
      },
      [&os](const tuple &tp) {
        os << "(";
        bool comma = false;
        for (const t &x : tp.items) {
          if (comma)os << ", ";
          comma = true;
          x.print(os);
        }
        if (tp.items.size() == 1)os << ",";
        os << ")";
      },
      [&os](const udt &u) { os << u.name; },
      [&os](const param &p) { os << "'T" << p.id; }
  }, static_cast<const base &>(*this));
}

t unit() { return tuple{}; }
t make(prim p) { return primitive{p}; }
t array_of(t item) { return array{std::make_shared<const t>(std::move(item))}; }
t arrow_of(callable_kind kind, t input, t output) {
  return arrow{kind, std::make_shared<const t>(std::move(input)), std::make_shared<const t>(std::move(output))};
}
t tuple_of(std::vector<t> items) { return tuple{std::move(items)}; }
t udt_of(std::string_view name) { return udt{std::string(name)}; }
t param_of(size_t id) { return param{id}; }

std::ostream &operator<<(std::ostream &os, const t &type) {
  type.print(os);
  return os;
}

}
}
