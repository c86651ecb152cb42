#include <fir/core_package.h>
#include <fir/builder.h>

namespace rca::fir {

namespace {

struct intrinsic_signature {
  callable_kind kind;
  std::string_view name;
  std::vector<ty::t> params;
  ty::t output;
};

void add_namespace(package_builder &b, std::string_view name, const std::vector<intrinsic_signature> &sigs) {
  const local_item_id ns = b.namespace_(name);
  for (const intrinsic_signature &s : sigs)b.add_to_namespace(ns, b.intrinsic(s.kind, s.name, s.params, s.output));
}

}

package make_core_package() {
  const callable_kind fn = callable_kind::function;
  const callable_kind op = callable_kind::operation;
  const ty::t unit = ty::unit();
  const ty::t qubit = ty::make(ty::prim::qubit);
  const ty::t result = ty::make(ty::prim::result);
  const ty::t boolean = ty::make(ty::prim::boolean);
  const ty::t integer = ty::make(ty::prim::integer);
  const ty::t dbl = ty::make(ty::prim::dbl);
  const ty::t string = ty::make(ty::prim::string);
  const ty::t qubits = ty::array_of(qubit);

  package_builder b;
  add_namespace(b, "QIR.Runtime", {
      {op, "__quantum__rt__qubit_allocate", {}, qubit},
      {op, "__quantum__rt__qubit_release", {qubit}, unit},
  });

  std::vector<intrinsic_signature> qis = {
      {op, "__quantum__qis__m__body", {qubit}, result},
      {op, "__quantum__qis__mresetz__body", {qubit}, result},
      {op, "__quantum__qis__ccx__body", {qubit, qubit, qubit}, unit},
      {op, "__quantum__qis__cx__body", {qubit, qubit}, unit},
      {op, "__quantum__qis__cy__body", {qubit, qubit}, unit},
      {op, "__quantum__qis__cz__body", {qubit, qubit}, unit},
      {op, "__quantum__qis__swap__body", {qubit, qubit}, unit},
  };
  for (std::string_view name : {"__quantum__qis__rx__body", "__quantum__qis__ry__body", "__quantum__qis__rz__body"}) {
    qis.push_back({op, name, {dbl, qubit}, unit});
  }
  for (std::string_view name : {"__quantum__qis__rxx__body", "__quantum__qis__ryy__body", "__quantum__qis__rzz__body"}) {
    qis.push_back({op, name, {dbl, qubit, qubit}, unit});
  }
  for (std::string_view name : {"__quantum__qis__h__body", "__quantum__qis__s__body", "__quantum__qis__s__adj",
                                "__quantum__qis__t__body", "__quantum__qis__t__adj", "__quantum__qis__x__body",
                                "__quantum__qis__y__body", "__quantum__qis__z__body", "__quantum__qis__reset__body"}) {
    qis.push_back({op, name, {qubit}, unit});
  }
  add_namespace(b, "QIR.Intrinsic", qis);

  add_namespace(b, "Microsoft.Quantum.Core", {
      {fn, "Length", {ty::array_of(ty::param_of(0))}, integer},
  });
  add_namespace(b, "Microsoft.Quantum.Convert", {
      {fn, "IntAsDouble", {integer}, dbl},
      {fn, "IntAsBigInt", {integer}, ty::make(ty::prim::big_int)},
  });
  add_namespace(b, "Microsoft.Quantum.Diagnostics", {
      {fn, "DumpMachine", {}, unit},
      {fn, "CheckZero", {qubit}, boolean},
  });
  add_namespace(b, "Microsoft.Quantum.Intrinsic", {
      {fn, "Message", {string}, unit},
  });

  std::vector<intrinsic_signature> math;
  for (std::string_view name : {"ArcCos", "ArcSin", "ArcTan", "Cos", "Cosh", "Sin", "Sinh", "Tan", "Tanh", "Sqrt", "Log"}) {
    math.push_back({fn, name, {dbl}, dbl});
  }
  math.push_back({fn, "ArcTan2", {dbl, dbl}, dbl});
  math.push_back({fn, "Truncate", {dbl}, integer});
  add_namespace(b, "Microsoft.Quantum.Math", math);

  add_namespace(b, "Microsoft.Quantum.Random", {
      {op, "DrawRandomInt", {integer, integer}, integer},
      {op, "DrawRandomDouble", {dbl, dbl}, dbl},
  });
  add_namespace(b, "Microsoft.Quantum.ResourceEstimation", {
      {fn, "BeginEstimateCaching", {string, integer}, boolean},
      {fn, "EndEstimateCaching", {}, unit},
      {op, "AccountForEstimatesInternal", {ty::array_of(ty::tuple_of({integer, integer})), integer, qubits}, unit},
      {op, "BeginRepeatEstimatesInternal", {integer}, unit},
      {op, "EndRepeatEstimatesInternal", {}, unit},
  });
  return b.finish();
}

}
