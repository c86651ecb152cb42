#include <gtest/gtest.h>
#include <fir/builder.h>
#include <fir/core_package.h>
#include <error/error.h>

namespace rca::fir {
namespace {

TEST(Builder, DenseIds) {
  package_builder b;
  const pat_id q = b.bind("q", ty::make(ty::prim::qubit));
  const expr_id v = b.local_var(q);
  const expr_id one = b.int_lit(1);
  const stmt_id s = b.semi(one);
  const block_id blk = b.block({s, b.expr_stmt(v)});
  EXPECT_EQ(q, 0);
  EXPECT_EQ(v, 0);
  EXPECT_EQ(one, 1);
  EXPECT_EQ(s, 0);
  EXPECT_EQ(blk, 0);
  const package p = b.finish();
  EXPECT_EQ(p.get_block(blk).ty, ty::make(ty::prim::qubit));
  EXPECT_EQ(p.get_expr(one).ty, ty::make(ty::prim::integer));
}

TEST(Builder, CallTypes) {
  package_builder b;
  const local_item_id m = b.intrinsic(callable_kind::operation, "M", {ty::make(ty::prim::qubit)},
                                      ty::make(ty::prim::result));
  const pat_id q = b.bind("q", ty::make(ty::prim::qubit));
  const expr_id call = b.call(b.callable_ref(m), b.local_var(q));
  const expr_id eq = b.bin_op(binary_operator::eq, call, b.lit("One", ty::make(ty::prim::result)));
  const expr_id sum = b.bin_op(binary_operator::add, b.int_lit(1), b.int_lit(2));
  const package &p = b.peek();
  EXPECT_EQ(p.get_expr(call).ty, ty::make(ty::prim::result));
  EXPECT_EQ(p.get_expr(eq).ty, ty::make(ty::prim::boolean));
  EXPECT_EQ(p.get_expr(sum).ty, ty::make(ty::prim::integer));
  EXPECT_THROW(b.call(b.int_lit(3), b.unit_lit()), error::malformed_fir);
}

TEST(Builder, ControlledType) {
  package_builder b;
  const local_item_id x = b.intrinsic(callable_kind::operation, "X", {ty::make(ty::prim::qubit)}, ty::unit());
  const expr_id ctl = b.controlled(b.callable_ref(x));
  const expr_id adj = b.adjoint(b.callable_ref(x));
  EXPECT_EQ(util::to_string(b.peek().get_expr(ctl).ty), "((Qubit[], Qubit) => ())");
  EXPECT_EQ(util::to_string(b.peek().get_expr(adj).ty), "(Qubit => ())");
}

TEST(Builder, IntrinsicParameterPatterns) {
  package_builder b;
  const local_item_id none = b.intrinsic(callable_kind::function, "None", std::vector<ty::t>{}, ty::unit());
  const local_item_id two = b.intrinsic(callable_kind::function, "Two",
                                        {ty::make(ty::prim::integer), ty::make(ty::prim::dbl)}, ty::unit());
  const package p = b.finish();
  EXPECT_TRUE(p.get_pat(p.get_callable(none).input).ty.is_unit());
  auto tuple = std::get_if<pat_kind::tuple>(&p.get_pat(p.get_callable(two).input).kind);
  ASSERT_NE(tuple, nullptr);
  EXPECT_EQ(tuple->items.size(), 2);
  EXPECT_TRUE(p.get_callable(two).is_intrinsic());
}

TEST(Builder, DeclareThenDefine) {
  package_builder b;
  const local_item_id f = b.declare(callable_kind::operation, "F", b.bind("q", ty::make(ty::prim::qubit)), ty::unit());
  const block_id body = b.block({b.semi(b.call(b.callable_ref(f), b.unit_lit()))});
  b.set_body(f, body);
  const block_id adj = b.block({});
  b.set_adj(f, adj);
  const package p = b.finish();
  const auto &impl = std::get<spec_impl>(p.get_callable(f).implementation);
  EXPECT_EQ(impl.body.block, body);
  ASSERT_TRUE(impl.adj.has_value());
  EXPECT_EQ(impl.adj->block, adj);
  EXPECT_FALSE(impl.ctl.has_value());
}

TEST(Builder, SpecializationsOfIntrinsicThrow) {
  package_builder b;
  const local_item_id x = b.intrinsic(callable_kind::operation, "X", {ty::make(ty::prim::qubit)}, ty::unit());
  EXPECT_THROW(b.set_adj(x, b.block({})), error::malformed_fir);
}

TEST(Package, MissingNodes) {
  package_builder b;
  b.int_lit(0);
  const package p = b.finish();
  EXPECT_THROW(p.get_expr(1), error::missing_node);
  EXPECT_THROW(p.get_block(0), error::missing_node);
  EXPECT_THROW(p.get_item(0), error::malformed_fir);
}

TEST(Package, GetCallableRejectsOtherItems) {
  package_builder b;
  const local_item_id ns = b.namespace_("Ns");
  const package p = b.finish();
  EXPECT_THROW(p.get_callable(ns), error::malformed_fir);
  EXPECT_EQ(p.get_item(ns).name(), "Ns");
}

TEST(CorePackage, Namespaces) {
  const package p = make_core_package();
  const std::optional<local_item_id> m = p.find_callable("__quantum__qis__m__body");
  ASSERT_TRUE(m.has_value());
  const item &it = p.get_item(*m);
  ASSERT_TRUE(it.parent.has_value());
  EXPECT_EQ(p.get_item(*it.parent).name(), "QIR.Intrinsic");
  EXPECT_EQ(p.get_callable(*m).kind, callable_kind::operation);
  EXPECT_EQ(p.get_callable(*m).output, ty::make(ty::prim::result));
  EXPECT_FALSE(p.find_callable("Microsoft.Quantum.Math").has_value());
  EXPECT_FALSE(p.find_callable("NoSuchCallable").has_value());
}

TEST(CorePackage, EveryCallableIsIntrinsic) {
  const package p = make_core_package();
  size_t callables = 0;
  for (const auto &[id, it] : p.items) {
    if (const callable_decl *decl = it.as_callable()) {
      EXPECT_TRUE(decl->is_intrinsic()) << decl->name;
      ++callables;
    }
  }
  EXPECT_EQ(callables, 50);
}

}
}
