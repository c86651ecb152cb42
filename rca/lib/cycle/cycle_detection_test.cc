#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cycle/cycle_detection.h>
#include <fir/builder.h>
#include <error/error.h>

namespace rca::cycle {
namespace {

using namespace fir;

ty::t qubit() { return ty::make(ty::prim::qubit); }

std::string sexps(const std::vector<cycled_callable_info> &infos) {
  return util::sexp::make_sexp(infos).to_string();
}

TEST(CycleDetection, NoCycles) {
  package_builder b;
  const local_item_id h = b.intrinsic(callable_kind::operation, "H", {qubit()}, ty::unit());
  const pat_id q = b.bind("q", qubit());
  b.callable(callable_kind::operation, "ApplyH", q, ty::unit(),
             b.block({b.semi(b.call(b.callable_ref(h), b.local_var(q)))}));
  EXPECT_TRUE(detect_callables_with_cycles(0, b.finish()).empty());
}

TEST(CycleDetection, SelfRecursion) {
  package_builder b;
  const pat_id n = b.bind("n", ty::make(ty::prim::integer));
  const local_item_id f = b.declare(callable_kind::function, "Fact", n, ty::make(ty::prim::integer));
  const expr_id rec = b.call(b.callable_ref(f), b.bin_op(binary_operator::sub, b.local_var(n), b.int_lit(1)));
  b.set_body(f, b.block({b.expr_stmt(b.bin_op(binary_operator::mul, b.local_var(n), rec))}));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 1);
  EXPECT_EQ(infos[0].id, f);
  EXPECT_TRUE(infos[0].is_body_cycled());
  EXPECT_EQ(sexps(infos), "((cycled_callable 0 (body true) (adj none) (ctl none) (ctl-adj none)))");
}

TEST(CycleDetection, MutualRecursion) {
  package_builder b;
  const pat_id qa = b.bind("q", qubit());
  const local_item_id a = b.declare(callable_kind::operation, "A", qa, ty::unit());
  const pat_id qb = b.bind("q", qubit());
  const local_item_id bb = b.declare(callable_kind::operation, "B", qb, ty::unit());
  b.set_body(a, b.block({b.expr_stmt(b.call(b.callable_ref(bb), b.local_var(qa)))}));
  b.set_body(bb, b.block({b.expr_stmt(b.call(b.callable_ref(a), b.local_var(qb)))}));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 2);
  EXPECT_EQ(infos[0].id, a);
  EXPECT_EQ(infos[1].id, bb);
  for (const cycled_callable_info &info : infos) {
    EXPECT_TRUE(info.is_body_cycled());
    EXPECT_FALSE(info.is_adj_cycled().has_value());
    EXPECT_FALSE(info.is_ctl_cycled().has_value());
    EXPECT_FALSE(info.is_ctl_adj_cycled().has_value());
  }
}

TEST(CycleDetection, OnlyTheCycleIsReported) {
  package_builder b;
  const pat_id n = b.bind("n", ty::make(ty::prim::integer));
  const local_item_id loop = b.declare(callable_kind::function, "Loop", n, ty::unit());
  b.set_body(loop, b.block({b.expr_stmt(b.call(b.callable_ref(loop), b.local_var(n)))}));
  const pat_id m = b.bind("m", ty::make(ty::prim::integer));
  b.callable(callable_kind::function, "Entry", m, ty::unit(),
             b.block({b.expr_stmt(b.call(b.callable_ref(loop), b.local_var(m)))}));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 1);
  EXPECT_EQ(infos[0].id, loop);
}

TEST(CycleDetection, AdjointSpecializations) {
  package_builder b;
  const pat_id q = b.bind("q", qubit());
  const local_item_id f = b.declare(callable_kind::operation, "F", q, ty::unit());
  b.set_body(f, b.block({}));
  b.set_adj(f, b.block({b.semi(b.call(b.adjoint(b.callable_ref(f)), b.local_var(q)))}));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 1);
  EXPECT_FALSE(infos[0].is_body_cycled());
  EXPECT_EQ(infos[0].is_adj_cycled(), std::optional<bool>(true));
  EXPECT_FALSE(infos[0].is_ctl_cycled().has_value());
}

TEST(CycleDetection, ControlledAdjointWalksItsOwnBlock) {
  package_builder b;
  const pat_id q = b.bind("q", qubit());
  const ty::t qubits = ty::array_of(qubit());
  const local_item_id f = b.declare(callable_kind::operation, "F", q, ty::unit());
  b.set_body(f, b.block({}));
  const pat_id c1 = b.bind("ctls", qubits);
  b.set_ctl(f, c1, b.block({}));
  const pat_id c2 = b.bind("ctls", qubits);
  const expr_id args = b.tuple({b.local_var(c2), b.local_var(q)});
  b.set_ctl_adj(f, c2, b.block({b.semi(b.call(b.controlled(b.adjoint(b.callable_ref(f))), args))}));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 1);
  EXPECT_EQ(infos[0].is_ctl_cycled(), std::optional<bool>(false));
  EXPECT_EQ(infos[0].is_ctl_adj_cycled(), std::optional<bool>(true));
  EXPECT_FALSE(infos[0].is_adj_cycled().has_value());
}

TEST(CycleDetection, ThroughLocalBinding) {
  package_builder b;
  const pat_id q = b.bind("q", qubit());
  const local_item_id f = b.declare(callable_kind::operation, "F", q, ty::unit());
  const expr_id ref = b.callable_ref(f);
  const pat_id op = b.bind("op", b.peek().get_expr(ref).ty);
  b.set_body(f, b.block({
      b.local(op, ref),
      b.semi(b.call(b.local_var(op), b.local_var(q))),
  }));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 1);
  EXPECT_TRUE(infos[0].is_body_cycled());
}

TEST(CycleDetection, ThroughClosure) {
  package_builder b;
  const pat_id q = b.bind("q", qubit());
  const local_item_id f = b.declare(callable_kind::operation, "F", q, ty::unit());
  const pat_id lq = b.bind("q", qubit());
  const local_item_id lambda = b.callable(callable_kind::operation, "<lambda>", lq, ty::unit(),
                                          b.block({b.semi(b.call(b.callable_ref(f), b.local_var(lq)))}));
  b.set_body(f, b.block({b.semi(b.call(b.closure({}, lambda), b.local_var(q)))}));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 2);
  EXPECT_EQ(infos[0].id, f);
  EXPECT_EQ(infos[1].id, lambda);
}

TEST(CycleDetection, CallInsideArgumentsAndBranches) {
  package_builder b;
  const pat_id n = b.bind("n", ty::make(ty::prim::integer));
  const local_item_id f = b.declare(callable_kind::function, "F", n, ty::make(ty::prim::integer));
  const expr_id cond = b.bin_op(binary_operator::gt, b.local_var(n), b.int_lit(0));
  const expr_id inner = b.call(b.callable_ref(f), b.int_lit(0));
  const expr_id then = b.block_expr(b.block({b.expr_stmt(b.bin_op(binary_operator::add, inner, b.int_lit(1)))}));
  b.set_body(f, b.block({b.expr_stmt(b.if_(cond, then, b.int_lit(0)))}));
  EXPECT_EQ(detect_callables_with_cycles(0, b.finish()).size(), 1);
}

TEST(CycleDetection, CallInsideCalleeExpression) {
  package_builder b;
  const ty::t integer = ty::make(ty::prim::integer);
  const local_item_id g = b.callable(callable_kind::function, "G", b.bind("m", integer), integer, b.block({
      b.expr_stmt(b.int_lit(0))}));
  const pat_id n = b.bind("n", integer);
  const local_item_id f = b.declare(callable_kind::function, "F", n, integer);
  const block_id pick = b.block({
      b.local(b.discard(integer), b.call(b.callable_ref(f), b.local_var(n))),
      b.expr_stmt(b.callable_ref(g)),
  });
  b.set_body(f, b.block({b.expr_stmt(b.call(b.block_expr(pick), b.local_var(n)))}));
  const std::vector<cycled_callable_info> infos = detect_callables_with_cycles(0, b.finish());
  ASSERT_EQ(infos.size(), 1);
  EXPECT_EQ(infos[0].id, f);
  EXPECT_TRUE(infos[0].is_body_cycled());
}

TEST(CycleDetection, UnresolvableCalleeIsIgnored) {
  package_builder b;
  const ty::t op_ty = ty::arrow_of(callable_kind::operation, qubit(), ty::unit());
  const pat_id op = b.bind("op", op_ty);
  const pat_id q = b.bind("q", qubit());
  const pat_id input = b.tuple_pat({op, q});
  b.callable(callable_kind::operation, "ApplyOp", input, ty::unit(),
             b.block({b.semi(b.call(b.local_var(op), b.local_var(q)))}));
  EXPECT_TRUE(detect_callables_with_cycles(0, b.finish()).empty());
}

TEST(CycleDetection, MissingSpecializationIsMalformed) {
  package_builder b;
  const pat_id q = b.bind("q", qubit());
  const local_item_id g = b.callable(callable_kind::operation, "G", b.bind("q", qubit()), ty::unit(), b.block({}));
  b.callable(callable_kind::operation, "F", q, ty::unit(),
             b.block({b.semi(b.call(b.adjoint(b.callable_ref(g)), b.local_var(q)))}));
  EXPECT_THROW(detect_callables_with_cycles(0, b.finish()), error::malformed_fir);
}

TEST(CycleDetection, TraceNotes) {
  package_builder b;
  const pat_id n = b.bind("n", ty::make(ty::prim::integer));
  const local_item_id f = b.declare(callable_kind::function, "Loop", n, ty::unit());
  b.set_body(f, b.block({b.expr_stmt(b.call(b.callable_ref(f), b.local_var(n)))}));
  std::stringstream trace;
  detect_callables_with_cycles(0, b.finish(), &trace);
  EXPECT_THAT(trace.str(), ::testing::HasSubstr("specialization body of Loop is part of a call cycle"));
}

}
}
