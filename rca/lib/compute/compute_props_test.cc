#include <gtest/gtest.h>
#include <compute/compute_props.h>
#include <error/error.h>

namespace rca::compute {
namespace {

typedef runtime_capability rc;

compute_props props(capability_set caps, bool source = false) {
  compute_props p;
  p.runtime_capabilities = caps;
  if (source)p.add_source(quantum_source::intrinsic);
  return p;
}

TEST(ComputeProps, Kind) {
  EXPECT_EQ(compute_props{}.kind(), compute_kind::static_);
  EXPECT_EQ(props({rc::integer_computations}).kind(), compute_kind::dynamic);
  compute_props qubit_only;
  qubit_only.uses_dynamic_qubit = true;
  EXPECT_EQ(qubit_only.kind(), compute_kind::static_);
  EXPECT_FALSE(qubit_only.is_quantum_source());
}

TEST(ComputeProps, SourcesHaveNoDuplicates) {
  compute_props p;
  p.add_source(quantum_source::intrinsic);
  p.add_source(quantum_source::intrinsic);
  EXPECT_EQ(p.quantum_sources.size(), 1);
  EXPECT_FALSE(p.merge(props({}, true)));
  EXPECT_EQ(p.quantum_sources.size(), 1);
}

TEST(ComputeProps, Merge) {
  compute_props p = props({rc::integer_computations});
  EXPECT_FALSE(p.merge(props({rc::integer_computations})));
  EXPECT_TRUE(p.merge(props({rc::floating_point_computation})));
  compute_props qubit;
  qubit.uses_dynamic_qubit = true;
  EXPECT_TRUE(p.merge(qubit));
  EXPECT_FALSE(p.merge(qubit));
  EXPECT_TRUE(p.merge(props({}, true)));
  EXPECT_EQ(p.to_sexp_string(),
            "(compute_props Dynamic (IntegerComputations FloatingPointComputation) (Intrinsic) uses_dynamic_qubit)");
}

TEST(ComputeProps, PrintStatic) {
  std::stringstream s;
  compute_props{}.print(s, 0);
  EXPECT_EQ(s.str(),
            "Compute Properties (Static):\n"
            "    Runtime Capabilities: <empty>\n"
            "    Quantum Sources: <empty>");
}

TEST(ComputeProps, PrintDynamic) {
  std::stringstream s;
  compute_props p = props({rc::conditional_forward_branching, rc::higher_level_constructs}, true);
  p.uses_dynamic_qubit = true;
  p.print(s, 1);
  EXPECT_EQ(s.str(),
            "Compute Properties (Dynamic):\n"
            "        Runtime Capabilities: {\n"
            "            ConditionalForwardBranching\n"
            "            HigherLevelConstructs\n"
            "        }\n"
            "        Quantum Sources:\n"
            "            Intrinsic\n"
            "        Uses Dynamic Qubit");
}

TEST(ApplicationsTable, SizeIsPowerOfTwo) {
  for (size_t k = 0; k < 6; ++k) {
    applications_table t(k);
    EXPECT_EQ(t.size(), size_t(1) << k);
    EXPECT_EQ(t.input_param_count(), k);
    EXPECT_TRUE(t.is_app_independent());
  }
}

TEST(ApplicationsTable, OutOfRange) {
  applications_table t(2);
  EXPECT_NO_THROW(t.at(3));
  EXPECT_THROW(t.at(4), error::app_index_out_of_range);
  const applications_table &c = t;
  EXPECT_THROW(c.at(100), error::app_index_out_of_range);
  EXPECT_THROW(applications_table(64), std::runtime_error);
}

TEST(ApplicationsTable, Merge) {
  applications_table a(1), b(1);
  b.at(1) = props({rc::integer_computations}, true);
  EXPECT_TRUE(a.merge(b));
  EXPECT_FALSE(a.merge(b));
  EXPECT_EQ(a, b);
  EXPECT_FALSE(a.is_app_independent());
  EXPECT_THROW(a.merge(applications_table(2)), std::runtime_error);
}

TEST(ApplicationsTable, IsParamDynamic) {
  EXPECT_FALSE(is_param_dynamic(0, 0));
  EXPECT_TRUE(is_param_dynamic(1, 0));
  EXPECT_FALSE(is_param_dynamic(1, 1));
  EXPECT_TRUE(is_param_dynamic(6, 1));
  EXPECT_TRUE(is_param_dynamic(6, 2));
}

TEST(ApplicationsTable, Print) {
  applications_table t(1);
  t.at(1) = props({rc::integer_computations});
  std::stringstream s;
  t.print(s, 0);
  EXPECT_EQ(s.str(),
            "Applications Table (1 input parameters):\n"
            "    [0b00000000] -> Compute Properties (Static):\n"
            "        Runtime Capabilities: <empty>\n"
            "        Quantum Sources: <empty>\n"
            "    [0b00000001] -> Compute Properties (Dynamic):\n"
            "        Runtime Capabilities: {\n"
            "            IntegerComputations\n"
            "        }\n"
            "        Quantum Sources: <empty>");
}

TEST(ApplicationsTable, Sexp) {
  applications_table t(1);
  t.at(1) = props({rc::floating_point_computation}, true);
  EXPECT_EQ(t.to_sexp_string(),
            "(applications_table 1 (compute_props Static () ()) "
            "(compute_props Dynamic (FloatingPointComputation) (Intrinsic)))");
}

}
}
