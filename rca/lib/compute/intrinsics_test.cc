#include <gtest/gtest.h>
#include <compute/analyzer.h>
#include <fir/core_package.h>
#include <error/error.h>
#include <memory>

namespace rca::compute {
namespace {

typedef runtime_capability rc;

class Intrinsics : public ::testing::Test {
 protected:
  static void SetUpTestSuite() { core = std::make_unique<fir::package>(fir::make_core_package()); }
  static void TearDownTestSuite() { core.reset(); }

  static applications_table table_of(std::string_view name, const options &opts = {}) {
    std::optional<fir::local_item_id> id = core->find_callable(name);
    if (!id.has_value())throw std::runtime_error("no callable " + std::string(name));
    return analyze_intrinsic(*core, core->get_callable(*id), foundational::mapping(), opts);
  }

  static std::unique_ptr<fir::package> core;
};
std::unique_ptr<fir::package> Intrinsics::core;

TEST_F(Intrinsics, QubitAllocateHasOneStaticApplication) {
  const applications_table t = table_of("__quantum__rt__qubit_allocate");
  ASSERT_EQ(t.size(), 1);
  EXPECT_TRUE(t.at(0).runtime_capabilities.empty());
  EXPECT_FALSE(t.at(0).is_quantum_source());
  EXPECT_FALSE(t.at(0).uses_dynamic_qubit);
}

TEST_F(Intrinsics, QubitReleaseFlagsDynamicQubit) {
  const applications_table t = table_of("__quantum__rt__qubit_release");
  ASSERT_EQ(t.size(), 2);
  EXPECT_EQ(t.at(0), compute_props{});
  EXPECT_TRUE(t.at(1).runtime_capabilities.empty());
  EXPECT_EQ(t.at(1).kind(), compute_kind::static_);
  EXPECT_TRUE(t.at(1).uses_dynamic_qubit);
  EXPECT_FALSE(t.at(1).is_quantum_source());
}

TEST_F(Intrinsics, IntAsDouble) {
  const applications_table t = table_of("IntAsDouble");
  ASSERT_EQ(t.size(), 2);
  EXPECT_EQ(t.at(0), compute_props{});
  EXPECT_EQ(t.at(1).runtime_capabilities, (capability_set{rc::integer_computations, rc::floating_point_computation}));
  EXPECT_TRUE(t.at(1).is_quantum_source());
  EXPECT_FALSE(t.at(1).uses_dynamic_qubit);
}

TEST_F(Intrinsics, Length) {
  const applications_table t = table_of("Length");
  ASSERT_EQ(t.size(), 2);
  EXPECT_TRUE(t.at(0).runtime_capabilities.empty());
  EXPECT_EQ(t.at(1).runtime_capabilities, (capability_set{rc::higher_level_constructs, rc::integer_computations}));
}

TEST_F(Intrinsics, CheckZeroIsAlwaysASource) {
  const applications_table t = table_of("CheckZero");
  ASSERT_EQ(t.size(), 2);
  EXPECT_EQ(t.at(0).runtime_capabilities, capability_set{rc::conditional_forward_branching});
  EXPECT_TRUE(t.at(0).is_quantum_source());
  EXPECT_FALSE(t.at(0).uses_dynamic_qubit);
  EXPECT_EQ(t.at(1).runtime_capabilities, capability_set{rc::conditional_forward_branching});
  EXPECT_TRUE(t.at(1).uses_dynamic_qubit);
}

TEST_F(Intrinsics, Measurement) {
  const applications_table t = table_of("__quantum__qis__m__body");
  EXPECT_EQ(t.at(0).to_sexp_string(), "(compute_props Dynamic (ConditionalForwardBranching) (Intrinsic))");
  EXPECT_EQ(t.at(1).to_sexp_string(),
            "(compute_props Dynamic (ConditionalForwardBranching) (Intrinsic) uses_dynamic_qubit)");
}

TEST_F(Intrinsics, GatesNeedNoCapability) {
  for (std::string_view name : {"__quantum__qis__h__body", "__quantum__qis__cx__body", "__quantum__qis__ccx__body"}) {
    for (const compute_props &p : table_of(name)) {
      EXPECT_TRUE(p.runtime_capabilities.empty()) << name;
      EXPECT_FALSE(p.is_quantum_source()) << name;
    }
  }
  const applications_table rx = table_of("__quantum__qis__rx__body");
  ASSERT_EQ(rx.size(), 4);
  EXPECT_EQ(rx.at(1).runtime_capabilities, capability_set{rc::floating_point_computation});
  EXPECT_FALSE(rx.at(1).uses_dynamic_qubit);
  EXPECT_TRUE(rx.at(2).runtime_capabilities.empty());
  EXPECT_TRUE(rx.at(2).uses_dynamic_qubit);
}

TEST_F(Intrinsics, RandomOperationsAreSources) {
  const applications_table t = table_of("DrawRandomInt");
  ASSERT_EQ(t.size(), 4);
  for (const compute_props &p : t) {
    EXPECT_EQ(p.runtime_capabilities, capability_set{rc::integer_computations});
    EXPECT_TRUE(p.is_quantum_source());
  }
}

TEST_F(Intrinsics, MessageIsNeverASource) {
  const applications_table t = table_of("Message");
  EXPECT_EQ(t.at(0), compute_props{});
  EXPECT_EQ(t.at(1).runtime_capabilities, capability_set{rc::higher_level_constructs});
  EXPECT_FALSE(t.at(1).is_quantum_source());
}

TEST_F(Intrinsics, FunctionWithTwoParameters) {
  const applications_table t = table_of("ArcTan2");
  ASSERT_EQ(t.size(), 4);
  EXPECT_EQ(t.at(0), compute_props{});
  for (app_idx app = 1; app < 4; ++app) {
    EXPECT_EQ(t.at(app).runtime_capabilities, capability_set{rc::floating_point_computation});
    EXPECT_TRUE(t.at(app).is_quantum_source());
  }
}

TEST_F(Intrinsics, ParametersAreChargedIndependently) {
  const applications_table t = table_of("AccountForEstimatesInternal");
  ASSERT_EQ(t.size(), 8);
  EXPECT_EQ(t.at(0), compute_props{});
  EXPECT_EQ(t.at(1).runtime_capabilities, capability_set{rc::higher_level_constructs});
  EXPECT_EQ(t.at(2).runtime_capabilities, capability_set{rc::integer_computations});
  EXPECT_FALSE(t.at(2).uses_dynamic_qubit);
  EXPECT_EQ(t.at(4).runtime_capabilities, capability_set{rc::higher_level_constructs});
  EXPECT_TRUE(t.at(4).uses_dynamic_qubit);
  EXPECT_EQ(t.at(7).runtime_capabilities, (capability_set{rc::higher_level_constructs, rc::integer_computations}));
  EXPECT_FALSE(t.at(7).is_quantum_source());
}

TEST_F(Intrinsics, FunctionOutputIsChargedForDynamicApplications) {
  for (const auto &[id, it] : core->items) {
    const fir::callable_decl *decl = it.as_callable();
    if (decl == nullptr)continue;
    const applications_table t = analyze_intrinsic(*core, *decl, foundational::mapping());
    EXPECT_EQ(t.size(), size_t(1) << derive_input_params(*core, *decl).size()) << decl->name;
    if (decl->kind != fir::callable_kind::function)continue;
    const capability_set output = foundational::capabilities_of(decl->output);
    for (app_idx app = 1; app < t.size(); ++app) {
      EXPECT_TRUE(t.at(app).runtime_capabilities.includes(output)) << decl->name << " " << app;
    }
  }
}

TEST_F(Intrinsics, TooManyParameters) {
  options opts;
  opts.max_input_param_count = 1;
  EXPECT_THROW(table_of("ArcTan2", opts), error::too_many_parameters);
  EXPECT_NO_THROW(table_of("Sqrt", opts));
}

}
}
