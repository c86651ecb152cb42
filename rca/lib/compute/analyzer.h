#ifndef RCA_LIB_COMPUTE_ANALYZER_H_
#define RCA_LIB_COMPUTE_ANALYZER_H_
#include <iostream>
#include <fir/fir.h>
#include <capability/capability.h>
#include <compute/compute_props.h>
#include <compute/store.h>

namespace rca::compute {

struct options {
  std::ostream *trace = nullptr; //progress notes go here when set
  size_t max_input_param_count = 20; //a table holds 2^count entries
};

// Applications table of an intrinsic callable, derived from its signature alone.
applications_table analyze_intrinsic(const fir::package &package, const fir::callable_decl &decl,
                                     const capability_mapping &mapping, const options &opts = {});

// Analyzes every item of every package. Errors derived from error::base abort the whole run.
store_compute_props analyze(const fir::package_store &store,
                            const capability_mapping &mapping = foundational::mapping(),
                            const options &opts = {});

}

#endif //RCA_LIB_COMPUTE_ANALYZER_H_
