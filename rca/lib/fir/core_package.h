#ifndef RCA_LIB_FIR_CORE_PACKAGE_H_
#define RCA_LIB_FIR_CORE_PACKAGE_H_
#include <fir/fir.h>

namespace rca::fir {

// Runtime, QIS and standard library intrinsics every program links against, grouped in namespaces.
package make_core_package();

}

#endif //RCA_LIB_FIR_CORE_PACKAGE_H_
