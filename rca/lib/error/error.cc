#include <error/error.h>

namespace rca::error {

missing_node::missing_node(std::string_view arena, size_t id)
    : malformed_fir("couldn't find " + std::string(arena) + " " + std::to_string(id) + " in FIR"),
      arena(arena), id(id) {}

app_index_out_of_range::app_index_out_of_range(size_t index, size_t size)
    : base("application index " + std::to_string(index) + " is out of range for a table of size "
               + std::to_string(size)), index(index), size(size) {}

too_many_parameters::too_many_parameters(std::string_view callable, size_t count, size_t limit)
    : base("callable " + std::string(callable) + " has " + std::to_string(count)
               + " input parameters, the analysis supports at most " + std::to_string(limit)) {}

missing_compute_props::missing_compute_props(size_t package, size_t item)
    : base("no compute properties for item " + std::to_string(item) + " of package " + std::to_string(package)) {}

}
