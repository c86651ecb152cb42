#ifndef RCA_LIB_ERROR_ERROR_H_
#define RCA_LIB_ERROR_ERROR_H_

#include <stdexcept>
#include <string>
#include <string_view>
#include <cstddef>
#include <util/message.h>

// Fatal contract violations of the analysis. They abort the run and surface as internal compiler errors.
namespace rca::error {

class base : public std::runtime_error, public util::message::internal_error_report {
 public:
  explicit base(const std::string &what) : std::runtime_error(what) {}
  void describe(std::ostream &os) const override { os << what(); }
};

class malformed_fir : public base {
 public:
  explicit malformed_fir(const std::string &what) : base("malformed FIR: " + what) {}
};

// an id is referenced but absent from its arena
class missing_node : public malformed_fir {
 public:
  missing_node(std::string_view arena, size_t id);
  std::string_view arena;
  size_t id;
};

class unsupported_type : public base {
 public:
  explicit unsupported_type(const std::string &type) : base("type " + type + " has no runtime capability mapping") {}
};

class app_index_out_of_range : public base {
 public:
  app_index_out_of_range(size_t index, size_t size);
  size_t index, size;
};

class too_many_parameters : public base {
 public:
  too_many_parameters(std::string_view callable, size_t count, size_t limit);
};

// lookup of an item the analysis never stored
class missing_compute_props : public base {
 public:
  missing_compute_props(size_t package, size_t item);
};

}

#endif //RCA_LIB_ERROR_ERROR_H_
