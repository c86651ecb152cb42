#ifndef RCA_LIB_COMPUTE_COMPUTE_PROPS_H_
#define RCA_LIB_COMPUTE_COMPUTE_PROPS_H_
#include <vector>
#include <iostream>
#include <util/sexp.h>
#include <capability/capability.h>

namespace rca::compute {

// Bit i set: input parameter i is dynamic in this application. 0 is the fully static application.
typedef size_t app_idx;
inline bool is_param_dynamic(app_idx app, size_t param) { return (app >> param) & 1; }

enum class compute_kind { static_, dynamic };
std::string_view to_string(compute_kind k);

// where a value that can't be known before execution comes from
enum class quantum_source { intrinsic };
std::string_view to_string(quantum_source s);

struct compute_props : public util::sexp::sexp_of_t {
  capability_set runtime_capabilities;
  std::vector<quantum_source> quantum_sources; //no duplicates
  bool uses_dynamic_qubit = false; //a dynamic qubit reaches an intrinsic, needs no capability by itself

  compute_kind kind() const { return runtime_capabilities.empty() ? compute_kind::static_ : compute_kind::dynamic; }
  bool is_quantum_source() const { return !quantum_sources.empty(); }
  void add_source(quantum_source s);
  // returns true if anything was added
  bool merge(const compute_props &o);

  bool operator==(const compute_props &o) const;
  bool operator!=(const compute_props &o) const { return !(*this == o); }
  // continuation lines are indented `level + 1` times
  void print(std::ostream &os, size_t level) const;
  util::sexp::t to_sexp() const final;
};

// Exactly 2^k entries for a specialization with k input parameters.
class applications_table : public util::sexp::sexp_of_t {
 public:
  explicit applications_table(size_t input_param_count);

  size_t input_param_count() const { return param_count; }
  size_t size() const { return entries.size(); }
  // throw error::app_index_out_of_range
  const compute_props &at(app_idx app) const;
  compute_props &at(app_idx app);
  bool merge(const applications_table &o);
  // every application yields the same properties
  bool is_app_independent() const;

  auto begin() const { return entries.cbegin(); }
  auto end() const { return entries.cend(); }

  bool operator==(const applications_table &o) const { return param_count == o.param_count && entries == o.entries; }
  bool operator!=(const applications_table &o) const { return !(*this == o); }
  void print(std::ostream &os, size_t level) const;
  util::sexp::t to_sexp() const final;

 private:
  size_t param_count;
  std::vector<compute_props> entries;
};

}

#endif //RCA_LIB_COMPUTE_COMPUTE_PROPS_H_
