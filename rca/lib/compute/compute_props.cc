#include <compute/compute_props.h>
#include <error/error.h>
#include <algorithm>

namespace rca::compute {

std::string_view to_string(compute_kind k) {
  switch (k) {
    case compute_kind::static_:return "Static";
    case compute_kind::dynamic:return "Dynamic";
  }
  THROW_INTERNAL_ERROR
}

std::string_view to_string(quantum_source s) {
  switch (s) {
    case quantum_source::intrinsic:return "Intrinsic";
  }
  THROW_INTERNAL_ERROR
}

void compute_props::add_source(quantum_source s) {
  if (std::find(quantum_sources.begin(), quantum_sources.end(), s) == quantum_sources.end())quantum_sources.push_back(s);
}

bool compute_props::merge(const compute_props &o) {
  bool changed = runtime_capabilities.merge(o.runtime_capabilities);
  for (quantum_source s : o.quantum_sources) {
    if (std::find(quantum_sources.begin(), quantum_sources.end(), s) == quantum_sources.end()) {
      quantum_sources.push_back(s);
      changed = true;
    }
  }
  if (o.uses_dynamic_qubit && !uses_dynamic_qubit) {
    uses_dynamic_qubit = true;
    changed = true;
  }
  return changed;
}

bool compute_props::operator==(const compute_props &o) const {
  return runtime_capabilities == o.runtime_capabilities && quantum_sources == o.quantum_sources
      && uses_dynamic_qubit == o.uses_dynamic_qubit;
}

void compute_props::print(std::ostream &os, size_t level) const {
  os << "Compute Properties (" << to_string(kind()) << "):";
  os << "\n";
  util::indent(os, level + 1);
  if (runtime_capabilities.empty()) {
    os << "Runtime Capabilities: <empty>";
  } else {
    os << "Runtime Capabilities: {";
    runtime_capabilities.for_each([&](runtime_capability c) {
      os << "\n";
      util::indent(os, level + 2);
      os << rca::to_string(c);
    });
    os << "\n";
    util::indent(os, level + 1);
    os << "}";
  }
  os << "\n";
  util::indent(os, level + 1);
  if (quantum_sources.empty()) {
    os << "Quantum Sources: <empty>";
  } else {
    os << "Quantum Sources:";
    for (quantum_source s : quantum_sources) {
      os << "\n";
      util::indent(os, level + 2);
      os << to_string(s);
    }
  }
  if (uses_dynamic_qubit) {
    os << "\n";
    util::indent(os, level + 1);
    os << "Uses Dynamic Qubit";
  }
}

util::sexp::t compute_props::to_sexp() const {
  util::sexp::t sources = {};
  for (quantum_source s : quantum_sources)sources.push_back(to_string(s));
  util::sexp::t s = {"compute_props", to_string(kind()), runtime_capabilities.to_sexp(), sources};
  if (uses_dynamic_qubit)s.push_back("uses_dynamic_qubit");
  return s;
}

applications_table::applications_table(size_t input_param_count)
    : param_count(input_param_count) {
  if (input_param_count >= 8 * sizeof(app_idx))THROW_INTERNAL_ERROR
  entries.resize(size_t(1) << input_param_count);
}

const compute_props &applications_table::at(app_idx app) const {
  if (app >= entries.size())throw error::app_index_out_of_range(app, entries.size());
  return entries[app];
}

compute_props &applications_table::at(app_idx app) {
  if (app >= entries.size())throw error::app_index_out_of_range(app, entries.size());
  return entries[app];
}

bool applications_table::merge(const applications_table &o) {
  if (o.param_count != param_count)THROW_INTERNAL_ERROR
  bool changed = false;
  for (size_t i = 0; i < entries.size(); ++i)changed |= entries[i].merge(o.entries[i]);
  return changed;
}

bool applications_table::is_app_independent() const {
  return std::all_of(entries.begin(), entries.end(), [this](const compute_props &p) { return p == entries.front(); });
}

void applications_table::print(std::ostream &os, size_t level) const {
  os << "Applications Table (" << param_count << " input parameters):";
  for (size_t i = 0; i < entries.size(); ++i) {
    os << "\n";
    util::indent(os, level + 1);
    os << "[" << util::to_binary_string(i, 8) << "] -> ";
    entries[i].print(os, level + 1);
  }
}

util::sexp::t applications_table::to_sexp() const {
  util::sexp::t s = {"applications_table", util::sexp::make_sexp(param_count)};
  for (const compute_props &p : entries)s.push_back(p.to_sexp());
  return s;
}

}
