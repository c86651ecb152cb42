#ifndef RCA_LIB_UTIL_MESSAGE_H_
#define RCA_LIB_UTIL_MESSAGE_H_
#include <string>
#include <string_view>
#include <iostream>
#include <util/util.h>
namespace util::message {

struct base {
  virtual void print(std::ostream &) const = 0;
  virtual ~base() = default;
};

namespace style {

static constexpr std::string_view bold = "\e[1m";
static constexpr std::string_view clear = "\e[0m";

struct none {
  static constexpr std::string_view name = "";
  static constexpr std::string_view escape = "\e[0m";
};

struct error {
  static constexpr std::string_view name = "error";
  static constexpr std::string_view escape = "\e[31m";
};

struct internal_error {
  static constexpr std::string_view name = "internal compiler error";
  static constexpr std::string_view escape = "\e[31m";
};

struct note {
  static constexpr std::string_view name = "note";
  static constexpr std::string_view escape = "\e[36m";
};

}

template<typename Style>
struct styled_string : public virtual base {
  std::string what;
  styled_string(std::string_view what) : what(what) {}
  void print(std::ostream &os) const final {
    os << style::bold << Style::escape << Style::name << ": " << style::none::escape << what << std::endl;
  }
};
typedef styled_string<style::error> error_string;
typedef styled_string<style::internal_error> internal_error_string;
typedef styled_string<style::note> note_string;

// A message whose text is produced on demand by the subclass.
template<typename Style>
struct report : public virtual base {
  virtual void describe(std::ostream &os) const = 0;
  void print(std::ostream &os) const final {
    os << style::bold << Style::escape << Style::name << ": " << style::clear;
    describe(os);
    os << std::endl;
  }
}; // virtual class
typedef report<style::internal_error> internal_error_report;

}
#endif //RCA_LIB_UTIL_MESSAGE_H_
