#ifndef RCA_LIB_UTIL_UTIL_H_
#define RCA_LIB_UTIL_UTIL_H_

#include <string>
#include <string_view>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <ostream>
#include <initializer_list>

namespace util {

template<typename T>
bool is_in(const T &v, std::initializer_list<T> lst) {
  return std::find(std::begin(lst), std::end(lst), v) != std::end(lst);
}

template<class... Ts>
struct overloaded : Ts ... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// writes the leading whitespace of a dump line nested `level` times
void indent(std::ostream &os, size_t level);

// "0b" followed by `width` binary digits of `value` (at least one digit)
std::string to_binary_string(size_t value, size_t width);

template<typename T>
std::string to_string(const T &x) {
  std::stringstream ss;
  ss << x;
  return ss.str();
}

}

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#define AT __FILE__ ":" TOSTRING(__LINE__)
#define THROW_INTERNAL_ERROR throw std::runtime_error( AT ": internal_error" );

#endif //RCA_LIB_UTIL_UTIL_H_
