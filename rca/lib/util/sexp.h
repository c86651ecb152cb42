#ifndef RCA_LIB_UTIL_SEXP_H_
#define RCA_LIB_UTIL_SEXP_H_
#include <type_traits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <set>
#include <map>
#include <variant>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <util/util.h>

namespace util {

namespace sexp {
//the sexp type
struct t;
struct sexp_of_t {
  virtual t to_sexp() const = 0;
  std::string to_sexp_string() const;
  virtual ~sexp_of_t() = default;
};
struct t : public sexp_of_t {
  t(const t &) = default;
  t(t &&) = default;
  t &operator=(const t &) = default;
  t &operator=(t &&) = default;
  std::variant<std::string, std::vector<t>> value;
  t(std::string_view s) : value(std::string(s)) {}
  t(const char *s) : value(std::string(s)) {}
  t(std::initializer_list<t> l) : value(std::vector<t>(l)) {}
  explicit t(std::vector<t> &&l) : value(std::move(l)) {}
  t &at(size_t index) { return std::get<1>(value).at(index); }
  const t &at(size_t index) const { return std::get<1>(value).at(index); }
  const t &operator[](size_t index) const { return at(index); }
  auto begin() const { return std::get<1>(value).cbegin(); }
  auto end() const { return std::get<1>(value).cend(); }
  auto size() const { return std::get<1>(value).size(); }
  void push_back(t x) { std::get<1>(value).push_back(std::move(x)); }
  std::string_view atom() const { return std::get<0>(value); }
  bool is_atom() const { return value.index() == 0; }
  bool is_list() const { return value.index() == 1; }
  bool operator==(const t &o) const { return value == o.value; }
  bool operator!=(const t &o) const { return value != o.value; }
  t to_sexp() const final { return *this; }
  std::ostream &to_stream(std::ostream &os) const {
    if (value.index() == 0) {
      if (std::any_of(std::get<0>(value).begin(), std::get<0>(value).end(), [](unsigned char c) { return std::isspace(c); })) {
        os << "\"" << std::get<0>(value) << "\"";
      } else {
        os << std::get<0>(value);
      }

    } else {
      os << "(";
      bool pad = false;
      for (const t &x : std::get<1>(value)) {
        if (pad)os << " ";
        pad = true;
        x.to_stream(os);
      }
      os << ")";
    }
    return os;
  }
  std::string to_string() const {
    std::stringstream ss;
    to_stream(ss);
    return ss.str();
  }

};

std::ostream &operator<<(std::ostream &os, const t &s);

namespace __internal {

struct try_get_as_string {
  static t get_sexp(std::string_view s) {
    return s;
  }
};

template<typename T>
struct try_convert_to_string {
  static t get_sexp(const T &v) {
    if constexpr (std::is_same_v<T, bool>) return t(v ? "true" : "false");
    else return t(std::to_string(v));
  }
};

struct try_using_sexpable_base_class {
  static t get_sexp(const sexp_of_t &s) {
    return s.to_sexp();
  }
};

template<typename T>
struct sexp_of_single {
  static t get_sexp(const T &p) {
    typedef std::conditional_t<std::is_base_of_v<sexp_of_t, T>, try_using_sexpable_base_class,
                               std::conditional_t<std::is_arithmetic_v<T>, try_convert_to_string<T>, try_get_as_string>

    > strategy;
    return strategy::get_sexp(p);
  }
};

template<typename C>
struct sexp_of_single<std::optional<C> > {
  static t get_sexp(const std::optional<C> &p) {
    return p.has_value() ? sexp_of_single<C>::get_sexp(*p) : t("none");
  }
};

template<typename C>
struct sexp_of_single<std::vector<C>> {
  static t get_sexp(const std::vector<C> &v) {
    t s = {};
    for (const C &x : v)s.push_back(sexp_of_single<C>::get_sexp(x));
    return s;
  }
};

template<typename C>
struct sexp_of_single<std::set<C>> {
  static t get_sexp(const std::set<C> &v) {
    t s = {};
    for (const C &x : v)s.push_back(sexp_of_single<C>::get_sexp(x));
    return s;
  }
};

template<typename K, typename V>
struct sexp_of_single<std::map<K, V>> {
  static t get_sexp(const std::map<K, V> &m) {
    t s = {};
    for (const auto&[k, v] : m)s.push_back({sexp_of_single<K>::get_sexp(k), sexp_of_single<V>::get_sexp(v)});
    return s;
  }
};

template<typename ...Ts>
t make_from(const Ts &... fields) {
  return {sexp_of_single<Ts>::get_sexp(fields) ...};
}

}

template<typename T>
t make_sexp(const T &x) {
  return __internal::sexp_of_single<T>::get_sexp(x);
}

// (name field1 field2 ...)
#define TO_SEXP(name, ...) ::util::sexp::t to_sexp() const final {\
  ::util::sexp::t s = ::util::sexp::__internal::make_from( __VA_ARGS__ ); \
  std::get<1>(s.value).insert(std::get<1>(s.value).begin(), ::util::sexp::t(name)); \
  return s; \
}

}

}
#endif //RCA_LIB_UTIL_SEXP_H_
