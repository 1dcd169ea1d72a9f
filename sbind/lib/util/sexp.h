#ifndef SBIND_LIB_UTIL_SEXP_H_
#define SBIND_LIB_UTIL_SEXP_H_
#include <algorithm>
#include <type_traits>
#include <memory>
#include <string>
#include <string_view>
#include <sstream>
#include <variant>
#include <vector>
#include <set>
#include <map>
#include <optional>
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
  t(const std::string &s) : value(s) {}
  t(const char *s) : value(std::string(s)) {}
  t(std::initializer_list<t> l) : value(std::vector<t>(l)) {}
  explicit t(std::vector<t> &&l) : value(std::move(l)) {}
  const t &at(size_t index) const { return std::get<1>(value).at(index); }
  const t &operator[](size_t index) const { return at(index); }
  auto begin() const { return std::get<1>(value).cbegin(); }
  auto end() const { return std::get<1>(value).cend(); }
  size_t size() const { return std::get<1>(value).size(); }
  std::string_view atom() const { return std::get<0>(value); }
  bool is_atom() const { return value.index() == 0; }
  bool is_list() const { return value.index() == 1; }
  bool is_atom(std::string_view a) const { return is_atom() && atom() == a; }
  void push_back(t x) { std::get<1>(value).push_back(std::move(x)); }
  bool operator==(const t &o) const { return value == o.value; }
  bool operator!=(const t &o) const { return value != o.value; }
  t to_sexp() const final { return *this; }
  std::ostream &to_stream(std::ostream &os) const {
    if (is_atom()) {
      const auto &a = std::get<0>(value);
      if (a.empty() || std::any_of(a.begin(), a.end(), [](unsigned char c) { return std::isspace(c); })) {
        os << "\"" << a << "\"";
      } else {
        os << a;
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
    return t(std::to_string(v));
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
                               std::conditional_t<std::is_fundamental_v<T>, try_convert_to_string<T>, try_get_as_string>
    > strategy;
    return strategy::get_sexp(p);
  }
};

template<typename C>
struct sexp_of_single<std::shared_ptr<C> > {
  static t get_sexp(const std::shared_ptr<C> &p) {
    return p == nullptr ? t("NULL") : sexp_of_single<std::remove_const_t<C>>::get_sexp(*p);
  }
};

template<typename C>
struct sexp_of_single<std::unique_ptr<C> > {
  static t get_sexp(const std::unique_ptr<C> &p) {
    return p == nullptr ? t("NULL") : sexp_of_single<std::remove_const_t<C>>::get_sexp(*p);
  }
};

template<typename C>
struct sexp_of_single<std::optional<C>> {
  static t get_sexp(const std::optional<C> &o) {
    if (!o)return t{};
    return t(std::vector<t>{sexp_of_single<C>::get_sexp(*o)});
  }
};

template<typename A, typename B>
struct sexp_of_single<std::pair<A, B>> {
  static t get_sexp(const std::pair<A, B> &p) {
    return {sexp_of_single<A>::get_sexp(p.first), sexp_of_single<B>::get_sexp(p.second)};
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
  return t(std::vector<t>{sexp_of_single<Ts>::get_sexp(fields) ...});
}

}

template<typename T>
t make_sexp(const T &x) {
  return __internal::sexp_of_single<T>::get_sexp(x);
}

// to_sexp of a type rendered as (tag field1 field2 ...)
#define TO_SEXP(tag, ...) ::util::sexp::t to_sexp() const final {\
  ::util::sexp::t s = ::util::sexp::__internal::make_from( __VA_ARGS__ ); \
  std::get<1>(s.value).insert(std::get<1>(s.value).begin(), ::util::sexp::t(tag)); \
  return s; \
}

}

}
#endif //SBIND_LIB_UTIL_SEXP_H_
