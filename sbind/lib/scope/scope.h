#ifndef SBIND_LIB_SCOPE_SCOPE_H_
#define SBIND_LIB_SCOPE_SCOPE_H_

#include <cstddef>
#include <map>
#include <set>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <util/util.h>
#include <util/sexp.h>

/*
 Names are plain integers. A scope is the set of integers currently in play,
 and a binder is the one integer a binding site adds to it.
 Only factory can turn an integer into a name or a binder, and only the
 operations that produce binders (and the renamings built from them) can reach
 it. Every binder is either fresh for the scope it extends or a name reused
 because it is known not to clash. That is the whole capture-avoidance
 argument, and it is not checked at runtime.
 */
namespace scope {

typedef size_t raw_name;
typedef std::set<raw_name> raw_scope;

class t;
class name;
class binder;
class renaming;

namespace test_support { struct access; }

template<typename F>
std::invoke_result_t<F, const binder &> with_fresh_binder(const t &s, F &&k);
template<typename F>
std::invoke_result_t<F, const binder &> with_refreshed(const t &s, const name &n, F &&k);

class factory {
  static name name_of(raw_name id);
  static binder binder_of(raw_name id);

  template<typename F>
  friend std::invoke_result_t<F, const binder &> with_fresh_binder(const t &s, F &&k);
  template<typename F>
  friend std::invoke_result_t<F, const binder &> with_refreshed(const t &s, const name &n, F &&k);
  friend class renaming;
  friend struct test_support::access;
};

class name {
  raw_name id_;
  explicit name(raw_name id) : id_(id) {}
  friend class factory;
 public:
  raw_name id() const { return id_; }
  bool operator==(const name &o) const { return id_ == o.id_; }
  bool operator!=(const name &o) const { return id_ != o.id_; }
  bool operator<(const name &o) const { return id_ < o.id_; }
};

class binder {
  scope::name name_;
  explicit binder(scope::name n) : name_(n) {}
  friend class factory;
 public:
  const scope::name &name_of() const { return name_; }
  raw_name id() const { return name_.id(); }
  bool operator==(const binder &o) const { return name_ == o.name_; }
  bool operator!=(const binder &o) const { return name_ != o.name_; }
  bool operator<(const binder &o) const { return name_ < o.name_; }
};

/*
 Immutable. A scope is a chain of nodes, one per binder, ending at the empty
 scope: copying and extending are O(1) and extensions share their parent.
 member walks the chain from the innermost binder, stopping early once every
 remaining identifier is smaller than the one looked for.
 */
class t {
 public:
  t() = default;
  bool member(raw_name id) const;
  bool member(const name &n) const { return member(n.id()); }
  t extend(const binder &b) const;
  // 0 for the empty scope, max + 1 otherwise
  raw_name fresh() const { return head ? head->top + 1 : 0; }
  size_t size() const { return ids().size(); }
  bool empty() const { return head == nullptr; }
  raw_scope ids() const;
  // every name of o is also in this scope
  bool extends(const t &o) const;
 private:
  struct node {
    raw_name id;
    // largest identifier of the chain up to here
    raw_name top;
    std::shared_ptr<const node> parent;
  };
  explicit t(std::shared_ptr<const node> &&n) : head(std::move(n)) {}
  std::shared_ptr<const node> head;
};

t empty();
bool member(const name &n, const t &s);
t extend(const binder &b, const t &s);
raw_name fresh_name(const t &s);

// k(binder) with a binder not in s
template<typename F>
std::invoke_result_t<F, const binder &> with_fresh_binder(const t &s, F &&k) {
  return std::forward<F>(k)(factory::binder_of(fresh_name(s)));
}

// k(binder) reusing n when it does not clash with s
template<typename F>
std::invoke_result_t<F, const binder &> with_refreshed(const t &s, const name &n, F &&k) {
  if (s.member(n))return with_fresh_binder(s, std::forward<F>(k));
  return std::forward<F>(k)(factory::binder_of(n.id()));
}

// n seen from the scope b extends, or nothing if n is b itself
std::optional<name> unsink_name(const binder &b, const name &n);

/*
 A finite injective renaming of binders, identity outside its domain.
 All entries apply simultaneously: {0 -> 1, 1 -> 0} swaps.
 */
class renaming {
 public:
  renaming() = default;
  renaming(const binder &from, const binder &to);
  name operator()(const name &n) const;
  binder operator()(const binder &b) const;
  bool is_identity() const { return m.empty(); }
  bool renames(const binder &b) const { return m.find(b.id()) != m.end(); }
  // b no longer renamed
  renaming without(const binder &b) const;
  size_t size() const { return m.size(); }
  const std::map<raw_name, raw_name> &entries() const { return m; }
  // f(from, to) for every entry
  template<typename F>
  void for_each(F &&f) const {
    for (const auto &[from, to] : m)f(factory::binder_of(from), factory::name_of(to));
  }
  // union of two renamings with disjoint domains
  renaming merge(const renaming &o) const;
  util::sexp::t to_sexp() const { return util::sexp::make_sexp(m); }
 private:
  std::map<raw_name, raw_name> m;
};

// A total map on the names of a scope. Looking up a name that was never
// added breaks the scoping invariant and aborts the operation.
template<typename T>
class name_map {
  struct node {
    raw_name id;
    T value;
    std::shared_ptr<const node> parent;
  };
 public:
  name_map() = default;
  const T &lookup(const name &n) const {
    for (const node *p = head.get(); p; p = p->parent.get())
      if (p->id == n.id())return p->value;
    THROW_INVARIANT_VIOLATION("unknown name " + std::to_string(n.id()) + " in a name_map")
  }
  name_map add(const binder &b, T x) const {
    return name_map(std::make_shared<const node>(node{.id = b.id(), .value = std::move(x), .parent = head}));
  }
  size_t size() const {
    raw_scope seen;
    for (const node *p = head.get(); p; p = p->parent.get())seen.insert(p->id);
    return seen.size();
  }
 private:
  explicit name_map(std::shared_ptr<const node> &&p) : head(std::move(p)) {}
  std::shared_ptr<const node> head;
};

}

#endif //SBIND_LIB_SCOPE_SCOPE_H_
