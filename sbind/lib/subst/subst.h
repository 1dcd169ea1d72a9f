#ifndef SBIND_LIB_SUBST_SUBST_H_
#define SBIND_LIB_SUBST_SUBST_H_

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>
#include <scope/scope.h>
#include <pattern/pattern.h>
#include <util/util.h>
#include <util/sexp.h>

namespace subst {

// Specialized by each term type: the term standing for a free name.
template<typename E>
struct inject_name;

/*
 Maps names of an input scope to terms of an output scope; names that are not
 in the map stand for themselves. A value is never modified: add and friends
 push a node in front of the map and the old substitution stays valid, so it
 can be shared by every branch of a traversal. Lookup walks from the newest
 node; a node without a term marks a name that stands for itself again.
 */
template<typename E>
class t {
  struct node {
    scope::raw_name id;
    std::optional<E> value;
    std::shared_ptr<const node> parent;
  };
  typedef std::shared_ptr<const node> ptr;

 public:
  static t identity() { return t(nullptr); }

  E lookup(const scope::name &n) const {
    if (const node *p = find(n.id()); p && p->value)return *p->value;
    return inject_name<E>::apply(n);
  }

  t add(const scope::binder &b, E e) const {
    return t(std::make_shared<const node>(node{.id = b.id(), .value = std::move(e), .parent = head}));
  }

  // b renamed to n. When they are the same name the entry is dropped instead,
  // so crossing binders that do not clash never grows the map.
  t add_rename(const scope::binder &b, const scope::name &n) const {
    if (b.name_of() == n) {
      if (!contains(n))return *this;
      return t(std::make_shared<const node>(node{.id = b.id(), .value = std::nullopt, .parent = head}));
    }
    return add(b, inject_name<E>::apply(n));
  }

  // crossing a pattern moved into the output scope
  t extend(const pattern::refreshed &r) const {
    t s = sink();
    for (const auto &[from, to] : r.renames)s = s.add_rename(from, to.name_of());
    return s;
  }

  // binds the names of p, in order, to es
  t add_pattern(const pattern::t &p, const std::vector<E> &es) const {
    const auto bs = pattern::binders_of(p);
    if (bs.size() != es.size()) {
      THROW_INVARIANT_VIOLATION("pattern binds " + std::to_string(bs.size()) + " names, got "
                                    + std::to_string(es.size()) + " terms")
    }
    t s = *this;
    for (size_t i = 0; i < bs.size(); ++i)s = s.add(bs[i], es[i]);
    return s;
  }

  // The same substitution, producing terms for an extension of the output
  // scope. Terms valid in a scope are valid in all its extensions, so there is
  // nothing to do.
  t sink() const { return *this; }

  size_t size() const { return entries().size(); }
  bool contains(const scope::name &n) const {
    const node *p = find(n.id());
    return p && p->value;
  }
  util::sexp::t to_sexp() const { return util::sexp::make_sexp(entries()); }

 private:
  explicit t(ptr &&p) : head(std::move(p)) {}

  const node *find(scope::raw_name id) const {
    for (const node *p = head.get(); p; p = p->parent.get())
      if (p->id == id)return p;
    return nullptr;
  }

  // the newest entry of every name that has one
  std::map<scope::raw_name, E> entries() const {
    std::map<scope::raw_name, E> m;
    std::set<scope::raw_name> seen;
    for (const node *p = head.get(); p; p = p->parent.get()) {
      if (!seen.insert(p->id).second)continue;
      if (p->value)m.try_emplace(p->id, *p->value);
    }
    return m;
  }

  ptr head;
};

template<typename E>
t<E> identity() { return t<E>::identity(); }

template<typename E>
t<E> from_renaming(const scope::renaming &r) {
  t<E> s = t<E>::identity();
  r.for_each([&s](const scope::binder &from, const scope::name &to) { s = s.add_rename(from, to); });
  return s;
}

}

#endif //SBIND_LIB_SUBST_SUBST_H_
