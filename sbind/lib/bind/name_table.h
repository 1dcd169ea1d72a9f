#ifndef SBIND_LIB_BIND_NAME_TABLE_H_
#define SBIND_LIB_BIND_NAME_TABLE_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <scope/scope.h>
#include <util/util.h>
#include <util/message.h>

namespace bind {

namespace error {
class t : public std::runtime_error {
 public:
  t() : std::runtime_error("binding error") {}
};

class unbound_identifier : public t, public util::message::error_token {
 public:
  explicit unbound_identifier(std::string_view identifier) : util::message::error_token(identifier) {}
  void describe(std::ostream &os) const final {
    os << "unbound identifier " << util::message::style::bold << token << util::message::style::clear;
  }
};
}

/*
 Identifiers of the raw syntax in scope at some point of an importer, and the
 scope of names they stand for.
 Tables are never modified. bind returns a child table whose node points to
 this one, so the table of every binding site stays valid and siblings share
 their common prefix. Shadowing is allowed: lookup walks from the innermost
 node out.
 Id has to be viewable as a std::string_view, for the error.
 */
template<typename Id = std::string>
class name_table {
  struct map_node {
    std::map<Id, scope::name, std::less<>> map;
    std::shared_ptr<const map_node> parent;
  };
  typedef std::shared_ptr<const map_node> ptr;

 public:
  name_table() = default;
  // a table over a scope with nothing named yet
  explicit name_table(scope::t s) : names(std::move(s)) {}

  template<typename K>
  scope::name lookup(const K &id) const {
    for (const map_node *p = head.get(); p; p = p->parent.get())
      if (auto it = p->map.find(id); it != p->map.end())
        return it->second;
    throw error::unbound_identifier(std::string_view(id));
  }

  template<typename K>
  bool contains(const K &id) const {
    for (const map_node *p = head.get(); p; p = p->parent.get())
      if (p->map.find(id) != p->map.end())return true;
    return false;
  }

  // id bound to a binder fresh for the scope of the table
  std::pair<scope::binder, name_table> bind(const Id &id) const {
    return scope::with_fresh_binder(names, [&](const scope::binder &b) {
      return std::make_pair(b, bind(id, b));
    });
  }

  // id bound to a binder chosen by the caller; b must not be in the scope
  name_table bind(const Id &id, const scope::binder &b) const {
    auto node = std::make_shared<map_node>();
    node->map.try_emplace(id, b.name_of());
    node->parent = head;
    return name_table(names.extend(b), std::move(node));
  }

  const scope::t &current_scope() const { return names; }

 private:
  name_table(scope::t s, ptr h) : names(std::move(s)), head(std::move(h)) {}
  scope::t names;
  ptr head;
};

}

#endif //SBIND_LIB_BIND_NAME_TABLE_H_
