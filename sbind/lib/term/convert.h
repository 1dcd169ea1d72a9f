#ifndef SBIND_LIB_TERM_CONVERT_H_
#define SBIND_LIB_TERM_CONVERT_H_

#include <functional>
#include <utility>
#include <variant>
#include <vector>
#include <scope/scope.h>
#include <pattern/pattern.h>
#include <term/term.h>
#include <bind/name_table.h>
#include <util/util.h>

/*
 Conversion between a client's raw syntax, where variables are identifiers,
 and terms. The client only says how to take one layer of its syntax apart and
 how to put it back together; binding identifiers, resolving variables and
 threading the name tables through scoped children happens here.
 */
namespace term {

// One layer of a raw term: its raw children, pointing into the term being
// converted, and how to build the node once they are converted. A scoped child
// is a raw pattern and the raw body it scopes over.
template<typename Raw>
struct raw_layer {
  std::vector<const Raw *> terms;
  std::vector<std::pair<const Raw *, const Raw *>> scopes;
  std::function<signature::ptr(std::vector<ptr> &&, std::vector<scoped> &&)> build;
};

// Key is what peel returns for a variable, anything the table can look up.
// A view into the raw term lets unbound identifier errors point at it.
template<typename Raw, typename Id, typename Key = Id>
struct raw_importer {
  typedef bind::name_table<Id> table;
  // a variable, or one layer of syntax
  std::function<std::variant<Key, raw_layer<Raw>>(const Raw &)> peel;
  // the pattern, with its identifiers bound to binders fresh for the table
  std::function<std::pair<pattern::ptr, table>(const table &, const Raw &)> to_pattern;
};

template<typename Raw, typename Id>
struct raw_exporter {
  std::function<Raw(const Id &)> from_var;
  // one layer of syntax, out of a node and its children already converted
  std::function<Raw(const signature::t &, std::vector<Raw> &&, std::vector<std::pair<Raw, Raw>> &&)> from_node;
  // the raw pattern; name_binder gives each binder its identifier
  std::function<Raw(const pattern::t &, const std::function<Id(const scope::binder &)> &name_binder)> from_pattern;
  // identifiers for binders; must never produce one of the free names
  std::function<Id()> fresh;
};

template<typename Raw, typename Id, typename Key>
ptr convert_to_ast(const raw_importer<Raw, Id, Key> &im, const bind::name_table<Id> &names, const Raw &raw);

template<typename Raw, typename Id, typename Key>
scoped convert_to_scoped_ast(const raw_importer<Raw, Id, Key> &im, const bind::name_table<Id> &names,
                             const Raw &raw_pattern, const Raw &raw_body) {
  auto[p, inner] = im.to_pattern(names, raw_pattern);
  return scoped{.binder = std::move(p), .body = convert_to_ast(im, inner, raw_body)};
}

// Every binder gets a name fresh for the scope of the table it extends.
// Throws bind::error::unbound_identifier for a variable names does not know.
template<typename Raw, typename Id, typename Key>
ptr convert_to_ast(const raw_importer<Raw, Id, Key> &im, const bind::name_table<Id> &names, const Raw &raw) {
  return std::visit(util::overloaded{
      [&](const Key &id) -> ptr { return var(names.lookup(id)); },
      [&](const raw_layer<Raw> &l) -> ptr {
        std::vector<ptr> ts;
        ts.reserve(l.terms.size());
        for (const Raw *x : l.terms)ts.push_back(convert_to_ast(im, names, *x));
        std::vector<scoped> ss;
        ss.reserve(l.scopes.size());
        for (const auto &[p, body] : l.scopes)ss.push_back(convert_to_scoped_ast(im, names, *p, *body));
        return make_node(l.build(std::move(ts), std::move(ss)));
      }
  }, im.peel(raw));
}

template<typename Raw, typename Id>
Raw convert_from_ast(const raw_exporter<Raw, Id> &ex, const scope::name_map<Id> &names, const ptr &e);

template<typename Raw, typename Id>
std::pair<Raw, Raw> convert_from_scoped_ast(const raw_exporter<Raw, Id> &ex, const scope::name_map<Id> &names,
                                            const scoped &sc) {
  scope::name_map<Id> inner = names;
  Raw p = ex.from_pattern(*sc.binder, [&](const scope::binder &b) {
    Id id = ex.fresh();
    inner = inner.add(b, id);
    return id;
  });
  return {std::move(p), convert_from_ast(ex, inner, sc.body)};
}

// Free names are displayed as in names. Children are converted in the order
// the signature visits them, so are the binders given identifiers.
template<typename Raw, typename Id>
Raw convert_from_ast(const raw_exporter<Raw, Id> &ex, const scope::name_map<Id> &names, const ptr &e) {
  return std::visit(util::overloaded{
      [&](const variable &v) -> Raw { return ex.from_var(names.lookup(v.name)); },
      [&](const node &n) -> Raw {
        std::vector<Raw> ts;
        std::vector<std::pair<Raw, Raw>> ss;
        n.sig->for_each(
            [&](const scoped &sc) { ss.push_back(convert_from_scoped_ast(ex, names, sc)); },
            [&](const ptr &x) { ts.push_back(convert_from_ast(ex, names, x)); });
        return ex.from_node(*n.sig, std::move(ts), std::move(ss));
      }
  }, e->as_variant());
}

}

#endif //SBIND_LIB_TERM_CONVERT_H_
