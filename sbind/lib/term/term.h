#ifndef SBIND_LIB_TERM_TERM_H_
#define SBIND_LIB_TERM_TERM_H_

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <scope/scope.h>
#include <pattern/pattern.h>
#include <subst/subst.h>
#include <unify/unify.h>
#include <util/util.h>
#include <util/sexp.h>

namespace term {

struct t;
// Terms are immutable and freely shared between the results of a traversal.
typedef std::shared_ptr<const t> ptr;

// A pattern together with the term it scopes over.
struct scoped {
  pattern::ptr binder;
  ptr body;
};

namespace signature {
struct t;
typedef std::shared_ptr<const t> ptr;
typedef std::function<scoped(const scoped &)> scoped_fn;
typedef std::function<term::ptr(const term::ptr &)> term_fn;

// children of two nodes with the same constructor, paired up
struct zipped {
  std::vector<std::pair<scoped, scoped>> scopes;
  std::vector<std::pair<term::ptr, term::ptr>> terms;
};

/*
 One layer of client syntax: a constructor whose children are either plain
 subterms or scoped subterms. This is all the generic algorithms need to know
 about a language.
 */
struct t {
  virtual ~t() = default;
  virtual std::string_view constructor() const = 0;
  // same constructor, children replaced by f (scoped) and g (plain)
  virtual ptr map(const scoped_fn &f, const term_fn &g) const = 0;
  // pairs up the children, or nothing if the constructors differ
  virtual std::optional<zipped> zip_match(const t &o) const = 0;
  // visits the children in order
  virtual void for_each(const std::function<void(const scoped &)> &f,
                        const std::function<void(const term::ptr &)> &g) const = 0;
};
}

struct variable {
  scope::name name;
};

struct node {
  signature::ptr sig;
};

struct t : public std::variant<variable, node> {
  typedef std::variant<variable, node> base;
  using base::base;
  const base &as_variant() const { return *this; }
  bool is_var() const { return std::holds_alternative<variable>(*this); }
};

ptr var(const scope::name &n);
ptr make_node(signature::ptr sig);

typedef subst::t<ptr> substitution;

ptr substitute(const scope::t &s, const substitution &sigma, const ptr &e);
// same, but every binder crossed is renamed
ptr substitute_refreshed(const scope::t &s, const substitution &sigma, const ptr &e);
// body with the names bound by p replaced by args
ptr substitute_pattern(const scope::t &s, const substitution &sigma, const pattern::t &p,
                       const std::vector<ptr> &args, const ptr &body);

// every bound name renamed to the first fresh one, in traversal order
ptr refresh_ast(const scope::t &s, const ptr &e);
scoped refresh_scoped(const scope::t &s, const scoped &sc);

// free names of e renamed by r; s is the scope the result lives in
ptr rename(const scope::t &s, const scope::renaming &r, const ptr &e);

bool alpha_equiv(const scope::t &s, const ptr &l, const ptr &r);
bool alpha_equiv_scoped(const scope::t &s, const scoped &l, const scoped &r);
// by comparing the refreshed terms
bool alpha_equiv_refreshed(const scope::t &s, const ptr &l, const ptr &r);
// syntactic equality, binders included
bool raw_equal(const ptr &l, const ptr &r);

std::set<scope::raw_name> free_vars(const ptr &e);
// variables as their identifiers, nodes as (constructor children...), scoped
// subterms as (pattern body)
util::sexp::t to_sexp(const ptr &e);

}

namespace subst {
template<>
struct inject_name<term::ptr> {
  static term::ptr apply(const scope::name &n) { return term::var(n); }
};
}

#endif //SBIND_LIB_TERM_TERM_H_
