#ifndef SBIND_LIB_LAMBDA_PI_LAMBDA_PI_H_
#define SBIND_LIB_LAMBDA_PI_LAMBDA_PI_H_

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <scope/scope.h>
#include <pattern/pattern.h>
#include <term/term.h>
#include <term/convert.h>
#include <bind/name_table.h>
#include <util/util.h>
#include <util/message.h>
#include <util/sexp.h>

/*
 Untyped lambda-pi with pairs, on top of the generic term module.
 Raw syntax is a sexp:
   U                 universe
   x                 variable
   (app f x)
   (lam P body)
   (pi P A B)        P has type A and scopes over B
   (pair a b) (first t) (second t) (product A B)
 and patterns are
   x  _  (pair P Q)  (list x1 ... xn)
 */
namespace lambda_pi {

namespace error {
class t : public std::runtime_error {
 public:
  t() : std::runtime_error("lambda_pi error") {}
};

class malformed : public t, public util::message::error_token {
  std::string what_;
 public:
  malformed(std::string_view what, const util::sexp::t &where)
      : util::message::error_token(where.to_string(), where.is_atom() ? where.atom() : std::string_view()),
        what_(what) {}
  void describe(std::ostream &os) const final {
    os << "malformed " << what_ << " " << util::message::style::bold << token << util::message::style::clear;
  }
};
}

enum form { APP, LAM, PI, PAIR, FIRST, SECOND, PRODUCT, UNIVERSE };

std::string_view form_name(form f);

// One node. Plain children come first, in source order, then the scoped one.
struct sig final : public term::signature::t {
  form f;
  std::vector<term::ptr> terms;
  std::vector<term::scoped> scopes;

  sig(form f, std::vector<term::ptr> &&terms, std::vector<term::scoped> &&scopes = {})
      : f(f), terms(std::move(terms)), scopes(std::move(scopes)) {}

  std::string_view constructor() const final { return form_name(f); }
  term::signature::ptr map(const term::signature::scoped_fn &on_scoped,
                           const term::signature::term_fn &on_term) const final;
  std::optional<term::signature::zipped> zip_match(const term::signature::t &o) const final;
  void for_each(const std::function<void(const term::scoped &)> &on_scoped,
                const std::function<void(const term::ptr &)> &on_term) const final;
};

// the node of e, or nullptr for a variable
const sig *as_sig(const term::ptr &e);

term::ptr universe();
term::ptr app(term::ptr f, term::ptr x);
term::ptr lam(pattern::ptr p, term::ptr body);
term::ptr pi(pattern::ptr p, term::ptr a, term::ptr b);
term::ptr pair(term::ptr a, term::ptr b);
term::ptr first(term::ptr e);
term::ptr second(term::ptr e);
term::ptr product(term::ptr a, term::ptr b);

// binds the names of l, then those of r
struct pattern_pair final : public pattern::t {
  pattern::ptr l, r;
  pattern_pair(pattern::ptr l, pattern::ptr r) : l(std::move(l)), r(std::move(r)) {}
  pattern::ptr traverse(scope::t &s, const pattern::binder_fn &f) const final;
  bool same_shape(const pattern::t &o) const final;
  util::sexp::t to_sexp() const final { return {"pair", l->to_sexp(), r->to_sexp()}; }
};

typedef bind::name_table<std::string> name_table;

// Identifiers are resolved in table, and every binder gets a name fresh for
// the scope it extends.
term::ptr to_term(const name_table &table, const util::sexp::t &raw);
std::pair<pattern::ptr, name_table> to_pattern(const name_table &table, const util::sexp::t &raw);

typedef std::function<std::string()> identifier_stream;
// prefix0, prefix1, ...
identifier_stream default_fresh_identifiers(std::string prefix = "x");

// Free names are displayed as in names, binders take the next identifiers of
// fresh. The caller makes sure those never collide with the free ones.
util::sexp::t from_term(const term::ptr &e, const scope::name_map<std::string> &names, const identifier_stream &fresh);
util::sexp::t from_term(const term::ptr &e);

// The components of e the names of p stand for.
term::substitution match_pattern(const pattern::t &p, const term::ptr &e);

// weak head normal form
term::ptr whnf(const scope::t &s, const term::ptr &e);

}

#endif //SBIND_LIB_LAMBDA_PI_LAMBDA_PI_H_
