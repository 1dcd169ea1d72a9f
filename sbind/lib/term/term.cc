#include <term/term.h>

namespace term {

ptr var(const scope::name &n) { return std::make_shared<const t>(variable{.name = n}); }
ptr make_node(signature::ptr sig) { return std::make_shared<const t>(node{.sig = std::move(sig)}); }

namespace {

typedef std::function<pattern::refreshed(const scope::t &, const pattern::ptr &)> refresh_fn;

ptr substitute_with(const scope::t &s, const substitution &sigma, const ptr &e, const refresh_fn &refresh) {
  return std::visit(util::overloaded{
      [&](const variable &v) -> ptr { return sigma.lookup(v.name); },
      [&](const node &n) -> ptr {
        return make_node(n.sig->map(
            [&](const scoped &sc) {
              pattern::refreshed r = refresh(s, sc.binder);
              return scoped{.binder = r.pattern, .body = substitute_with(r.extended, sigma.extend(r), sc.body, refresh)};
            },
            [&](const ptr &x) { return substitute_with(s, sigma, x, refresh); }));
      }
  }, e->as_variant());
}

}

ptr substitute(const scope::t &s, const substitution &sigma, const ptr &e) {
  return substitute_with(s, sigma, e, pattern::with_refreshed_pattern);
}

ptr substitute_refreshed(const scope::t &s, const substitution &sigma, const ptr &e) {
  return substitute_with(s, sigma, e, pattern::with_fresh_pattern);
}

ptr substitute_pattern(const scope::t &s, const substitution &sigma, const pattern::t &p,
                       const std::vector<ptr> &args, const ptr &body) {
  return substitute(s, sigma.add_pattern(p, args), body);
}

ptr refresh_ast(const scope::t &s, const ptr &e) {
  return substitute_refreshed(s, substitution::identity(), e);
}

scoped refresh_scoped(const scope::t &s, const scoped &sc) {
  pattern::refreshed r = pattern::with_fresh_pattern(s, sc.binder);
  return scoped{.binder = r.pattern,
      .body = substitute_refreshed(r.extended, substitution::identity().extend(r), sc.body)};
}

ptr rename(const scope::t &s, const scope::renaming &r, const ptr &e) {
  if (r.is_identity())return e;
  return std::visit(util::overloaded{
      [&](const variable &v) -> ptr { return var(r(v.name)); },
      [&](const node &n) -> ptr {
        return make_node(n.sig->map(
            [&](const scoped &sc) {
              // binders that clash with s move away, the others stop being renamed
              pattern::refreshed rp = pattern::with_refreshed_pattern(s, sc.binder);
              scope::renaming inner = r;
              for (const auto &[from, to] : rp.renames)inner = inner.without(from);
              for (const auto &[from, to] : rp.renames)inner = inner.merge(scope::renaming(from, to));
              return scoped{.binder = rp.pattern, .body = rename(rp.extended, inner, sc.body)};
            },
            [&](const ptr &x) { return rename(s, r, x); }));
      }
  }, e->as_variant());
}

bool alpha_equiv(const scope::t &s, const ptr &l, const ptr &r) {
  if (l == r)return true;
  if (l->is_var() || r->is_var()) {
    return l->is_var() && r->is_var() && std::get<variable>(*l).name == std::get<variable>(*r).name;
  }
  const auto zipped = std::get<node>(*l).sig->zip_match(*std::get<node>(*r).sig);
  if (!zipped)return false;
  for (const auto &[a, b] : zipped->terms)if (!alpha_equiv(s, a, b))return false;
  for (const auto &[a, b] : zipped->scopes)if (!alpha_equiv_scoped(s, a, b))return false;
  return true;
}

// Both bodies are moved into the scope of the unified pattern.
bool alpha_equiv_scoped(const scope::t &s, const scoped &l, const scoped &r) {
  const unify::result u = unify::unify_patterns(s, *l.binder, *r.binder);
  if (u.k == unify::NOT_UNIFIABLE)return false;
  const scope::t inner = pattern::extend_scope(u.binders, s);
  return alpha_equiv(inner, rename(inner, u.left, l.body), rename(inner, u.right, r.body));
}

bool alpha_equiv_refreshed(const scope::t &s, const ptr &l, const ptr &r) {
  return raw_equal(refresh_ast(s, l), refresh_ast(s, r));
}

bool raw_equal(const ptr &l, const ptr &r) {
  if (l == r)return true;
  if (l->is_var() || r->is_var()) {
    return l->is_var() && r->is_var() && std::get<variable>(*l).name == std::get<variable>(*r).name;
  }
  const auto zipped = std::get<node>(*l).sig->zip_match(*std::get<node>(*r).sig);
  if (!zipped)return false;
  for (const auto &[a, b] : zipped->terms)if (!raw_equal(a, b))return false;
  for (const auto &[a, b] : zipped->scopes) {
    if (!pattern::equal(*a.binder, *b.binder) || !raw_equal(a.body, b.body))return false;
  }
  return true;
}

std::set<scope::raw_name> free_vars(const ptr &e) {
  return std::visit(util::overloaded{
      [](const variable &v) -> std::set<scope::raw_name> { return {v.name.id()}; },
      [](const node &n) {
        std::set<scope::raw_name> fv;
        n.sig->for_each(
            [&fv](const scoped &sc) {
              std::set<scope::raw_name> inner = free_vars(sc.body);
              for (const auto &b : pattern::binders_of(*sc.binder))inner.erase(b.id());
              fv.insert(inner.begin(), inner.end());
            },
            [&fv](const ptr &x) {
              const auto inner = free_vars(x);
              fv.insert(inner.begin(), inner.end());
            });
        return fv;
      }
  }, e->as_variant());
}

util::sexp::t to_sexp(const ptr &e) {
  return std::visit(util::overloaded{
      [](const variable &v) { return util::sexp::make_sexp(v.name.id()); },
      [](const node &n) {
        util::sexp::t s(std::vector<util::sexp::t>{util::sexp::t(n.sig->constructor())});
        n.sig->for_each(
            [&s](const scoped &sc) { s.push_back({sc.binder->to_sexp(), to_sexp(sc.body)}); },
            [&s](const ptr &x) { s.push_back(to_sexp(x)); });
        return s;
      }
  }, e->as_variant());
}

}
