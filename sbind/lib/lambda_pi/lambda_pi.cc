#include <lambda_pi/lambda_pi.h>
#include <memory>
#include <variant>

namespace lambda_pi {

std::string_view form_name(form f) {
  switch (f) {
    case APP:return "app";
    case LAM:return "lam";
    case PI:return "pi";
    case PAIR:return "pair";
    case FIRST:return "first";
    case SECOND:return "second";
    case PRODUCT:return "product";
    case UNIVERSE:return "U";
    default: THROW_INTERNAL_ERROR
  }
}

term::signature::ptr sig::map(const term::signature::scoped_fn &on_scoped,
                              const term::signature::term_fn &on_term) const {
  std::vector<term::ptr> ts;
  ts.reserve(terms.size());
  for (const auto &x : terms)ts.push_back(on_term(x));
  std::vector<term::scoped> ss;
  ss.reserve(scopes.size());
  for (const auto &x : scopes)ss.push_back(on_scoped(x));
  return std::make_shared<sig>(f, std::move(ts), std::move(ss));
}

std::optional<term::signature::zipped> sig::zip_match(const term::signature::t &o) const {
  const auto *other = dynamic_cast<const sig *>(&o);
  if (!other || other->f != f)return std::nullopt;
  if (other->terms.size() != terms.size() || other->scopes.size() != scopes.size())return std::nullopt;
  term::signature::zipped z;
  for (size_t i = 0; i < terms.size(); ++i)z.terms.emplace_back(terms[i], other->terms[i]);
  for (size_t i = 0; i < scopes.size(); ++i)z.scopes.emplace_back(scopes[i], other->scopes[i]);
  return z;
}

void sig::for_each(const std::function<void(const term::scoped &)> &on_scoped,
                   const std::function<void(const term::ptr &)> &on_term) const {
  for (const auto &x : terms)on_term(x);
  for (const auto &x : scopes)on_scoped(x);
}

const sig *as_sig(const term::ptr &e) {
  if (const auto *n = std::get_if<term::node>(&e->as_variant()))return dynamic_cast<const sig *>(n->sig.get());
  return nullptr;
}

namespace {
term::ptr make(form f, std::vector<term::ptr> &&terms, std::vector<term::scoped> &&scopes = {}) {
  return term::make_node(std::make_shared<sig>(f, std::move(terms), std::move(scopes)));
}
}

term::ptr universe() { return make(UNIVERSE, {}); }
term::ptr app(term::ptr f, term::ptr x) { return make(APP, {std::move(f), std::move(x)}); }
term::ptr lam(pattern::ptr p, term::ptr body) {
  return make(LAM, {}, {term::scoped{.binder = std::move(p), .body = std::move(body)}});
}
term::ptr pi(pattern::ptr p, term::ptr a, term::ptr b) {
  return make(PI, {std::move(a)}, {term::scoped{.binder = std::move(p), .body = std::move(b)}});
}
term::ptr pair(term::ptr a, term::ptr b) { return make(PAIR, {std::move(a), std::move(b)}); }
term::ptr first(term::ptr e) { return make(FIRST, {std::move(e)}); }
term::ptr second(term::ptr e) { return make(SECOND, {std::move(e)}); }
term::ptr product(term::ptr a, term::ptr b) { return make(PRODUCT, {std::move(a), std::move(b)}); }

pattern::ptr pattern_pair::traverse(scope::t &s, const pattern::binder_fn &f) const {
  pattern::ptr nl = l->traverse(s, f);
  pattern::ptr nr = r->traverse(s, f);
  return std::make_shared<pattern_pair>(std::move(nl), std::move(nr));
}

bool pattern_pair::same_shape(const pattern::t &o) const {
  const auto *p = dynamic_cast<const pattern_pair *>(&o);
  return p && l->same_shape(*p->l) && r->same_shape(*p->r);
}

namespace {

void expect_size(const util::sexp::t &raw, size_t n, std::string_view what) {
  if (raw.size() != n)throw error::malformed(what, raw);
}

bool is_identifier(const util::sexp::t &raw) {
  return raw.is_atom() && !raw.atom().empty() && !raw.is_atom("_") && !raw.is_atom("U");
}

typedef term::raw_layer<util::sexp::t> layer;

layer node_of(form f, std::vector<const util::sexp::t *> &&terms,
              std::vector<std::pair<const util::sexp::t *, const util::sexp::t *>> &&scopes = {}) {
  return layer{.terms = std::move(terms), .scopes = std::move(scopes),
      .build = [f](std::vector<term::ptr> &&ts, std::vector<term::scoped> &&ss) -> term::signature::ptr {
        return std::make_shared<sig>(f, std::move(ts), std::move(ss));
      }};
}

std::variant<std::string_view, layer> peel(const util::sexp::t &raw) {
  if (raw.is_atom("U"))return node_of(UNIVERSE, {});
  if (raw.is_atom()) {
    if (!is_identifier(raw))throw error::malformed("term", raw);
    return raw.atom();
  }
  if (raw.size() == 0 || !raw[0].is_atom())throw error::malformed("term", raw);
  const std::string_view head = raw[0].atom();
  if (head == "app") {
    expect_size(raw, 3, "application");
    return node_of(APP, {&raw[1], &raw[2]});
  }
  if (head == "lam") {
    expect_size(raw, 3, "lambda");
    return node_of(LAM, {}, {{&raw[1], &raw[2]}});
  }
  if (head == "pi") {
    expect_size(raw, 4, "pi type");
    return node_of(PI, {&raw[2]}, {{&raw[1], &raw[3]}});
  }
  if (head == "pair") {
    expect_size(raw, 3, "pair");
    return node_of(PAIR, {&raw[1], &raw[2]});
  }
  if (head == "product") {
    expect_size(raw, 3, "product type");
    return node_of(PRODUCT, {&raw[1], &raw[2]});
  }
  if (head == "first") {
    expect_size(raw, 2, "projection");
    return node_of(FIRST, {&raw[1]});
  }
  if (head == "second") {
    expect_size(raw, 2, "projection");
    return node_of(SECOND, {&raw[1]});
  }
  throw error::malformed("term", raw);
}

const term::raw_importer<util::sexp::t, std::string, std::string_view> &importer() {
  static const term::raw_importer<util::sexp::t, std::string, std::string_view> im{.peel = peel, .to_pattern = to_pattern};
  return im;
}

}

term::ptr to_term(const name_table &table, const util::sexp::t &raw) {
  return term::convert_to_ast(importer(), table, raw);
}

std::pair<pattern::ptr, name_table> to_pattern(const name_table &table, const util::sexp::t &raw) {
  if (raw.is_atom("_"))return {std::make_shared<pattern::wildcard>(), table};
  if (raw.is_atom()) {
    if (!is_identifier(raw))throw error::malformed("pattern", raw);
    auto[b, inner] = table.bind(std::string(raw.atom()));
    return {std::make_shared<pattern::single>(b), inner};
  }
  if (raw.size() == 0 || !raw[0].is_atom())throw error::malformed("pattern", raw);
  if (raw[0].is_atom("pair")) {
    expect_size(raw, 3, "pair pattern");
    auto[l, after_l] = to_pattern(table, raw[1]);
    auto[r, after_r] = to_pattern(after_l, raw[2]);
    return {std::make_shared<pattern_pair>(l, r), after_r};
  }
  if (raw[0].is_atom("list")) {
    name_table inner = table;
    std::vector<scope::binder> bs;
    for (size_t i = 1; i < raw.size(); ++i) {
      if (!is_identifier(raw[i]))throw error::malformed("list pattern entry", raw[i]);
      auto bound = inner.bind(std::string(raw[i].atom()));
      bs.push_back(bound.first);
      inner = bound.second;
    }
    return {std::make_shared<pattern::name_binder_list>(std::move(bs)), inner};
  }
  throw error::malformed("pattern", raw);
}

identifier_stream default_fresh_identifiers(std::string prefix) {
  auto next = std::make_shared<size_t>(0);
  return [prefix = std::move(prefix), next]() { return prefix + std::to_string((*next)++); };
}

namespace {

util::sexp::t pattern_of(const pattern::t &p, const std::function<std::string(const scope::binder &)> &name_binder) {
  if (dynamic_cast<const pattern::wildcard *>(&p))return "_";
  if (const auto *s = dynamic_cast<const pattern::single *>(&p))return name_binder(s->b);
  if (const auto *pp = dynamic_cast<const pattern_pair *>(&p)) {
    util::sexp::t l = pattern_of(*pp->l, name_binder);
    util::sexp::t r = pattern_of(*pp->r, name_binder);
    return {"pair", std::move(l), std::move(r)};
  }
  if (const auto *list = dynamic_cast<const pattern::name_binder_list *>(&p)) {
    util::sexp::t raw = {"list"};
    for (const auto &b : list->binders)raw.push_back(name_binder(b));
    return raw;
  }
  THROW_INTERNAL_ERROR
}

util::sexp::t node_to_sexp(const term::signature::t &n, std::vector<util::sexp::t> &&ts,
                           std::vector<std::pair<util::sexp::t, util::sexp::t>> &&ss) {
  const auto *s = dynamic_cast<const sig *>(&n);
  if (!s)THROW_INTERNAL_ERROR
  switch (s->f) {
    case UNIVERSE:return "U";
    case APP:
    case PAIR:
    case PRODUCT:return {util::sexp::t(form_name(s->f)), std::move(ts[0]), std::move(ts[1])};
    case FIRST:
    case SECOND:return {util::sexp::t(form_name(s->f)), std::move(ts[0])};
    case LAM:return {"lam", std::move(ss[0].first), std::move(ss[0].second)};
    case PI:return {"pi", std::move(ss[0].first), std::move(ts[0]), std::move(ss[0].second)};
    default: THROW_INTERNAL_ERROR
  }
}

}

util::sexp::t from_term(const term::ptr &e, const scope::name_map<std::string> &names, const identifier_stream &fresh) {
  const term::raw_exporter<util::sexp::t, std::string> ex{
      .from_var = [](const std::string &id) { return util::sexp::t(id); },
      .from_node = node_to_sexp,
      .from_pattern = pattern_of,
      .fresh = fresh};
  return term::convert_from_ast(ex, names, e);
}

util::sexp::t from_term(const term::ptr &e) {
  return from_term(e, scope::name_map<std::string>(), default_fresh_identifiers());
}

namespace {

term::substitution match(const pattern::t &p, const term::ptr &e, const term::substitution &acc) {
  if (dynamic_cast<const pattern::wildcard *>(&p))return acc;
  if (const auto *s = dynamic_cast<const pattern::single *>(&p))return acc.add(s->b, e);
  if (const auto *pp = dynamic_cast<const pattern_pair *>(&p)) {
    return match(*pp->r, second(e), match(*pp->l, first(e), acc));
  }
  if (const auto *list = dynamic_cast<const pattern::name_binder_list *>(&p)) {
    // (list x1 ... xn) against (pair e1 (pair e2 ... en))
    term::substitution out = acc;
    term::ptr rest = e;
    for (size_t i = 0; i < list->binders.size(); ++i) {
      if (i + 1 == list->binders.size()) {
        out = out.add(list->binders[i], rest);
      } else {
        out = out.add(list->binders[i], first(rest));
        rest = second(rest);
      }
    }
    return out;
  }
  THROW_INTERNAL_ERROR
}

}

term::substitution match_pattern(const pattern::t &p, const term::ptr &e) {
  return match(p, e, term::substitution::identity());
}

term::ptr whnf(const scope::t &s, const term::ptr &e) {
  const sig *n = as_sig(e);
  if (!n)return e;
  switch (n->f) {
    case APP: {
      term::ptr f = whnf(s, n->terms[0]);
      if (const sig *l = as_sig(f); l && l->f == LAM) {
        const term::scoped &sc = l->scopes[0];
        return whnf(s, term::substitute(s, match_pattern(*sc.binder, n->terms[1]), sc.body));
      }
      return f == n->terms[0] ? e : app(f, n->terms[1]);
    }
    case FIRST:
    case SECOND: {
      term::ptr t = whnf(s, n->terms[0]);
      if (const sig *p = as_sig(t); p && p->f == PAIR)return whnf(s, p->terms[n->f == FIRST ? 0 : 1]);
      if (t == n->terms[0])return e;
      return n->f == FIRST ? first(t) : second(t);
    }
    default:return e;
  }
}

}
