#include <pattern/pattern.h>
#include <algorithm>

namespace pattern {

namespace {
typedef std::vector<std::pair<scope::binder, scope::binder>> renames_t;

template<typename V>
V concat(V &&a, V &&b) {
  if (a.empty())return std::move(b);
  a.insert(a.end(), std::make_move_iterator(b.begin()), std::make_move_iterator(b.end()));
  return std::move(a);
}

std::pair<renames_t, scope::binder> keep_pair(const scope::binder &from, const scope::binder &to) {
  return {renames_t{{from, to}}, to};
}

}

ptr wildcard::traverse(scope::t &, const binder_fn &) const {
  return std::make_shared<wildcard>();
}
bool wildcard::same_shape(const t &o) const { return dynamic_cast<const wildcard *>(&o) != nullptr; }

ptr single::traverse(scope::t &s, const binder_fn &f) const {
  scope::binder nb = f(s, b);
  s = s.extend(nb);
  return std::make_shared<single>(nb);
}
bool single::same_shape(const t &o) const { return dynamic_cast<const single *>(&o) != nullptr; }

ptr name_binder_list::traverse(scope::t &s, const binder_fn &f) const {
  std::vector<scope::binder> nbs;
  nbs.reserve(binders.size());
  for (const auto &b : binders) {
    nbs.push_back(f(s, b));
    s = s.extend(nbs.back());
  }
  return std::make_shared<name_binder_list>(std::move(nbs));
}
bool name_binder_list::same_shape(const t &o) const {
  const auto *l = dynamic_cast<const name_binder_list *>(&o);
  return l && l->binders.size() == binders.size();
}
util::sexp::t name_binder_list::to_sexp() const {
  util::sexp::t s = {"list"};
  for (const auto &b : binders)s.push_back(util::sexp::make_sexp(b.id()));
  return s;
}
name_binders name_binder_list::to_set() const { return name_binders::from_list(*this); }

name_binders name_binders::from_list(const name_binder_list &l) {
  return name_binders(std::set<scope::binder>(l.binders.begin(), l.binders.end()));
}
name_binder_list name_binders::to_list() const {
  return name_binder_list(std::vector<scope::binder>(binders.begin(), binders.end()));
}
name_binders name_binders::merge(const name_binders &o) const {
  std::set<scope::binder> u = binders;
  u.insert(o.binders.begin(), o.binders.end());
  return name_binders(std::move(u));
}
ptr name_binders::traverse(scope::t &s, const binder_fn &f) const {
  std::set<scope::binder> nbs;
  for (const auto &b : binders) {
    scope::binder nb = f(s, b);
    s = s.extend(nb);
    nbs.insert(nb);
  }
  return std::make_shared<name_binders>(std::move(nbs));
}
bool name_binders::same_shape(const t &o) const {
  const auto *l = dynamic_cast<const name_binders *>(&o);
  return l && l->binders.size() == binders.size();
}
util::sexp::t name_binders::to_sexp() const {
  util::sexp::t s = {"set"};
  for (const auto &b : binders)s.push_back(util::sexp::make_sexp(b.id()));
  return s;
}

scope::t extend_scope(const t &p, const scope::t &s) {
  scope::t inner = s;
  p.traverse(inner, [](const scope::t &, const scope::binder &b) { return b; });
  return inner;
}

std::vector<scope::binder> binders_of(const t &p) {
  return with_pattern(scope::empty(), p, [](const scope::t &, const scope::binder &b) {
    return std::make_pair(std::vector<scope::binder>{b}, b);
  }, std::vector<scope::binder>{}, concat<std::vector<scope::binder>>).value;
}

std::vector<scope::name> names_of(const t &p) {
  std::vector<scope::name> names;
  for (const auto &b : binders_of(p))names.push_back(b.name_of());
  return names;
}

size_t size(const t &p) {
  return with_pattern(scope::empty(), p, [](const scope::t &, const scope::binder &b) {
    return std::make_pair(size_t(1), b);
  }, size_t(0), std::plus<size_t>()).value;
}

std::optional<scope::name> unsink_name(const t &p, const scope::name &n) {
  for (const auto &b : binders_of(p))if (!scope::unsink_name(b, n))return std::nullopt;
  return n;
}

bool clashes(const t &p, const scope::t &s) {
  const auto bs = binders_of(p);
  return std::any_of(bs.begin(), bs.end(), [&s](const scope::binder &b) { return s.member(b.name_of()); });
}

bool equal(const t &l, const t &r) {
  return l.same_shape(r) && binders_of(l) == binders_of(r);
}

bool refreshed::unchanged() const {
  return std::all_of(renames.begin(), renames.end(), [](const auto &r) { return r.first == r.second; });
}

refreshed with_refreshed_pattern(const scope::t &s, const ptr &p) {
  auto r = with_pattern(s, *p, [](const scope::t &before, const scope::binder &b) {
    return scope::with_refreshed(before, b.name_of(), [&b](const scope::binder &nb) { return keep_pair(b, nb); });
  }, renames_t{}, concat<renames_t>);
  refreshed result{.pattern = std::move(r.pattern), .extended = std::move(r.extended), .renames = std::move(r.value)};
  // nothing clashed: keep sharing the original pattern
  if (result.unchanged())result.pattern = p;
  return result;
}

refreshed with_fresh_pattern(const scope::t &s, const ptr &p) {
  auto r = with_pattern(s, *p, [](const scope::t &before, const scope::binder &b) {
    return scope::with_fresh_binder(before, [&b](const scope::binder &nb) { return keep_pair(b, nb); });
  }, renames_t{}, concat<renames_t>);
  return refreshed{.pattern = std::move(r.pattern), .extended = std::move(r.extended), .renames = std::move(r.value)};
}

}
