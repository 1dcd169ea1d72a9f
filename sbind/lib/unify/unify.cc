#include <unify/unify.h>
#include <set>

namespace unify {

std::string_view kind_name(kind k) {
  switch (k) {
    case IDENTICAL:return "identical";
    case RENAME_RIGHT:return "rename_right";
    case RENAME_LEFT:return "rename_left";
    case RENAME_BOTH:return "rename_both";
    case NOT_UNIFIABLE:return "not_unifiable";
    default: THROW_INTERNAL_ERROR
  }
}

std::ostream &operator<<(std::ostream &os, kind k) {
  return os << kind_name(k);
}

util::sexp::t result::to_sexp() const {
  return {util::sexp::t(kind_name(k)), binders.to_sexp(), left.to_sexp(), right.to_sexp()};
}

namespace {

kind merge_kinds(kind a, kind b) {
  if (a == NOT_UNIFIABLE || b == NOT_UNIFIABLE)return NOT_UNIFIABLE;
  if (a == IDENTICAL)return b;
  if (b == IDENTICAL)return a;
  if (a == b)return a;
  return RENAME_BOTH;
}

// l and r line up on c, which is one of them or a fresh binder
result align(const scope::binder &l, const scope::binder &r, const scope::binder &c) {
  result res;
  res.binders = pattern::name_binders::singleton(c);
  res.left = scope::renaming(l, c);
  res.right = scope::renaming(r, c);
  if (l == c && r == c)res.k = IDENTICAL;
  else if (l == c)res.k = RENAME_RIGHT;
  else if (r == c)res.k = RENAME_LEFT;
  else res.k = RENAME_BOTH;
  return res;
}

result identical() {
  result res;
  res.k = IDENTICAL;
  return res;
}

}

result merge(const result &a, const result &b) {
  result res;
  res.k = merge_kinds(a.k, b.k);
  if (res.k == NOT_UNIFIABLE)return res;
  res.binders = a.binders.merge(b.binders);
  res.left = a.left.merge(b.left);
  res.right = a.right.merge(b.right);
  return res;
}

result unify_name_binders(const scope::binder &l, const scope::binder &r) {
  return align(l, r, r < l ? r : l);
}

/*
 Pairs are aligned in traversal order. A pair lines up on its smaller binder,
 unless an earlier pair already took it, then on the larger one, and when both
 are taken on a binder fresh for s and both patterns. The renamings of a side
 are applied all at once, so targets only have to be pairwise distinct.
 A binder may shadow a name of s. Renaming the other side onto it would
 capture that side's occurrences of the outer name, so such a binder is only
 a target when both sides bind it.
 */
result unify_patterns(const scope::t &s, const pattern::t &l, const pattern::t &r) {
  if (!l.same_shape(r))return result();
  const auto lbs = pattern::binders_of(l);
  const auto rbs = pattern::binders_of(r);
  if (lbs.size() != rbs.size())return result();

  scope::t taken = s;
  for (const auto &b : lbs)taken = taken.extend(b);
  for (const auto &b : rbs)taken = taken.extend(b);

  std::set<scope::binder> targets;
  result acc = identical();
  for (size_t i = 0; i < lbs.size(); ++i) {
    const scope::binder &lo = rbs[i] < lbs[i] ? rbs[i] : lbs[i];
    const scope::binder &hi = rbs[i] < lbs[i] ? lbs[i] : rbs[i];
    auto usable = [&](const scope::binder &c) {
      return targets.find(c) == targets.end() && (lbs[i] == rbs[i] || !s.member(c.name_of()));
    };
    result step;
    if (usable(lo)) {
      step = align(lbs[i], rbs[i], lo);
    } else if (usable(hi)) {
      step = align(lbs[i], rbs[i], hi);
    } else {
      step = scope::with_fresh_binder(taken, [&](const scope::binder &c) {
        taken = taken.extend(c);
        return align(lbs[i], rbs[i], c);
      });
    }
    targets.insert(step.binders.binders.begin(), step.binders.binders.end());
    acc = merge(acc, step);
  }
  return acc;
}

}
