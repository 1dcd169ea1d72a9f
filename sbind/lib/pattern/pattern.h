#ifndef SBIND_LIB_PATTERN_PATTERN_H_
#define SBIND_LIB_PATTERN_PATTERN_H_

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>
#include <scope/scope.h>
#include <util/util.h>
#include <util/sexp.h>

namespace pattern {

struct t;
typedef std::shared_ptr<const t> ptr;

// Gets the scope right before a binder and the binder itself, and returns the
// binder that takes its place in the rebuilt pattern.
typedef std::function<scope::binder(const scope::t &, const scope::binder &)> binder_fn;

/*
 A group of binders introduced together by one binding site. Implementations
 only need to say how to walk their binders left to right (rebuilding
 themselves on the way) and when two patterns have the same shape; every other
 operation below is a fold over that walk.
 */
struct t : public util::sexp::sexp_of_t {
  // Calls f on each binder in order. On return s has been extended with the
  // binders f returned.
  virtual ptr traverse(scope::t &s, const binder_fn &f) const = 0;
  // Same constructors everywhere but at the binders.
  virtual bool same_shape(const t &o) const = 0;
};

// Uninhabited. A signature that uses it in a binder position has no binders.
struct empty final : public t {
  empty() = delete;
  ptr traverse(scope::t &, const binder_fn &) const final { THROW_INTERNAL_ERROR }
  bool same_shape(const t &) const final { THROW_INTERNAL_ERROR }
  util::sexp::t to_sexp() const final { THROW_INTERNAL_ERROR }
};

struct wildcard final : public t {
  ptr traverse(scope::t &s, const binder_fn &f) const final;
  bool same_shape(const t &o) const final;
  util::sexp::t to_sexp() const final { return "_"; }
};

struct single final : public t {
  scope::binder b;
  explicit single(const scope::binder &b) : b(b) {}
  ptr traverse(scope::t &s, const binder_fn &f) const final;
  bool same_shape(const t &o) const final;
  util::sexp::t to_sexp() const final { return util::sexp::make_sexp(b.id()); }
};

struct name_binders;

// Ordered: iteration follows the source order of the binding site.
struct name_binder_list final : public t {
  std::vector<scope::binder> binders;
  name_binder_list() = default;
  explicit name_binder_list(std::vector<scope::binder> &&bs) : binders(std::move(bs)) {}
  ptr traverse(scope::t &s, const binder_fn &f) const final;
  bool same_shape(const t &o) const final;
  util::sexp::t to_sexp() const final;
  name_binders to_set() const;
};

// Unordered: iteration is in increasing identifier order.
struct name_binders final : public t {
  std::set<scope::binder> binders;
  name_binders() = default;
  explicit name_binders(std::set<scope::binder> &&bs) : binders(std::move(bs)) {}
  static name_binders singleton(const scope::binder &b) { return name_binders({b}); }
  static name_binders from_list(const name_binder_list &l);
  name_binder_list to_list() const;
  name_binders merge(const name_binders &o) const;
  ptr traverse(scope::t &s, const binder_fn &f) const final;
  bool same_shape(const t &o) const final;
  util::sexp::t to_sexp() const final;
};

template<typename F>
struct fold_result {
  F value;
  ptr pattern;
  scope::t extended;
};

/*
 The traversal as a fold. on_binder(scope, binder) returns a pair of a value
 and the replacement binder; values are combined left to right starting from
 unit, and combine has to be associative.
 */
template<typename F, typename OnBinder, typename Combine>
fold_result<F> with_pattern(const scope::t &s, const t &p, OnBinder &&on_binder, F unit, Combine &&combine) {
  F acc = std::move(unit);
  scope::t inner = s;
  ptr rebuilt = p.traverse(inner, [&](const scope::t &before, const scope::binder &b) {
    auto[value, replacement] = on_binder(before, b);
    acc = combine(std::move(acc), std::move(value));
    return replacement;
  });
  return fold_result<F>{.value = std::move(acc), .pattern = std::move(rebuilt), .extended = std::move(inner)};
}

scope::t extend_scope(const t &p, const scope::t &s);
std::vector<scope::binder> binders_of(const t &p);
std::vector<scope::name> names_of(const t &p);
size_t size(const t &p);
// n seen from the outer scope, or nothing if p binds it
std::optional<scope::name> unsink_name(const t &p, const scope::name &n);
// some binder of p is already in s
bool clashes(const t &p, const scope::t &s);
// same shape and same binders
bool equal(const t &l, const t &r);

/*
 Result of moving a pattern into an ambient scope: the pattern to use there,
 the scope it extends it to, and for every original binder (in order) the
 binder replacing it. Substitutions and renamings crossing the pattern are
 extended with those pairs.
 */
struct refreshed {
  ptr pattern;
  scope::t extended;
  std::vector<std::pair<scope::binder, scope::binder>> renames;
  bool unchanged() const;
};

// renames only the binders that clash with s
refreshed with_refreshed_pattern(const scope::t &s, const ptr &p);
// renames every binder
refreshed with_fresh_pattern(const scope::t &s, const ptr &p);

// A renaming of the outer scope is also a renaming of the inner scope, and the
// pattern does not change: neither is touched.
template<typename Renaming>
std::pair<Renaming, ptr> extend_renaming(Renaming r, const ptr &p) {
  return {std::move(r), p};
}

}

#endif //SBIND_LIB_PATTERN_PATTERN_H_
