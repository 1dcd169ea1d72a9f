#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <unify/unify.h>
#include <scope/testing.h>

namespace {

using scope::test_support::unsafe_binder;
using scope::test_support::unsafe_name;

pattern::name_binder_list list_of(std::initializer_list<scope::raw_name> ids) {
  std::vector<scope::binder> bs;
  for (auto id : ids)bs.push_back(unsafe_binder(id));
  return pattern::name_binder_list(std::move(bs));
}

// applies both renamings to the binders, which must then coincide
void expect_aligned(const unify::result &u, const pattern::t &l, const pattern::t &r) {
  const auto lbs = pattern::binders_of(l);
  const auto rbs = pattern::binders_of(r);
  ASSERT_EQ(lbs.size(), rbs.size());
  std::set<scope::raw_name> targets;
  for (size_t i = 0; i < lbs.size(); ++i) {
    EXPECT_EQ(u.left(lbs[i]), u.right(rbs[i])) << "position " << i;
    targets.insert(u.left(lbs[i]).id());
  }
  // distinct binders stay distinct
  EXPECT_EQ(targets.size(), lbs.size());
}

TEST(Unify, NameBindersEqual) {
  auto u = unify::unify_name_binders(unsafe_binder(3), unsafe_binder(3));
  EXPECT_EQ(u.k, unify::IDENTICAL);
  EXPECT_TRUE(u.left.is_identity());
  EXPECT_TRUE(u.right.is_identity());
}

TEST(Unify, NameBindersSmallerWins) {
  auto u = unify::unify_name_binders(unsafe_binder(2), unsafe_binder(5));
  EXPECT_EQ(u.k, unify::RENAME_RIGHT);
  EXPECT_EQ(u.right(unsafe_name(5)).id(), 2);
  EXPECT_EQ(u.to_sexp().to_string(), "(rename_right (set 2) () ((5 2)))");

  auto v = unify::unify_name_binders(unsafe_binder(5), unsafe_binder(2));
  EXPECT_EQ(v.k, unify::RENAME_LEFT);
  EXPECT_EQ(v.left(unsafe_name(5)).id(), 2);
}

TEST(Unify, MergeTable) {
  auto id = unify::unify_name_binders(unsafe_binder(0), unsafe_binder(0));
  auto rr = unify::unify_name_binders(unsafe_binder(1), unsafe_binder(2));
  auto rl = unify::unify_name_binders(unsafe_binder(4), unsafe_binder(3));
  unify::result no;
  EXPECT_EQ(unify::merge(id, id).k, unify::IDENTICAL);
  EXPECT_EQ(unify::merge(id, rr).k, unify::RENAME_RIGHT);
  EXPECT_EQ(unify::merge(rl, id).k, unify::RENAME_LEFT);
  EXPECT_EQ(unify::merge(rr, rr).k, unify::RENAME_RIGHT);
  EXPECT_EQ(unify::merge(rr, rl).k, unify::RENAME_BOTH);
  EXPECT_EQ(unify::merge(no, id).k, unify::NOT_UNIFIABLE);
  EXPECT_EQ(unify::merge(rl, no).k, unify::NOT_UNIFIABLE);
  EXPECT_THAT(pattern::binders_of(unify::merge(rr, rl).binders),
              ::testing::ElementsAre(unsafe_binder(1), unsafe_binder(3)));
}

TEST(Unify, PatternsDifferentShape) {
  EXPECT_EQ(unify::unify_patterns(scope::empty(), pattern::wildcard(), pattern::single(unsafe_binder(0))).k,
            unify::NOT_UNIFIABLE);
  EXPECT_EQ(unify::unify_patterns(scope::empty(), list_of({0, 1}), list_of({0})).k, unify::NOT_UNIFIABLE);
  EXPECT_EQ(unify::unify_patterns(scope::empty(), pattern::single(unsafe_binder(0)), list_of({0, 1})).k,
            unify::NOT_UNIFIABLE);
}

TEST(Unify, Reflexive) {
  scope::t s = scope::empty().extend(unsafe_binder(0));
  for (const auto &p : {list_of({1, 2, 3}), list_of({}), list_of({7})}) {
    EXPECT_EQ(unify::unify_patterns(s, p, p).k, unify::IDENTICAL);
  }
  EXPECT_EQ(unify::unify_patterns(s, pattern::single(unsafe_binder(4)), pattern::single(unsafe_binder(4))).k,
            unify::IDENTICAL);
}

TEST(Unify, Wildcards) {
  auto u = unify::unify_patterns(scope::empty(), pattern::wildcard(), pattern::wildcard());
  EXPECT_EQ(u.k, unify::IDENTICAL);
  EXPECT_TRUE(u.binders.binders.empty());
}

TEST(Unify, ListsIdentical) {
  auto l = list_of({1, 2});
  auto u = unify::unify_patterns(scope::empty(), l, list_of({1, 2}));
  EXPECT_EQ(u.k, unify::IDENTICAL);
  expect_aligned(u, l, list_of({1, 2}));
}

TEST(Unify, ListsRenameOneSide) {
  auto l = list_of({1, 2});
  auto r = list_of({3, 4});
  auto u = unify::unify_patterns(scope::empty(), l, r);
  EXPECT_EQ(u.k, unify::RENAME_RIGHT);
  expect_aligned(u, l, r);
}

TEST(Unify, ListsMixed) {
  auto l = list_of({1, 4});
  auto r = list_of({2, 3});
  auto u = unify::unify_patterns(scope::empty(), l, r);
  EXPECT_EQ(u.k, unify::RENAME_BOTH);
  expect_aligned(u, l, r);
}

// Pairwise smallest-wins would map both positions of the right side to 0.
TEST(Unify, ListsSwapped) {
  auto l = list_of({0, 1});
  auto r = list_of({1, 0});
  auto u = unify::unify_patterns(scope::empty(), l, r);
  EXPECT_NE(u.k, unify::NOT_UNIFIABLE);
  expect_aligned(u, l, r);
}

TEST(Unify, ListsCrossed) {
  auto l = list_of({0, 5, 2});
  auto r = list_of({2, 0, 7});
  scope::t s = scope::empty().extend(unsafe_binder(9));
  auto u = unify::unify_patterns(s, l, r);
  expect_aligned(u, l, r);
  for (const auto &b : u.binders.binders)EXPECT_FALSE(s.member(b.name_of()));
}

// A binder reusing a name of the outer scope is never the target of a rename:
// the renamed side could refer to the outer name.
TEST(Unify, BinderShadowingOuterName) {
  scope::t s = scope::empty().extend(unsafe_binder(1));
  auto u = unify::unify_patterns(s, pattern::single(unsafe_binder(1)), pattern::single(unsafe_binder(3)));
  EXPECT_EQ(u.k, unify::RENAME_LEFT);
  EXPECT_EQ(u.left(unsafe_name(1)).id(), 3);
  EXPECT_TRUE(u.right.is_identity());

  scope::t both = s.extend(unsafe_binder(3));
  auto v = unify::unify_patterns(both, pattern::single(unsafe_binder(1)), pattern::single(unsafe_binder(3)));
  EXPECT_EQ(v.k, unify::RENAME_BOTH);
  EXPECT_THAT(pattern::binders_of(v.binders), ::testing::ElementsAre(unsafe_binder(4)));

  // both sides shadow the same name
  EXPECT_EQ(unify::unify_patterns(s, pattern::single(unsafe_binder(1)), pattern::single(unsafe_binder(1))).k,
            unify::IDENTICAL);

  auto l = list_of({0, 1});
  auto r = list_of({1, 2});
  auto w = unify::unify_patterns(s, l, r);
  expect_aligned(w, l, r);
  for (const auto &b : w.binders.binders)EXPECT_FALSE(s.member(b.name_of()));
}

}
