#include <gtest/gtest.h>
#include <sstream>
#include <lambda_pi/lambda_pi.h>

namespace {

using util::sexp::t;

term::ptr import(const t &raw) { return lambda_pi::to_term(lambda_pi::name_table(), raw); }
std::string export_(const term::ptr &e) { return lambda_pi::from_term(e).to_string(); }
std::string normalize(const t &raw) { return export_(lambda_pi::whnf(scope::empty(), import(raw))); }

TEST(LambdaPi, RoundTrip) {
  t id = {"lam", "x", "x"};
  EXPECT_EQ(export_(import(id)), "(lam x0 x0)");
  t k = {"lam", {"pair", "a", "b"}, {"lam", "_", {"pair", "b", "a"}}};
  EXPECT_EQ(export_(import(k)), "(lam (pair x0 x1) (lam _ (pair x1 x0)))");
  t dep = {"pi", "A", "U", {"pi", "x", "A", {"product", "A", "A"}}};
  EXPECT_EQ(export_(import(dep)), "(pi x0 U (pi x1 x0 (product x0 x0)))");
  t lst = {"lam", {"list", "a", "b", "c"}, {"app", {"first", "c"}, {"second", "a"}}};
  EXPECT_EQ(export_(import(lst)), "(lam (list x0 x1 x2) (app (first x2) (second x0)))");
}

TEST(LambdaPi, ImportShadowing) {
  term::ptr e = import({"lam", "x", {"lam", "x", "x"}});
  EXPECT_EQ(term::to_sexp(e).to_string(), "(lam (0 (lam (1 1))))");
}

TEST(LambdaPi, ImportFreeNames) {
  auto[b, table] = lambda_pi::name_table().bind("y");
  term::ptr e = lambda_pi::to_term(table, {"app", "y", "U"});
  EXPECT_EQ(term::free_vars(e), std::set<scope::raw_name>{b.id()});
  scope::name_map<std::string> names = scope::name_map<std::string>().add(b, "y");
  EXPECT_EQ(lambda_pi::from_term(e, names, lambda_pi::default_fresh_identifiers("v")).to_string(), "(app y U)");
}

TEST(LambdaPi, Unbound) {
  EXPECT_THROW(import({"lam", "x", "y"}), bind::error::unbound_identifier);
}

TEST(LambdaPi, Malformed) {
  EXPECT_THROW(import({"app", "U"}), lambda_pi::error::malformed);
  EXPECT_THROW(import({"frob", "U"}), lambda_pi::error::malformed);
  EXPECT_THROW(import({"lam", {"list", "x", "_"}, "x"}), lambda_pi::error::malformed);
  EXPECT_THROW(import({"lam", {"pair", "x"}, "x"}), lambda_pi::error::malformed);
  EXPECT_THROW(import("_"), lambda_pi::error::malformed);
  EXPECT_THROW(import(t(std::vector<t>{})), lambda_pi::error::t);
}

TEST(LambdaPi, MalformedReport) {
  std::stringstream ss;
  try {
    import({"app", "U"});
    FAIL() << "import should throw";
  } catch (const lambda_pi::error::malformed &e) {
    e.print(ss);
  }
  EXPECT_NE(ss.str().find("malformed application"), std::string::npos);
  EXPECT_NE(ss.str().find("(app U)"), std::string::npos);
}

TEST(LambdaPi, FreshIdentifiers) {
  auto fresh = lambda_pi::default_fresh_identifiers("n");
  EXPECT_EQ(fresh(), "n0");
  EXPECT_EQ(fresh(), "n1");
  auto copy = fresh;
  EXPECT_EQ(copy(), "n2");
  EXPECT_EQ(fresh(), "n3");
}

TEST(LambdaPi, WhnfBeta) {
  EXPECT_EQ(normalize({"app", {"lam", "x", "x"}, "U"}), "U");
  EXPECT_EQ(normalize({"app", {"lam", "_", "U"}, {"lam", "y", "y"}}), "U");
  // only the head is reduced
  EXPECT_EQ(normalize({"lam", "x", {"app", {"lam", "y", "y"}, "x"}}), "(lam x0 (app (lam x1 x1) x0))");
}

TEST(LambdaPi, WhnfProjections) {
  EXPECT_EQ(normalize({"first", {"pair", "U", {"lam", "x", "x"}}}), "U");
  EXPECT_EQ(normalize({"second", {"pair", "U", {"lam", "x", "x"}}}), "(lam x0 x0)");
  EXPECT_EQ(normalize({"lam", "p", {"first", "p"}}), "(lam x0 (first x0))");
}

TEST(LambdaPi, WhnfPatterns) {
  t swap = {"lam", {"pair", "a", "b"}, {"pair", "b", "a"}};
  EXPECT_EQ(normalize({"first", {"app", swap, {"pair", "U", {"lam", "z", "z"}}}}), "(lam x0 x0)");
  t third = {"lam", {"list", "a", "b", "c"}, "c"};
  EXPECT_EQ(normalize({"app", third, {"pair", "U", {"pair", "U", {"lam", "z", "z"}}}}), "(lam x0 x0)");
}

// (\x. \y. x) y must not capture y
TEST(LambdaPi, WhnfAvoidsCapture) {
  auto[b, table] = lambda_pi::name_table().bind("y");
  term::ptr e = lambda_pi::to_term(table, {"app", {"lam", "x", {"lam", "y", "x"}}, "y"});
  term::ptr r = lambda_pi::whnf(table.current_scope(), e);
  scope::name_map<std::string> names = scope::name_map<std::string>().add(b, "y");
  EXPECT_EQ(lambda_pi::from_term(r, names, lambda_pi::default_fresh_identifiers()).to_string(), "(lam x0 y)");
  term::ptr expected = lambda_pi::to_term(table, {"lam", "z", "y"});
  EXPECT_TRUE(term::alpha_equiv(table.current_scope(), r, expected));
}

TEST(LambdaPi, MatchPattern) {
  auto[p, table] = lambda_pi::to_pattern(lambda_pi::name_table(), {"pair", "a", {"pair", "_", "b"}});
  term::ptr arg = lambda_pi::universe();
  term::substitution sigma = lambda_pi::match_pattern(*p, arg);
  EXPECT_EQ(sigma.size(), 2);
  EXPECT_EQ(export_(sigma.lookup(table.lookup("a"))), "(first U)");
  EXPECT_EQ(export_(sigma.lookup(table.lookup("b"))), "(second (second U))");
}

TEST(LambdaPi, AlphaEquivalence) {
  scope::t s;
  EXPECT_TRUE(term::alpha_equiv(s, import({"lam", "x", "x"}), import({"lam", "y", "y"})));
  EXPECT_TRUE(term::alpha_equiv(s, import({"lam", {"pair", "a", "b"}, "a"}), import({"lam", {"pair", "c", "d"}, "c"})));
  EXPECT_FALSE(term::alpha_equiv(s, import({"lam", {"pair", "a", "b"}, "a"}), import({"lam", {"pair", "c", "d"}, "d"})));
  EXPECT_FALSE(term::alpha_equiv(s, import({"lam", {"pair", "a", "b"}, "a"}), import({"lam", {"list", "c", "d"}, "c"})));
  EXPECT_FALSE(term::alpha_equiv(s, import({"lam", "_", "U"}), import({"lam", "x", "U"})));
  EXPECT_TRUE(term::alpha_equiv(s, import({"pi", "x", "U", "x"}), import({"pi", "y", "U", "y"})));
}

// Beta reduction plugs the argument in under a binder with the same
// identifier as one of its own binders.
TEST(LambdaPi, AlphaEquivalenceOfReducedTerms) {
  term::ptr a = lambda_pi::whnf(scope::empty(), import({"app", {"lam", "f", {"lam", "a", "f"}},
                                                        {"lam", "u", {"lam", "b", "b"}}}));
  term::ptr b = lambda_pi::whnf(scope::empty(), import({"app", {"lam", "f", {"lam", "a", {"lam", "u", {"lam", "b", "a"}}}},
                                                        "U"}));
  EXPECT_EQ(term::to_sexp(a).to_string(), "(lam (1 (lam (0 (lam (1 1))))))");
  EXPECT_EQ(export_(a), "(lam x0 (lam x1 (lam x2 x2)))");
  EXPECT_EQ(export_(b), "(lam x0 (lam x1 (lam x2 x0)))");
  EXPECT_FALSE(term::alpha_equiv(scope::empty(), a, b));
  EXPECT_FALSE(term::alpha_equiv(scope::empty(), b, a));
  EXPECT_FALSE(term::alpha_equiv_refreshed(scope::empty(), a, b));
  EXPECT_TRUE(term::alpha_equiv(scope::empty(), a, import({"lam", "p", {"lam", "q", {"lam", "r", "r"}}})));
}

TEST(LambdaPi, AlphaEquivalenceAgreesWithRefreshedAfterWhnf) {
  const t k = {"lam", "x", {"lam", "y", "x"}};
  const t twice = {"lam", "f", {"lam", "z", {"app", "f", {"app", "f", "z"}}}};
  const t swap = {"lam", {"pair", "a", "b"}, {"pair", "b", "a"}};
  const std::vector<t> raws = {
      {"app", k, k},
      {"app", k, {"lam", "y", "y"}},
      {"app", {"app", k, k}, "U"},
      {"app", twice, k},
      {"app", twice, {"lam", "y", "y"}},
      {"first", {"pair", k, "U"}},
      {"app", swap, {"pair", k, {"lam", "w", {"lam", "v", "v"}}}},
      {"lam", "y", {"lam", "x", "y"}},
      {"lam", "x", {"lam", "y", "y"}},
  };
  std::vector<term::ptr> reduced;
  for (const auto &raw : raws)reduced.push_back(lambda_pi::whnf(scope::empty(), import(raw)));
  for (const auto &a : reduced) {
    for (const auto &b : reduced) {
      EXPECT_EQ(term::alpha_equiv(scope::empty(), a, b), term::alpha_equiv_refreshed(scope::empty(), a, b))
                << export_(a) << " vs " << export_(b);
    }
  }
  // k k reduces to \y. k, not to \y. \y. y
  EXPECT_TRUE(term::alpha_equiv(scope::empty(), reduced[0], import({"lam", "u", k})));
  EXPECT_FALSE(term::alpha_equiv(scope::empty(), reduced[0], import({"lam", "u", {"lam", "x", {"lam", "y", "y"}}})));
}

}
