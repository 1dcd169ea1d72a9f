#ifndef SBIND_LIB_UNIFY_UNIFY_H_
#define SBIND_LIB_UNIFY_UNIFY_H_

#include <iostream>
#include <string_view>
#include <scope/scope.h>
#include <pattern/pattern.h>
#include <util/sexp.h>

namespace unify {

// cheapest first
enum kind { IDENTICAL, RENAME_RIGHT, RENAME_LEFT, RENAME_BOTH, NOT_UNIFIABLE };

std::string_view kind_name(kind k);
std::ostream &operator<<(std::ostream &os, kind k);

/*
 How two patterns extending the same scope line up.
 binders is the (unordered) set of binders of the unified pattern: the left
 binders for IDENTICAL and RENAME_RIGHT, the right ones for RENAME_LEFT.
 left and right rename each side's binders into it; a side that keeps its
 binders gets the identity.
 */
struct result : public util::sexp::sexp_of_t {
  kind k = NOT_UNIFIABLE;
  pattern::name_binders binders;
  scope::renaming left, right;
  util::sexp::t to_sexp() const final;
};

// The combination table used to unify composite patterns one binder pair at a
// time. IDENTICAL is the unit and NOT_UNIFIABLE absorbs everything.
result merge(const result &a, const result &b);

// Equal identifiers are IDENTICAL, otherwise the side with the larger one is
// renamed to the smaller.
result unify_name_binders(const scope::binder &l, const scope::binder &r);

// l and r both extend s. NOT_UNIFIABLE when their shapes differ.
result unify_patterns(const scope::t &s, const pattern::t &l, const pattern::t &r);

}

#endif //SBIND_LIB_UNIFY_UNIFY_H_
