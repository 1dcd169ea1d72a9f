#ifndef SBIND_LIB_SCOPE_TESTING_H_
#define SBIND_LIB_SCOPE_TESTING_H_

#include <scope/scope.h>

// Names and binders out of plain integers, for tests only.
namespace scope::test_support {

struct access {
  static name name_of(raw_name id) { return factory::name_of(id); }
  static binder binder_of(raw_name id) { return factory::binder_of(id); }
};

inline name unsafe_name(raw_name id) { return access::name_of(id); }
inline binder unsafe_binder(raw_name id) { return access::binder_of(id); }

}

#endif //SBIND_LIB_SCOPE_TESTING_H_
