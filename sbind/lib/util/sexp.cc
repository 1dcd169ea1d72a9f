#include <util/sexp.h>

namespace util::sexp {
std::string sexp_of_t::to_sexp_string() const { return to_sexp().to_string(); }

std::ostream &operator<<(std::ostream &os, const t &s) {
  return s.to_stream(os);
}

}
